#include <array>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sharebox/crypto.hpp"
#include "sharebox/encoding/base64.hpp"
#include "sharebox/error_codes.hpp"
#include "sharebox/framing.hpp"
#include "sharebox/protocol.hpp"

using namespace sharebox;
using namespace sharebox::protocol;

void run_server_component_tests();
void run_session_flow_tests();

namespace
{

    std::vector<std::uint8_t> frame_from_text(const std::string &text)
    {
        std::vector<std::uint8_t> frame(kFrameHeaderSize + text.size());
        const auto size = static_cast<std::uint32_t>(text.size());
        frame[0] = static_cast<std::uint8_t>(size >> 24);
        frame[1] = static_cast<std::uint8_t>(size >> 16);
        frame[2] = static_cast<std::uint8_t>(size >> 8);
        frame[3] = static_cast<std::uint8_t>(size);
        std::copy(text.begin(), text.end(), frame.begin() + kFrameHeaderSize);
        return frame;
    }

    bool decode_fails(const std::vector<std::uint8_t> &frame, std::size_t max_frame = kDefaultMaxFrameBytes)
    {
        try
        {
            (void)try_decode_frame(frame, max_frame);
        }
        catch (const FramingError &)
        {
            return true;
        }
        return false;
    }

    void test_request_roundtrip()
    {
        const auto request = make_request(Command::List, PathRequest{.path = "docs"});
        const auto frame = encode_frame(request);
        const auto decoded = try_decode_frame(frame);
        assert(decoded.has_value());
        assert(decoded->bytes_consumed == frame.size());
        assert(decoded->message == request);
        assert(decoded->message.type == MessageType::Request);
        assert(decoded->message.command == "ls");
        assert(decoded->message.fields.get<PathRequest>().path == "docs");
        assert(!decoded->message.binary);
    }

    void test_data_frame_carries_binary()
    {
        std::vector<std::byte> payload(1000);
        for (std::size_t i = 0; i < payload.size(); ++i)
        {
            payload[i] = static_cast<std::byte>(i % 251);
        }
        const ChunkHeader header{.transfer_id = "t1-ab", .offset = 4096, .total_size = 5096};
        const auto data = make_data("cp", header, payload);
        const auto frame = encode_frame(data);
        assert(frame.size() - kFrameHeaderSize <= data_frame_bound(payload.size()));

        const auto decoded = try_decode_frame(frame);
        assert(decoded.has_value());
        assert(decoded->message.type == MessageType::Data);
        assert(decoded->message.binary == payload);
        const auto decoded_header = decoded->message.fields.get<ChunkHeader>();
        assert(decoded_header.transfer_id == "t1-ab");
        assert(decoded_header.offset == 4096);
        assert(decoded_header.total_size == 5096u);
    }

    void test_partial_frames_wait_for_more_bytes()
    {
        const auto frame = encode_frame(make_request(Command::Exit));
        assert(!try_decode_frame(std::span<const std::uint8_t>(frame.data(), 2)).has_value());
        assert(!try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size() - 1)).has_value());

        // Two frames back to back: only the first one is consumed.
        auto stream = frame;
        const auto second = encode_frame(make_request(Command::List));
        stream.insert(stream.end(), second.begin(), second.end());
        const auto first = try_decode_frame(stream);
        assert(first.has_value());
        assert(first->bytes_consumed == frame.size());
        assert(first->message.command == "exit");
    }

    void test_oversized_frame_is_rejected()
    {
        std::vector<std::uint8_t> header{0x7F, 0xFF, 0xFF, 0xFF};
        assert(decode_fails(header));

        const auto frame = encode_frame(make_request(Command::List, PathRequest{.path = std::string(200, 'x')}));
        assert(decode_fails(frame, 64));
    }

    void test_malformed_payloads_are_rejected()
    {
        assert(decode_fails(frame_from_text("{not json")));
        assert(decode_fails(frame_from_text("[1,2,3]")));
        assert(decode_fails(frame_from_text(R"({"command":"ls","fields":{}})")));
        assert(decode_fails(frame_from_text(R"({"type":"SHOUT","command":"ls","fields":{}})")));
        assert(decode_fails(frame_from_text(R"({"type":"REQUEST","command":"ls","fields":[1]})")));
        assert(decode_fails(frame_from_text(R"({"type":"DATA","command":"put","fields":{},"binary":"@@@"})")));
    }

    void test_error_frames()
    {
        const auto error = make_error("rm", ErrorCode::PathViolation, "escapes the shared root", "t9-00");
        const auto decoded = try_decode_frame(encode_frame(error));
        assert(decoded.has_value());
        assert(decoded->message.type == MessageType::Error);
        const auto info = decoded->message.fields.get<ErrorInfo>();
        assert(info.code == ErrorCode::PathViolation);
        assert(info.detail == "escapes the shared root");
        assert(info.transfer_id == std::string("t9-00"));
        assert(decoded->message.fields.at("reason") == "path_violation");

        for (std::uint16_t value = 0; value <= to_int(ErrorCode::InternalError); ++value)
        {
            const auto code = error_code_from_int(value);
            assert(to_int(code) == value);
            assert(error_code_from_string(to_string(code)) == code);
        }
        assert(error_code_from_int(999) == ErrorCode::InternalError);
        assert(is_connection_fatal(ErrorCode::ProtocolViolation));
        assert(!is_connection_fatal(ErrorCode::NotFound));
    }

    void test_command_names()
    {
        for (const auto command : {Command::Hello, Command::List, Command::Copy, Command::Put, Command::Remove,
                                   Command::Cut, Command::Exit})
        {
            assert(command_from_string(to_string(command)) == command);
        }
        assert(!command_from_string("mkdir").has_value());
    }

    void test_transfer_payloads()
    {
        const TransferSummary summary{.transfer_id = "t2-ff", .bytes = 12, .checksum = "abc", .status = "complete"};
        const auto summary_json = nlohmann::json(summary);
        const auto decoded_summary = summary_json.get<TransferSummary>();
        assert(decoded_summary.bytes == 12);
        assert(decoded_summary.checksum == std::string("abc"));
        assert(decoded_summary.status == "complete");

        const DeliveryConfirmation confirmation{.transfer_id = "t2-ff", .received = 12, .checksum = std::nullopt};
        const auto confirmation_json = nlohmann::json(confirmation);
        assert(!confirmation_json.contains("checksum"));
        assert(confirmation_json.get<DeliveryConfirmation>().received == 12);

        const PutRequest put{.path = "a/b.bin", .size = std::nullopt};
        assert(!nlohmann::json(put).get<PutRequest>().size.has_value());
    }

    void test_base64()
    {
        const std::array<std::byte, 5> raw{std::byte{'h'}, std::byte{'e'}, std::byte{'l'}, std::byte{'l'},
                                           std::byte{'o'}};
        const auto encoded = encoding::encode_base64(raw);
        assert(encoded == "aGVsbG8=");
        const auto decoded = encoding::decode_base64(encoded);
        assert(decoded.has_value());
        assert(std::equal(decoded->begin(), decoded->end(), raw.begin(), raw.end()));
        assert(!encoding::decode_base64("aGVsbG8").has_value());
        assert(encoding::decode_base64("")->empty());
    }

    void test_crypto()
    {
        const std::array<std::byte, 4> chunk = {
            std::byte{0xDE},
            std::byte{0xAD},
            std::byte{0xBE},
            std::byte{0xEF},
        };
        const auto chunk_hash = crypto::hash_bytes(chunk);

        std::istringstream stream(std::string("\xDE\xAD\xBE\xEF", 4));
        const auto stream_hash = crypto::hash_stream(stream);
        assert(chunk_hash == stream_hash);

        crypto::StreamingHash incremental;
        incremental.update(std::span<const std::byte>(chunk).first(1));
        incremental.update(std::span<const std::byte>(chunk).subspan(1));
        assert(incremental.finish() == chunk_hash);

        const auto temp_dir = std::filesystem::temp_directory_path();
        const auto file_path = temp_dir / "sharebox_crypto_test.bin";
        {
            std::ofstream file(file_path, std::ios::binary);
            file.write("\xDE\xAD\xBE\xEF", 4);
        }
        const auto file_hash = crypto::hash_file(file_path);
        assert(file_hash == chunk_hash);
        std::filesystem::remove(file_path);

        const auto id = crypto::random_hex(4);
        assert(id.size() == 8);
        assert(id.find_first_not_of("0123456789abcdef") == std::string::npos);
    }

} // namespace

int main()
{
    try
    {
        test_request_roundtrip();
        test_data_frame_carries_binary();
        test_partial_frames_wait_for_more_bytes();
        test_oversized_frame_is_rejected();
        test_malformed_payloads_are_rejected();
        test_error_frames();
        test_command_names();
        test_transfer_payloads();
        test_base64();
        test_crypto();
        run_server_component_tests();
        run_session_flow_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed" << std::endl;
    return 0;
}
