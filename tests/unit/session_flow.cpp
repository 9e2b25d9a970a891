#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "sharebox/client/session.hpp"
#include "sharebox/crypto.hpp"
#include "sharebox/framing.hpp"
#include "sharebox/protocol.hpp"
#include "sharebox/server/server.hpp"

using namespace sharebox;
using namespace std::chrono_literals;

namespace
{

    // A server on an ephemeral loopback port, running in a background thread.
    class ServerFixture
    {
    public:
        explicit ServerFixture(server::ServerConfig config)
            : server_(std::move(config)), thread_([this]
                                                  { server_.run(); })
        {
        }

        ~ServerFixture()
        {
            stop();
        }

        void stop()
        {
            server_.stop();
            if (thread_.joinable())
            {
                thread_.join();
            }
        }

        server::Server &server() { return server_; }

    private:
        server::Server server_;
        std::thread thread_;
    };

    struct Sandbox
    {
        explicit Sandbox(const std::string &name) : base(std::filesystem::temp_directory_path() / name)
        {
            std::error_code ec;
            std::filesystem::remove_all(base, ec);
            std::filesystem::create_directories(base / "shared");
            std::filesystem::create_directories(base / "local");
        }

        ~Sandbox()
        {
            std::error_code ec;
            std::filesystem::remove_all(base, ec);
        }

        std::filesystem::path shared() const { return base / "shared"; }
        std::filesystem::path local() const { return base / "local"; }

        server::ServerConfig config() const
        {
            server::ServerConfig config;
            config.address = "127.0.0.1";
            config.port = 0;
            config.root = shared();
            config.log_store = base / "transfers.db";
            config.chunk_size = 4096;
            return config;
        }

        std::filesystem::path base;
    };

    client::ClientSession make_client(const std::string &alias, std::uint16_t port,
                                      const std::filesystem::path &download_dir)
    {
        client::ClientConfig config;
        config.alias = alias;
        config.host = "127.0.0.1";
        config.port = port;
        config.download_dir = download_dir;
        return client::ClientSession(config, client::Logger(std::nullopt));
    }

    std::string pattern(std::size_t size)
    {
        std::string data(size, '\0');
        for (std::size_t i = 0; i < size; ++i)
        {
            data[i] = static_cast<char>((i * 31 + 7) % 256);
        }
        return data;
    }

    void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    bool wait_until(const std::function<bool()> &predicate, std::chrono::milliseconds timeout = 5s)
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (predicate())
            {
                return true;
            }
            std::this_thread::sleep_for(10ms);
        }
        return predicate();
    }

    template <typename Fn>
    std::optional<ErrorCode> remote_error_of(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const client::RemoteError &ex)
        {
            return ex.code();
        }
        return std::nullopt;
    }

    bool has_staging_files(const std::filesystem::path &root)
    {
        for (const auto &entry : std::filesystem::recursive_directory_iterator(root))
        {
            if (entry.path().extension() == ".part")
            {
                return true;
            }
        }
        return false;
    }

    protocol::Message chunk_frame(const std::string &transfer_id, std::uint64_t offset, const std::string &data)
    {
        std::vector<std::byte> bytes(data.size());
        std::transform(data.begin(), data.end(), bytes.begin(), [](char c)
                       { return static_cast<std::byte>(c); });
        return protocol::make_data("put", protocol::ChunkHeader{.transfer_id = transfer_id, .offset = offset},
                                   std::move(bytes));
    }

    void test_copy_reassembles_source()
    {
        Sandbox sandbox("sharebox_flow_copy");
        const auto content = pattern(100 * 1024 + 123);
        write_file(sandbox.shared() / "docs" / "big.bin", content);
        write_file(sandbox.shared() / "empty.txt", "");

        ServerFixture fixture(sandbox.config());
        auto client = make_client("alice", fixture.server().port(), sandbox.local());
        client.connect();
        const auto welcome = client.hello();
        assert(welcome.alias == "alice");
        assert(welcome.chunk_size == 4096);

        const auto listing = client.list("/");
        assert(listing.entries.size() == 2);
        assert(listing.entries[0].name == "docs" && listing.entries[0].is_directory);
        assert(listing.entries[1].name == "empty.txt" && listing.entries[1].size == 0);

        const auto result = client.copy("docs/big.bin");
        assert(result.bytes == content.size());
        assert(result.local_path == sandbox.local() / "big.bin");
        assert(read_file(result.local_path) == content);
        assert(!std::filesystem::exists(sandbox.local() / "big.bin.part"));
        assert(std::filesystem::exists(sandbox.shared() / "docs" / "big.bin"));

        const auto empty = client.copy("empty.txt", sandbox.local() / "nothing.txt");
        assert(empty.bytes == 0);
        assert(std::filesystem::file_size(sandbox.local() / "nothing.txt") == 0);

        assert(remote_error_of([&]
                               { client.copy("docs"); }) == ErrorCode::IsADirectory);
        assert(remote_error_of([&]
                               { client.copy("missing.bin"); }) == ErrorCode::NotFound);
        assert(remote_error_of([&]
                               { client.list("empty.txt"); }) == ErrorCode::NotADirectory);
        client.exit();
    }

    void test_cut_requires_confirmation()
    {
        Sandbox sandbox("sharebox_flow_cut");
        write_file(sandbox.shared() / "move.txt", pattern(10000));
        write_file(sandbox.shared() / "keep.txt", "keep me");
        write_file(sandbox.shared() / "wrong.txt", "wrong count");

        ServerFixture fixture(sandbox.config());

        // Confirmed delivery removes the source.
        {
            auto client = make_client("bob", fixture.server().port(), sandbox.local());
            client.connect();
            client.hello();
            const auto result = client.cut("move.txt");
            assert(result.bytes == 10000);
            assert(read_file(sandbox.local() / "move.txt") == pattern(10000));
            assert(!std::filesystem::exists(sandbox.shared() / "move.txt"));

            // A confirmation that does not match what was sent keeps the file.
            client.send(protocol::make_request(protocol::Command::Cut, protocol::PathRequest{.path = "wrong.txt"}));
            std::optional<protocol::TransferSummary> summary;
            while (!summary)
            {
                auto message = client.receive();
                if (message.type == protocol::MessageType::Response)
                {
                    summary = message.fields.get<protocol::TransferSummary>();
                }
            }
            assert(summary->status == protocol::status::kAwaitingConfirmation);
            client.send(protocol::make_response("cut", protocol::DeliveryConfirmation{
                                                           .transfer_id = summary->transfer_id,
                                                           .received = summary->bytes - 1,
                                                           .checksum = std::nullopt,
                                                       }));
            const auto reply = client.receive();
            assert(reply.type == protocol::MessageType::Error);
            assert(reply.fields.get<protocol::ErrorInfo>().code == ErrorCode::IOError);
            assert(std::filesystem::exists(sandbox.shared() / "wrong.txt"));

            // The session is still usable.
            assert(client.list().entries.size() == 2);
            client.exit();
        }

        // Disconnecting before confirmation keeps the source.
        {
            auto client = make_client("carol", fixture.server().port(), sandbox.local());
            client.connect();
            client.hello();
            client.send(protocol::make_request(protocol::Command::Cut, protocol::PathRequest{.path = "keep.txt"}));
            bool awaiting = false;
            while (!awaiting)
            {
                auto message = client.receive();
                awaiting = message.type == protocol::MessageType::Response &&
                           message.fields.value("status", std::string{}) == protocol::status::kAwaitingConfirmation;
            }
            client.close();
        }
        assert(wait_until([&]
                          { return fixture.server().sessions().size() == 0; }));
        assert(read_file(sandbox.shared() / "keep.txt") == "keep me");
    }

    std::string text_of(const std::vector<std::byte> &bytes)
    {
        std::string text(bytes.size(), '\0');
        std::transform(bytes.begin(), bytes.end(), text.begin(), [](std::byte b)
                       { return static_cast<char>(b); });
        return text;
    }

    void test_copy_is_not_torn_by_concurrent_put()
    {
        Sandbox sandbox("sharebox_flow_replace");
        const std::size_t size = 2 * 1024 * 1024 + 17;
        const std::string original(size, 'A');
        const std::string replacement(size, 'B');
        write_file(sandbox.shared() / "doc.bin", original);
        write_file(sandbox.local() / "doc.bin", replacement);

        ServerFixture fixture(sandbox.config());
        auto reader = make_client("olive", fixture.server().port(), sandbox.local());
        auto writer = make_client("peggy", fixture.server().port(), sandbox.local());
        reader.connect();
        reader.hello();
        writer.connect();
        writer.hello();

        reader.send(protocol::make_request(protocol::Command::Copy, protocol::PathRequest{.path = "doc.bin"}));
        const auto first = reader.receive();
        assert(first.type == protocol::MessageType::Data);
        std::string received = text_of(*first.binary);

        // The other client replaces the file while the copy is still streaming.
        const auto stored = writer.put(sandbox.local() / "doc.bin", "doc.bin");
        assert(stored.bytes == size);
        assert(read_file(sandbox.shared() / "doc.bin") == replacement);

        std::optional<protocol::TransferSummary> summary;
        while (!summary)
        {
            auto message = reader.receive();
            assert(message.type != protocol::MessageType::Error);
            if (message.type == protocol::MessageType::Data)
            {
                received += text_of(*message.binary);
            }
            else
            {
                summary = message.fields.get<protocol::TransferSummary>();
            }
        }
        assert(summary->bytes == size);
        assert(received == original);
        assert(summary->checksum == crypto::hash_bytes(std::as_bytes(std::span(original.data(), original.size()))));
        reader.exit();
        writer.exit();
    }

    void test_staging_area_is_private()
    {
        Sandbox sandbox("sharebox_flow_staging");
        write_file(sandbox.local() / "intruder.txt", "overwrite attempt");
        ServerFixture fixture(sandbox.config());
        auto owner = make_client("quinn", fixture.server().port(), sandbox.local());
        auto other = make_client("rupert", fixture.server().port(), sandbox.local());
        owner.connect();
        owner.hello();
        other.connect();
        other.hello();

        owner.send(protocol::make_request(protocol::Command::Put,
                                          protocol::PutRequest{.path = "upload.txt", .size = 6}));
        const auto transfer = owner.receive().fields.get<protocol::TransferReady>();
        owner.send(chunk_frame(transfer.transfer_id, 0, "hal"));

        // Nothing of the upload in progress is visible or reachable.
        assert(other.list("/").entries.empty());
        const auto staged = ".sharebox-staging/" + transfer.transfer_id + ".part";
        assert(remote_error_of([&]
                               { other.list(".sharebox-staging"); }) == ErrorCode::PathViolation);
        assert(remote_error_of([&]
                               { other.copy(staged); }) == ErrorCode::PathViolation);
        assert(remote_error_of([&]
                               { other.remove(staged); }) == ErrorCode::PathViolation);
        assert(remote_error_of([&]
                               { other.put(sandbox.local() / "intruder.txt", staged); }) == ErrorCode::PathViolation);

        owner.send(chunk_frame(transfer.transfer_id, 3, "ves"));
        owner.send(protocol::make_response("put", protocol::TransferSummary{
                                                      .transfer_id = transfer.transfer_id,
                                                      .bytes = 6,
                                                      .checksum = std::nullopt,
                                                      .status = {},
                                                  }));
        const auto reply = owner.receive();
        assert(reply.type == protocol::MessageType::Response);
        assert(read_file(sandbox.shared() / "upload.txt") == "halves");

        const auto listing = other.list("/");
        assert(listing.entries.size() == 1 && listing.entries[0].name == "upload.txt");
        owner.exit();
        other.exit();
    }

    void test_concurrent_put_conflicts()
    {
        Sandbox sandbox("sharebox_flow_conflict");
        write_file(sandbox.local() / "other.txt", "second writer");

        ServerFixture fixture(sandbox.config());
        auto first = make_client("dave", fixture.server().port(), sandbox.local());
        auto second = make_client("erin", fixture.server().port(), sandbox.local());
        first.connect();
        first.hello();
        second.connect();
        second.hello();

        first.send(protocol::make_request(protocol::Command::Put,
                                          protocol::PutRequest{.path = "shared.txt", .size = 5}));
        const auto ready = first.receive();
        assert(ready.type == protocol::MessageType::Response);
        const auto transfer = ready.fields.get<protocol::TransferReady>();

        assert(remote_error_of([&]
                               { second.put(sandbox.local() / "other.txt", "shared.txt"); }) == ErrorCode::Conflict);

        first.send(chunk_frame(transfer.transfer_id, 0, "fir"));
        first.send(chunk_frame(transfer.transfer_id, 3, "st"));
        first.send(protocol::make_response("put", protocol::TransferSummary{
                                                      .transfer_id = transfer.transfer_id,
                                                      .bytes = 5,
                                                      .checksum = std::nullopt,
                                                      .status = {},
                                                  }));
        const auto stored = first.receive();
        assert(stored.type == protocol::MessageType::Response);
        assert(stored.fields.get<protocol::TransferSummary>().status == protocol::status::kStored);
        assert(read_file(sandbox.shared() / "shared.txt") == "first");

        // Once the first upload is done the path is free again.
        const auto result = second.put(sandbox.local() / "other.txt", "shared.txt");
        assert(result.bytes == 13);
        assert(read_file(sandbox.shared() / "shared.txt") == "second writer");
        assert(!has_staging_files(sandbox.shared()));
    }

    void test_path_violations_are_rejected()
    {
        Sandbox sandbox("sharebox_flow_paths");
        ServerFixture fixture(sandbox.config());
        auto client = make_client("mallory", fixture.server().port(), sandbox.local());
        client.connect();
        client.hello();

        assert(remote_error_of([&]
                               { client.remove("../../etc/passwd"); }) == ErrorCode::PathViolation);
        assert(remote_error_of([&]
                               { client.copy("../outside.txt"); }) == ErrorCode::PathViolation);
        assert(remote_error_of([&]
                               { client.list("/../.."); }) == ErrorCode::PathViolation);
        assert(remote_error_of([&]
                               { client.remove("ghost.txt"); }) == ErrorCode::NotFound);

        // Unknown commands are reported and the session carries on.
        client.send(protocol::Message{.type = protocol::MessageType::Request,
                                      .command = "mkdir",
                                      .fields = {{"path", "x"}},
                                      .binary = std::nullopt});
        const auto unknown = client.receive();
        assert(unknown.type == protocol::MessageType::Error);
        assert(unknown.fields.get<protocol::ErrorInfo>().code == ErrorCode::UnknownCommand);
        assert(client.list().entries.empty());
        client.exit();
        assert(!client.is_open());
    }

    void test_handshake_is_enforced()
    {
        Sandbox sandbox("sharebox_flow_handshake");
        ServerFixture fixture(sandbox.config());

        {
            auto client = make_client("eve", fixture.server().port(), sandbox.local());
            client.connect();
            client.send(protocol::make_request(protocol::Command::List));
            const auto reply = client.receive();
            assert(reply.type == protocol::MessageType::Error);
            assert(reply.fields.get<protocol::ErrorInfo>().code == ErrorCode::ProtocolViolation);
            bool closed = false;
            try
            {
                (void)client.receive();
            }
            catch (const std::system_error &)
            {
                closed = true;
            }
            assert(closed);
        }

        {
            // An empty alias is refused but the handshake can be retried.
            auto client = make_client("", fixture.server().port(), sandbox.local());
            client.connect();
            assert(remote_error_of([&]
                                   { client.hello(); }) == ErrorCode::InvalidPayload);
            client.send(protocol::make_request(protocol::Command::Hello, protocol::HelloRequest{.alias = "frank"}));
            const auto reply = client.receive();
            assert(reply.type == protocol::MessageType::Response);
            assert(reply.fields.get<protocol::HelloResponse>().alias == "frank");

            // A second hello is a protocol violation.
            client.send(protocol::make_request(protocol::Command::Hello, protocol::HelloRequest{.alias = "again"}));
            const auto again = client.receive();
            assert(again.fields.get<protocol::ErrorInfo>().code == ErrorCode::ProtocolViolation);
        }
    }

    void test_quota_overflow_leaves_nothing_behind()
    {
        Sandbox sandbox("sharebox_flow_quota");
        auto config = sandbox.config();
        config.max_upload_bytes = 1000;
        config.chunk_size = 256;
        write_file(sandbox.local() / "large.bin", pattern(2000));

        ServerFixture fixture(config);
        auto client = make_client("grace", fixture.server().port(), sandbox.local());
        client.connect();
        client.hello();

        // Declared size over the limit is rejected up front.
        assert(remote_error_of([&]
                               { client.put(sandbox.local() / "large.bin", "large.bin"); }) ==
               ErrorCode::QuotaExceeded);

        // Undeclared size is cut off once the stream passes the limit.
        client.send(protocol::make_request(protocol::Command::Put, protocol::PutRequest{.path = "sneaky.bin"}));
        const auto ready = client.receive().fields.get<protocol::TransferReady>();
        assert(ready.chunk_size == 256);
        const auto chunk = pattern(256);
        std::uint64_t offset = 0;
        for (int i = 0; i < 5; ++i)
        {
            client.send(chunk_frame(ready.transfer_id, offset, chunk));
            offset += chunk.size();
        }
        client.send(protocol::make_response("put", protocol::TransferSummary{
                                                       .transfer_id = ready.transfer_id,
                                                       .bytes = offset,
                                                       .checksum = std::nullopt,
                                                       .status = {},
                                                   }));
        const auto reply = client.receive();
        assert(reply.type == protocol::MessageType::Error);
        const auto info = reply.fields.get<protocol::ErrorInfo>();
        assert(info.code == ErrorCode::QuotaExceeded);
        assert(info.transfer_id == ready.transfer_id);

        // The session keeps going and nothing was left on disk.
        assert(client.list().entries.empty());
        assert(!std::filesystem::exists(sandbox.shared() / "sneaky.bin"));
        assert(!has_staging_files(sandbox.shared()));
        client.exit();
    }

    void test_refuses_beyond_capacity()
    {
        Sandbox sandbox("sharebox_flow_capacity");
        auto config = sandbox.config();
        config.max_sessions = 1;
        ServerFixture fixture(config);

        auto first = make_client("heidi", fixture.server().port(), sandbox.local());
        first.connect();
        first.hello();

        auto second = make_client("ivan", fixture.server().port(), sandbox.local());
        second.connect();
        assert(remote_error_of([&]
                               { second.hello(); }) == ErrorCode::Refused);

        const auto snapshot = fixture.server().sessions().snapshot();
        assert(snapshot.size() == 1);
        assert(snapshot[0].alias == "heidi");

        first.exit();
        assert(wait_until([&]
                          { return fixture.server().sessions().size() == 0; }));
        auto third = make_client("judy", fixture.server().port(), sandbox.local());
        third.connect();
        assert(third.hello().alias == "judy");
    }

    void test_transfer_log_records_each_operation()
    {
        Sandbox sandbox("sharebox_flow_log");
        write_file(sandbox.local() / "report.txt", "quarterly numbers");
        ServerFixture fixture(sandbox.config());
        {
            auto client = make_client("ken", fixture.server().port(), sandbox.local());
            client.connect();
            client.hello();
            client.put(sandbox.local() / "report.txt", "reports/report.txt");
            client.copy("reports/report.txt", sandbox.local() / "copy.txt");
            client.cut("reports/report.txt", sandbox.local() / "moved.txt");
            assert(remote_error_of([&]
                                   { client.remove("reports/report.txt"); }) == ErrorCode::NotFound);
            client.put(sandbox.local() / "report.txt", "again.txt");
            client.remove("again.txt");
            client.exit();
        }
        fixture.stop();

        using server::Operation;
        using server::Outcome;
        const auto entries = fixture.server().transfer_log().query(server::LogQuery{.alias = "ken"});
        const std::vector<std::pair<Operation, Outcome>> expected{
            {Operation::Connect, Outcome::Ok},
            {Operation::Put, Outcome::Ok},
            {Operation::Get, Outcome::Ok},
            {Operation::Cut, Outcome::Ok},
            {Operation::Remove, Outcome::Failed},
            {Operation::Put, Outcome::Ok},
            {Operation::Remove, Outcome::Ok},
            {Operation::Disconnect, Outcome::Ok},
        };
        assert(entries.size() == expected.size());
        for (std::size_t i = 0; i < expected.size(); ++i)
        {
            assert(entries[i].operation == expected[i].first);
            assert(entries[i].outcome == expected[i].second);
            assert(entries[i].peer.find("127.0.0.1") != std::string::npos);
            if (i > 0)
            {
                assert(entries[i].sequence > entries[i - 1].sequence);
                assert(entries[i].timestamp >= entries[i - 1].timestamp);
            }
        }
        assert(entries[1].target_path == "reports/report.txt");
        assert(!entries[1].transfer_id.empty());
        assert(entries[2].transfer_id != entries[1].transfer_id);
    }

    void test_disconnect_mid_copy_is_logged_once()
    {
        Sandbox sandbox("sharebox_flow_abort");
        write_file(sandbox.shared() / "huge.bin", pattern(4 * 1024 * 1024));
        auto config = sandbox.config();
        ServerFixture fixture(config);
        {
            auto client = make_client("leo", fixture.server().port(), sandbox.local());
            client.connect();
            client.hello();
            client.send(protocol::make_request(protocol::Command::Copy, protocol::PathRequest{.path = "huge.bin"}));
            const auto first_chunk = client.receive();
            assert(first_chunk.type == protocol::MessageType::Data);
            client.close();
        }
        assert(wait_until([&]
                          { return fixture.server().sessions().size() == 0; }));
        fixture.stop();

        const auto gets = fixture.server().transfer_log().query(
            server::LogQuery{.alias = "leo", .operation = server::Operation::Get});
        assert(gets.size() == 1);
        assert(gets[0].outcome == server::Outcome::Failed);
        assert(std::filesystem::file_size(sandbox.shared() / "huge.bin") == 4 * 1024 * 1024);
    }

} // namespace

void run_session_flow_tests()
{
    test_copy_reassembles_source();
    test_cut_requires_confirmation();
    test_copy_is_not_torn_by_concurrent_put();
    test_staging_area_is_private();
    test_concurrent_put_conflicts();
    test_path_violations_are_rejected();
    test_handshake_is_enforced();
    test_quota_overflow_leaves_nothing_behind();
    test_refuses_beyond_capacity();
    test_transfer_log_records_each_operation();
    test_disconnect_mid_copy_is_logged_once();
}
