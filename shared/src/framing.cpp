#include "sharebox/framing.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include <nlohmann/json.hpp>

namespace sharebox::protocol
{

    namespace
    {
        // Room for type, command and the chunk header fields around the base64 text.
        constexpr std::size_t kDataFrameOverhead = 1024;

        void write_u32_be(std::uint32_t value, std::span<std::uint8_t, kFrameHeaderSize> buffer)
        {
            buffer[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
            buffer[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
            buffer[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
            buffer[3] = static_cast<std::uint8_t>(value & 0xFF);
        }
    } // namespace

    std::vector<std::uint8_t> encode_frame(const Message &message)
    {
        // Invalid UTF-8 in file names is replaced rather than failing the whole frame.
        const auto text = nlohmann::json(message).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        if (text.size() > std::numeric_limits<std::uint32_t>::max())
        {
            throw std::length_error("Message too large to frame");
        }
        std::vector<std::uint8_t> frame(kFrameHeaderSize + text.size());
        write_u32_be(static_cast<std::uint32_t>(text.size()),
                     std::span<std::uint8_t>(frame).first<kFrameHeaderSize>());
        std::copy(text.begin(), text.end(), frame.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize));
        return frame;
    }

    std::uint32_t read_frame_length(std::span<const std::uint8_t, kFrameHeaderSize> header)
    {
        return (static_cast<std::uint32_t>(header[0]) << 24) |
               (static_cast<std::uint32_t>(header[1]) << 16) |
               (static_cast<std::uint32_t>(header[2]) << 8) |
               static_cast<std::uint32_t>(header[3]);
    }

    void check_frame_length(std::uint32_t length, std::size_t max_frame_bytes)
    {
        if (length > max_frame_bytes)
        {
            throw FramingError("Declared frame length " + std::to_string(length) + " exceeds limit of " +
                               std::to_string(max_frame_bytes) + " bytes");
        }
    }

    Message decode_message(std::span<const std::uint8_t> payload)
    {
        try
        {
            const auto json = nlohmann::json::parse(payload.begin(), payload.end());
            return json.get<Message>();
        }
        catch (const std::exception &ex)
        {
            throw FramingError(std::string("Malformed frame payload: ") + ex.what());
        }
    }

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer, std::size_t max_frame_bytes)
    {
        if (buffer.size() < kFrameHeaderSize)
        {
            return std::nullopt;
        }
        const auto payload_size = read_frame_length(buffer.first<kFrameHeaderSize>());
        check_frame_length(payload_size, max_frame_bytes);
        if (buffer.size() < kFrameHeaderSize + payload_size)
        {
            return std::nullopt;
        }
        DecodedFrame result{
            .message = decode_message(buffer.subspan(kFrameHeaderSize, payload_size)),
            .bytes_consumed = kFrameHeaderSize + payload_size,
        };
        return result;
    }

    std::size_t data_frame_bound(std::size_t chunk_bytes) noexcept
    {
        return ((chunk_bytes + 2) / 3) * 4 + kDataFrameOverhead;
    }

} // namespace sharebox::protocol
