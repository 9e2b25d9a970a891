/**
 * ShareBox - Length-prefixed JSON framing helpers.
 *
 * Wire layout: [4-byte big-endian payload length][payload]. The payload is the
 * JSON serialization of a protocol::Message.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

#include "sharebox/protocol.hpp"

namespace sharebox::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);
    inline constexpr std::size_t kDefaultMaxFrameBytes = 1u << 20;
    inline constexpr std::size_t kDefaultChunkSize = 64u * 1024u;

    // Oversized or unparseable frame. Fatal for the connection that produced it.
    class FramingError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct DecodedFrame
    {
        Message message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const Message &message);

    std::uint32_t read_frame_length(std::span<const std::uint8_t, kFrameHeaderSize> header);

    void check_frame_length(std::uint32_t length, std::size_t max_frame_bytes);

    Message decode_message(std::span<const std::uint8_t> payload);

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer,
                                                 std::size_t max_frame_bytes = kDefaultMaxFrameBytes);

    // Upper bound on the frame length produced by a DATA frame that carries
    // `chunk_bytes` of binary payload.
    std::size_t data_frame_bound(std::size_t chunk_bytes) noexcept;

} // namespace sharebox::protocol
