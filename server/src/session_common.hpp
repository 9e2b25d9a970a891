#pragma once

#include <asio/ip/tcp.hpp>

#include <chrono>
#include <cstddef>
#include <exception>
#include <string>

#include "sharebox/error_codes.hpp"

namespace sharebox::server::session_common
{

    // Reading pauses while this many decoded frames wait to be processed.
    inline constexpr std::size_t kMaxQueuedFrames = 32;

    inline constexpr std::chrono::milliseconds kChunkRetryDelay{5};

    inline constexpr const char *kClientDisconnected = "client disconnected";

    struct Failure
    {
        sharebox::ErrorCode code{sharebox::ErrorCode::InternalError};
        std::string detail;
    };

    // Maps an exception reported by a worker role to the code sent to the client.
    Failure describe_failure(std::exception_ptr error);

    std::string describe_peer(const asio::ip::tcp::socket &socket);

} // namespace sharebox::server::session_common
