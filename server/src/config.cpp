#include "sharebox/server/config.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace sharebox::server
{

    void validate(const ServerConfig &config)
    {
        if (config.root.empty())
        {
            throw std::invalid_argument("Shared root must be set");
        }
        if (config.io_threads == 0)
        {
            throw std::invalid_argument("At least one I/O thread is required");
        }
        if (config.max_sessions == 0)
        {
            throw std::invalid_argument("max_sessions must be positive");
        }
        if (config.max_inflight_chunks == 0)
        {
            throw std::invalid_argument("max_inflight_chunks must be positive");
        }
        if (config.chunk_size == 0)
        {
            throw std::invalid_argument("chunk_size must be positive");
        }
        if (protocol::data_frame_bound(config.chunk_size) > config.max_frame_bytes)
        {
            throw std::invalid_argument("A chunk of " + std::to_string(config.chunk_size) +
                                        " bytes does not fit in frames limited to " +
                                        std::to_string(config.max_frame_bytes) + " bytes");
        }
        if (config.max_frame_bytes > UINT32_MAX)
        {
            throw std::invalid_argument("max_frame_bytes exceeds the 32-bit length prefix");
        }
    }

} // namespace sharebox::server
