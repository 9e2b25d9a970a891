#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "sharebox/framing.hpp"

namespace sharebox::client
{

    inline constexpr std::uint16_t kDefaultPort = 65432;

    struct ClientConfig
    {
        std::string alias;
        std::string host{"localhost"};
        std::uint16_t port{kDefaultPort};
        std::filesystem::path download_dir{"downloads"};
        std::optional<std::filesystem::path> log_path;
        std::size_t max_frame_bytes{sharebox::protocol::kDefaultMaxFrameBytes};
    };

    // sharebox_client <alias> [--host H] [--port P] [-d DIR] [--log FILE] [--max-frame BYTES]
    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace sharebox::client
