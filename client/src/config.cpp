#include "sharebox/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace sharebox::client
{

    namespace
    {

        constexpr const char *kUsage =
            "Usage: sharebox_client <alias> [--host <host>] [--port <port>] [-d|--download-dir <dir>] "
            "[--log <file>] [--max-frame <bytes>]";

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 2)
        {
            throw std::runtime_error(kUsage);
        }

        ClientConfig config;
        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--host")
            {
                config.host = require_value(index, argc, argv, arg);
            }
            else if (arg == "--port")
            {
                const auto port = std::stoul(require_value(index, argc, argv, arg));
                if (port == 0 || port > 65535)
                {
                    throw std::runtime_error("--port must be between 1 and 65535");
                }
                config.port = static_cast<std::uint16_t>(port);
            }
            else if (arg == "-d" || arg == "--download-dir")
            {
                config.download_dir = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--max-frame")
            {
                config.max_frame_bytes = static_cast<std::size_t>(std::stoull(require_value(index, argc, argv, arg)));
            }
            else if (!arg.empty() && arg.front() == '-')
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else if (config.alias.empty())
            {
                config.alias = arg;
            }
            else
            {
                throw std::runtime_error("Unexpected argument: " + arg);
            }
        }

        if (config.alias.empty())
        {
            throw std::runtime_error(kUsage);
        }
        return config;
    }

} // namespace sharebox::client
