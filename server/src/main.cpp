#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "sharebox/server/server.hpp"
#include "sharebox/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "ShareBox server " << sharebox::version() << "\n"
                  << "Usage: " << program_name
                  << " --port <PORT> --root <ROOT> [--address <ADDRESS>] [--db <FILE>] [--threads <N>]\n"
                     "       [--max-sessions <N>] [--max-inflight-chunks <N>] [--chunk-size <BYTES>]\n"
                     "       [--max-frame <BYTES>] [--max-upload <BYTES>] [--log <FILE>] [--log-level <LEVEL>]\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    std::size_t to_size(const std::string &value)
    {
        std::size_t consumed = 0;
        const auto parsed = std::stoull(value, &consumed);
        if (consumed != value.size())
        {
            throw std::invalid_argument("not a number: " + value);
        }
        return static_cast<std::size_t>(parsed);
    }

    // Applies one "--flag value" pair. Returns false for an unknown flag.
    bool apply_option(sharebox::server::ServerConfig &config, const std::string &flag, const std::string &value)
    {
        if (flag == "--port")
        {
            const auto port = to_size(value);
            if (port > 65535)
            {
                throw std::invalid_argument("port out of range: " + value);
            }
            config.port = static_cast<std::uint16_t>(port);
        }
        else if (flag == "--root")
        {
            config.root = std::filesystem::path(value);
        }
        else if (flag == "--address")
        {
            config.address = value;
        }
        else if (flag == "--db")
        {
            config.log_store = std::filesystem::path(value);
        }
        else if (flag == "--threads")
        {
            config.io_threads = to_size(value);
        }
        else if (flag == "--max-sessions")
        {
            config.max_sessions = to_size(value);
        }
        else if (flag == "--max-inflight-chunks")
        {
            config.max_inflight_chunks = to_size(value);
        }
        else if (flag == "--chunk-size")
        {
            config.chunk_size = to_size(value);
        }
        else if (flag == "--max-frame")
        {
            config.max_frame_bytes = to_size(value);
        }
        else if (flag == "--max-upload")
        {
            config.max_upload_bytes = to_size(value);
        }
        else if (flag == "--log")
        {
            config.log_file = std::filesystem::path(value);
        }
        else if (flag == "--log-level")
        {
            const auto level = spdlog::level::from_str(value);
            if (level == spdlog::level::off && value != "off")
            {
                throw std::invalid_argument("unknown log level: " + value);
            }
            config.log_level = level;
        }
        else
        {
            return false;
        }
        return true;
    }

} // namespace

int main(int argc, char *argv[])
{
    using sharebox::server::Server;
    using sharebox::server::ServerConfig;

    ServerConfig config;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        auto value = read_option(i, argc, argv);
        if (!value)
        {
            std::cerr << "Missing value for " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        try
        {
            if (!apply_option(config, arg, *value))
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
        }
        catch (const std::exception &ex)
        {
            std::cerr << "Invalid value for " << arg << ": " << ex.what() << std::endl;
            return EXIT_FAILURE;
        }
    }

    if (config.port == 0 || config.root.empty())
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(config.log_level);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting ShareBox server {} on {}:{}", sharebox::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
