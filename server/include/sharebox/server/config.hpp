#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <spdlog/common.h>

#include "sharebox/framing.hpp"

namespace sharebox::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::filesystem::path log_store{"sharebox-transfers.db"};
        std::size_t io_threads{1};
        std::size_t max_sessions{64};
        std::size_t max_inflight_chunks{256};
        std::size_t chunk_size{protocol::kDefaultChunkSize};
        std::size_t max_frame_bytes{protocol::kDefaultMaxFrameBytes};
        std::uint64_t max_upload_bytes{1ULL << 30};
        std::optional<std::filesystem::path> log_file;
        spdlog::level::level_enum log_level{spdlog::level::info};
    };

    // Throws std::invalid_argument when the limits are inconsistent, e.g. a
    // chunk that cannot fit into a single frame.
    void validate(const ServerConfig &config);

} // namespace sharebox::server
