#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>

#include "sharebox/crypto.hpp"
#include "sharebox/server/filesystem.hpp"

namespace sharebox::server
{

    struct CommittedUpload
    {
        std::uint64_t bytes{};
        std::string checksum;
    };

    // In-progress uploads staged as temp files in the server's private staging
    // directory (see prepare_staging_area). Not synchronized: the writer role
    // is the only thread that touches it.
    class UploadStaging
    {
    public:
        UploadStaging(std::filesystem::path staging_dir, std::uint64_t max_upload_bytes);
        ~UploadStaging();

        UploadStaging(const UploadStaging &) = delete;
        UploadStaging &operator=(const UploadStaging &) = delete;

        // Throws Conflict when another upload already targets the same path.
        void begin(const std::string &transfer_id, const PathReference &target);

        // Returns the number of bytes staged so far. Throws QuotaExceeded (and
        // discards the temp file) once the upload would grow past the limit.
        std::uint64_t append(const std::string &transfer_id, std::span<const std::byte> data);

        // Verifies the byte count and optional checksum, then renames the temp
        // file over the target. Any failure discards the staged data.
        CommittedUpload commit(const std::string &transfer_id, std::uint64_t expected_bytes,
                               const std::optional<std::string> &expected_checksum);

        // Returns false when the transfer is unknown (already committed or discarded).
        bool abort(const std::string &transfer_id);

        bool is_target_busy(const std::filesystem::path &target) const;

        std::size_t active() const noexcept { return uploads_.size(); }

    private:
        struct UploadState
        {
            PathReference target;
            std::filesystem::path temp_path;
            std::ofstream stream;
            std::uint64_t bytes_written{};
            sharebox::crypto::StreamingHash hash;
        };

        UploadState &find_or_throw(const std::string &transfer_id);
        void discard(const std::string &transfer_id);

        std::filesystem::path staging_dir_;
        std::uint64_t max_upload_bytes_;
        std::unordered_map<std::string, UploadState> uploads_;
    };

} // namespace sharebox::server
