#include "sharebox/server/upload_staging.hpp"

#include <algorithm>
#include <system_error>

#include <spdlog/spdlog.h>

namespace sharebox::server
{

    UploadStaging::UploadStaging(std::filesystem::path staging_dir, std::uint64_t max_upload_bytes)
        : staging_dir_(std::move(staging_dir)), max_upload_bytes_(max_upload_bytes) {}

    UploadStaging::~UploadStaging()
    {
        for (auto &[transfer_id, state] : uploads_)
        {
            state.stream.close();
            std::error_code ec;
            std::filesystem::remove(state.temp_path, ec);
        }
    }

    void UploadStaging::begin(const std::string &transfer_id, const PathReference &target)
    {
        if (uploads_.contains(transfer_id))
        {
            throw OperationError(sharebox::ErrorCode::Conflict, "Transfer already staged: " + transfer_id);
        }
        if (is_target_busy(target.absolute))
        {
            throw OperationError(sharebox::ErrorCode::Conflict,
                                 "Another upload to " + target.relative + " is in progress");
        }
        std::error_code ec;
        if (std::filesystem::is_directory(target.absolute, ec))
        {
            throw OperationError(sharebox::ErrorCode::IsADirectory, "Is a directory: " + target.relative);
        }
        std::filesystem::create_directories(target.absolute.parent_path(), ec);
        if (ec)
        {
            throw OperationError(sharebox::ErrorCode::IOError,
                                 "Cannot create parent directory for " + target.relative + ": " + ec.message());
        }

        auto [it, inserted] = uploads_.try_emplace(transfer_id);
        auto &state = it->second;
        state.target = target;
        // Transfer ids are server generated, so they are safe as file names.
        state.temp_path = staging_dir_ / (transfer_id + ".part");
        state.stream.open(state.temp_path, std::ios::binary | std::ios::trunc);
        if (!state.stream.is_open())
        {
            uploads_.erase(it);
            throw OperationError(sharebox::ErrorCode::IOError, "Cannot create staging file for " + target.relative);
        }
        spdlog::debug("Staging upload {} -> {}", transfer_id, target.relative);
    }

    std::uint64_t UploadStaging::append(const std::string &transfer_id, std::span<const std::byte> data)
    {
        auto &state = find_or_throw(transfer_id);
        if (state.bytes_written + data.size() > max_upload_bytes_)
        {
            const auto relative = state.target.relative;
            discard(transfer_id);
            throw OperationError(sharebox::ErrorCode::QuotaExceeded,
                                 "Upload of " + relative + " exceeds the limit of " +
                                     std::to_string(max_upload_bytes_) + " bytes");
        }
        state.stream.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!state.stream)
        {
            const auto relative = state.target.relative;
            discard(transfer_id);
            throw OperationError(sharebox::ErrorCode::IOError, "Write failed while staging " + relative);
        }
        state.hash.update(data);
        state.bytes_written += data.size();
        return state.bytes_written;
    }

    CommittedUpload UploadStaging::commit(const std::string &transfer_id, std::uint64_t expected_bytes,
                                          const std::optional<std::string> &expected_checksum)
    {
        auto &state = find_or_throw(transfer_id);
        state.stream.close();
        if (state.stream.fail())
        {
            discard(transfer_id);
            throw OperationError(sharebox::ErrorCode::IOError, "Failed to flush staged upload " + transfer_id);
        }
        if (state.bytes_written != expected_bytes)
        {
            const auto written = state.bytes_written;
            discard(transfer_id);
            throw OperationError(sharebox::ErrorCode::IOError,
                                 "Upload incomplete: received " + std::to_string(written) + " of " +
                                     std::to_string(expected_bytes) + " bytes");
        }

        CommittedUpload committed{
            .bytes = state.bytes_written,
            .checksum = state.hash.finish(),
        };
        if (expected_checksum && *expected_checksum != committed.checksum)
        {
            discard(transfer_id);
            throw OperationError(sharebox::ErrorCode::IOError, "Checksum mismatch for upload " + transfer_id);
        }

        std::error_code ec;
        std::filesystem::rename(state.temp_path, state.target.absolute, ec);
        if (ec)
        {
            const auto relative = state.target.relative;
            discard(transfer_id);
            throw OperationError(sharebox::ErrorCode::IOError, "Failed to move upload into " + relative + ": " + ec.message());
        }
        spdlog::debug("Committed upload {} ({} bytes) -> {}", transfer_id, committed.bytes, state.target.relative);
        uploads_.erase(transfer_id);
        return committed;
    }

    bool UploadStaging::abort(const std::string &transfer_id)
    {
        if (!uploads_.contains(transfer_id))
        {
            return false;
        }
        discard(transfer_id);
        return true;
    }

    bool UploadStaging::is_target_busy(const std::filesystem::path &target) const
    {
        return std::any_of(uploads_.begin(), uploads_.end(), [&](const auto &item)
                           { return item.second.target.absolute == target; });
    }

    UploadStaging::UploadState &UploadStaging::find_or_throw(const std::string &transfer_id)
    {
        auto it = uploads_.find(transfer_id);
        if (it == uploads_.end())
        {
            throw OperationError(sharebox::ErrorCode::InvalidPayload, "Unknown transfer: " + transfer_id);
        }
        return it->second;
    }

    void UploadStaging::discard(const std::string &transfer_id)
    {
        auto it = uploads_.find(transfer_id);
        if (it == uploads_.end())
        {
            return;
        }
        it->second.stream.close();
        std::error_code ec;
        std::filesystem::remove(it->second.temp_path, ec);
        if (ec)
        {
            spdlog::warn("Failed to remove staging file {}: {}", it->second.temp_path.string(), ec.message());
        }
        uploads_.erase(it);
    }

} // namespace sharebox::server
