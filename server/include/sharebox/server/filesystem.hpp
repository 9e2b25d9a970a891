#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "sharebox/error_codes.hpp"
#include "sharebox/protocol.hpp"

namespace sharebox::server
{

    class OperationError : public std::runtime_error
    {
    public:
        OperationError(sharebox::ErrorCode code, std::string message);

        sharebox::ErrorCode code() const noexcept { return code_; }

    private:
        sharebox::ErrorCode code_;
    };

    // A client supplied path that has been resolved against the shared root.
    // `absolute` is always the root itself or one of its descendants.
    struct PathReference
    {
        std::filesystem::path absolute;
        std::string relative;
    };

    // Directory under the shared root where uploads are staged. Clients can
    // neither name it nor see it in a listing.
    inline constexpr std::string_view kStagingDirectory = ".sharebox-staging";

    // Canonical form of the shared root; creates the directory when missing.
    std::filesystem::path prepare_shared_root(const std::filesystem::path &root);

    // Creates the staging directory under `root` and clears what an earlier
    // run left behind in it.
    std::filesystem::path prepare_staging_area(const std::filesystem::path &root);

    // Throws OperationError(PathViolation) when `user_path` escapes `root` or
    // names the staging directory. `root` must already be canonical (see
    // prepare_shared_root).
    PathReference resolve_and_validate(const std::filesystem::path &root, const std::string &user_path);

    // Blocking storage primitives. Reader and writer roles call these; the
    // connection loop never does.
    std::vector<sharebox::protocol::EntryInfo> list_directory(const PathReference &directory);

    std::uint64_t stat_file(const PathReference &file);

    // A regular file opened for streaming to a client. The handle keeps reading
    // the content the file had when it was opened, even after another upload
    // renames a new file over the path or the path is removed.
    class SourceFile
    {
    public:
        explicit SourceFile(const PathReference &file);

        SourceFile(const SourceFile &) = delete;
        SourceFile &operator=(const SourceFile &) = delete;

        std::uint64_t size() const noexcept { return size_; }
        const PathReference &file() const noexcept { return file_; }

        std::vector<std::byte> read(std::uint64_t offset, std::size_t max_bytes);

    private:
        PathReference file_;
        std::ifstream input_;
        std::uint64_t size_{};
    };

    void remove_file(const PathReference &file);

} // namespace sharebox::server
