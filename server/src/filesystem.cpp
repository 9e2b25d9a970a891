#include "sharebox/server/filesystem.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

namespace sharebox::server
{

    OperationError::OperationError(sharebox::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    namespace
    {

        bool is_within(const std::filesystem::path &root, const std::filesystem::path &candidate)
        {
            const auto [root_it, candidate_it] =
                std::mismatch(root.begin(), root.end(), candidate.begin(), candidate.end());
            return root_it == root.end();
        }

        std::string relative_path_or_dot(const std::filesystem::path &base, const std::filesystem::path &target)
        {
            auto rel = target.lexically_relative(base);
            auto str = rel.generic_string();
            if (str.empty() || str == ".")
            {
                return ".";
            }
            return str;
        }

        std::filesystem::file_status status_or_throw(const PathReference &target)
        {
            std::error_code ec;
            const auto status = std::filesystem::status(target.absolute, ec);
            if (status.type() == std::filesystem::file_type::not_found)
            {
                throw OperationError(sharebox::ErrorCode::NotFound, "No such file or directory: " + target.relative);
            }
            if (ec)
            {
                throw OperationError(sharebox::ErrorCode::IOError, "Cannot inspect " + target.relative + ": " + ec.message());
            }
            return status;
        }

        bool is_staging_path(const std::filesystem::path &root, const std::filesystem::path &resolved)
        {
            const auto rel = resolved.lexically_relative(root);
            return std::any_of(rel.begin(), rel.end(), [](const std::filesystem::path &part)
                               { return part.string() == kStagingDirectory; });
        }

    } // namespace

    std::filesystem::path prepare_shared_root(const std::filesystem::path &root)
    {
        std::filesystem::create_directories(root);
        return std::filesystem::canonical(root);
    }

    std::filesystem::path prepare_staging_area(const std::filesystem::path &root)
    {
        const auto staging = root / kStagingDirectory;
        std::filesystem::create_directories(staging);
        for (const auto &entry : std::filesystem::directory_iterator(staging))
        {
            std::error_code ec;
            std::filesystem::remove_all(entry.path(), ec);
            if (ec)
            {
                spdlog::warn("Cannot clear stale staging entry {}: {}", entry.path().string(), ec.message());
            }
        }
        return staging;
    }

    PathReference resolve_and_validate(const std::filesystem::path &root, const std::string &user_path)
    {
        if (user_path.find('\0') != std::string::npos)
        {
            throw OperationError(sharebox::ErrorCode::PathViolation, "Path contains a NUL byte");
        }

        // "/docs/a.txt" and "docs/a.txt" both name a file under the shared root
        auto candidate = (root / std::filesystem::path(user_path).relative_path()).lexically_normal();
        if (!candidate.has_filename() && candidate.has_parent_path())
        {
            candidate = candidate.parent_path();
        }

        std::error_code ec;
        auto resolved = std::filesystem::weakly_canonical(candidate, ec);
        if (ec)
        {
            throw OperationError(sharebox::ErrorCode::IOError, "Cannot resolve " + user_path + ": " + ec.message());
        }
        if (!is_within(root, resolved))
        {
            throw OperationError(sharebox::ErrorCode::PathViolation, "Path escapes the shared root: " + user_path);
        }
        if (is_staging_path(root, resolved))
        {
            throw OperationError(sharebox::ErrorCode::PathViolation, "Path is reserved by the server: " + user_path);
        }

        return PathReference{
            .absolute = resolved,
            .relative = relative_path_or_dot(root, resolved),
        };
    }

    std::vector<sharebox::protocol::EntryInfo> list_directory(const PathReference &directory)
    {
        const auto status = status_or_throw(directory);
        if (!std::filesystem::is_directory(status))
        {
            throw OperationError(sharebox::ErrorCode::NotADirectory, "Not a directory: " + directory.relative);
        }

        std::vector<sharebox::protocol::EntryInfo> entries;
        for (const auto &entry : std::filesystem::directory_iterator(directory.absolute))
        {
            if (entry.path().filename().string() == kStagingDirectory)
            {
                continue;
            }
            sharebox::protocol::EntryInfo info{};
            info.name = entry.path().filename().string();
            std::error_code ec;
            info.is_directory = entry.is_directory(ec);
            if (!info.is_directory)
            {
                const auto size = entry.file_size(ec);
                info.size = ec ? 0 : size;
            }
            entries.push_back(std::move(info));
        }
        std::sort(entries.begin(), entries.end(),
                  [](const auto &lhs, const auto &rhs)
                  { return lhs.name < rhs.name; });
        return entries;
    }

    std::uint64_t stat_file(const PathReference &file)
    {
        const auto status = status_or_throw(file);
        if (std::filesystem::is_directory(status))
        {
            throw OperationError(sharebox::ErrorCode::IsADirectory, "Is a directory: " + file.relative);
        }
        if (!std::filesystem::is_regular_file(status))
        {
            throw OperationError(sharebox::ErrorCode::IOError, "Not a regular file: " + file.relative);
        }
        return std::filesystem::file_size(file.absolute);
    }

    SourceFile::SourceFile(const PathReference &file) : file_(file)
    {
        (void)stat_file(file_);
        input_.open(file_.absolute, std::ios::binary | std::ios::ate);
        if (!input_.is_open())
        {
            throw OperationError(sharebox::ErrorCode::IOError, "Failed to open " + file_.relative);
        }
        const auto end = input_.tellg();
        if (end < 0)
        {
            throw OperationError(sharebox::ErrorCode::IOError, "Failed to size " + file_.relative);
        }
        size_ = static_cast<std::uint64_t>(end);
    }

    std::vector<std::byte> SourceFile::read(std::uint64_t offset, std::size_t max_bytes)
    {
        input_.clear();
        input_.seekg(static_cast<std::streamoff>(offset));
        if (!input_)
        {
            throw OperationError(sharebox::ErrorCode::IOError, "Failed to seek in " + file_.relative);
        }
        std::vector<std::byte> buffer(max_bytes);
        input_.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        if (input_.bad())
        {
            throw OperationError(sharebox::ErrorCode::IOError, "Failed to read " + file_.relative);
        }
        buffer.resize(static_cast<std::size_t>(input_.gcount()));
        return buffer;
    }

    void remove_file(const PathReference &file)
    {
        const auto status = status_or_throw(file);
        if (std::filesystem::is_directory(status))
        {
            throw OperationError(sharebox::ErrorCode::IsADirectory, "Refusing to remove directory " + file.relative);
        }
        std::error_code ec;
        if (!std::filesystem::remove(file.absolute, ec) || ec)
        {
            throw OperationError(sharebox::ErrorCode::IOError,
                                 "Failed to remove " + file.relative + (ec ? ": " + ec.message() : std::string{}));
        }
    }

} // namespace sharebox::server
