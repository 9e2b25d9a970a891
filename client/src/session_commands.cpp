#include "sharebox/client/session.hpp"

#include <array>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

#include "sharebox/protocol.hpp"

namespace sharebox::client
{

    void ClientSession::handle_list(const std::vector<std::string> &args)
    {
        if (args.size() > 1)
        {
            std::cout << "Usage: ls [path]" << std::endl;
            return;
        }
        const auto response = list(args.empty() ? "." : args[0]);
        std::cout << "OK " << response.path << std::endl;
        for (const auto &entry : response.entries)
        {
            if (entry.is_directory)
            {
                std::cout << "[DIR ] " << entry.name << std::endl;
            }
            else
            {
                std::cout << "[FILE] " << entry.name << "  (" << format_size(entry.size) << ")" << std::endl;
            }
        }
    }

    void ClientSession::handle_copy(const std::vector<std::string> &args)
    {
        if (args.empty() || args.size() > 2)
        {
            std::cout << "Usage: cp <remote_path> [local_path]" << std::endl;
            return;
        }
        std::optional<std::filesystem::path> local;
        if (args.size() == 2)
        {
            local = std::filesystem::path(args[1]);
        }
        const auto result = copy(args[0], local);
        std::cout << "OK copied " << args[0] << " -> " << result.local_path.string() << " ("
                  << format_size(result.bytes) << ")" << std::endl;
    }

    void ClientSession::handle_put(const std::vector<std::string> &args)
    {
        if (args.empty() || args.size() > 2)
        {
            std::cout << "Usage: put <local_path> [remote_path]" << std::endl;
            return;
        }
        const std::filesystem::path local(args[0]);
        const auto remote = args.size() == 2 ? args[1] : local.filename().generic_string();
        if (max_upload_bytes_ > 0 && std::filesystem::is_regular_file(local) &&
            std::filesystem::file_size(local) > max_upload_bytes_)
        {
            std::cout << "ERROR: " << local.string() << " is larger than the server limit of "
                      << format_size(max_upload_bytes_) << std::endl;
            return;
        }
        const auto result = put(local, remote);
        std::cout << "OK stored " << remote << " (" << format_size(result.bytes) << ")" << std::endl;
    }

    void ClientSession::handle_remove(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            std::cout << "Usage: rm <remote_path>" << std::endl;
            return;
        }
        remove(args[0]);
        std::cout << "OK removed " << args[0] << std::endl;
    }

    void ClientSession::handle_cut(const std::vector<std::string> &args)
    {
        if (args.empty() || args.size() > 2)
        {
            std::cout << "Usage: cut <remote_path> [local_path]" << std::endl;
            return;
        }
        std::optional<std::filesystem::path> local;
        if (args.size() == 2)
        {
            local = std::filesystem::path(args[1]);
        }
        const auto result = cut(args[0], local);
        std::cout << "OK moved " << args[0] << " -> " << result.local_path.string() << " ("
                  << format_size(result.bytes) << ")" << std::endl;
    }

    void ClientSession::print_help() const
    {
        std::cout << "Commands:\n"
                     "  ls [path]                     list a remote directory\n"
                     "  cp <remote> [local]           download a copy into " << config_.download_dir.string() << "\n"
                     "  put <local> [remote]          upload a file\n"
                     "  rm <remote>                   delete a remote file\n"
                     "  cut <remote> [local]          download, then delete the remote file\n"
                     "  help                          show this help\n"
                     "  exit                          leave the session"
                  << std::endl;
    }

    std::string format_size(std::uint64_t bytes)
    {
        static constexpr std::array<const char *, 5> kUnits{"B", "KiB", "MiB", "GiB", "TiB"};
        if (bytes < 1024)
        {
            return std::to_string(bytes) + " B";
        }
        auto value = static_cast<double>(bytes);
        std::size_t unit = 0;
        while (value >= 1024.0 && unit + 1 < kUnits.size())
        {
            value /= 1024.0;
            ++unit;
        }
        std::ostringstream out;
        out << std::fixed << std::setprecision(1) << value << ' ' << kUnits[unit];
        return out.str();
    }

} // namespace sharebox::client
