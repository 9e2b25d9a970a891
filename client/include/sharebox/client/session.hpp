#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "sharebox/client/config.hpp"
#include "sharebox/client/logger.hpp"
#include "sharebox/error_codes.hpp"
#include "sharebox/protocol.hpp"

namespace sharebox::client
{

    // The server answered with an ERROR frame.
    class RemoteError : public std::runtime_error
    {
    public:
        RemoteError(sharebox::ErrorCode code, const std::string &detail,
                    std::optional<std::string> transfer_id = std::nullopt);

        sharebox::ErrorCode code() const noexcept { return code_; }
        const std::optional<std::string> &transfer_id() const noexcept { return transfer_id_; }

    private:
        sharebox::ErrorCode code_;
        std::optional<std::string> transfer_id_;
    };

    struct DownloadResult
    {
        std::string transfer_id;
        std::filesystem::path local_path;
        std::uint64_t bytes{};
        std::string checksum;
    };

    struct UploadResult
    {
        std::string transfer_id;
        std::uint64_t bytes{};
        std::string checksum;
    };

    // Blocking client for one connection. Every call sends a request and waits
    // for its reply; ERROR replies surface as RemoteError.
    class ClientSession
    {
    public:
        ClientSession(ClientConfig config, Logger logger);
        ~ClientSession();

        ClientSession(const ClientSession &) = delete;
        ClientSession &operator=(const ClientSession &) = delete;

        // Connects, says hello and runs the interactive shell on stdin.
        int run();

        void connect();
        sharebox::protocol::HelloResponse hello();
        sharebox::protocol::ListResponse list(const std::string &remote_path = ".");
        DownloadResult copy(const std::string &remote_path,
                            const std::optional<std::filesystem::path> &local_path = std::nullopt);
        UploadResult put(const std::filesystem::path &local_path, const std::string &remote_path);
        void remove(const std::string &remote_path);
        // Downloads like copy, then confirms receipt so the server deletes its copy.
        DownloadResult cut(const std::string &remote_path,
                           const std::optional<std::filesystem::path> &local_path = std::nullopt);
        void exit();

        // Raw frame access.
        void send(const sharebox::protocol::Message &message);
        sharebox::protocol::Message receive();
        void close();

        bool is_open() const { return socket_.is_open(); }
        const std::string &session_id() const noexcept { return session_id_; }

    private:
        // Progress of an incoming chunk stream, kept even when the stream fails.
        struct StreamProgress
        {
            std::string transfer_id;
            std::uint64_t received{};
            std::string checksum;
            bool ended{false};
            // Byte count and checksum matched the server's terminator.
            bool verified{false};
        };

        DownloadResult receive_stream(sharebox::protocol::Command command, const std::string &remote_path,
                                      const std::optional<std::filesystem::path> &local_path,
                                      StreamProgress &progress);
        sharebox::protocol::Message expect_response(std::string_view command);
        std::filesystem::path download_target(const std::string &remote_path,
                                              const std::optional<std::filesystem::path> &local_path) const;

        void interactive_shell();
        bool dispatch(const std::string &command, const std::vector<std::string> &args);
        void handle_list(const std::vector<std::string> &args);
        void handle_copy(const std::vector<std::string> &args);
        void handle_put(const std::vector<std::string> &args);
        void handle_remove(const std::vector<std::string> &args);
        void handle_cut(const std::vector<std::string> &args);
        void print_help() const;

        ClientConfig config_;
        Logger logger_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::string session_id_;
        std::uint64_t max_upload_bytes_{};
    };

    std::string format_size(std::uint64_t bytes);

} // namespace sharebox::client
