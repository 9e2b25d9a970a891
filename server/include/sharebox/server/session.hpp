#pragma once

#include <asio/ip/tcp.hpp>
#include <asio/steady_timer.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sharebox/crypto.hpp"
#include "sharebox/error_codes.hpp"
#include "sharebox/protocol.hpp"
#include "sharebox/server/chunk_budget.hpp"
#include "sharebox/server/config.hpp"
#include "sharebox/server/delivery.hpp"
#include "sharebox/server/filesystem.hpp"
#include "sharebox/server/session_registry.hpp"
#include "sharebox/server/transfer_ids.hpp"
#include "sharebox/server/transfer_log.hpp"
#include "sharebox/server/worker_pool.hpp"

namespace sharebox::server
{

    struct SessionServices
    {
        const ServerConfig &config;
        const std::filesystem::path &root;
        WorkerPool &workers;
        SessionRegistry &registry;
        ChunkBudget &chunk_budget;
        TransferIdGenerator &transfer_ids;
    };

    // One client connection. Every handler runs on the strand the socket was
    // accepted on; worker results are posted back to the same strand.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        enum class State : std::uint8_t
        {
            Handshake,
            Authenticated,
            Closed
        };

        Session(asio::ip::tcp::socket socket, std::uint64_t id, std::string peer, SessionServices services);
        ~Session();

        void start();

        // Thread safe; the session closes on its own strand.
        void stop();

        std::uint64_t id() const noexcept { return id_; }
        const std::string &peer() const noexcept { return peer_; }

    private:
        struct Outbound
        {
            std::vector<std::uint8_t> frame;
            std::function<void()> on_sent;
        };

        struct DownloadState
        {
            sharebox::protocol::Command command{sharebox::protocol::Command::Copy};
            std::string transfer_id;
            PathReference source;
            std::uint64_t total_size{};
            std::uint64_t sent{};
            sharebox::crypto::StreamingHash hash;
        };

        struct UploadState
        {
            std::string transfer_id;
            PathReference target;
            std::uint64_t received{};
        };

        // A transfer or file command whose log entry has not been written yet.
        struct PendingRecord
        {
            Operation operation{Operation::Get};
            std::string target_path;
            std::string transfer_id;
        };

        // Inbound
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_next();
        void finish_command();
        void dispatch(sharebox::protocol::Message message);
        void handle_handshake(const sharebox::protocol::Message &message);
        void handle_request(const sharebox::protocol::Message &message);

        // Outbound
        void send(sharebox::protocol::Message message, std::function<void()> on_sent = {});
        void send_error(std::string_view command, sharebox::ErrorCode code, std::string_view detail,
                        std::optional<std::string> transfer_id = std::nullopt);
        void write_next();

        // ls, rm, exit
        void handle_list(const sharebox::protocol::Message &message);
        void handle_remove(const sharebox::protocol::Message &message);
        void handle_exit();

        // cp, cut
        void handle_download(sharebox::protocol::Command command, const sharebox::protocol::Message &message);
        void send_next_chunk();
        void finish_download();
        void fail_download(sharebox::ErrorCode code, const std::string &detail);
        void handle_cut_confirmation(const sharebox::protocol::Message &message);

        // put
        void handle_put(const sharebox::protocol::Message &message);
        void handle_upload_frame(const sharebox::protocol::Message &message);
        void handle_upload_chunk(const sharebox::protocol::Message &message);
        void handle_upload_end(const sharebox::protocol::Message &message);
        void handle_discarded_frame(const sharebox::protocol::Message &message);

        // Chunk budget
        void with_chunk_slot(std::function<void()> next);

        // Transfer log
        void open_record(Operation operation, std::string target_path, std::string transfer_id = {});
        void close_record(Outcome outcome, std::string detail = {});
        void log_event(Operation operation, Outcome outcome, std::string target_path = {}, std::string detail = {});

        // Termination
        void fail_connection(std::string_view command, sharebox::ErrorCode code, std::string_view detail);
        void close(std::string_view reason);

        // True once the session is closed or only flushing a final reply.
        bool closed() const noexcept { return state_ == State::Closed || closing_; }
        asio::any_io_executor executor() { return socket_.get_executor(); }

        asio::ip::tcp::socket socket_;
        std::uint64_t id_;
        std::string peer_;
        SessionServices services_;
        State state_{State::Handshake};
        std::string alias_;

        std::array<std::uint8_t, 4> header_buffer_{};
        std::vector<std::uint8_t> payload_buffer_;
        std::deque<sharebox::protocol::Message> inbound_;
        bool reading_{false};
        bool busy_{false};
        bool closing_{false};
        std::string close_reason_;

        std::deque<Outbound> outbound_;
        bool writing_{false};

        asio::steady_timer retry_timer_;
        std::optional<ChunkSlot> chunk_slot_;

        std::optional<DownloadState> download_;
        std::optional<SentCopy> awaiting_cut_;
        std::optional<UploadState> upload_;
        std::optional<std::string> discarding_;
        std::optional<PendingRecord> record_;
        bool finalizing_{false};
    };

} // namespace sharebox::server
