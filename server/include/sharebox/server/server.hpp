#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <thread>
#include <vector>

#include "sharebox/server/chunk_budget.hpp"
#include "sharebox/server/config.hpp"
#include "sharebox/server/session_registry.hpp"
#include "sharebox/server/transfer_ids.hpp"
#include "sharebox/server/transfer_log.hpp"
#include "sharebox/server/worker_pool.hpp"

namespace sharebox::server
{

    class Server
    {
    public:
        // Binds the listening socket and opens the transfer log. Throws on
        // invalid configuration or when either cannot be opened.
        explicit Server(ServerConfig config);
        ~Server();

        // Blocks until stop() is called or SIGINT/SIGTERM arrives, then drains
        // every session and worker before returning.
        void run();

        // Safe to call from any thread, including before run().
        void stop();

        std::uint16_t port() const noexcept { return port_; }
        const std::filesystem::path &root() const noexcept { return root_; }
        const TransferLog &transfer_log() const noexcept { return transfer_log_; }
        const SessionRegistry &sessions() const noexcept { return registry_; }

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void refuse(asio::ip::tcp::socket socket, const std::string &peer);
        void shutdown();

        ServerConfig config_;
        std::filesystem::path root_;
        TransferLog transfer_log_;
        SessionRegistry registry_;
        ChunkBudget chunk_budget_;
        TransferIdGenerator transfer_ids_;

        asio::io_context io_context_;
        // Accept, signal and shutdown handlers share the acceptor's strand.
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        std::uint16_t port_{0};
        std::atomic<bool> stopping_{false};

        // Declared after io_context_ so the roles are joined before it goes away.
        WorkerPool workers_;
        std::vector<std::thread> io_threads_;
    };

} // namespace sharebox::server
