#include "sharebox/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>
#include <asio/write.hpp>

#include <array>
#include <chrono>
#include <csignal>
#include <memory>

#include <spdlog/spdlog.h>

#include "sharebox/crypto.hpp"
#include "sharebox/framing.hpp"
#include "sharebox/server/filesystem.hpp"
#include "sharebox/server/session.hpp"
#include "session_common.hpp"

namespace sharebox::server
{

    namespace
    {

        constexpr std::chrono::seconds kRefusalLinger{2};

        ServerConfig checked(ServerConfig config)
        {
            validate(config);
            return config;
        }

        // A connection turned away at capacity. The ERROR frame is written, the
        // send side shut down, and whatever the peer already sent is drained so
        // the close does not reset the connection before the peer reads the reply.
        struct Refusal
        {
            explicit Refusal(asio::ip::tcp::socket s) : socket(std::move(s)), timer(socket.get_executor()) {}

            asio::ip::tcp::socket socket;
            asio::steady_timer timer;
            std::vector<std::uint8_t> frame;
            std::array<char, 512> sink{};
        };

        void close_refused(Refusal &refusal)
        {
            std::error_code ec;
            refusal.timer.cancel();
            refusal.socket.close(ec);
        }

        void drain_refused(const std::shared_ptr<Refusal> &refusal)
        {
            refusal->socket.async_read_some(asio::buffer(refusal->sink),
                                            [refusal](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                                            {
                                                if (ec)
                                                {
                                                    close_refused(*refusal);
                                                    return;
                                                }
                                                drain_refused(refusal);
                                            });
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(checked(std::move(config))),
          root_(prepare_shared_root(config_.root)),
          transfer_log_(config_.log_store),
          registry_(config_.max_sessions),
          chunk_budget_(config_.max_inflight_chunks),
          io_context_(static_cast<int>(config_.io_threads)),
          acceptor_(asio::make_strand(io_context_)),
          signals_(acceptor_.get_executor()),
          workers_(transfer_log_, prepare_staging_area(root_), config_.max_upload_bytes)
    {
        sharebox::crypto::ensure_sodium_init();

        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        port_ = acceptor_.local_endpoint().port();

        spdlog::info("Listening on {}:{} with root {}", config_.address, port_, root_.string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int signal)
                            {
            if (!ec)
            {
                spdlog::info("Signal {} received", signal);
                shutdown();
            } });
    }

    Server::~Server()
    {
        workers_.shutdown();
    }

    void Server::run()
    {
        accept_next();

        const auto thread_count = config_.io_threads;
        io_threads_.reserve(thread_count - 1);
        for (std::size_t i = 1; i < thread_count; ++i)
        {
            io_threads_.emplace_back([this]
                                     { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", thread_count);
        io_context_.run();

        for (auto &thread : io_threads_)
        {
            if (thread.joinable())
            {
                thread.join();
            }
        }
        io_threads_.clear();

        workers_.shutdown();
        spdlog::info("Server stopped");
    }

    void Server::stop()
    {
        asio::post(acceptor_.get_executor(), [this]
                   { shutdown(); });
    }

    void Server::shutdown()
    {
        if (stopping_.exchange(true))
        {
            return;
        }
        spdlog::info("Shutting down, closing {} sessions", registry_.size());
        std::error_code ec;
        signals_.cancel(ec);
        acceptor_.close(ec);
        registry_.close_all();
    }

    void Server::accept_next()
    {
        acceptor_.async_accept(asio::make_strand(io_context_),
                               [this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (ec)
        {
            if (ec == asio::error::operation_aborted || !acceptor_.is_open())
            {
                return;
            }
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
            return;
        }

        const auto peer = session_common::describe_peer(socket);
        if (stopping_)
        {
            std::error_code ignored;
            socket.close(ignored);
            return;
        }

        if (auto id = registry_.try_admit(peer))
        {
            const SessionServices services{
                .config = config_,
                .root = root_,
                .workers = workers_,
                .registry = registry_,
                .chunk_budget = chunk_budget_,
                .transfer_ids = transfer_ids_,
            };
            auto session = std::make_shared<Session>(std::move(socket), *id, peer, services);
            session->start();
        }
        else
        {
            refuse(std::move(socket), peer);
        }
        accept_next();
    }

    void Server::refuse(asio::ip::tcp::socket socket, const std::string &peer)
    {
        spdlog::warn("Refusing connection from {}: {} sessions already active", peer, config_.max_sessions);
        auto refusal = std::make_shared<Refusal>(std::move(socket));
        refusal->frame = protocol::encode_frame(protocol::make_error(
            protocol::to_string(protocol::Command::Hello), sharebox::ErrorCode::Refused, "Server is at capacity"));
        refusal->timer.expires_after(kRefusalLinger);
        refusal->timer.async_wait([refusal](const std::error_code &ec)
                                  {
            if (!ec)
            {
                close_refused(*refusal);
            } });
        asio::async_write(refusal->socket, asio::buffer(refusal->frame),
                          [refusal](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  close_refused(*refusal);
                                  return;
                              }
                              std::error_code ignored;
                              refusal->socket.shutdown(asio::ip::tcp::socket::shutdown_send, ignored);
                              drain_refused(refusal);
                          });
    }

} // namespace sharebox::server
