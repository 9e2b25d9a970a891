#include "sharebox/server/session.hpp"

#include <asio/dispatch.hpp>
#include <asio/post.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "sharebox/framing.hpp"
#include "session_common.hpp"

namespace sharebox::server
{

    Session::Session(asio::ip::tcp::socket socket, std::uint64_t id, std::string peer, SessionServices services)
        : socket_(std::move(socket)),
          id_(id),
          peer_(std::move(peer)),
          services_(services),
          retry_timer_(socket_.get_executor())
    {
    }

    Session::~Session()
    {
        spdlog::debug("Session {} released", id_);
    }

    void Session::start()
    {
        services_.registry.attach(id_, shared_from_this());
        spdlog::info("Client connected from {} (session {})", peer_, id_);
        asio::dispatch(executor(), [self = shared_from_this()]
                       { self->read_frame_header(); });
    }

    void Session::stop()
    {
        asio::post(executor(), [self = shared_from_this()]
                   { self->close("server shutdown"); });
    }

    void Session::read_frame_header()
    {
        if (closed() || inbound_.size() >= session_common::kMaxQueuedFrames)
        {
            reading_ = false;
            return;
        }
        reading_ = true;
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 reading_ = false;
                                 close(session_common::kClientDisconnected);
                                 return;
                             }
                             const auto length = protocol::read_frame_length(header_buffer_);
                             try
                             {
                                 protocol::check_frame_length(length, services_.config.max_frame_bytes);
                             }
                             catch (const protocol::FramingError &ex)
                             {
                                 reading_ = false;
                                 fail_connection("", sharebox::ErrorCode::FramingError, ex.what());
                                 return;
                             }
                             read_frame_payload(length);
                         });
    }

    void Session::read_frame_payload(std::size_t size)
    {
        payload_buffer_.resize(size);
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(payload_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 reading_ = false;
                                 close(session_common::kClientDisconnected);
                                 return;
                             }
                             if (closed())
                             {
                                 reading_ = false;
                                 return;
                             }
                             try
                             {
                                 inbound_.push_back(protocol::decode_message(payload_buffer_));
                             }
                             catch (const protocol::FramingError &ex)
                             {
                                 reading_ = false;
                                 fail_connection("", sharebox::ErrorCode::FramingError, ex.what());
                                 return;
                             }
                             read_frame_header();
                             process_next();
                         });
    }

    void Session::process_next()
    {
        if (busy_ || closed() || inbound_.empty())
        {
            return;
        }
        auto message = std::move(inbound_.front());
        inbound_.pop_front();
        busy_ = true;
        if (!reading_)
        {
            read_frame_header();
        }
        dispatch(std::move(message));
    }

    void Session::finish_command()
    {
        busy_ = false;
        if (closed())
        {
            return;
        }
        asio::post(executor(), [self = shared_from_this()]
                   { self->process_next(); });
    }

    void Session::dispatch(protocol::Message message)
    {
        spdlog::debug("Session {} <- {} {}", id_, protocol::to_string(message.type), message.command);
        try
        {
            if (state_ == State::Handshake)
            {
                handle_handshake(message);
            }
            else if (upload_)
            {
                handle_upload_frame(message);
            }
            else if (discarding_)
            {
                handle_discarded_frame(message);
            }
            else if (awaiting_cut_)
            {
                handle_cut_confirmation(message);
            }
            else if (message.type == protocol::MessageType::Request)
            {
                handle_request(message);
            }
            else
            {
                fail_connection(message.command, sharebox::ErrorCode::ProtocolViolation,
                                "Unexpected " + std::string(protocol::to_string(message.type)) + " frame");
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            // Handlers parse their fields before doing anything else.
            send_error(message.command, sharebox::ErrorCode::InvalidPayload, ex.what());
            finish_command();
        }
    }

    void Session::handle_handshake(const protocol::Message &message)
    {
        if (message.type != protocol::MessageType::Request ||
            message.command != protocol::to_string(protocol::Command::Hello))
        {
            fail_connection(message.command, sharebox::ErrorCode::ProtocolViolation,
                            "Expected hello before any other frame");
            return;
        }
        const auto request = message.fields.get<protocol::HelloRequest>();
        if (request.alias.empty())
        {
            send_error(message.command, sharebox::ErrorCode::InvalidPayload, "Alias must not be empty");
            finish_command();
            return;
        }

        alias_ = request.alias;
        state_ = State::Authenticated;
        services_.registry.attach_alias(id_, alias_);

        const protocol::HelloResponse response{
            .session_id = std::to_string(id_),
            .alias = alias_,
            .chunk_size = services_.config.chunk_size,
            .max_upload_bytes = services_.config.max_upload_bytes,
        };
        send(protocol::make_response(message.command, response));
        log_event(Operation::Connect, Outcome::Ok);
        spdlog::info("Session {} identified as {} ({})", id_, alias_, peer_);
        finish_command();
    }

    void Session::handle_request(const protocol::Message &message)
    {
        const auto command = protocol::command_from_string(message.command);
        if (!command)
        {
            send_error(message.command, sharebox::ErrorCode::UnknownCommand, "Unknown command: " + message.command);
            finish_command();
            return;
        }

        switch (*command)
        {
        case protocol::Command::Hello:
            fail_connection(message.command, sharebox::ErrorCode::ProtocolViolation, "Session already identified");
            break;
        case protocol::Command::List:
            handle_list(message);
            break;
        case protocol::Command::Copy:
            handle_download(protocol::Command::Copy, message);
            break;
        case protocol::Command::Cut:
            handle_download(protocol::Command::Cut, message);
            break;
        case protocol::Command::Put:
            handle_put(message);
            break;
        case protocol::Command::Remove:
            handle_remove(message);
            break;
        case protocol::Command::Exit:
            handle_exit();
            break;
        }
    }

    void Session::send(protocol::Message message, std::function<void()> on_sent)
    {
        if (closed())
        {
            return;
        }
        std::vector<std::uint8_t> frame;
        try
        {
            frame = protocol::encode_frame(message);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Session {} failed to encode {} frame: {}", id_, message.command, ex.what());
            if (message.type != protocol::MessageType::Error)
            {
                send_error(message.command, sharebox::ErrorCode::InternalError, "Failed to encode reply");
            }
            return;
        }
        outbound_.push_back(Outbound{.frame = std::move(frame), .on_sent = std::move(on_sent)});
        write_next();
    }

    void Session::send_error(std::string_view command, sharebox::ErrorCode code, std::string_view detail,
                             std::optional<std::string> transfer_id)
    {
        spdlog::debug("Session {} -> ERROR {} {}: {}", id_, command, sharebox::to_string(code), detail);
        send(protocol::make_error(command, code, detail, std::move(transfer_id)));
    }

    void Session::write_next()
    {
        if (writing_ || outbound_.empty())
        {
            return;
        }
        writing_ = true;
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(outbound_.front().frame),
                          [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              writing_ = false;
                              if (state_ == State::Closed)
                              {
                                  return;
                              }
                              if (ec)
                              {
                                  close(session_common::kClientDisconnected);
                                  return;
                              }
                              auto on_sent = std::move(outbound_.front().on_sent);
                              outbound_.pop_front();
                              if (closing_)
                              {
                                  if (outbound_.empty())
                                  {
                                      close(close_reason_);
                                      return;
                                  }
                              }
                              else if (on_sent)
                              {
                                  on_sent();
                              }
                              write_next();
                          });
    }

    void Session::with_chunk_slot(std::function<void()> next)
    {
        if (closed())
        {
            return;
        }
        if (auto slot = services_.chunk_budget.try_acquire())
        {
            chunk_slot_.emplace(std::move(*slot));
            next();
            return;
        }
        retry_timer_.expires_after(session_common::kChunkRetryDelay);
        retry_timer_.async_wait([this, self = shared_from_this(), next = std::move(next)](const std::error_code &ec) mutable
                                {
            if (ec || closed())
            {
                return;
            }
            with_chunk_slot(std::move(next)); });
    }

    void Session::open_record(Operation operation, std::string target_path, std::string transfer_id)
    {
        record_ = PendingRecord{
            .operation = operation,
            .target_path = std::move(target_path),
            .transfer_id = std::move(transfer_id),
        };
        finalizing_ = false;
    }

    void Session::close_record(Outcome outcome, std::string detail)
    {
        if (!record_)
        {
            return;
        }
        LogEntry entry{};
        entry.alias = alias_;
        entry.peer = peer_;
        entry.operation = record_->operation;
        entry.target_path = std::move(record_->target_path);
        entry.transfer_id = std::move(record_->transfer_id);
        entry.outcome = outcome;
        entry.detail = std::move(detail);
        record_.reset();
        finalizing_ = false;
        services_.workers.append_log(std::move(entry));
    }

    void Session::log_event(Operation operation, Outcome outcome, std::string target_path, std::string detail)
    {
        LogEntry entry{};
        entry.alias = alias_;
        entry.peer = peer_;
        entry.operation = operation;
        entry.target_path = std::move(target_path);
        entry.outcome = outcome;
        entry.detail = std::move(detail);
        services_.workers.append_log(std::move(entry));
    }

    void Session::fail_connection(std::string_view command, sharebox::ErrorCode code, std::string_view detail)
    {
        if (closed())
        {
            return;
        }
        spdlog::warn("Session {} ({}): {}: {}", id_, peer_, sharebox::to_string(code), detail);
        std::optional<std::string> transfer_id;
        if (upload_)
        {
            transfer_id = upload_->transfer_id;
        }
        send_error(command, code, detail, std::move(transfer_id));
        closing_ = true;
        close_reason_ = std::string(detail);
        inbound_.clear();
        if (!writing_ && outbound_.empty())
        {
            close(close_reason_);
        }
    }

    void Session::close(std::string_view reason)
    {
        if (state_ == State::Closed)
        {
            return;
        }
        const bool identified = state_ == State::Authenticated;
        state_ = State::Closed;
        closing_ = false;
        busy_ = false;
        inbound_.clear();

        std::error_code ec;
        retry_timer_.cancel();
        chunk_slot_.reset();

        if (upload_)
        {
            services_.workers.abort_upload(upload_->transfer_id);
            upload_.reset();
        }
        if (download_)
        {
            services_.workers.close_source(download_->transfer_id);
            download_.reset();
        }
        awaiting_cut_.reset();
        discarding_.reset();

        // A commit or confirmed delete already handed to the writer logs its
        // own outcome when it completes.
        if (record_ && !finalizing_)
        {
            close_record(Outcome::Failed, std::string(reason));
        }
        if (identified)
        {
            log_event(Operation::Disconnect, Outcome::Ok, {}, std::string(reason));
        }
        services_.registry.remove(id_);

        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        spdlog::info("Session {} closed ({})", id_, reason);
    }

} // namespace sharebox::server
