#include "sharebox/server/session.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "session_common.hpp"

namespace sharebox::server
{

    namespace
    {

        Operation operation_for(protocol::Command command)
        {
            return command == protocol::Command::Cut ? Operation::Cut : Operation::Get;
        }

    } // namespace

    void Session::handle_download(protocol::Command command, const protocol::Message &message)
    {
        const auto request = message.fields.get<protocol::PathRequest>();
        PathReference source;
        try
        {
            source = resolve_and_validate(services_.root, request.path);
        }
        catch (const OperationError &ex)
        {
            log_event(operation_for(command), Outcome::Failed, request.path, ex.what());
            send_error(message.command, ex.code(), ex.what());
            finish_command();
            return;
        }

        auto transfer_id = services_.transfer_ids.next();
        open_record(operation_for(command), source.relative, transfer_id);
        services_.workers.open_source(transfer_id, source, executor(),
                                      [this, self = shared_from_this(), command, transfer_id, source](
                                          std::exception_ptr error, std::uint64_t size) mutable
                                      {
                                          if (closed())
                                          {
                                              if (!error)
                                              {
                                                  services_.workers.close_source(transfer_id);
                                              }
                                              return;
                                          }
                                          if (error)
                                          {
                                              auto failure = session_common::describe_failure(error);
                                              close_record(Outcome::Failed, failure.detail);
                                              send_error(protocol::to_string(command), failure.code, failure.detail,
                                                         transfer_id);
                                              finish_command();
                                              return;
                                          }
                                          spdlog::debug("Session {} streaming {} ({} bytes) as {}", id_,
                                                        source.relative, size, transfer_id);
                                          download_.emplace();
                                          download_->command = command;
                                          download_->transfer_id = std::move(transfer_id);
                                          download_->source = std::move(source);
                                          download_->total_size = size;
                                          send_next_chunk();
                                      });
    }

    void Session::send_next_chunk()
    {
        if (closed() || !download_)
        {
            return;
        }
        if (download_->sent >= download_->total_size)
        {
            finish_download();
            return;
        }

        with_chunk_slot([this]
                        {
            if (!download_)
            {
                return;
            }
            const auto remaining = download_->total_size - download_->sent;
            const auto length = static_cast<std::size_t>(
                std::min<std::uint64_t>(remaining, services_.config.chunk_size));
            services_.workers.read_source(
                download_->transfer_id, download_->sent, length, executor(),
                [this, self = shared_from_this()](std::exception_ptr error, std::vector<std::byte> chunk)
                {
                    if (closed() || !download_)
                    {
                        return;
                    }
                    if (error)
                    {
                        chunk_slot_.reset();
                        auto failure = session_common::describe_failure(error);
                        fail_download(failure.code, failure.detail);
                        return;
                    }
                    if (chunk.empty())
                    {
                        chunk_slot_.reset();
                        fail_download(sharebox::ErrorCode::IOError,
                                      download_->source.relative + " shrank while it was being sent");
                        return;
                    }

                    download_->hash.update(chunk);
                    const protocol::ChunkHeader header{
                        .transfer_id = download_->transfer_id,
                        .offset = download_->sent,
                        .total_size = download_->total_size,
                    };
                    download_->sent += chunk.size();
                    // The next chunk is read only once this one is on the wire.
                    send(protocol::make_data(protocol::to_string(download_->command), header, std::move(chunk)),
                         [this]
                         {
                             chunk_slot_.reset();
                             send_next_chunk();
                         });
                }); });
    }

    void Session::finish_download()
    {
        chunk_slot_.reset();
        auto &download = *download_;
        services_.workers.close_source(download.transfer_id);
        protocol::TransferSummary summary{
            .transfer_id = download.transfer_id,
            .bytes = download.sent,
            .checksum = download.hash.finish(),
            .status = {},
        };

        if (download.command == protocol::Command::Copy)
        {
            summary.status = protocol::status::kComplete;
            close_record(Outcome::Ok, std::to_string(download.sent) + " bytes");
            spdlog::info("{} copied {} ({} bytes)", alias_, download.source.relative, download.sent);
            download_.reset();
            send(protocol::make_response("cp", summary));
            finish_command();
            return;
        }

        // Phase one of a cut is over; the source stays until the client confirms.
        summary.status = protocol::status::kAwaitingConfirmation;
        awaiting_cut_ = SentCopy{
            .transfer_id = download.transfer_id,
            .source = download.source,
            .bytes = download.sent,
            .checksum = *summary.checksum,
        };
        download_.reset();
        send(protocol::make_response("cut", summary));
        finish_command();
    }

    void Session::fail_download(sharebox::ErrorCode code, const std::string &detail)
    {
        const auto command = protocol::to_string(download_->command);
        auto transfer_id = download_->transfer_id;
        spdlog::warn("Session {} transfer {} failed: {}", id_, transfer_id, detail);
        services_.workers.close_source(transfer_id);
        download_.reset();
        close_record(Outcome::Failed, detail);
        send_error(command, code, detail, std::move(transfer_id));
        finish_command();
    }

    void Session::handle_cut_confirmation(const protocol::Message &message)
    {
        if (message.type != protocol::MessageType::Response ||
            message.command != protocol::to_string(protocol::Command::Cut))
        {
            fail_connection(message.command, sharebox::ErrorCode::ProtocolViolation,
                            "Expected delivery confirmation for " + awaiting_cut_->transfer_id);
            return;
        }
        const auto confirmation = message.fields.get<protocol::DeliveryConfirmation>();
        if (confirmation.transfer_id != awaiting_cut_->transfer_id)
        {
            fail_connection(message.command, sharebox::ErrorCode::ProtocolViolation,
                            "Confirmation for unknown transfer " + confirmation.transfer_id);
            return;
        }

        auto sent = std::move(*awaiting_cut_);
        awaiting_cut_.reset();
        std::optional<ConfirmedCopy> confirmed;
        try
        {
            confirmed.emplace(confirm_delivery(sent, confirmation));
        }
        catch (const OperationError &ex)
        {
            close_record(Outcome::Failed, ex.what());
            send_error(message.command, ex.code(), ex.what(), sent.transfer_id);
            finish_command();
            return;
        }

        finalizing_ = true;
        services_.workers.remove_confirmed(
            std::move(*confirmed), executor(),
            [this, self = shared_from_this(), sent](std::exception_ptr error)
            {
                if (error)
                {
                    auto failure = session_common::describe_failure(error);
                    close_record(Outcome::Failed, failure.detail);
                    if (closed())
                    {
                        return;
                    }
                    send_error("cut", failure.code, failure.detail, sent.transfer_id);
                    finish_command();
                    return;
                }
                close_record(Outcome::Ok, std::to_string(sent.bytes) + " bytes");
                spdlog::info("{} cut {} ({} bytes)", alias_, sent.source.relative, sent.bytes);
                if (closed())
                {
                    return;
                }
                const protocol::TransferSummary summary{
                    .transfer_id = sent.transfer_id,
                    .bytes = sent.bytes,
                    .checksum = std::nullopt,
                    .status = std::string(protocol::status::kRemoved),
                };
                send(protocol::make_response("cut", summary));
                finish_command();
            });
    }

} // namespace sharebox::server
