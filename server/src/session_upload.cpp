#include "sharebox/server/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "session_common.hpp"

namespace sharebox::server
{

    void Session::handle_put(const protocol::Message &message)
    {
        const auto request = message.fields.get<protocol::PutRequest>();
        PathReference target;
        try
        {
            target = resolve_and_validate(services_.root, request.path);
        }
        catch (const OperationError &ex)
        {
            log_event(Operation::Put, Outcome::Failed, request.path, ex.what());
            send_error(message.command, ex.code(), ex.what());
            finish_command();
            return;
        }
        if (request.size && *request.size > services_.config.max_upload_bytes)
        {
            const auto detail = "Declared size " + std::to_string(*request.size) + " exceeds the limit of " +
                                std::to_string(services_.config.max_upload_bytes) + " bytes";
            log_event(Operation::Put, Outcome::Failed, target.relative, detail);
            send_error(message.command, sharebox::ErrorCode::QuotaExceeded, detail);
            finish_command();
            return;
        }

        auto transfer_id = services_.transfer_ids.next();
        open_record(Operation::Put, target.relative, transfer_id);
        services_.workers.begin_upload(
            transfer_id, target, executor(),
            [this, self = shared_from_this(), transfer_id, target](std::exception_ptr error)
            {
                if (closed())
                {
                    if (!error)
                    {
                        services_.workers.abort_upload(transfer_id);
                    }
                    return;
                }
                if (error)
                {
                    auto failure = session_common::describe_failure(error);
                    close_record(Outcome::Failed, failure.detail);
                    send_error("put", failure.code, failure.detail, transfer_id);
                    finish_command();
                    return;
                }
                upload_ = UploadState{.transfer_id = transfer_id, .target = target, .received = 0};
                const protocol::TransferReady ready{
                    .transfer_id = transfer_id,
                    .chunk_size = services_.config.chunk_size,
                };
                send(protocol::make_response("put", ready));
                finish_command();
            });
    }

    void Session::handle_upload_frame(const protocol::Message &message)
    {
        const bool is_put = message.command == protocol::to_string(protocol::Command::Put);
        if (is_put && message.type == protocol::MessageType::Data)
        {
            handle_upload_chunk(message);
        }
        else if (is_put && message.type == protocol::MessageType::Response)
        {
            handle_upload_end(message);
        }
        else
        {
            fail_connection(message.command, sharebox::ErrorCode::ProtocolViolation,
                            "Upload " + upload_->transfer_id + " is in progress");
        }
    }

    void Session::handle_upload_chunk(const protocol::Message &message)
    {
        const auto header = message.fields.get<protocol::ChunkHeader>();
        if (header.transfer_id != upload_->transfer_id)
        {
            fail_connection(message.command, sharebox::ErrorCode::ProtocolViolation,
                            "Chunk for unknown transfer " + header.transfer_id);
            return;
        }
        if (header.offset != upload_->received)
        {
            fail_connection(message.command, sharebox::ErrorCode::ProtocolViolation,
                            "Chunk at offset " + std::to_string(header.offset) + ", expected " +
                                std::to_string(upload_->received));
            return;
        }
        if (!message.binary)
        {
            fail_connection(message.command, sharebox::ErrorCode::ProtocolViolation, "DATA frame without payload");
            return;
        }

        auto data = *message.binary;
        upload_->received += data.size();
        with_chunk_slot([this, data = std::move(data)]() mutable
                        {
            if (!upload_)
            {
                return;
            }
            services_.workers.append_upload(
                upload_->transfer_id, std::move(data), executor(),
                [this, self = shared_from_this()](std::exception_ptr error, std::uint64_t /*staged*/)
                {
                    chunk_slot_.reset();
                    if (closed() || !upload_)
                    {
                        return;
                    }
                    if (error)
                    {
                        // The writer has already thrown the staged data away.
                        auto failure = session_common::describe_failure(error);
                        auto transfer_id = upload_->transfer_id;
                        spdlog::warn("Session {} upload {} aborted: {}", id_, transfer_id, failure.detail);
                        upload_.reset();
                        discarding_ = transfer_id;
                        close_record(Outcome::Failed, failure.detail);
                        send_error("put", failure.code, failure.detail, std::move(transfer_id));
                        finish_command();
                        return;
                    }
                    finish_command();
                }); });
    }

    void Session::handle_upload_end(const protocol::Message &message)
    {
        const auto summary = message.fields.get<protocol::TransferSummary>();
        if (summary.transfer_id != upload_->transfer_id)
        {
            fail_connection(message.command, sharebox::ErrorCode::ProtocolViolation,
                            "End of stream for unknown transfer " + summary.transfer_id);
            return;
        }

        auto upload = std::move(*upload_);
        upload_.reset();
        finalizing_ = true;
        services_.workers.commit_upload(
            upload.transfer_id, summary.bytes, summary.checksum, executor(),
            [this, self = shared_from_this(), upload](std::exception_ptr error, CommittedUpload committed)
            {
                if (error)
                {
                    auto failure = session_common::describe_failure(error);
                    close_record(Outcome::Failed, failure.detail);
                    if (closed())
                    {
                        return;
                    }
                    send_error("put", failure.code, failure.detail, upload.transfer_id);
                    finish_command();
                    return;
                }
                close_record(Outcome::Ok, std::to_string(committed.bytes) + " bytes");
                spdlog::info("{} stored {} ({} bytes)", alias_, upload.target.relative, committed.bytes);
                if (closed())
                {
                    return;
                }
                const protocol::TransferSummary stored{
                    .transfer_id = upload.transfer_id,
                    .bytes = committed.bytes,
                    .checksum = committed.checksum,
                    .status = std::string(protocol::status::kStored),
                };
                send(protocol::make_response("put", stored));
                finish_command();
            });
    }

    void Session::handle_discarded_frame(const protocol::Message &message)
    {
        const bool is_put = message.command == protocol::to_string(protocol::Command::Put);
        const bool same_transfer = message.fields.value("transfer_id", std::string{}) == *discarding_;
        if (is_put && same_transfer && message.type == protocol::MessageType::Data)
        {
            finish_command();
            return;
        }
        if (is_put && same_transfer && message.type == protocol::MessageType::Response)
        {
            discarding_.reset();
            finish_command();
            return;
        }
        if (message.type == protocol::MessageType::Request)
        {
            // The client gave up on the aborted upload without an end marker.
            discarding_.reset();
            handle_request(message);
            return;
        }
        fail_connection(message.command, sharebox::ErrorCode::ProtocolViolation,
                        "Unexpected frame after aborted upload " + *discarding_);
    }

} // namespace sharebox::server
