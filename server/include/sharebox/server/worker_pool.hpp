/**
 * ShareBox - Reader, writer and logger roles.
 *
 * Every blocking filesystem or store operation runs on one of three dedicated
 * threads so the connection loop never waits on disk. Results are posted back
 * to the executor of the session that asked for them.
 */
#pragma once

#include <asio/any_io_executor.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/post.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "sharebox/error_codes.hpp"
#include "sharebox/protocol.hpp"
#include "sharebox/server/delivery.hpp"
#include "sharebox/server/filesystem.hpp"
#include "sharebox/server/transfer_log.hpp"
#include "sharebox/server/upload_staging.hpp"

namespace sharebox::server
{

    // A named thread with its own FIFO queue of work.
    class WorkerRole
    {
    public:
        explicit WorkerRole(std::string name);
        ~WorkerRole();

        WorkerRole(const WorkerRole &) = delete;
        WorkerRole &operator=(const WorkerRole &) = delete;

        const std::string &name() const noexcept { return name_; }

        bool available() const;

        // Runs `work` on the role thread and posts handler(error, result) to
        // `reply_to`. Once the role is shut down the handler receives a
        // ServiceUnavailable error and `work` is never run.
        template <typename Work, typename Handler>
        void submit(Work work, asio::any_io_executor reply_to, Handler handler)
        {
            using Result = std::invoke_result_t<Work &>;
            auto guard = asio::make_work_guard(reply_to);

            std::lock_guard lock(mutex_);
            if (!accepting_)
            {
                auto error = std::make_exception_ptr(
                    OperationError(sharebox::ErrorCode::ServiceUnavailable, name_ + " worker is not available"));
                asio::post(reply_to, [handler = std::move(handler), guard = std::move(guard), error]() mutable
                           {
                    if constexpr (std::is_void_v<Result>)
                    {
                        handler(error);
                    }
                    else
                    {
                        handler(error, Result{});
                    } });
                return;
            }

            asio::post(context_, [work = std::move(work), reply_to, handler = std::move(handler),
                                  guard = std::move(guard)]() mutable
                       {
                std::exception_ptr error;
                if constexpr (std::is_void_v<Result>)
                {
                    try
                    {
                        work();
                    }
                    catch (...)
                    {
                        error = std::current_exception();
                    }
                    asio::post(reply_to, [handler = std::move(handler), guard = std::move(guard), error]() mutable
                               { handler(error); });
                }
                else
                {
                    Result result{};
                    try
                    {
                        result = work();
                    }
                    catch (...)
                    {
                        error = std::current_exception();
                    }
                    asio::post(reply_to, [handler = std::move(handler), guard = std::move(guard), error,
                                          result = std::move(result)]() mutable
                               { handler(error, std::move(result)); });
                } });
        }

        // Fire and forget. Failures are only reported to the operational log.
        template <typename Work>
        void execute(Work work)
        {
            std::lock_guard lock(mutex_);
            if (!accepting_)
            {
                spdlog::warn("{} worker is not available, dropping task", name_);
                return;
            }
            asio::post(context_, [work = std::move(work), name = name_]() mutable
                       {
                try
                {
                    work();
                }
                catch (const std::exception &ex)
                {
                    spdlog::error("{} worker task failed: {}", name, ex.what());
                } });
        }

        // Drains everything already queued, then stops the thread.
        void shutdown();

    private:
        std::string name_;
        asio::io_context context_;
        asio::executor_work_guard<asio::io_context::executor_type> idle_guard_;
        mutable std::mutex mutex_;
        bool accepting_{true};
        std::thread thread_;
    };

    class WorkerPool
    {
    public:
        using Executor = asio::any_io_executor;
        using DoneHandler = std::function<void(std::exception_ptr)>;

        WorkerPool(TransferLog &transfer_log, std::filesystem::path staging_dir, std::uint64_t max_upload_bytes);
        ~WorkerPool();

        WorkerPool(const WorkerPool &) = delete;
        WorkerPool &operator=(const WorkerPool &) = delete;

        // Reader role
        void list(PathReference directory, Executor reply_to,
                  std::function<void(std::exception_ptr, std::vector<sharebox::protocol::EntryInfo>)> handler);
        // Opens a cp or cut source once; every chunk of the transfer is read
        // from that handle, so a file replaced mid-stream is never mixed in.
        // The handler receives the size at open time.
        void open_source(std::string transfer_id, PathReference file, Executor reply_to,
                         std::function<void(std::exception_ptr, std::uint64_t)> handler);
        void read_source(std::string transfer_id, std::uint64_t offset, std::size_t max_bytes, Executor reply_to,
                         std::function<void(std::exception_ptr, std::vector<std::byte>)> handler);
        void close_source(std::string transfer_id);

        // Writer role
        void begin_upload(std::string transfer_id, PathReference target, Executor reply_to, DoneHandler handler);
        void append_upload(std::string transfer_id, std::vector<std::byte> data, Executor reply_to,
                           std::function<void(std::exception_ptr, std::uint64_t)> handler);
        void commit_upload(std::string transfer_id, std::uint64_t expected_bytes,
                           std::optional<std::string> expected_checksum, Executor reply_to,
                           std::function<void(std::exception_ptr, CommittedUpload)> handler);
        void abort_upload(std::string transfer_id);
        void remove_file(PathReference file, Executor reply_to, DoneHandler handler);
        // Deletes a cut source, provided it is still the content that was sent.
        void remove_confirmed(ConfirmedCopy copy, Executor reply_to, DoneHandler handler);

        // Logger role
        void append_log(LogEntry entry);
        void append_log(LogEntry entry, Executor reply_to, std::function<void(std::exception_ptr, LogEntry)> handler);

        // Reader and writer first, logger last so every queued record is stored.
        void shutdown();

        const WorkerRole &reader() const noexcept { return reader_; }
        const WorkerRole &writer() const noexcept { return writer_; }
        const WorkerRole &logger() const noexcept { return logger_; }

    private:
        TransferLog &transfer_log_;
        UploadStaging staging_;
        // Only touched on the reader thread.
        std::unordered_map<std::string, SourceFile> open_sources_;
        WorkerRole reader_;
        WorkerRole writer_;
        WorkerRole logger_;
    };

} // namespace sharebox::server
