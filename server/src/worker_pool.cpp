#include "sharebox/server/worker_pool.hpp"

#include "sharebox/crypto.hpp"

namespace sharebox::server
{

    WorkerRole::WorkerRole(std::string name)
        : name_(std::move(name)), idle_guard_(asio::make_work_guard(context_))
    {
        thread_ = std::thread([this]
                              {
            spdlog::debug("{} worker started", name_);
            context_.run();
            spdlog::debug("{} worker stopped", name_); });
    }

    WorkerRole::~WorkerRole()
    {
        shutdown();
    }

    bool WorkerRole::available() const
    {
        std::lock_guard lock(mutex_);
        return accepting_;
    }

    void WorkerRole::shutdown()
    {
        {
            std::lock_guard lock(mutex_);
            if (!accepting_)
            {
                return;
            }
            accepting_ = false;
        }
        idle_guard_.reset();
        if (thread_.joinable())
        {
            thread_.join();
        }
    }

    WorkerPool::WorkerPool(TransferLog &transfer_log, std::filesystem::path staging_dir,
                           std::uint64_t max_upload_bytes)
        : transfer_log_(transfer_log),
          staging_(std::move(staging_dir), max_upload_bytes),
          reader_("reader"),
          writer_("writer"),
          logger_("logger")
    {
    }

    WorkerPool::~WorkerPool()
    {
        shutdown();
    }

    void WorkerPool::list(PathReference directory, Executor reply_to,
                          std::function<void(std::exception_ptr, std::vector<sharebox::protocol::EntryInfo>)> handler)
    {
        reader_.submit([directory = std::move(directory)]
                       { return list_directory(directory); },
                       std::move(reply_to), std::move(handler));
    }

    void WorkerPool::open_source(std::string transfer_id, PathReference file, Executor reply_to,
                                 std::function<void(std::exception_ptr, std::uint64_t)> handler)
    {
        reader_.submit([this, transfer_id = std::move(transfer_id), file = std::move(file)]
                       {
            const auto it = open_sources_.try_emplace(transfer_id, file).first;
            return it->second.size(); },
                       std::move(reply_to), std::move(handler));
    }

    void WorkerPool::read_source(std::string transfer_id, std::uint64_t offset, std::size_t max_bytes,
                                 Executor reply_to,
                                 std::function<void(std::exception_ptr, std::vector<std::byte>)> handler)
    {
        reader_.submit([this, transfer_id = std::move(transfer_id), offset, max_bytes]
                       {
            auto it = open_sources_.find(transfer_id);
            if (it == open_sources_.end())
            {
                throw OperationError(sharebox::ErrorCode::InternalError, "No open source for " + transfer_id);
            }
            return it->second.read(offset, max_bytes); },
                       std::move(reply_to), std::move(handler));
    }

    void WorkerPool::close_source(std::string transfer_id)
    {
        reader_.execute([this, transfer_id = std::move(transfer_id)]
                        { open_sources_.erase(transfer_id); });
    }

    void WorkerPool::begin_upload(std::string transfer_id, PathReference target, Executor reply_to, DoneHandler handler)
    {
        writer_.submit([this, transfer_id = std::move(transfer_id), target = std::move(target)]
                       { staging_.begin(transfer_id, target); },
                       std::move(reply_to), std::move(handler));
    }

    void WorkerPool::append_upload(std::string transfer_id, std::vector<std::byte> data, Executor reply_to,
                                   std::function<void(std::exception_ptr, std::uint64_t)> handler)
    {
        writer_.submit([this, transfer_id = std::move(transfer_id), data = std::move(data)]
                       { return staging_.append(transfer_id, data); },
                       std::move(reply_to), std::move(handler));
    }

    void WorkerPool::commit_upload(std::string transfer_id, std::uint64_t expected_bytes,
                                   std::optional<std::string> expected_checksum, Executor reply_to,
                                   std::function<void(std::exception_ptr, CommittedUpload)> handler)
    {
        writer_.submit([this, transfer_id = std::move(transfer_id), expected_bytes,
                        expected_checksum = std::move(expected_checksum)]
                       { return staging_.commit(transfer_id, expected_bytes, expected_checksum); },
                       std::move(reply_to), std::move(handler));
    }

    void WorkerPool::abort_upload(std::string transfer_id)
    {
        writer_.execute([this, transfer_id = std::move(transfer_id)]
                        {
            if (staging_.abort(transfer_id))
            {
                spdlog::debug("Discarded staged upload {}", transfer_id);
            } });
    }

    void WorkerPool::remove_file(PathReference file, Executor reply_to, DoneHandler handler)
    {
        writer_.submit([file = std::move(file)]
                       { server::remove_file(file); },
                       std::move(reply_to), std::move(handler));
    }

    void WorkerPool::remove_confirmed(ConfirmedCopy copy, Executor reply_to, DoneHandler handler)
    {
        writer_.submit([copy = std::move(copy)]
                       {
            const auto size = server::stat_file(copy.source());
            if (size != copy.bytes() || sharebox::crypto::hash_file(copy.source().absolute) != copy.checksum())
            {
                throw OperationError(sharebox::ErrorCode::Conflict,
                                     copy.source().relative + " changed after it was sent; keeping it");
            }
            server::remove_file(copy.source()); },
                       std::move(reply_to), std::move(handler));
    }

    void WorkerPool::append_log(LogEntry entry)
    {
        logger_.execute([this, entry = std::move(entry)]() mutable
                        { transfer_log_.append(std::move(entry)); });
    }

    void WorkerPool::append_log(LogEntry entry, Executor reply_to,
                                std::function<void(std::exception_ptr, LogEntry)> handler)
    {
        logger_.submit([this, entry = std::move(entry)]() mutable
                       { return transfer_log_.append(std::move(entry)); },
                       std::move(reply_to), std::move(handler));
    }

    void WorkerPool::shutdown()
    {
        reader_.shutdown();
        writer_.shutdown();
        logger_.shutdown();
    }

} // namespace sharebox::server
