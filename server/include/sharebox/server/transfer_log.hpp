#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;

namespace sharebox::server
{

    enum class Operation : std::uint8_t
    {
        List,
        Get,
        Put,
        Remove,
        Cut,
        Connect,
        Disconnect
    };

    std::string_view to_string(Operation operation) noexcept;
    std::optional<Operation> operation_from_string(std::string_view value) noexcept;

    enum class Outcome : std::uint8_t
    {
        Ok,
        Failed
    };

    std::string_view to_string(Outcome outcome) noexcept;
    std::optional<Outcome> outcome_from_string(std::string_view value) noexcept;

    struct LogEntry
    {
        std::int64_t sequence{};
        std::chrono::system_clock::time_point timestamp{};
        std::string alias;
        std::string peer;
        Operation operation{Operation::List};
        std::string target_path;
        std::string transfer_id;
        Outcome outcome{Outcome::Ok};
        std::string detail;
    };

    struct LogQuery
    {
        std::optional<std::string> alias;
        std::optional<Operation> operation;
        std::optional<Outcome> outcome;
        std::optional<std::string> transfer_id;
        std::optional<std::chrono::system_clock::time_point> since;
        std::optional<std::chrono::system_clock::time_point> until;
        std::optional<std::size_t> limit;
    };

    class TransferLogError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Append-only audit trail of transfers, kept in SQLite. Each append is its
    // own transaction and is durable once append() returns. Entries are totally
    // ordered by sequence and timestamps never go backwards.
    class TransferLog
    {
    public:
        explicit TransferLog(std::filesystem::path database_path);
        ~TransferLog();

        TransferLog(const TransferLog &) = delete;
        TransferLog &operator=(const TransferLog &) = delete;

        // Assigns sequence and timestamp, stores the entry and returns the stored copy.
        LogEntry append(LogEntry entry);

        std::vector<LogEntry> query(const LogQuery &filter = {}) const;

        std::size_t count() const;

        const std::filesystem::path &path() const noexcept { return path_; }

    private:
        void exec_locked(const char *sql) const;

        std::filesystem::path path_;
        sqlite3 *db_{nullptr};
        mutable std::mutex mutex_;
        std::int64_t last_timestamp_ms_{0};
    };

} // namespace sharebox::server
