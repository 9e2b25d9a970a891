#include "sharebox/server/transfer_log.hpp"

#include <algorithm>
#include <array>
#include <variant>

#include <sqlite3.h>
#include <spdlog/spdlog.h>

namespace sharebox::server
{

    namespace
    {

        constexpr std::array<std::pair<Operation, std::string_view>, 7> kOperationLabels{{
            {Operation::List, "LIST"},
            {Operation::Get, "GET"},
            {Operation::Put, "PUT"},
            {Operation::Remove, "REMOVE"},
            {Operation::Cut, "CUT"},
            {Operation::Connect, "CONNECT"},
            {Operation::Disconnect, "DISCONNECT"},
        }};

        constexpr std::array<std::pair<Outcome, std::string_view>, 2> kOutcomeLabels{{
            {Outcome::Ok, "OK"},
            {Outcome::Failed, "FAILED"},
        }};

        constexpr auto kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS transfer_log (
    sequence     INTEGER PRIMARY KEY AUTOINCREMENT,
    timestamp_ms INTEGER NOT NULL,
    alias        TEXT NOT NULL,
    peer         TEXT NOT NULL DEFAULT '',
    operation    TEXT NOT NULL,
    target_path  TEXT NOT NULL DEFAULT '',
    transfer_id  TEXT NOT NULL DEFAULT '',
    outcome      TEXT NOT NULL,
    detail       TEXT NOT NULL DEFAULT ''
);

CREATE INDEX IF NOT EXISTS idx_transfer_log_alias_time
    ON transfer_log(alias, timestamp_ms);
)SQL";

        using BindValue = std::variant<std::int64_t, std::string>;

        class Statement
        {
        public:
            Statement(sqlite3 *db, const std::string &sql) : db_(db)
            {
                if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK)
                {
                    throw TransferLogError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
                }
            }

            ~Statement()
            {
                sqlite3_finalize(stmt_);
            }

            Statement(const Statement &) = delete;
            Statement &operator=(const Statement &) = delete;

            void bind(int index, const BindValue &value)
            {
                int rc = SQLITE_OK;
                if (const auto *number = std::get_if<std::int64_t>(&value))
                {
                    rc = sqlite3_bind_int64(stmt_, index, *number);
                }
                else
                {
                    const auto &text = std::get<std::string>(value);
                    rc = sqlite3_bind_text(stmt_, index, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
                }
                if (rc != SQLITE_OK)
                {
                    throw TransferLogError(std::string("Failed to bind parameter: ") + sqlite3_errmsg(db_));
                }
            }

            // true while rows are available
            bool step()
            {
                const auto rc = sqlite3_step(stmt_);
                if (rc == SQLITE_ROW)
                {
                    return true;
                }
                if (rc == SQLITE_DONE)
                {
                    return false;
                }
                throw TransferLogError(std::string("SQLite step failed: ") + sqlite3_errmsg(db_));
            }

            std::int64_t column_int(int index) const
            {
                return sqlite3_column_int64(stmt_, index);
            }

            std::string column_text(int index) const
            {
                const auto *text = sqlite3_column_text(stmt_, index);
                return text ? std::string(reinterpret_cast<const char *>(text)) : std::string{};
            }

        private:
            sqlite3 *db_;
            sqlite3_stmt *stmt_{nullptr};
        };

        std::int64_t to_millis(std::chrono::system_clock::time_point time)
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
        }

        std::chrono::system_clock::time_point from_millis(std::int64_t millis)
        {
            return std::chrono::system_clock::time_point{std::chrono::milliseconds{millis}};
        }

    } // namespace

    std::string_view to_string(Operation operation) noexcept
    {
        for (const auto &[value, label] : kOperationLabels)
        {
            if (value == operation)
            {
                return label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Operation> operation_from_string(std::string_view value) noexcept
    {
        for (const auto &[operation, label] : kOperationLabels)
        {
            if (label == value)
            {
                return operation;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(Outcome outcome) noexcept
    {
        for (const auto &[value, label] : kOutcomeLabels)
        {
            if (value == outcome)
            {
                return label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Outcome> outcome_from_string(std::string_view value) noexcept
    {
        for (const auto &[outcome, label] : kOutcomeLabels)
        {
            if (label == value)
            {
                return outcome;
            }
        }
        return std::nullopt;
    }

    TransferLog::TransferLog(std::filesystem::path database_path) : path_(std::move(database_path))
    {
        if (path_.has_parent_path())
        {
            std::filesystem::create_directories(path_.parent_path());
        }
        if (sqlite3_open(path_.string().c_str(), &db_) != SQLITE_OK)
        {
            std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
            sqlite3_close(db_);
            db_ = nullptr;
            throw TransferLogError("Cannot open transfer log " + path_.string() + ": " + message);
        }
        sqlite3_busy_timeout(db_, 5000);

        std::lock_guard lock(mutex_);
        try
        {
            exec_locked("PRAGMA journal_mode = WAL;");
            exec_locked("PRAGMA synchronous = FULL;");
            exec_locked(kSchema);
            Statement last(db_, "SELECT COALESCE(MAX(timestamp_ms), 0) FROM transfer_log;");
            if (last.step())
            {
                last_timestamp_ms_ = last.column_int(0);
            }
        }
        catch (...)
        {
            sqlite3_close(db_);
            db_ = nullptr;
            throw;
        }
        spdlog::info("Transfer log opened at {}", path_.string());
    }

    TransferLog::~TransferLog()
    {
        if (db_)
        {
            sqlite3_close(db_);
        }
    }

    LogEntry TransferLog::append(LogEntry entry)
    {
        std::lock_guard lock(mutex_);

        auto timestamp_ms = entry.timestamp == std::chrono::system_clock::time_point{}
                                ? to_millis(std::chrono::system_clock::now())
                                : to_millis(entry.timestamp);
        timestamp_ms = std::max(timestamp_ms, last_timestamp_ms_);

        exec_locked("BEGIN IMMEDIATE;");
        try
        {
            Statement insert(db_, "INSERT INTO transfer_log (timestamp_ms, alias, peer, operation, target_path, "
                                  "transfer_id, outcome, detail) VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
            insert.bind(1, timestamp_ms);
            insert.bind(2, entry.alias);
            insert.bind(3, entry.peer);
            insert.bind(4, std::string(to_string(entry.operation)));
            insert.bind(5, entry.target_path);
            insert.bind(6, entry.transfer_id);
            insert.bind(7, std::string(to_string(entry.outcome)));
            insert.bind(8, entry.detail);
            insert.step();
            entry.sequence = sqlite3_last_insert_rowid(db_);
            exec_locked("COMMIT;");
        }
        catch (...)
        {
            char *errmsg = nullptr;
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &errmsg);
            if (errmsg)
            {
                spdlog::error("Transfer log rollback failed: {}", errmsg);
                sqlite3_free(errmsg);
            }
            throw;
        }

        last_timestamp_ms_ = timestamp_ms;
        entry.timestamp = from_millis(timestamp_ms);
        return entry;
    }

    std::vector<LogEntry> TransferLog::query(const LogQuery &filter) const
    {
        std::string sql = "SELECT sequence, timestamp_ms, alias, peer, operation, target_path, transfer_id, outcome, "
                          "detail FROM transfer_log WHERE 1 = 1";
        std::vector<BindValue> binds;
        if (filter.alias)
        {
            sql += " AND alias = ?";
            binds.emplace_back(*filter.alias);
        }
        if (filter.operation)
        {
            sql += " AND operation = ?";
            binds.emplace_back(std::string(to_string(*filter.operation)));
        }
        if (filter.outcome)
        {
            sql += " AND outcome = ?";
            binds.emplace_back(std::string(to_string(*filter.outcome)));
        }
        if (filter.transfer_id)
        {
            sql += " AND transfer_id = ?";
            binds.emplace_back(*filter.transfer_id);
        }
        if (filter.since)
        {
            sql += " AND timestamp_ms >= ?";
            binds.emplace_back(to_millis(*filter.since));
        }
        if (filter.until)
        {
            sql += " AND timestamp_ms <= ?";
            binds.emplace_back(to_millis(*filter.until));
        }
        sql += " ORDER BY sequence ASC";
        if (filter.limit)
        {
            sql += " LIMIT ?";
            binds.emplace_back(static_cast<std::int64_t>(*filter.limit));
        }
        sql += ";";

        std::lock_guard lock(mutex_);
        Statement select(db_, sql);
        for (std::size_t i = 0; i < binds.size(); ++i)
        {
            select.bind(static_cast<int>(i + 1), binds[i]);
        }

        std::vector<LogEntry> entries;
        while (select.step())
        {
            LogEntry entry{};
            entry.sequence = select.column_int(0);
            entry.timestamp = from_millis(select.column_int(1));
            entry.alias = select.column_text(2);
            entry.peer = select.column_text(3);
            entry.operation = operation_from_string(select.column_text(4)).value_or(Operation::List);
            entry.target_path = select.column_text(5);
            entry.transfer_id = select.column_text(6);
            entry.outcome = outcome_from_string(select.column_text(7)).value_or(Outcome::Failed);
            entry.detail = select.column_text(8);
            entries.push_back(std::move(entry));
        }
        return entries;
    }

    std::size_t TransferLog::count() const
    {
        std::lock_guard lock(mutex_);
        Statement select(db_, "SELECT COUNT(*) FROM transfer_log;");
        return select.step() ? static_cast<std::size_t>(select.column_int(0)) : 0;
    }

    void TransferLog::exec_locked(const char *sql) const
    {
        char *errmsg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg) != SQLITE_OK)
        {
            std::string message = errmsg ? errmsg : "unknown SQLite error";
            sqlite3_free(errmsg);
            throw TransferLogError(message);
        }
    }

} // namespace sharebox::server
