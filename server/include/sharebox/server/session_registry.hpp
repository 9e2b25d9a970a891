#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sharebox::server
{

    class Session;

    struct SessionSummary
    {
        std::uint64_t id{};
        std::string alias;
        std::string peer;
    };

    // Live sessions of one server, keyed by session id.
    class SessionRegistry
    {
    public:
        explicit SessionRegistry(std::size_t max_sessions);

        // Reserves a slot for a new connection. Returns nullopt once
        // max_sessions connections are live.
        std::optional<std::uint64_t> try_admit(const std::string &peer);

        void attach(std::uint64_t id, const std::shared_ptr<Session> &session);
        void attach_alias(std::uint64_t id, const std::string &alias);
        void remove(std::uint64_t id);

        std::size_t size() const;
        std::vector<SessionSummary> snapshot() const;

        // Asks every live session to close. Sessions unregister themselves.
        void close_all();

    private:
        struct Entry
        {
            std::string alias;
            std::string peer;
            std::weak_ptr<Session> session;
        };

        std::size_t max_sessions_;
        mutable std::mutex mutex_;
        std::uint64_t next_id_{1};
        std::map<std::uint64_t, Entry> sessions_;
    };

} // namespace sharebox::server
