#include "sharebox/server/session_registry.hpp"

#include "sharebox/server/session.hpp"

namespace sharebox::server
{

    SessionRegistry::SessionRegistry(std::size_t max_sessions) : max_sessions_(max_sessions) {}

    std::optional<std::uint64_t> SessionRegistry::try_admit(const std::string &peer)
    {
        std::lock_guard lock(mutex_);
        if (sessions_.size() >= max_sessions_)
        {
            return std::nullopt;
        }
        const auto id = next_id_++;
        sessions_.emplace(id, Entry{.alias = {}, .peer = peer, .session = {}});
        return id;
    }

    void SessionRegistry::attach(std::uint64_t id, const std::shared_ptr<Session> &session)
    {
        std::lock_guard lock(mutex_);
        if (auto it = sessions_.find(id); it != sessions_.end())
        {
            it->second.session = session;
        }
    }

    void SessionRegistry::attach_alias(std::uint64_t id, const std::string &alias)
    {
        std::lock_guard lock(mutex_);
        if (auto it = sessions_.find(id); it != sessions_.end())
        {
            it->second.alias = alias;
        }
    }

    void SessionRegistry::remove(std::uint64_t id)
    {
        std::lock_guard lock(mutex_);
        sessions_.erase(id);
    }

    std::size_t SessionRegistry::size() const
    {
        std::lock_guard lock(mutex_);
        return sessions_.size();
    }

    std::vector<SessionSummary> SessionRegistry::snapshot() const
    {
        std::lock_guard lock(mutex_);
        std::vector<SessionSummary> result;
        result.reserve(sessions_.size());
        for (const auto &[id, entry] : sessions_)
        {
            result.push_back(SessionSummary{.id = id, .alias = entry.alias, .peer = entry.peer});
        }
        return result;
    }

    void SessionRegistry::close_all()
    {
        std::vector<std::shared_ptr<Session>> live;
        {
            std::lock_guard lock(mutex_);
            for (const auto &[id, entry] : sessions_)
            {
                if (auto session = entry.session.lock())
                {
                    live.push_back(std::move(session));
                }
            }
        }
        // Stopped outside the lock: closing sessions call remove().
        for (const auto &session : live)
        {
            session->stop();
        }
    }

} // namespace sharebox::server
