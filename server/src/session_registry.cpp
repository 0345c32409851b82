#include "minishare/server/session_registry.hpp"

#include <algorithm>

#include "minishare/server/session.hpp"

namespace minishare::server
{

    bool SessionRegistry::try_register(const std::shared_ptr<Session> &session)
    {
        std::lock_guard lock(mutex_);
        if (closed_)
        {
            return false;
        }
        sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                       [](const std::weak_ptr<Session> &weak)
                                       { return weak.expired(); }),
                        sessions_.end());
        sessions_.push_back(session);
        return true;
    }

    void SessionRegistry::unregister(const Session *session)
    {
        std::lock_guard lock(mutex_);
        sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                       [session](const std::weak_ptr<Session> &weak)
                                       {
                                           auto ptr = weak.lock();
                                           return !ptr || ptr.get() == session;
                                       }),
                        sessions_.end());
        if (sessions_.empty())
        {
            emptied_.notify_all();
        }
    }

    std::size_t SessionRegistry::size() const
    {
        std::lock_guard lock(mutex_);
        return static_cast<std::size_t>(std::count_if(sessions_.begin(), sessions_.end(),
                                                      [](const std::weak_ptr<Session> &weak)
                                                      { return !weak.expired(); }));
    }

    void SessionRegistry::request_stop_all()
    {
        std::vector<std::shared_ptr<Session>> sessions;
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
            sessions = snapshot_locked();
        }
        for (const auto &session : sessions)
        {
            session->request_stop();
        }
    }

    void SessionRegistry::interrupt_all()
    {
        std::vector<std::shared_ptr<Session>> sessions;
        {
            std::lock_guard lock(mutex_);
            sessions = snapshot_locked();
        }
        for (const auto &session : sessions)
        {
            session->interrupt();
        }
    }

    bool SessionRegistry::wait_until_empty(std::chrono::milliseconds timeout)
    {
        std::unique_lock lock(mutex_);
        return emptied_.wait_for(lock, timeout, [this]
                                 { return std::all_of(sessions_.begin(), sessions_.end(),
                                                      [](const std::weak_ptr<Session> &weak)
                                                      { return weak.expired(); }); });
    }

    std::vector<std::shared_ptr<Session>> SessionRegistry::snapshot_locked() const
    {
        std::vector<std::shared_ptr<Session>> sessions;
        sessions.reserve(sessions_.size());
        for (const auto &weak : sessions_)
        {
            if (auto session = weak.lock())
            {
                sessions.push_back(std::move(session));
            }
        }
        return sessions;
    }

} // namespace minishare::server
