#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace minishare::server
{

    class Session;

    // Live sessions of one acceptor, tracked for shutdown signalling only.
    class SessionRegistry
    {
    public:
        // Returns false once request_stop_all() has been called.
        bool try_register(const std::shared_ptr<Session> &session);
        void unregister(const Session *session);

        std::size_t size() const;

        // Closes the registry and asks every session to end after its current command.
        void request_stop_all();

        // Shuts every remaining session's socket down.
        void interrupt_all();

        // True when the registry emptied before the timeout.
        bool wait_until_empty(std::chrono::milliseconds timeout);

    private:
        std::vector<std::shared_ptr<Session>> snapshot_locked() const;

        mutable std::mutex mutex_;
        std::condition_variable emptied_;
        std::vector<std::weak_ptr<Session>> sessions_;
        bool closed_{false};
    };

} // namespace minishare::server
