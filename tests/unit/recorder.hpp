#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

#include "tonnerre/connection.hpp"
#include "tonnerre/message.hpp"

namespace tonnerre::test
{

    constexpr auto kWaitLimit = std::chrono::seconds(5);

    // Collects handler callbacks from connection workers.
    class Recorder
    {
    public:
        MessageHandler message_handler()
        {
            return [this](const Message &message, const Endpoint &peer)
            {
                {
                    std::lock_guard lock(mutex_);
                    messages_.push_back(message);
                    peers_.push_back(peer);
                }
                changed_.notify_all();
            };
        }

        CloseHandler close_handler()
        {
            return [this](const Endpoint &, const CloseReason &reason)
            {
                {
                    std::lock_guard lock(mutex_);
                    closes_.push_back(reason);
                }
                changed_.notify_all();
            };
        }

        ConnectionHandlers handlers()
        {
            return ConnectionHandlers{.on_message = message_handler(), .on_close = close_handler()};
        }

        bool wait_for_messages(std::size_t count)
        {
            std::unique_lock lock(mutex_);
            return changed_.wait_for(lock, kWaitLimit, [&]
                                     { return messages_.size() >= count; });
        }

        bool wait_for_closes(std::size_t count)
        {
            std::unique_lock lock(mutex_);
            return changed_.wait_for(lock, kWaitLimit, [&]
                                     { return closes_.size() >= count; });
        }

        std::vector<Message> messages() const
        {
            std::lock_guard lock(mutex_);
            return messages_;
        }

        std::vector<Endpoint> peers() const
        {
            std::lock_guard lock(mutex_);
            return peers_;
        }

        std::vector<CloseReason> closes() const
        {
            std::lock_guard lock(mutex_);
            return closes_;
        }

    private:
        mutable std::mutex mutex_;
        std::condition_variable changed_;
        std::vector<Message> messages_;
        std::vector<Endpoint> peers_;
        std::vector<CloseReason> closes_;
    };

    template <typename Predicate>
    bool eventually(Predicate predicate)
    {
        const auto deadline = std::chrono::steady_clock::now() + kWaitLimit;
        while (!predicate())
        {
            if (std::chrono::steady_clock::now() >= deadline)
            {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return true;
    }

} // namespace tonnerre::test
