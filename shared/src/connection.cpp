#include "tonnerre/connection.hpp"

#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "tonnerre/errors.hpp"
#include "tonnerre/framing.hpp"

namespace tonnerre
{

    namespace
    {

        std::string_view direction_label(Direction direction)
        {
            return direction == Direction::Inbound ? "inbound" : "outbound";
        }

    } // namespace

    std::shared_ptr<Connection> Connection::open(std::unique_ptr<StreamSource> stream, Direction direction,
                                                 ConnectionOptions options, ConnectionHandlers handlers)
    {
        auto connection = std::make_shared<Connection>(std::move(stream), direction, options, std::move(handlers));
        std::lock_guard lock(connection->lifecycle_mutex_);
        connection->worker_ = std::thread([self = connection]
                                          { self->run(); });
        return connection;
    }

    Connection::Connection(std::unique_ptr<StreamSource> stream, Direction direction, ConnectionOptions options,
                           ConnectionHandlers handlers)
        : stream_(std::move(stream)),
          direction_(direction),
          options_(options),
          handlers_(std::move(handlers)),
          local_(stream_->local_endpoint()),
          peer_(stream_->remote_endpoint()) {}

    Connection::~Connection()
    {
        if (worker_.joinable())
        {
            if (on_worker_thread())
            {
                worker_.detach();
            }
            else
            {
                worker_.join();
            }
        }
    }

    void Connection::send(const Message &message)
    {
        // Encode before taking the lock so an oversized message never touches the stream.
        const auto frame = protocol::encode_frame(message);

        std::lock_guard lock(write_mutex_);
        if (!is_open())
        {
            throw ConnectionClosed("connection to " + peer_.to_string() + " is closed");
        }
        try
        {
            stream_->write_all(frame);
        }
        catch (const TransportError &ex)
        {
            if (!is_open())
            {
                throw ConnectionClosed("connection to " + peer_.to_string() + " closed during send");
            }
            request_close(CloseReason{ErrorCode::TransportError, ex.what()});
            throw;
        }
    }

    void Connection::close()
    {
        request_close(CloseReason{ErrorCode::Ok, "closed locally"});
    }

    std::optional<Message> Connection::receive(std::optional<std::chrono::milliseconds> timeout)
    {
        if (handlers_.on_message)
        {
            throw std::logic_error("receive() is only available on connections without a message handler");
        }

        std::unique_lock lock(lifecycle_mutex_);
        const auto ready = [this]
        { return !mailbox_.empty() || finished_; };
        if (timeout)
        {
            if (!lifecycle_changed_.wait_for(lock, *timeout, ready))
            {
                throw TimeoutError("no message from " + peer_.to_string() + " within " +
                                   std::to_string(timeout->count()) + " ms");
            }
        }
        else
        {
            lifecycle_changed_.wait(lock, ready);
        }

        if (mailbox_.empty())
        {
            return std::nullopt;
        }
        auto message = std::move(mailbox_.front());
        mailbox_.pop_front();
        lock.unlock();
        // The worker may be waiting for room in a full mailbox.
        lifecycle_changed_.notify_all();
        return message;
    }

    Message Connection::request(const Message &message, std::optional<std::chrono::milliseconds> timeout)
    {
        send(message);
        auto reply = receive(timeout);
        if (!reply)
        {
            throw ConnectionClosed("connection to " + peer_.to_string() + " closed before a reply arrived");
        }
        return std::move(*reply);
    }

    void Connection::wait_closed()
    {
        if (on_worker_thread())
        {
            return;
        }
        std::unique_lock lock(lifecycle_mutex_);
        lifecycle_changed_.wait(lock, [this]
                                { return finished_; });
    }

    std::optional<CloseReason> Connection::close_reason() const
    {
        std::lock_guard lock(lifecycle_mutex_);
        return close_reason_;
    }

    std::size_t Connection::pending() const
    {
        std::lock_guard lock(lifecycle_mutex_);
        return mailbox_.size();
    }

    void Connection::run()
    {
        {
            // open() holds the lock until worker_ is assigned.
            std::lock_guard lock(lifecycle_mutex_);
        }
        spdlog::info("Connection {} {} open", direction_label(direction_), peer_.to_string());

        CloseReason reason{ErrorCode::Ok, "peer disconnected"};
        try
        {
            while (enter(ConnectionState::Reading))
            {
                auto message = protocol::read_frame(*stream_, options_.read_timeout, options_.max_body_size);
                if (!message)
                {
                    break;
                }
                if (!enter(ConnectionState::Dispatching))
                {
                    break;
                }
                dispatch(*message);
            }
        }
        catch (const MessagingError &ex)
        {
            reason = CloseReason{ex.code(), ex.what()};
        }
        catch (const std::exception &ex)
        {
            reason = CloseReason{ErrorCode::TransportError, ex.what()};
        }
        finish(std::move(reason));
    }

    bool Connection::enter(ConnectionState next)
    {
        auto current = state_.load();
        while (current != ConnectionState::Closed)
        {
            if (state_.compare_exchange_weak(current, next))
            {
                return true;
            }
        }
        return false;
    }

    void Connection::dispatch(const Message &message)
    {
        if (!handlers_.on_message)
        {
            {
                std::unique_lock lock(lifecycle_mutex_);
                lifecycle_changed_.wait(lock, [this]
                                        { return mailbox_.size() < options_.mailbox_capacity || !is_open(); });
                if (!is_open())
                {
                    return;
                }
                mailbox_.push_back(message);
            }
            lifecycle_changed_.notify_all();
            return;
        }

        try
        {
            handlers_.on_message(message, peer_);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Message handler failed for {}: {}", peer_.to_string(), ex.what());
        }
        catch (...)
        {
            spdlog::error("Message handler failed for {} with a non-standard exception", peer_.to_string());
        }
    }

    void Connection::request_close(CloseReason reason)
    {
        {
            std::lock_guard lock(lifecycle_mutex_);
            if (!requested_reason_)
            {
                requested_reason_ = std::move(reason);
            }
            state_.store(ConnectionState::Closed);
            if (!stream_released_)
            {
                stream_->shutdown();
            }
        }
        lifecycle_changed_.notify_all();
    }

    void Connection::finish(CloseReason reason)
    {
        state_.store(ConnectionState::Closed);
        {
            std::lock_guard lock(lifecycle_mutex_);
            if (requested_reason_)
            {
                reason = *requested_reason_;
            }
            stream_released_ = true;
        }
        stream_->shutdown();
        {
            // A sender blocked in write_all() has been woken by shutdown(); wait it out before closing.
            std::lock_guard lock(write_mutex_);
            stream_->close();
        }

        if (reason.code == ErrorCode::Ok)
        {
            spdlog::info("Connection {} closed: {}", peer_.to_string(), reason.detail);
        }
        else
        {
            spdlog::warn("Connection {} closed on {}: {}", peer_.to_string(), to_string(reason.code), reason.detail);
        }

        if (handlers_.on_close)
        {
            try
            {
                handlers_.on_close(peer_, reason);
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Close handler failed for {}: {}", peer_.to_string(), ex.what());
            }
            catch (...)
            {
                spdlog::error("Close handler failed for {} with a non-standard exception", peer_.to_string());
            }
        }

        {
            std::lock_guard lock(lifecycle_mutex_);
            close_reason_ = std::move(reason);
            finished_ = true;
        }
        lifecycle_changed_.notify_all();
    }

    bool Connection::on_worker_thread() const
    {
        return worker_.get_id() == std::this_thread::get_id();
    }

} // namespace tonnerre
