/**
 * Tonnerre - One live stream connection: a serial read/dispatch worker plus a locked send path.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "tonnerre/config.hpp"
#include "tonnerre/error_codes.hpp"
#include "tonnerre/message.hpp"
#include "tonnerre/stream.hpp"

namespace tonnerre
{

    enum class ConnectionState : std::uint8_t
    {
        Open,
        Reading,
        Dispatching,
        Closed
    };

    enum class Direction : std::uint8_t
    {
        Inbound,
        Outbound
    };

    // ErrorCode::Ok means an orderly close by either side.
    struct CloseReason
    {
        ErrorCode code{ErrorCode::Ok};
        std::string detail;
    };

    using MessageHandler = std::function<void(const Message &message, const Endpoint &peer)>;
    using CloseHandler = std::function<void(const Endpoint &peer, const CloseReason &reason)>;

    struct ConnectionHandlers
    {
        // Without a message handler, inbound messages queue for receive().
        MessageHandler on_message{};
        CloseHandler on_close{};
    };

    class Connection : public std::enable_shared_from_this<Connection>
    {
    public:
        // Wraps @p stream and starts its worker, which begins in Reading.
        static std::shared_ptr<Connection> open(std::unique_ptr<StreamSource> stream, Direction direction,
                                                ConnectionOptions options, ConnectionHandlers handlers);

        Connection(std::unique_ptr<StreamSource> stream, Direction direction, ConnectionOptions options,
                   ConnectionHandlers handlers);
        ~Connection();

        Connection(const Connection &) = delete;
        Connection &operator=(const Connection &) = delete;

        /**
         * Encodes and writes one frame; concurrent senders never interleave.
         * @throws ConnectionClosed once closed, PayloadTooLarge (connection stays usable),
         *         TransportError (connection is closed).
         */
        void send(const Message &message);

        // Idempotent. Interrupts a blocked read; on_close still fires once from the worker.
        void close();

        /**
         * Next queued inbound message, for connections opened without a message handler.
         * Once ConnectionOptions::mailbox_capacity messages are queued the worker stops reading
         * until one is taken, leaving the peer to the transport's backpressure.
         * @return nullopt once the connection is closed and the queue is drained.
         * @throws TimeoutError when nothing arrives within @p timeout; the connection stays open.
         */
        std::optional<Message> receive(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

        // send() followed by receive(). Throws ConnectionClosed if the peer closes without replying.
        Message request(const Message &message, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

        // Blocks until the worker has exited and on_close has run. Returns at once on the worker itself.
        void wait_closed();

        ConnectionState state() const noexcept { return state_.load(); }
        bool is_open() const noexcept { return state() != ConnectionState::Closed; }
        Direction direction() const noexcept { return direction_; }
        const Endpoint &peer() const noexcept { return peer_; }
        const Endpoint &local() const noexcept { return local_; }

        // Set once the worker has finished.
        std::optional<CloseReason> close_reason() const;

        // Messages queued for receive().
        std::size_t pending() const;

    private:
        void run();
        bool enter(ConnectionState next);
        void dispatch(const Message &message);
        void request_close(CloseReason reason);
        void finish(CloseReason reason);
        bool on_worker_thread() const;

        std::unique_ptr<StreamSource> stream_;
        Direction direction_;
        ConnectionOptions options_;
        ConnectionHandlers handlers_;
        Endpoint local_;
        Endpoint peer_;
        std::atomic<ConnectionState> state_{ConnectionState::Open};

        std::mutex write_mutex_;

        mutable std::mutex lifecycle_mutex_;
        std::condition_variable lifecycle_changed_;
        std::optional<CloseReason> requested_reason_;
        std::optional<CloseReason> close_reason_;
        bool stream_released_{false};
        bool finished_{false};
        std::deque<Message> mailbox_;

        std::thread worker_;
    };

} // namespace tonnerre
