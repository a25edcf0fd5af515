/**
 * Tonnerre - Listener accepting inbound connections and dispatching their messages.
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "tonnerre/config.hpp"
#include "tonnerre/connection.hpp"
#include "tonnerre/message.hpp"
#include "tonnerre/stream.hpp"

namespace tonnerre::server
{

    class Listener
    {
    public:
        Listener(std::unique_ptr<Acceptor> acceptor, ConnectionOptions options);
        ~Listener();

        Listener(const Listener &) = delete;
        Listener &operator=(const Listener &) = delete;

        // Throws TransportError.
        void bind(const std::string &host, std::uint16_t port);

        // Starts the accept loop. Every accepted connection dispatches to @p on_message on its own worker.
        void start(MessageHandler on_message, CloseHandler on_close = {});

        /**
         * Stops accepting, closes every tracked connection and waits for their workers.
         * Idempotent; concurrent callers return once the first has finished.
         */
        void stop();

        // Writes to the live connection whose remote endpoint is @p peer. Throws ConnectionClosed if there is none.
        void send(const Endpoint &peer, const Message &message);

        std::size_t connection_count() const;
        Endpoint local_endpoint() const;
        bool is_running() const noexcept { return running_.load(); }

    private:
        void accept_loop();
        void track(std::unique_ptr<StreamSource> stream);
        void untrack(std::uint64_t id);

        std::unique_ptr<Acceptor> acceptor_;
        ConnectionOptions options_;
        ConnectionHandlers handlers_;
        std::thread accept_thread_;
        std::atomic<bool> running_{false};

        mutable std::mutex mutex_;
        std::map<std::uint64_t, std::shared_ptr<Connection>> connections_;
        std::uint64_t next_id_{1};
        bool stopping_{false};

        std::mutex stop_mutex_;
        bool stopped_{false};
    };

    /**
     * Binds a TCP listener on @p config and starts accepting.
     * Throws std::invalid_argument for a bad configuration and TransportError when binding fails.
     */
    std::unique_ptr<Listener> listen(const EndpointConfig &config, MessageHandler on_message,
                                     CloseHandler on_close = {});

    // Same as above over any acceptor implementation.
    std::unique_ptr<Listener> listen(std::unique_ptr<Acceptor> acceptor, const EndpointConfig &config,
                                     MessageHandler on_message, CloseHandler on_close = {});

} // namespace tonnerre::server
