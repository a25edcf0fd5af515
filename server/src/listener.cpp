#include "tonnerre/server/listener.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "tonnerre/errors.hpp"
#include "tonnerre/tcp_stream.hpp"

namespace tonnerre::server
{

    namespace
    {
        // Pause after a failed accept so descriptor exhaustion does not spin the loop.
        constexpr auto kAcceptRetryDelay = std::chrono::milliseconds{50};
    } // namespace

    Listener::Listener(std::unique_ptr<Acceptor> acceptor, ConnectionOptions options)
        : acceptor_(std::move(acceptor)), options_(options) {}

    Listener::~Listener()
    {
        stop();
    }

    void Listener::bind(const std::string &host, std::uint16_t port)
    {
        acceptor_->bind(host, port);
        spdlog::info("Listening on {}", acceptor_->local_endpoint().to_string());
    }

    void Listener::start(MessageHandler on_message, CloseHandler on_close)
    {
        if (!on_message)
        {
            throw std::invalid_argument("listener requires a message handler");
        }
        if (running_.exchange(true))
        {
            throw std::logic_error("listener already started");
        }
        handlers_ = ConnectionHandlers{
            .on_message = std::move(on_message),
            .on_close = std::move(on_close),
        };
        accept_thread_ = std::thread([this]
                                     { accept_loop(); });
    }

    void Listener::stop()
    {
        std::lock_guard stop_lock(stop_mutex_);
        if (stopped_)
        {
            return;
        }
        {
            std::lock_guard lock(mutex_);
            stopping_ = true;
        }
        acceptor_->stop();
        if (accept_thread_.joinable())
        {
            accept_thread_.join();
        }

        std::vector<std::shared_ptr<Connection>> live;
        {
            std::lock_guard lock(mutex_);
            live.reserve(connections_.size());
            for (const auto &[id, connection] : connections_)
            {
                live.push_back(connection);
            }
        }
        for (const auto &connection : live)
        {
            connection->close();
        }
        for (const auto &connection : live)
        {
            connection->wait_closed();
        }

        stopped_ = true;
        running_.store(false);
        spdlog::info("Listener on {} stopped, {} connection(s) closed", acceptor_->local_endpoint().to_string(),
                     live.size());
    }

    void Listener::send(const Endpoint &peer, const Message &message)
    {
        std::shared_ptr<Connection> target;
        {
            std::lock_guard lock(mutex_);
            for (const auto &[id, connection] : connections_)
            {
                if (connection->peer() == peer)
                {
                    target = connection;
                    break;
                }
            }
        }
        if (!target)
        {
            throw ConnectionClosed("no live connection from " + peer.to_string());
        }
        target->send(message);
    }

    std::size_t Listener::connection_count() const
    {
        std::lock_guard lock(mutex_);
        return connections_.size();
    }

    Endpoint Listener::local_endpoint() const
    {
        return acceptor_->local_endpoint();
    }

    void Listener::accept_loop()
    {
        for (;;)
        {
            std::unique_ptr<StreamSource> stream;
            try
            {
                stream = acceptor_->accept();
            }
            catch (const TransportError &ex)
            {
                spdlog::error("Accept error: {}", ex.what());
                std::this_thread::sleep_for(kAcceptRetryDelay);
                continue;
            }
            if (!stream)
            {
                spdlog::debug("Accept loop on {} exiting", acceptor_->local_endpoint().to_string());
                return;
            }

            spdlog::debug("Accepted new connection from {}", stream->remote_endpoint().to_string());
            try
            {
                track(std::move(stream));
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Unable to start connection worker: {}", ex.what());
            }
        }
    }

    void Listener::track(std::unique_ptr<StreamSource> stream)
    {
        std::lock_guard lock(mutex_);
        if (stopping_)
        {
            stream->close();
            return;
        }

        const auto id = next_id_++;
        ConnectionHandlers handlers{
            .on_message = handlers_.on_message,
            .on_close = [this, id](const Endpoint &peer, const CloseReason &reason)
            {
                // Stays tracked until the callback returns so stop() waits for it.
                if (handlers_.on_close)
                {
                    try
                    {
                        handlers_.on_close(peer, reason);
                    }
                    catch (const std::exception &ex)
                    {
                        spdlog::error("Close handler failed for {}: {}", peer.to_string(), ex.what());
                    }
                    catch (...)
                    {
                        spdlog::error("Close handler failed for {} with a non-standard exception", peer.to_string());
                    }
                }
                untrack(id);
            },
        };
        connections_.emplace(id, Connection::open(std::move(stream), Direction::Inbound, options_,
                                                  std::move(handlers)));
    }

    void Listener::untrack(std::uint64_t id)
    {
        std::lock_guard lock(mutex_);
        connections_.erase(id);
    }

    std::unique_ptr<Listener> listen(const EndpointConfig &config, MessageHandler on_message, CloseHandler on_close)
    {
        return listen(std::make_unique<TcpAcceptor>(), config, std::move(on_message), std::move(on_close));
    }

    std::unique_ptr<Listener> listen(std::unique_ptr<Acceptor> acceptor, const EndpointConfig &config,
                                     MessageHandler on_message, CloseHandler on_close)
    {
        config.validate(true);
        auto listener = std::make_unique<Listener>(std::move(acceptor), config.connection_options());
        listener->bind(config.host, config.port);
        listener->start(std::move(on_message), std::move(on_close));
        return listener;
    }

} // namespace tonnerre::server
