/**
 * Tonnerre - Outbound connections and the handle returned to callers.
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "tonnerre/config.hpp"
#include "tonnerre/connection.hpp"
#include "tonnerre/message.hpp"
#include "tonnerre/stream.hpp"

namespace tonnerre::client
{

    // Owns one outbound connection; destroying the handle closes it.
    class ConnectionHandle
    {
    public:
        explicit ConnectionHandle(std::shared_ptr<Connection> connection);
        ~ConnectionHandle();

        ConnectionHandle(const ConnectionHandle &) = delete;
        ConnectionHandle &operator=(const ConnectionHandle &) = delete;

        void send(const Message &message);

        // Only for handles opened without a message handler.
        Message request(const Message &message, std::optional<std::chrono::milliseconds> timeout = std::nullopt);
        std::optional<Message> receive(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

        // Closes and waits for the read worker to exit.
        void close();

        bool is_open() const noexcept;
        const Endpoint &peer() const noexcept;
        std::optional<CloseReason> close_reason() const;

    private:
        std::shared_ptr<Connection> connection_;
    };

    /**
     * Opens a TCP connection to @p config.host:@p config.port.
     * Throws std::invalid_argument for a bad configuration and TransportError when the peer is unreachable.
     */
    std::unique_ptr<ConnectionHandle> connect(const EndpointConfig &config, ConnectionHandlers handlers = {});

    // Wraps an already established stream.
    std::unique_ptr<ConnectionHandle> connect(std::unique_ptr<StreamSource> stream, const ConnectionOptions &options,
                                              ConnectionHandlers handlers = {});

    // Throws std::out_of_range when @p name is not registered.
    std::unique_ptr<ConnectionHandle> connect_service(const ServiceRegistry &registry, const std::string &name,
                                                      ConnectionHandlers handlers = {});

} // namespace tonnerre::client
