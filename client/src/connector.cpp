#include "tonnerre/client/connector.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "tonnerre/tcp_stream.hpp"

namespace tonnerre::client
{

    ConnectionHandle::ConnectionHandle(std::shared_ptr<Connection> connection)
        : connection_(std::move(connection)) {}

    ConnectionHandle::~ConnectionHandle()
    {
        close();
    }

    void ConnectionHandle::send(const Message &message)
    {
        connection_->send(message);
    }

    Message ConnectionHandle::request(const Message &message, std::optional<std::chrono::milliseconds> timeout)
    {
        return connection_->request(message, timeout);
    }

    std::optional<Message> ConnectionHandle::receive(std::optional<std::chrono::milliseconds> timeout)
    {
        return connection_->receive(timeout);
    }

    void ConnectionHandle::close()
    {
        connection_->close();
        connection_->wait_closed();
    }

    bool ConnectionHandle::is_open() const noexcept
    {
        return connection_->is_open();
    }

    const Endpoint &ConnectionHandle::peer() const noexcept
    {
        return connection_->peer();
    }

    std::optional<CloseReason> ConnectionHandle::close_reason() const
    {
        return connection_->close_reason();
    }

    std::unique_ptr<ConnectionHandle> connect(const EndpointConfig &config, ConnectionHandlers handlers)
    {
        config.validate(false);
        spdlog::debug("Connecting to {}:{}", config.host, config.port);
        auto stream = TcpStream::connect(config.host, config.port);
        return connect(std::move(stream), config.connection_options(), std::move(handlers));
    }

    std::unique_ptr<ConnectionHandle> connect(std::unique_ptr<StreamSource> stream, const ConnectionOptions &options,
                                              ConnectionHandlers handlers)
    {
        auto connection = Connection::open(std::move(stream), Direction::Outbound, options, std::move(handlers));
        return std::make_unique<ConnectionHandle>(std::move(connection));
    }

    std::unique_ptr<ConnectionHandle> connect_service(const ServiceRegistry &registry, const std::string &name,
                                                      ConnectionHandlers handlers)
    {
        const auto &endpoint = registry.endpoint_for(name);
        spdlog::info("Connecting to service '{}' at {}:{}", name, endpoint.host, endpoint.port);
        return connect(endpoint, std::move(handlers));
    }

} // namespace tonnerre::client
