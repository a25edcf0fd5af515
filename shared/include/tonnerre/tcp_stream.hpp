/**
 * Tonnerre - TCP implementations of the stream and acceptor capabilities on standalone Asio.
 */
#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <atomic>
#include <memory>
#include <string>

#include "tonnerre/stream.hpp"

namespace tonnerre
{

    class TcpStream final : public StreamSource
    {
    public:
        TcpStream(std::unique_ptr<asio::io_context> io_context, asio::ip::tcp::socket socket);
        ~TcpStream() override;

        // Resolves @p host and connects to the first reachable address. Throws TransportError.
        static std::unique_ptr<TcpStream> connect(const std::string &host, std::uint16_t port);

        std::size_t read_exact(std::span<std::uint8_t> buffer,
                               std::optional<std::chrono::milliseconds> timeout) override;
        void write_all(std::span<const std::uint8_t> data) override;
        void shutdown() noexcept override;
        void close() noexcept override;

        Endpoint local_endpoint() const override { return local_; }
        Endpoint remote_endpoint() const override { return remote_; }

    private:
        void wait_readable(std::chrono::steady_clock::time_point deadline);

        // One context per socket so a stream never depends on the acceptor that produced it.
        std::unique_ptr<asio::io_context> io_context_;
        asio::ip::tcp::socket socket_;
        Endpoint local_;
        Endpoint remote_;
        std::atomic<bool> shut_down_{false};
    };

    class TcpAcceptor final : public Acceptor
    {
    public:
        TcpAcceptor();
        ~TcpAcceptor() override;

        void bind(const std::string &host, std::uint16_t port) override;
        std::unique_ptr<StreamSource> accept() override;
        void stop() noexcept override;
        Endpoint local_endpoint() const override;

    private:
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        std::atomic<bool> stopped_{false};
    };

} // namespace tonnerre
