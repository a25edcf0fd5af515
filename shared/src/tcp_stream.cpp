#include "tonnerre/tcp_stream.hpp"

#include <asio/connect.hpp>
#include <asio/write.hpp>

#include <poll.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <limits>
#include <system_error>

#include <spdlog/spdlog.h>

#include "tonnerre/errors.hpp"

namespace tonnerre
{

    namespace
    {

        Endpoint to_endpoint(const asio::ip::tcp::endpoint &endpoint)
        {
            return Endpoint{endpoint.address().to_string(), endpoint.port()};
        }

        void enable_no_delay(asio::ip::tcp::socket &socket)
        {
            std::error_code ec;
            socket.set_option(asio::ip::tcp::no_delay(true), ec);
            if (ec)
            {
                spdlog::debug("Unable to set TCP_NODELAY: {}", ec.message());
            }
        }

    } // namespace

    TcpStream::TcpStream(std::unique_ptr<asio::io_context> io_context, asio::ip::tcp::socket socket)
        : io_context_(std::move(io_context)), socket_(std::move(socket))
    {
        std::error_code ec;
        const auto local = socket_.local_endpoint(ec);
        if (!ec)
        {
            local_ = to_endpoint(local);
        }
        const auto remote = socket_.remote_endpoint(ec);
        if (!ec)
        {
            remote_ = to_endpoint(remote);
        }
    }

    TcpStream::~TcpStream()
    {
        close();
    }

    std::unique_ptr<TcpStream> TcpStream::connect(const std::string &host, std::uint16_t port)
    {
        auto io_context = std::make_unique<asio::io_context>();
        asio::ip::tcp::resolver resolver(*io_context);
        std::error_code ec;
        const auto results = resolver.resolve(host, std::to_string(port), ec);
        if (ec)
        {
            throw TransportError("cannot resolve " + host + ": " + ec.message());
        }

        asio::ip::tcp::socket socket(*io_context);
        asio::connect(socket, results, ec);
        if (ec)
        {
            throw TransportError("cannot connect to " + Endpoint{host, port}.to_string() + ": " + ec.message());
        }
        enable_no_delay(socket);
        return std::make_unique<TcpStream>(std::move(io_context), std::move(socket));
    }

    std::size_t TcpStream::read_exact(std::span<std::uint8_t> buffer,
                                      std::optional<std::chrono::milliseconds> timeout)
    {
        std::optional<std::chrono::steady_clock::time_point> deadline;
        if (timeout)
        {
            deadline = std::chrono::steady_clock::now() + *timeout;
        }

        std::size_t total = 0;
        while (total < buffer.size())
        {
            if (shut_down_.load())
            {
                return total;
            }
            if (deadline)
            {
                wait_readable(*deadline);
            }
            std::error_code ec;
            const auto received = socket_.read_some(asio::buffer(buffer.data() + total, buffer.size() - total), ec);
            if (ec == asio::error::eof)
            {
                return total;
            }
            if (ec)
            {
                if (shut_down_.load())
                {
                    return total;
                }
                throw TransportError("read from " + remote_.to_string() + " failed: " + ec.message());
            }
            total += received;
        }
        return total;
    }

    void TcpStream::wait_readable(std::chrono::steady_clock::time_point deadline)
    {
        pollfd descriptor{};
        descriptor.fd = socket_.native_handle();
        descriptor.events = POLLIN;
        for (;;)
        {
            const auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            const auto wait_ms = std::clamp<std::chrono::milliseconds::rep>(
                remaining.count(), 0, std::numeric_limits<int>::max());
            const int ready = ::poll(&descriptor, 1, static_cast<int>(wait_ms));
            if (ready > 0)
            {
                return;
            }
            if (ready == 0)
            {
                throw TimeoutError("read from " + remote_.to_string() + " timed out");
            }
            if (errno != EINTR)
            {
                throw TransportError("poll on " + remote_.to_string() +
                                     " failed: " + std::system_category().message(errno));
            }
        }
    }

    void TcpStream::write_all(std::span<const std::uint8_t> data)
    {
        std::error_code ec;
        asio::write(socket_, asio::buffer(data.data(), data.size()), ec);
        if (ec)
        {
            throw TransportError("write to " + remote_.to_string() + " failed: " + ec.message());
        }
    }

    void TcpStream::shutdown() noexcept
    {
        if (shut_down_.exchange(true))
        {
            return;
        }
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        if (ec && ec != asio::error::not_connected)
        {
            spdlog::debug("Shutdown of {} reported {}", remote_.to_string(), ec.message());
        }
    }

    void TcpStream::close() noexcept
    {
        shutdown();
        std::error_code ec;
        socket_.close(ec);
    }

    TcpAcceptor::TcpAcceptor() : acceptor_(io_context_) {}

    TcpAcceptor::~TcpAcceptor()
    {
        std::error_code ec;
        acceptor_.close(ec);
    }

    void TcpAcceptor::bind(const std::string &host, std::uint16_t port)
    {
        const auto fail = [&](const std::error_code &ec)
        {
            throw TransportError("cannot listen on " + Endpoint{host, port}.to_string() + ": " + ec.message());
        };

        asio::ip::tcp::resolver resolver(io_context_);
        std::error_code ec;
        const auto results = resolver.resolve(host, std::to_string(port), asio::ip::tcp::resolver::passive, ec);
        if (ec)
        {
            fail(ec);
        }
        if (results.empty())
        {
            fail(std::make_error_code(std::errc::address_not_available));
        }

        const asio::ip::tcp::endpoint endpoint = results.begin()->endpoint();
        acceptor_.open(endpoint.protocol(), ec);
        if (!ec)
        {
            acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
        }
        if (!ec)
        {
            acceptor_.bind(endpoint, ec);
        }
        if (!ec)
        {
            acceptor_.listen(asio::socket_base::max_listen_connections, ec);
        }
        if (ec)
        {
            std::error_code ignored;
            acceptor_.close(ignored);
            fail(ec);
        }
    }

    std::unique_ptr<StreamSource> TcpAcceptor::accept()
    {
        if (stopped_.load())
        {
            return nullptr;
        }
        auto io_context = std::make_unique<asio::io_context>();
        asio::ip::tcp::socket socket(*io_context);
        std::error_code ec;
        acceptor_.accept(socket, ec);
        if (stopped_.load())
        {
            return nullptr;
        }
        if (ec)
        {
            throw TransportError("accept failed: " + ec.message());
        }
        enable_no_delay(socket);
        return std::make_unique<TcpStream>(std::move(io_context), std::move(socket));
    }

    void TcpAcceptor::stop() noexcept
    {
        if (stopped_.exchange(true))
        {
            return;
        }
        if (acceptor_.is_open())
        {
            // Closing the descriptor does not wake a thread blocked in accept(2); shutting it down does.
            if (::shutdown(acceptor_.native_handle(), SHUT_RDWR) != 0)
            {
                spdlog::debug("Listener shutdown reported {}", std::system_category().message(errno));
            }
        }
    }

    Endpoint TcpAcceptor::local_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = acceptor_.local_endpoint(ec);
        if (ec)
        {
            return Endpoint{};
        }
        return to_endpoint(endpoint);
    }

} // namespace tonnerre
