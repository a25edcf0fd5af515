/**
 * Tonnerre - Byte stream and acceptor capabilities used by connections and listeners.
 *
 * Connections and listeners only talk to these interfaces, so TCP sockets and in-memory pipes
 * are interchangeable.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace tonnerre
{

    struct Endpoint
    {
        std::string host;
        std::uint16_t port{};

        std::string to_string() const;

        friend bool operator==(const Endpoint &, const Endpoint &) = default;
    };

    class StreamSource
    {
    public:
        virtual ~StreamSource() = default;

        /**
         * Blocks until @p buffer is full or the peer closes the stream.
         * @return number of bytes read; less than buffer.size() only when the stream closed.
         * @throws TimeoutError when @p timeout elapses first, TransportError on I/O failure.
         */
        virtual std::size_t read_exact(std::span<std::uint8_t> buffer,
                                       std::optional<std::chrono::milliseconds> timeout) = 0;

        // Blocks until every byte is handed to the transport. Throws TransportError.
        virtual void write_all(std::span<const std::uint8_t> data) = 0;

        // Wakes blocked readers and writers. Callable from any thread.
        virtual void shutdown() noexcept = 0;

        // Releases the underlying handle. Only the owning worker calls this.
        virtual void close() noexcept = 0;

        virtual Endpoint local_endpoint() const = 0;
        virtual Endpoint remote_endpoint() const = 0;
    };

    class Acceptor
    {
    public:
        virtual ~Acceptor() = default;

        // Throws TransportError when the endpoint cannot be bound.
        virtual void bind(const std::string &host, std::uint16_t port) = 0;

        /**
         * Blocks until a peer connects.
         * @return the new stream, or nullptr once stop() has been called.
         * @throws TransportError when a single accept fails; the acceptor stays usable.
         */
        virtual std::unique_ptr<StreamSource> accept() = 0;

        // Makes pending and future accept() calls return nullptr. Callable from any thread.
        virtual void stop() noexcept = 0;

        virtual Endpoint local_endpoint() const = 0;
    };

} // namespace tonnerre
