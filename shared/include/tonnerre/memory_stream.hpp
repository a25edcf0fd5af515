/**
 * Tonnerre - In-process pipes implementing the stream and acceptor capabilities.
 */
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>

#include "tonnerre/stream.hpp"

namespace tonnerre
{

    class MemoryStream final : public StreamSource
    {
    public:
        struct Channel
        {
            std::mutex mutex;
            std::condition_variable ready;
            std::deque<std::uint8_t> bytes;
            bool closed{false};
        };

        /**
         * Creates two connected ends. A non-zero @p max_read_chunk caps how many bytes each
         * internal read step takes, to exercise reassembly across partial reads.
         */
        static std::pair<std::unique_ptr<MemoryStream>, std::unique_ptr<MemoryStream>>
        make_pipe(Endpoint first, Endpoint second, std::size_t max_read_chunk = 0);

        MemoryStream(std::shared_ptr<Channel> inbound, std::shared_ptr<Channel> outbound, Endpoint local,
                     Endpoint remote, std::size_t max_read_chunk);
        ~MemoryStream() override;

        std::size_t read_exact(std::span<std::uint8_t> buffer,
                               std::optional<std::chrono::milliseconds> timeout) override;
        void write_all(std::span<const std::uint8_t> data) override;
        void shutdown() noexcept override;
        void close() noexcept override;

        Endpoint local_endpoint() const override { return local_; }
        Endpoint remote_endpoint() const override { return remote_; }

    private:
        std::shared_ptr<Channel> inbound_;
        std::shared_ptr<Channel> outbound_;
        Endpoint local_;
        Endpoint remote_;
        std::size_t max_read_chunk_;
        std::atomic<bool> shut_down_{false};
    };

    class MemoryAcceptor final : public Acceptor
    {
    public:
        explicit MemoryAcceptor(std::size_t max_read_chunk = 0);

        void bind(const std::string &host, std::uint16_t port) override;
        std::unique_ptr<StreamSource> accept() override;
        void stop() noexcept override;
        Endpoint local_endpoint() const override;

        // Client side of a new pipe whose server side is handed to accept(). Throws TransportError once stopped.
        std::unique_ptr<StreamSource> connect();

    private:
        mutable std::mutex mutex_;
        std::condition_variable pending_ready_;
        std::deque<std::unique_ptr<StreamSource>> pending_;
        Endpoint endpoint_{"memory", 0};
        std::uint16_t next_client_port_{40000};
        std::size_t max_read_chunk_;
        bool bound_{false};
        bool stopped_{false};
    };

} // namespace tonnerre
