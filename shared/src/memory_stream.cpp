#include "tonnerre/memory_stream.hpp"

#include <algorithm>

#include "tonnerre/errors.hpp"

namespace tonnerre
{

    namespace
    {

        void close_channel(MemoryStream::Channel &channel) noexcept
        {
            {
                std::lock_guard lock(channel.mutex);
                channel.closed = true;
            }
            channel.ready.notify_all();
        }

    } // namespace

    std::pair<std::unique_ptr<MemoryStream>, std::unique_ptr<MemoryStream>>
    MemoryStream::make_pipe(Endpoint first, Endpoint second, std::size_t max_read_chunk)
    {
        auto towards_first = std::make_shared<Channel>();
        auto towards_second = std::make_shared<Channel>();
        auto first_end = std::make_unique<MemoryStream>(towards_first, towards_second, first, second, max_read_chunk);
        auto second_end = std::make_unique<MemoryStream>(towards_second, towards_first, second, first, max_read_chunk);
        return {std::move(first_end), std::move(second_end)};
    }

    MemoryStream::MemoryStream(std::shared_ptr<Channel> inbound, std::shared_ptr<Channel> outbound, Endpoint local,
                               Endpoint remote, std::size_t max_read_chunk)
        : inbound_(std::move(inbound)),
          outbound_(std::move(outbound)),
          local_(std::move(local)),
          remote_(std::move(remote)),
          max_read_chunk_(max_read_chunk) {}

    MemoryStream::~MemoryStream()
    {
        close();
    }

    std::size_t MemoryStream::read_exact(std::span<std::uint8_t> buffer,
                                         std::optional<std::chrono::milliseconds> timeout)
    {
        std::optional<std::chrono::steady_clock::time_point> deadline;
        if (timeout)
        {
            deadline = std::chrono::steady_clock::now() + *timeout;
        }

        std::size_t total = 0;
        std::unique_lock lock(inbound_->mutex);
        while (total < buffer.size())
        {
            const auto readable = [this]
            { return shut_down_.load() || inbound_->closed || !inbound_->bytes.empty(); };
            if (deadline)
            {
                if (!inbound_->ready.wait_until(lock, *deadline, readable))
                {
                    throw TimeoutError("read timed out on " + local_.to_string());
                }
            }
            else
            {
                inbound_->ready.wait(lock, readable);
            }

            if (shut_down_.load() || inbound_->bytes.empty())
            {
                return total;
            }
            auto step = std::min(buffer.size() - total, inbound_->bytes.size());
            if (max_read_chunk_ > 0)
            {
                step = std::min(step, max_read_chunk_);
            }
            const auto end = inbound_->bytes.begin() + static_cast<std::ptrdiff_t>(step);
            std::copy(inbound_->bytes.begin(), end, buffer.begin() + static_cast<std::ptrdiff_t>(total));
            inbound_->bytes.erase(inbound_->bytes.begin(), end);
            total += step;
        }
        return total;
    }

    void MemoryStream::write_all(std::span<const std::uint8_t> data)
    {
        {
            std::lock_guard lock(outbound_->mutex);
            if (shut_down_.load() || outbound_->closed)
            {
                throw TransportError("pipe to " + remote_.to_string() + " is closed");
            }
            outbound_->bytes.insert(outbound_->bytes.end(), data.begin(), data.end());
        }
        outbound_->ready.notify_all();
    }

    void MemoryStream::shutdown() noexcept
    {
        shut_down_.store(true);
        close_channel(*inbound_);
        close_channel(*outbound_);
    }

    void MemoryStream::close() noexcept
    {
        shutdown();
    }

    MemoryAcceptor::MemoryAcceptor(std::size_t max_read_chunk) : max_read_chunk_(max_read_chunk) {}

    void MemoryAcceptor::bind(const std::string &host, std::uint16_t port)
    {
        std::lock_guard lock(mutex_);
        endpoint_ = Endpoint{host, port};
        bound_ = true;
    }

    std::unique_ptr<StreamSource> MemoryAcceptor::accept()
    {
        std::unique_lock lock(mutex_);
        pending_ready_.wait(lock, [this]
                            { return stopped_ || !pending_.empty(); });
        if (stopped_)
        {
            return nullptr;
        }
        auto stream = std::move(pending_.front());
        pending_.pop_front();
        return stream;
    }

    void MemoryAcceptor::stop() noexcept
    {
        {
            std::lock_guard lock(mutex_);
            stopped_ = true;
            pending_.clear();
        }
        pending_ready_.notify_all();
    }

    Endpoint MemoryAcceptor::local_endpoint() const
    {
        std::lock_guard lock(mutex_);
        return endpoint_;
    }

    std::unique_ptr<StreamSource> MemoryAcceptor::connect()
    {
        std::unique_ptr<MemoryStream> client_end;
        {
            std::lock_guard lock(mutex_);
            if (stopped_ || !bound_)
            {
                throw TransportError("connection refused by " + endpoint_.to_string());
            }
            auto [client, server] =
                MemoryStream::make_pipe(Endpoint{"memory", next_client_port_++}, endpoint_, max_read_chunk_);
            pending_.push_back(std::move(server));
            client_end = std::move(client);
        }
        pending_ready_.notify_one();
        return client_end;
    }

} // namespace tonnerre
