#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "recorder.hpp"
#include "tonnerre/client/connector.hpp"
#include "tonnerre/connection.hpp"
#include "tonnerre/errors.hpp"
#include "tonnerre/framing.hpp"
#include "tonnerre/memory_stream.hpp"
#include "tonnerre/server/listener.hpp"

using namespace tonnerre;
using namespace std::chrono_literals;

namespace
{

    using test::eventually;
    using test::Recorder;

    const Endpoint kClientEndpoint{"client", 40001};
    const Endpoint kServerEndpoint{"server", 9000};

    Message login_message()
    {
        return make_key_value_message({{"user", "alice"}, {"action", "login"}});
    }

    // Server side is a Connection with @p handlers; the client side is returned as a bare stream.
    std::pair<std::shared_ptr<Connection>, std::unique_ptr<StreamSource>>
    open_inbound(ConnectionHandlers handlers, ConnectionOptions options = {}, std::size_t max_read_chunk = 0)
    {
        auto [client_end, server_end] = MemoryStream::make_pipe(kClientEndpoint, kServerEndpoint, max_read_chunk);
        auto server = Connection::open(std::move(server_end), Direction::Inbound, options, std::move(handlers));
        return {std::move(server), std::move(client_end)};
    }

    void write_bytes(StreamSource &stream, const std::vector<std::uint8_t> &bytes)
    {
        stream.write_all(bytes);
    }

    // Every read fails with an exception outside the messaging hierarchy.
    class BrokenStream final : public StreamSource
    {
    public:
        std::size_t read_exact(std::span<std::uint8_t>, std::optional<std::chrono::milliseconds>) override
        {
            throw std::runtime_error("device unplugged");
        }
        void write_all(std::span<const std::uint8_t>) override {}
        void shutdown() noexcept override {}
        void close() noexcept override {}
        Endpoint local_endpoint() const override { return kServerEndpoint; }
        Endpoint remote_endpoint() const override { return kClientEndpoint; }
    };

    // Fails the first accept() and then hands out memory pipes.
    class FailingOnceAcceptor final : public Acceptor
    {
    public:
        void bind(const std::string &host, std::uint16_t port) override { inner_.bind(host, port); }

        std::unique_ptr<StreamSource> accept() override
        {
            if (accept_calls_.fetch_add(1) == 0)
            {
                throw TransportError("accept failed: too many open files");
            }
            return inner_.accept();
        }

        void stop() noexcept override { inner_.stop(); }
        Endpoint local_endpoint() const override { return inner_.local_endpoint(); }

        std::unique_ptr<StreamSource> connect() { return inner_.connect(); }
        int accept_calls() const { return accept_calls_.load(); }

    private:
        MemoryAcceptor inner_;
        std::atomic<int> accept_calls_{0};
    };

    void test_chunked_reads_preserve_order()
    {
        Recorder server_side;
        auto [client_end, server_end] = MemoryStream::make_pipe(kClientEndpoint, kServerEndpoint, 1);
        auto server = Connection::open(std::move(server_end), Direction::Inbound, {}, server_side.handlers());
        auto client = Connection::open(std::move(client_end), Direction::Outbound, {}, {});

        const auto first = login_message();
        const auto second = make_raw_message("<xml>ok</xml>");
        client->send(first);
        client->send(second);

        assert(server_side.wait_for_messages(2));
        const auto received = server_side.messages();
        assert(received.size() == 2);
        assert(received[0] == first);
        assert(received[1] == second);
        assert(server_side.peers()[0] == kClientEndpoint);
        assert(server->direction() == Direction::Inbound);
        assert(client->peer() == kServerEndpoint);

        server->send(make_raw_message("<xml>ok</xml>"));
        const auto reply = client->receive(2s);
        assert(reply && reply->text() == "<xml>ok</xml>");

        client->close();
        client->wait_closed();
        assert(server_side.wait_for_closes(1));
        assert(server_side.closes()[0].code == ErrorCode::Ok);
        server->wait_closed();
        assert(server->state() == ConnectionState::Closed);
        assert(server->close_reason() && server->close_reason()->code == ErrorCode::Ok);
        assert(!client->receive(10ms));
    }

    void test_clean_disconnect_notifies_once()
    {
        Recorder server_side;
        auto [server, client_end] = open_inbound(server_side.handlers());

        // A partial header followed by end of stream still counts as a clean disconnect.
        write_bytes(*client_end, {0x00, 0x00});
        client_end->close();

        assert(server_side.wait_for_closes(1));
        server->wait_closed();
        std::this_thread::sleep_for(20ms);
        assert(server_side.closes().size() == 1);
        assert(server_side.closes()[0].code == ErrorCode::Ok);
        assert(server_side.messages().empty());

        server->close();
        std::this_thread::sleep_for(20ms);
        assert(server_side.closes().size() == 1);
    }

    void test_unknown_kind_closes_connection()
    {
        Recorder server_side;
        auto [server, client_end] = open_inbound(server_side.handlers());

        write_bytes(*client_end, {0x09, 0x00, 0x00, 0x00, 0x00});
        assert(server_side.wait_for_closes(1));
        assert(server_side.closes()[0].code == ErrorCode::UnknownKind);
        server->wait_closed();
        assert(!server->is_open());

        try
        {
            server->send(login_message());
            assert(false && "send after protocol error must fail");
        }
        catch (const ConnectionClosed &ex)
        {
            assert(ex.code() == ErrorCode::ConnectionClosed);
        }
    }

    void test_truncated_body_is_malformed()
    {
        Recorder server_side;
        auto [server, client_end] = open_inbound(server_side.handlers());

        write_bytes(*client_end, {0x01, 0x00, 0x00, 0x00, 0x0A, 'a', 'b', 'c'});
        client_end->close();
        assert(server_side.wait_for_closes(1));
        assert(server_side.closes()[0].code == ErrorCode::Malformed);
        assert(server_side.messages().empty());
        server->wait_closed();
    }

    void test_oversized_declared_length()
    {
        Recorder server_side;
        auto [server, client_end] = open_inbound(server_side.handlers(), ConnectionOptions{.max_body_size = 8});

        write_bytes(*client_end, {0x01, 0x00, 0x00, 0x01, 0x00});
        assert(server_side.wait_for_closes(1));
        assert(server_side.closes()[0].code == ErrorCode::Malformed);
        server->wait_closed();
    }

    void test_read_timeout_closes_connection()
    {
        Recorder server_side;
        const auto started = std::chrono::steady_clock::now();
        auto [server, client_end] =
            open_inbound(server_side.handlers(), ConnectionOptions{.read_timeout = std::chrono::milliseconds(50)});

        assert(server_side.wait_for_closes(1));
        assert(server_side.closes()[0].code == ErrorCode::Timeout);
        assert(std::chrono::steady_clock::now() - started >= 40ms);
        server->wait_closed();
    }

    void test_handler_exception_keeps_reading()
    {
        Recorder server_side;
        std::atomic<int> calls{0};
        auto record = server_side.message_handler();
        ConnectionHandlers handlers{
            .on_message = [&](const Message &message, const Endpoint &peer)
            {
                if (calls.fetch_add(1) == 0)
                {
                    throw std::runtime_error("handler failure");
                }
                record(message, peer);
            },
            .on_close = server_side.close_handler(),
        };
        auto [server, client_end] = open_inbound(std::move(handlers));
        auto client = Connection::open(std::move(client_end), Direction::Outbound, {}, {});

        client->send(make_raw_message("first"));
        client->send(make_raw_message("second"));
        assert(server_side.wait_for_messages(1));
        assert(server_side.messages()[0].text() == "second");
        assert(server->is_open());
        assert(server_side.closes().empty());

        client->close();
        client->wait_closed();
        server->wait_closed();
    }

    void test_send_after_close()
    {
        auto [server, client_end] = open_inbound({.on_message = [](const Message &, const Endpoint &) {}});
        auto client = Connection::open(std::move(client_end), Direction::Outbound, {}, {});

        client->close();
        client->close();
        client->wait_closed();
        assert(client->state() == ConnectionState::Closed);
        assert(client->close_reason()->code == ErrorCode::Ok);

        bool rejected = false;
        try
        {
            client->send(login_message());
        }
        catch (const ConnectionClosed &)
        {
            rejected = true;
        }
        assert(rejected);
        server->wait_closed();
    }

    void test_payload_too_large_keeps_connection()
    {
        Recorder server_side;
        auto [server, client_end] = open_inbound(server_side.handlers());
        auto client = Connection::open(std::move(client_end), Direction::Outbound, {}, {});

        bool rejected = false;
        try
        {
            client->send(make_key_value_message({{"blob", std::string(0x10000, 'x')}}));
        }
        catch (const PayloadTooLarge &)
        {
            rejected = true;
        }
        assert(rejected);
        assert(client->is_open());

        client->send(login_message());
        assert(server_side.wait_for_messages(1));
        assert(server_side.messages()[0] == login_message());

        client->close();
        client->wait_closed();
        server->wait_closed();
    }

    void test_receive_timeout_and_mode()
    {
        Recorder server_side;
        auto [server, client_end] = open_inbound(server_side.handlers());
        auto client = Connection::open(std::move(client_end), Direction::Outbound, {}, {});

        bool timed_out = false;
        try
        {
            (void)client->receive(20ms);
        }
        catch (const TimeoutError &ex)
        {
            timed_out = ex.code() == ErrorCode::Timeout;
        }
        assert(timed_out);
        assert(client->is_open());

        bool misuse = false;
        try
        {
            (void)server->receive(1ms);
        }
        catch (const std::logic_error &)
        {
            misuse = true;
        }
        assert(misuse);

        client->close();
        client->wait_closed();
        server->wait_closed();
    }

    void test_concurrent_senders_do_not_interleave()
    {
        Recorder server_side;
        auto [server, client_end] = open_inbound(server_side.handlers(), {}, 3);
        auto client = Connection::open(std::move(client_end), Direction::Outbound, {}, {});

        constexpr int kSenders = 4;
        constexpr int kPerSender = 25;
        std::vector<std::thread> senders;
        for (int id = 0; id < kSenders; ++id)
        {
            senders.emplace_back([&client, id]
                                 {
                                     for (int n = 0; n < kPerSender; ++n)
                                     {
                                         client->send(make_key_value_message(
                                             {{"sender", std::to_string(id)}, {"seq", std::to_string(n)},
                                              {"pad", std::string(64, static_cast<char>('a' + id))}}));
                                     } });
        }
        for (auto &sender : senders)
        {
            sender.join();
        }

        assert(server_side.wait_for_messages(kSenders * kPerSender));
        std::vector<int> next(kSenders, 0);
        for (const auto &message : server_side.messages())
        {
            const auto id = std::stoi(std::string(*message.find("sender")));
            assert(std::stoi(std::string(*message.find("seq"))) == next[id]);
            assert(*message.find("pad") == std::string(64, static_cast<char>('a' + id)));
            ++next[id];
        }
        client->close();
        client->wait_closed();
        server->wait_closed();
    }

    void test_listener_request_reply()
    {
        Recorder server_side;
        auto acceptor = std::make_unique<MemoryAcceptor>(2);
        auto *memory = acceptor.get();
        server::Listener *listener_ptr = nullptr;

        auto listener = server::listen(
            std::move(acceptor), EndpointConfig{.host = "memory", .port = 0},
            [&](const Message &message, const Endpoint &peer)
            {
                if (message.find("action") == std::optional<std::string_view>("login"))
                {
                    listener_ptr->send(peer, make_raw_message("<xml>ok</xml>"));
                }
            },
            server_side.close_handler());
        listener_ptr = listener.get();
        assert(listener->is_running());
        assert(listener->local_endpoint() == (Endpoint{"memory", 0}));

        auto handle = client::connect(memory->connect(), ConnectionOptions{});
        const auto reply = handle->request(login_message(), 2s);
        assert(reply.kind() == MessageKind::RawString);
        assert(reply.text() == "<xml>ok</xml>");
        assert(listener->connection_count() == 1);

        bool unknown_peer = false;
        try
        {
            listener->send(Endpoint{"nobody", 1}, login_message());
        }
        catch (const ConnectionClosed &)
        {
            unknown_peer = true;
        }
        assert(unknown_peer);

        handle->close();
        assert(!handle->is_open());
        assert(server_side.wait_for_closes(1));
        assert(server_side.closes()[0].code == ErrorCode::Ok);
        assert(eventually([&]
                          { return listener->connection_count() == 0; }));

        listener->stop();
    }

    void test_listener_stop_while_idle()
    {
        Recorder server_side;
        auto acceptor = std::make_unique<MemoryAcceptor>();
        auto *memory = acceptor.get();
        auto listener = server::listen(std::move(acceptor), EndpointConfig{.host = "memory", .port = 0},
                                       server_side.message_handler(), server_side.close_handler());

        auto first = client::connect(memory->connect(), ConnectionOptions{});
        auto second = client::connect(memory->connect(), ConnectionOptions{});
        assert(eventually([&]
                          { return listener->connection_count() == 2; }));

        // Two concurrent stops plus one after the fact; all return once shutdown completes.
        const auto started = std::chrono::steady_clock::now();
        std::thread concurrent([&]
                               { listener->stop(); });
        listener->stop();
        concurrent.join();
        listener->stop();
        assert(std::chrono::steady_clock::now() - started < 2s);

        assert(!listener->is_running());
        assert(listener->connection_count() == 0);
        assert(server_side.closes().size() == 2);
        assert(!first->receive(2s));
        assert(!second->receive(2s));
        assert(!first->is_open());

        bool refused = false;
        try
        {
            (void)memory->connect();
        }
        catch (const TransportError &)
        {
            refused = true;
        }
        assert(refused);
    }

    void test_listener_requires_handler()
    {
        bool rejected = false;
        try
        {
            (void)server::listen(std::make_unique<MemoryAcceptor>(), EndpointConfig{.host = "memory", .port = 0},
                                 MessageHandler{});
        }
        catch (const std::invalid_argument &)
        {
            rejected = true;
        }
        assert(rejected);
    }

    void test_connect_service_unknown_name()
    {
        ServiceRegistry registry;
        registry.register_service("orders", EndpointConfig{.host = "127.0.0.1", .port = 7100});
        bool rejected = false;
        try
        {
            (void)client::connect_service(registry, "billing");
        }
        catch (const std::out_of_range &)
        {
            rejected = true;
        }
        assert(rejected);
    }

    void test_full_mailbox_pauses_reading()
    {
        auto [server, client_end] = open_inbound({}, ConnectionOptions{.mailbox_capacity = 2});
        for (int n = 0; n < 5; ++n)
        {
            write_bytes(*client_end, protocol::encode_frame(make_key_value_message({{"seq", std::to_string(n)}})));
        }

        assert(eventually([&]
                          { return server->pending() == 2; }));
        std::this_thread::sleep_for(50ms);
        assert(server->pending() == 2);
        assert(server->is_open());

        for (int n = 0; n < 5; ++n)
        {
            const auto message = server->receive(2s);
            assert(message && message->find("seq") == std::optional<std::string_view>(std::to_string(n)));
        }
        assert(server->pending() == 0);

        // A worker waiting for mailbox room still honours close().
        for (int n = 0; n < 4; ++n)
        {
            write_bytes(*client_end, protocol::encode_frame(login_message()));
        }
        assert(eventually([&]
                          { return server->pending() == 2; }));
        server->close();
        server->wait_closed();
        assert(server->close_reason() && server->close_reason()->code == ErrorCode::Ok);
    }

    void test_unexpected_read_failure_is_transport_error()
    {
        Recorder server_side;
        auto server = Connection::open(std::make_unique<BrokenStream>(), Direction::Inbound, {},
                                       server_side.handlers());
        assert(server_side.wait_for_closes(1));
        server->wait_closed();
        assert(server_side.closes()[0].code == ErrorCode::TransportError);
        assert(server->close_reason()->detail == "device unplugged");
    }

    void test_non_standard_close_handler_exception()
    {
        std::atomic<int> calls{0};
        auto [server, client_end] = open_inbound(ConnectionHandlers{
            .on_message = [](const Message &, const Endpoint &) {},
            .on_close = [&calls](const Endpoint &, const CloseReason &)
            {
                ++calls;
                throw 42;
            },
        });
        client_end->close();
        server->wait_closed();
        assert(calls == 1);
        assert(!server->is_open());
        assert(server->close_reason() && server->close_reason()->code == ErrorCode::Ok);
    }

    void test_listener_survives_failed_accept()
    {
        Recorder server_side;
        auto acceptor = std::make_unique<FailingOnceAcceptor>();
        auto *flaky = acceptor.get();
        server::Listener *listener_ptr = nullptr;

        auto listener = server::listen(
            std::move(acceptor), EndpointConfig{.host = "memory", .port = 0},
            [&](const Message &message, const Endpoint &peer)
            { listener_ptr->send(peer, message); },
            server_side.close_handler());
        listener_ptr = listener.get();

        auto handle = client::connect(flaky->connect(), ConnectionOptions{});
        assert(handle->request(login_message(), 2s) == login_message());
        assert(flaky->accept_calls() >= 2);
        assert(listener->is_running());
        assert(listener->connection_count() == 1);

        handle->close();
        assert(server_side.wait_for_closes(1));
        listener->stop();
        assert(!listener->is_running());
    }

    void test_listener_close_handler_non_standard_exception()
    {
        auto acceptor = std::make_unique<MemoryAcceptor>();
        auto *memory = acceptor.get();
        std::atomic<int> calls{0};
        auto listener = server::listen(
            std::move(acceptor), EndpointConfig{.host = "memory", .port = 0},
            [](const Message &, const Endpoint &) {},
            [&calls](const Endpoint &, const CloseReason &)
            {
                ++calls;
                throw std::string("not an exception type");
            });

        auto handle = client::connect(memory->connect(), ConnectionOptions{});
        assert(eventually([&]
                          { return listener->connection_count() == 1; }));
        handle->close();
        assert(eventually([&]
                          { return listener->connection_count() == 0; }));
        assert(calls == 1);
        listener->stop();
    }

} // namespace

void run_connection_component_tests()
{
    test_chunked_reads_preserve_order();
    test_clean_disconnect_notifies_once();
    test_unknown_kind_closes_connection();
    test_truncated_body_is_malformed();
    test_oversized_declared_length();
    test_read_timeout_closes_connection();
    test_handler_exception_keeps_reading();
    test_send_after_close();
    test_payload_too_large_keeps_connection();
    test_receive_timeout_and_mode();
    test_concurrent_senders_do_not_interleave();
    test_listener_request_reply();
    test_listener_stop_while_idle();
    test_listener_requires_handler();
    test_connect_service_unknown_name();
    test_full_mailbox_pauses_reading();
    test_unexpected_read_failure_is_transport_error();
    test_non_standard_close_handler_exception();
    test_listener_survives_failed_accept();
    test_listener_close_handler_non_standard_exception();
}
