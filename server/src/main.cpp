#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "tonnerre/config.hpp"
#include "tonnerre/logging.hpp"
#include "tonnerre/message.hpp"
#include "tonnerre/server/listener.hpp"
#include "tonnerre/tcp_stream.hpp"
#include "tonnerre/version.hpp"

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "Tonnerre server " << tonnerre::version() << "\n"
                  << "Usage: " << program_name
                  << " (--port <PORT> [--address <ADDRESS>] | --config <FILE> --service <NAME>)"
                     " [--read-timeout-ms <MS>] [--echo] [--log <FILE>] [--log-level <LEVEL>]\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

} // namespace

int main(int argc, char *argv[])
{
    using namespace tonnerre;

    EndpointConfig endpoint;
    LoggingConfig logging;
    std::optional<std::filesystem::path> config_file;
    std::optional<std::string> service;
    std::optional<std::string> log_file;
    std::optional<std::string> log_level;
    std::optional<std::chrono::milliseconds> read_timeout;
    bool port_given = false;
    bool echo = false;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--echo")
        {
            echo = true;
            continue;
        }
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        if (arg != "--port" && arg != "--address" && arg != "--read-timeout-ms" && arg != "--config" &&
            arg != "--service" && arg != "--log" && arg != "--log-level")
        {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }

        auto value = read_option(i, argc, argv);
        if (!value)
        {
            std::cerr << "Missing value for " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        try
        {
            if (arg == "--port")
            {
                const auto port = std::stoul(*value);
                if (port > 65535)
                {
                    throw std::out_of_range("port");
                }
                endpoint.port = static_cast<std::uint16_t>(port);
                port_given = true;
            }
            else if (arg == "--address")
            {
                endpoint.host = *value;
            }
            else if (arg == "--read-timeout-ms")
            {
                read_timeout = std::chrono::milliseconds(std::stoll(*value));
            }
            else if (arg == "--config")
            {
                config_file = std::filesystem::path(*value);
            }
            else if (arg == "--service")
            {
                service = *value;
            }
            else if (arg == "--log")
            {
                log_file = *value;
            }
            else
            {
                log_level = *value;
            }
        }
        catch (const std::exception &)
        {
            std::cerr << "Invalid value for " << arg << ": " << *value << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    if (config_file.has_value() != service.has_value() || (config_file && port_given) ||
        (!config_file && !port_given))
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        if (config_file)
        {
            auto messaging = load_config(*config_file);
            logging = messaging.logging;
            endpoint = messaging.services.endpoint_for(*service);
        }
        if (read_timeout)
        {
            endpoint.read_timeout = read_timeout;
        }
        if (log_file)
        {
            logging.file = std::filesystem::path(*log_file);
        }
        if (log_level)
        {
            logging.level = *log_level;
        }
        endpoint.validate(true);

        configure_logging(logging, "server");
        spdlog::info("Starting Tonnerre server {} on {}:{}", version(), endpoint.host, endpoint.port);

        server::Listener listener(std::make_unique<TcpAcceptor>(), endpoint.connection_options());
        listener.bind(endpoint.host, endpoint.port);
        listener.start(
            [&listener, echo](const Message &message, const Endpoint &peer)
            {
                spdlog::info("{} -> {}", peer.to_string(), describe(message));
                if (echo)
                {
                    listener.send(peer, message);
                }
            },
            [](const Endpoint &peer, const CloseReason &reason)
            {
                spdlog::debug("{} disconnected ({})", peer.to_string(), to_string(reason.code));
            });

        asio::io_context io_context;
        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&listener](const std::error_code &error, int signal_number)
                           {
                               if (!error)
                               {
                                   spdlog::info("Received signal {}, shutting down", signal_number);
                                   listener.stop();
                               } });
        io_context.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
