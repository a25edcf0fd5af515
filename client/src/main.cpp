#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "tonnerre/client/config.hpp"
#include "tonnerre/client/connector.hpp"
#include "tonnerre/config.hpp"
#include "tonnerre/errors.hpp"
#include "tonnerre/logging.hpp"
#include "tonnerre/message.hpp"

namespace
{

    void print_message(const tonnerre::Message &message)
    {
        if (message.kind() == tonnerre::MessageKind::RawString)
        {
            std::cout << message.text() << std::endl;
            return;
        }
        for (const auto &[key, value] : message.pairs())
        {
            std::cout << key << "=" << value << "\n";
        }
        std::cout.flush();
    }

} // namespace

int main(int argc, char *argv[])
{
    using namespace tonnerre;

    client::ClientConfig config;
    try
    {
        config = client::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << "\n"
                  << client::usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (config.show_help)
    {
        std::cout << client::usage(argv[0]);
        return EXIT_SUCCESS;
    }

    try
    {
        // stdout carries replies; diagnostics stay at warn unless a log file is requested.
        LoggingConfig logging{.level = config.log_path ? "info" : "warn", .file = config.log_path};
        std::optional<MessagingConfig> messaging;
        if (config.config_file)
        {
            messaging = load_config(*config.config_file);
            if (!config.log_path)
            {
                logging.file = messaging->logging.file;
            }
        }
        configure_logging(logging, "client");

        const auto message = config.text ? make_raw_message(*config.text) : make_key_value_message(config.pairs);

        std::unique_ptr<client::ConnectionHandle> handle;
        if (config.service)
        {
            handle = client::connect_service(messaging->services, *config.service);
        }
        else
        {
            EndpointConfig endpoint;
            endpoint.host = config.host;
            endpoint.port = config.port;
            endpoint.read_timeout = config.timeout;
            handle = client::connect(endpoint);
        }

        if (config.wait_reply)
        {
            print_message(handle->request(message, config.timeout));
        }
        else
        {
            handle->send(message);
        }
        handle->close();
    }
    catch (const MessagingError &ex)
    {
        std::cerr << "Messaging failed (" << to_string(ex.code()) << "): " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Client failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
