#include "tonnerre/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

#include "tonnerre/version.hpp"

namespace tonnerre::client
{

    namespace
    {

        std::string next_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

        void parse_endpoint(const std::string &endpoint, ClientConfig &config)
        {
            const auto colon_pos = endpoint.rfind(':');
            if (colon_pos == std::string::npos || colon_pos == 0)
            {
                throw std::runtime_error("Expected endpoint format host:port");
            }
            config.host = endpoint.substr(0, colon_pos);
            if (config.host.size() > 2 && config.host.front() == '[' && config.host.back() == ']')
            {
                config.host = config.host.substr(1, config.host.size() - 2);
            }
            const auto port = std::stoul(endpoint.substr(colon_pos + 1));
            if (port == 0 || port > 65535)
            {
                throw std::runtime_error("Port must be between 1 and 65535");
            }
            config.port = static_cast<std::uint16_t>(port);
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;
        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
                return config;
            }
            if (arg == "--config")
            {
                config.config_file = std::filesystem::path(next_value(index, argc, argv, arg));
            }
            else if (arg == "--service")
            {
                config.service = next_value(index, argc, argv, arg);
            }
            else if (arg == "--kv")
            {
                const auto entry = next_value(index, argc, argv, arg);
                const auto equals = entry.find('=');
                if (equals == std::string::npos)
                {
                    throw std::runtime_error("--kv expects key=value, got '" + entry + "'");
                }
                config.pairs.emplace_back(entry.substr(0, equals), entry.substr(equals + 1));
            }
            else if (arg == "--text")
            {
                config.text = next_value(index, argc, argv, arg);
            }
            else if (arg == "--wait-reply")
            {
                config.wait_reply = true;
            }
            else if (arg == "--timeout-ms")
            {
                config.timeout = std::chrono::milliseconds(std::stoll(next_value(index, argc, argv, arg)));
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(next_value(index, argc, argv, arg));
            }
            else if (arg.rfind("--", 0) == 0)
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else if (config.host.empty())
            {
                parse_endpoint(arg, config);
            }
            else
            {
                throw std::runtime_error("Unexpected argument: " + arg);
            }
        }

        if (config.service.has_value() != config.config_file.has_value())
        {
            throw std::runtime_error("--config and --service must be given together");
        }
        if (!config.service && config.host.empty())
        {
            throw std::runtime_error("Either <host>:<port> or --config <file> --service <name> is required");
        }
        if (config.service && !config.host.empty())
        {
            throw std::runtime_error("<host>:<port> cannot be combined with --service");
        }
        if (config.text && !config.pairs.empty())
        {
            throw std::runtime_error("--text cannot be combined with --kv");
        }
        if (!config.text && config.pairs.empty())
        {
            throw std::runtime_error("Nothing to send: give --text or at least one --kv");
        }
        return config;
    }

    std::string usage(const char *program_name)
    {
        return std::string("Tonnerre client ") + std::string(version()) + "\nUsage: " + program_name +
               " (<host>:<port> | --config <FILE> --service <NAME>) (--text <TEXT> | --kv <KEY=VALUE>...)"
               " [--wait-reply] [--timeout-ms <MS>] [--log <FILE>]\n";
    }

} // namespace tonnerre::client
