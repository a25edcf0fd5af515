#include "tonnerre/config.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace tonnerre
{

    namespace
    {
        constexpr auto kServicesKey = "services";
        constexpr auto kLoggingKey = "logging";

        std::int64_t bounded_integer(const nlohmann::json &value, const std::string &name, std::int64_t low,
                                     std::int64_t high)
        {
            const auto number = value.get<std::int64_t>();
            if (number < low || number > high)
            {
                throw std::invalid_argument(name + " " + std::to_string(number) + " out of range " +
                                            std::to_string(low) + "-" + std::to_string(high));
            }
            return number;
        }
    } // namespace

    void EndpointConfig::validate(bool listening) const
    {
        if (host.empty())
        {
            throw std::invalid_argument("endpoint host must not be empty");
        }
        if (port == 0 && !listening)
        {
            throw std::invalid_argument("endpoint port must be in 1-65535");
        }
        if (read_timeout && read_timeout->count() <= 0)
        {
            throw std::invalid_argument("read timeout must be positive");
        }
        if (max_body_size == 0)
        {
            throw std::invalid_argument("max body size must be positive");
        }
        if (mailbox_capacity == 0)
        {
            throw std::invalid_argument("mailbox capacity must be positive");
        }
    }

    ConnectionOptions EndpointConfig::connection_options() const
    {
        return ConnectionOptions{
            .read_timeout = read_timeout,
            .max_body_size = max_body_size,
            .mailbox_capacity = mailbox_capacity,
        };
    }

    void to_json(nlohmann::json &json, const EndpointConfig &config)
    {
        json = {
            {"host", config.host},
            {"port", config.port},
            {"max_body_size", config.max_body_size},
            {"mailbox_capacity", config.mailbox_capacity},
        };
        if (config.read_timeout)
        {
            json["read_timeout_ms"] = config.read_timeout->count();
        }
    }

    void from_json(const nlohmann::json &json, EndpointConfig &config)
    {
        config.host = json.at("host").get<std::string>();
        config.port = static_cast<std::uint16_t>(
            bounded_integer(json.at("port"), "port", 0, std::numeric_limits<std::uint16_t>::max()));
        if (auto it = json.find("read_timeout_ms"); it != json.end() && !it->is_null())
        {
            config.read_timeout = std::chrono::milliseconds(it->get<std::int64_t>());
        }
        else
        {
            config.read_timeout.reset();
        }
        config.max_body_size = protocol::kDefaultMaxBodySize;
        if (auto it = json.find("max_body_size"); it != json.end())
        {
            config.max_body_size = static_cast<std::uint32_t>(
                bounded_integer(*it, "max_body_size", 1, std::numeric_limits<std::uint32_t>::max()));
        }
        config.mailbox_capacity = kDefaultMailboxCapacity;
        if (auto it = json.find("mailbox_capacity"); it != json.end())
        {
            config.mailbox_capacity = static_cast<std::size_t>(
                bounded_integer(*it, "mailbox_capacity", 1, std::numeric_limits<std::int64_t>::max()));
        }
        config.validate(true);
    }

    void to_json(nlohmann::json &json, const LoggingConfig &config)
    {
        json = {{"level", config.level}};
        if (config.file)
        {
            json["file"] = config.file->string();
        }
    }

    void from_json(const nlohmann::json &json, LoggingConfig &config)
    {
        config.level = json.value("level", std::string{"info"});
        if (auto it = json.find("file"); it != json.end())
        {
            config.file = std::filesystem::path(it->get<std::string>());
        }
        else
        {
            config.file.reset();
        }
    }

    void ServiceRegistry::register_service(const std::string &name, EndpointConfig endpoint)
    {
        services_[name] = std::move(endpoint);
    }

    bool ServiceRegistry::is_registered(const std::string &name) const
    {
        return services_.contains(name);
    }

    const EndpointConfig &ServiceRegistry::endpoint_for(const std::string &name) const
    {
        const auto it = services_.find(name);
        if (it == services_.end())
        {
            throw std::out_of_range("service '" + name + "' is not registered");
        }
        return it->second;
    }

    std::vector<std::string> ServiceRegistry::service_names() const
    {
        std::vector<std::string> names;
        names.reserve(services_.size());
        for (const auto &[name, endpoint] : services_)
        {
            names.push_back(name);
        }
        return names;
    }

    void from_json(const nlohmann::json &json, ServiceRegistry &registry)
    {
        registry = ServiceRegistry{};
        if (!json.is_object())
        {
            throw std::runtime_error("services section must be an object");
        }
        for (const auto &[name, value] : json.items())
        {
            try
            {
                registry.register_service(name, value.get<EndpointConfig>());
            }
            catch (const std::exception &ex)
            {
                throw std::runtime_error("service '" + name + "': " + ex.what());
            }
        }
    }

    void from_json(const nlohmann::json &json, MessagingConfig &config)
    {
        config.logging = json.value(kLoggingKey, LoggingConfig{});
        if (auto it = json.find(kServicesKey); it != json.end())
        {
            config.services = it->get<ServiceRegistry>();
        }
        else
        {
            config.services = ServiceRegistry{};
        }
    }

    MessagingConfig load_config(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("cannot open configuration file " + path.string());
        }

        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw std::runtime_error("cannot parse configuration file " + path.string() + ": " + ex.what());
        }

        auto config = json.get<MessagingConfig>();
        if (config.services.empty())
        {
            throw std::runtime_error("no services registered in " + path.string());
        }
        spdlog::debug("Loaded {} service(s) from {}", config.services.service_names().size(), path.string());
        return config;
    }

} // namespace tonnerre
