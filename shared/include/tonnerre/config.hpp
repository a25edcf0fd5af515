/**
 * Tonnerre - Endpoint, logging and service configuration.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "tonnerre/framing.hpp"

namespace tonnerre
{

    // Inbound messages a handler-less connection holds before its worker stops reading.
    constexpr std::size_t kDefaultMailboxCapacity = 1024;

    struct ConnectionOptions
    {
        std::optional<std::chrono::milliseconds> read_timeout{};
        std::uint32_t max_body_size{protocol::kDefaultMaxBodySize};
        std::size_t mailbox_capacity{kDefaultMailboxCapacity};
    };

    struct EndpointConfig
    {
        std::string host{"127.0.0.1"};
        std::uint16_t port{0};
        std::optional<std::chrono::milliseconds> read_timeout{};
        std::uint32_t max_body_size{protocol::kDefaultMaxBodySize};
        std::size_t mailbox_capacity{kDefaultMailboxCapacity};

        // Throws std::invalid_argument. Port 0 (ephemeral) is only accepted when @p listening.
        void validate(bool listening) const;

        ConnectionOptions connection_options() const;
    };

    void to_json(nlohmann::json &json, const EndpointConfig &config);
    // Port 0 is accepted here; validate(listening) decides whether it is usable.
    void from_json(const nlohmann::json &json, EndpointConfig &config);

    struct LoggingConfig
    {
        std::string level{"info"};
        std::optional<std::filesystem::path> file{};
    };

    void to_json(nlohmann::json &json, const LoggingConfig &config);
    void from_json(const nlohmann::json &json, LoggingConfig &config);

    class ServiceRegistry
    {
    public:
        void register_service(const std::string &name, EndpointConfig endpoint);

        bool is_registered(const std::string &name) const;

        // Throws std::out_of_range for an unknown service.
        const EndpointConfig &endpoint_for(const std::string &name) const;

        std::vector<std::string> service_names() const;

        bool empty() const noexcept { return services_.empty(); }

    private:
        std::map<std::string, EndpointConfig> services_;
    };

    void from_json(const nlohmann::json &json, ServiceRegistry &registry);

    struct MessagingConfig
    {
        LoggingConfig logging{};
        ServiceRegistry services{};
    };

    void from_json(const nlohmann::json &json, MessagingConfig &config);

    // Throws std::runtime_error when the file cannot be read or registers no services.
    MessagingConfig load_config(const std::filesystem::path &path);

} // namespace tonnerre
