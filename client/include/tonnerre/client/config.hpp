#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "tonnerre/message.hpp"

namespace tonnerre::client
{

    struct ClientConfig
    {
        std::string host;
        std::uint16_t port{};
        std::optional<std::filesystem::path> config_file;
        std::optional<std::string> service;
        KeyValuePairs pairs;
        std::optional<std::string> text;
        bool wait_reply{false};
        std::optional<std::chrono::milliseconds> timeout;
        std::optional<std::filesystem::path> log_path;
        bool show_help{false};
    };

    // Throws std::runtime_error on malformed or missing arguments.
    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage(const char *program_name);

} // namespace tonnerre::client
