#include "tonnerre/logging.hpp"

#include <stdexcept>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace tonnerre
{

    std::shared_ptr<spdlog::logger> configure_logging(const LoggingConfig &config, const std::string &name)
    {
        const auto level = spdlog::level::from_str(config.level);
        if (level == spdlog::level::off && config.level != "off")
        {
            throw std::invalid_argument("unknown log level '" + config.level + "'");
        }

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        return logger;
    }

} // namespace tonnerre
