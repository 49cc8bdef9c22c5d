#include "Logging.hpp"
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

std::shared_ptr<spdlog::logger> make_logger(const std::string& name, const std::string& level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
    }
    logger->set_level(parsed);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    return logger;
}

std::shared_ptr<spdlog::logger> make_null_logger(const std::string& name) {
    return std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
}
