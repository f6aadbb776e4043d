#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

void init_logging(const std::string& name, const std::string& level) {
    auto logger = spdlog::get(name);
    if (!logger) {
        logger = spdlog::stdout_color_mt(name);
    }
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
    spdlog::set_default_logger(logger);
    set_log_level(level);
}

void set_log_level(const std::string& level) {
    auto lvl = spdlog::level::from_str(level);
    // from_str answers "off" for names it does not know
    if (lvl == spdlog::level::off && level != "off") lvl = spdlog::level::info;
    spdlog::set_level(lvl);
}
