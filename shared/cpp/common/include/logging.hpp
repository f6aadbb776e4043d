#pragma once
#include <spdlog/spdlog.h>
#include <string>

// Install the coloured console logger as the default spdlog logger.
// level: trace|debug|info|warn|error|critical|off; unknown names mean info.
void init_logging(const std::string& name, const std::string& level = "info");

void set_log_level(const std::string& level);
