#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace rollr {

// Shared "rollr" logger writing to stderr. Created on first use at warn.
std::shared_ptr<spdlog::logger> logger();

// Accepts spdlog level names: trace, debug, info, warn, error, critical, off.
void set_log_level(const std::string &level);

} // namespace rollr
