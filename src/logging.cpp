#include "logging.h"

#include <mutex>
#include <stdexcept>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace rollr {

std::shared_ptr<spdlog::logger> logger() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (!spdlog::get("rollr")) {
      auto created = spdlog::stderr_color_mt("rollr");
      created->set_level(spdlog::level::warn);
      created->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
    }
  });
  return spdlog::get("rollr");
}

void set_log_level(const std::string &level) {
  spdlog::level::level_enum parsed = spdlog::level::from_str(level);
  if (parsed == spdlog::level::off && level != "off") {
    throw std::invalid_argument("unknown log level '" + level + "'");
  }
  logger()->set_level(parsed);
}

} // namespace rollr
