#include <geocluster/common/logging.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace geocluster {

std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> instance = [] {
    if (auto existing = spdlog::get(LOGGER_NAME)) {
      return existing;
    }
    auto created = spdlog::stderr_color_mt(LOGGER_NAME);
    created->set_level(spdlog::level::warn);
    return created;
  }();
  return instance;
}

void set_log_level(spdlog::level::level_enum level) { logger()->set_level(level); }

}  // namespace geocluster
