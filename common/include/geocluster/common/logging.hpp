#pragma once
#include <memory>
#include <spdlog/spdlog.h>

namespace geocluster {

inline constexpr const char* LOGGER_NAME = "geocluster";

// Shared "geocluster" logger (stderr, color). Created on first use.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

}  // namespace geocluster
