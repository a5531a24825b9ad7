#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace liveprogress {

// Shared logger named "liveprogress", writing to stderr. Created on first
// use unless the application registered one under that name before.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

void setLogLevel(spdlog::level::level_enum level);

} // namespace liveprogress
