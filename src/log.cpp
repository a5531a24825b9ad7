#include "liveprogress/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace liveprogress {

namespace {
constexpr const char* kLoggerName = "liveprogress";
} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static const std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(kLoggerName)) {
            return existing;
        }
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        auto created = std::make_shared<spdlog::logger>(kLoggerName, sink);
        created->set_level(spdlog::level::warn);
        spdlog::register_logger(created);
        return created;
    }();
    return instance;
}

void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace liveprogress
