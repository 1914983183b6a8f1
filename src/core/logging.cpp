/**
 * @file logging.cpp
 * @brief Engine logger implementation
 */

#include "hornet/core/logging.h"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace hornet::log {

std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        if (auto existing = spdlog::get(LOGGER_NAME)) {
            return existing;
        }
        auto created = spdlog::stdout_color_mt(LOGGER_NAME);
        created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        created->set_level(spdlog::level::info);
        return created;
    }();
    return logger;
}

void set_level(spdlog::level::level_enum level) {
    get_logger()->set_level(level);
}

} // namespace hornet::log
