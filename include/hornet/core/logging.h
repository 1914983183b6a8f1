#pragma once
/**
 * @file logging.h
 * @brief Engine logger access
 *
 * All engine components log through one named spdlog logger ("hornet")
 * writing colored output to stdout. Hosts may replace it by registering
 * their own logger under the same name before first use.
 */

#include <spdlog/spdlog.h>
#include <memory>

namespace hornet::log {

/// Name under which the engine logger is registered with spdlog
constexpr const char* LOGGER_NAME = "hornet";

/**
 * @brief Get the shared engine logger, creating it on first use
 */
std::shared_ptr<spdlog::logger> get_logger();

/**
 * @brief Set the minimum level emitted by the engine logger
 */
void set_level(spdlog::level::level_enum level);

} // namespace hornet::log
