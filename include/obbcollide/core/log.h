#pragma once
/**
 * @file log.h
 * @brief Library logger
 */

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace obbcollide::log {

/**
 * @brief Shared "obbcollide" logger, created on first use
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the logger level from its config name
 *
 * Accepts trace, debug, info, warn, error, critical and off.
 * Unknown names leave the level unchanged and return false.
 */
bool set_level(const std::string& name);

} // namespace obbcollide::log
