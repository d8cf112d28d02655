/**
 * @file log.cpp
 * @brief Library logger implementation
 */

#include "obbcollide/core/log.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace obbcollide::log {

namespace {

constexpr const char* LOGGER_NAME = "obbcollide";

std::once_flag g_logger_once;

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    std::call_once(g_logger_once, [] {
        if (!spdlog::get(LOGGER_NAME)) {
            auto created = spdlog::stderr_color_mt(LOGGER_NAME);
            created->set_level(spdlog::level::warn);
        }
    });
    return spdlog::get(LOGGER_NAME);
}

bool set_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off, so only accept an explicit "off"
    if (level == spdlog::level::off && name != "off") {
        logger()->warn("Unknown log level '{}'", name);
        return false;
    }
    logger()->set_level(level);
    return true;
}

} // namespace obbcollide::log
