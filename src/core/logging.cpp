/// @file src/core/logging.cpp
/// @brief Named spdlog logger shared by every module.

#include "wfv/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace wfv {

namespace {
constexpr const char* LOGGER_NAME = "wfv";
}  // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(LOGGER_NAME)) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(LOGGER_NAME);
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        return created;
    }();
    return instance;
}

bool set_log_level(const std::string& level) {
    const auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to `off`; only accept an explicit "off".
    if (parsed == spdlog::level::off && level != "off") {
        return false;
    }
    logger()->set_level(parsed);
    return true;
}

}  // namespace wfv
