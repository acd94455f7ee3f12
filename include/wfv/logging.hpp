#pragma once

/// @file include/wfv/logging.hpp
/// @brief The library's named spdlog logger.

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace wfv {

/// The `wfv` logger, created on first use with a colored stderr sink.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// Set the logger level from a name (`trace` … `off`).  Unknown names leave
/// the level unchanged and return false.
bool set_log_level(const std::string& level);

}  // namespace wfv
