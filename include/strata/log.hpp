#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace strata {

// Shared "strata" logger (stderr, colour). Created on first use.
std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

}  // namespace strata

#define STRATA_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::strata::logger(), __VA_ARGS__)
#define STRATA_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::strata::logger(), __VA_ARGS__)
#define STRATA_LOG_INFO(...) SPDLOG_LOGGER_INFO(::strata::logger(), __VA_ARGS__)
#define STRATA_LOG_WARN(...) SPDLOG_LOGGER_WARN(::strata::logger(), __VA_ARGS__)
#define STRATA_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::strata::logger(), __VA_ARGS__)
