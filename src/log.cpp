#include <strata/log.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace strata {

namespace {

constexpr const char* k_logger_name = "strata";

}  // namespace

std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> instance = [] {
    if (auto existing = spdlog::get(k_logger_name)) {
      return existing;
    }
    auto created = spdlog::stderr_color_mt(k_logger_name);
    created->set_level(spdlog::level::warn);
    return created;
  }();
  return instance;
}

void set_log_level(spdlog::level::level_enum level) {
  logger()->set_level(level);
}

}  // namespace strata
