#include "fleet_core/log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace fleet {

namespace {

std::mutex s_lock;
spdlog::level::level_enum s_level = spdlog::level::info;
spdlog::sink_ptr s_sink;

}  // namespace

std::shared_ptr<spdlog::logger> log_get(const char* tag) {
  const char* name = tag ? tag : "fleet";
  std::lock_guard<std::mutex> lock(s_lock);
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  if (!s_sink) {
    s_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  }
  auto logger = std::make_shared<spdlog::logger>(name, s_sink);
  logger->set_pattern("%Y-%m-%d %H:%M:%S %^%L%$ (%n) %v");
  logger->set_level(s_level);
  spdlog::register_logger(logger);
  return logger;
}

void log_set_level(spdlog::level::level_enum level) {
  std::lock_guard<std::mutex> lock(s_lock);
  s_level = level;
  spdlog::apply_all([level](std::shared_ptr<spdlog::logger> logger) { logger->set_level(level); });
}

bool log_parse_level(const std::string& text, spdlog::level::level_enum& out) {
  const auto level = spdlog::level::from_str(text);
  if (level == spdlog::level::off && text != "off") {
    return false;
  }
  out = level;
  return true;
}

}  // namespace fleet
