#pragma once
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

// Tagged loggers. Every module keeps a `static const char* TAG` and logs
// through these macros, formatting with spdlog's {} placeholders.
#define FLEET_LOGE(tag, ...) ::fleet::log_get(tag)->error(__VA_ARGS__)
#define FLEET_LOGW(tag, ...) ::fleet::log_get(tag)->warn(__VA_ARGS__)
#define FLEET_LOGI(tag, ...) ::fleet::log_get(tag)->info(__VA_ARGS__)
#define FLEET_LOGD(tag, ...) ::fleet::log_get(tag)->debug(__VA_ARGS__)

namespace fleet {

std::shared_ptr<spdlog::logger> log_get(const char* tag);

// Applies to every existing tag logger and to loggers created later.
void log_set_level(spdlog::level::level_enum level);
bool log_parse_level(const std::string& text, spdlog::level::level_enum& out);

}  // namespace fleet
