#pragma once
#include "fleet_core/err.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace fleet {

struct ScanConfig {
  uint32_t timeout_ms{2000};
  uint32_t concurrency{50};
};

struct BatchConfig {
  uint32_t timeout_ms{5000};
  uint32_t concurrency{10};
  bool include_offline{false};
};

struct IdentityConfig {
  uint32_t timeout_ms{2000};
  std::string prefix{"LOUD"};
  int start_num{1};
  uint32_t identify_duration_s{30};
};

struct UploadConfig {
  uint32_t timeout_ms{60000};
};

struct AppConfig {
  std::string map_file{"device_map.json"};
  uint16_t device_port{80};
  std::string log_level{"info"};
  ScanConfig scan{};
  BatchConfig batch{};
  IdentityConfig identity{};
  UploadConfig upload{};
};

// Missing file leaves defaults in place and is not an error.
fleet_err_t config_load(const std::string& path, AppConfig& cfg);
fleet_err_t config_save(const std::string& path, const AppConfig& cfg);
void config_reset_defaults(AppConfig& cfg);
fleet_err_t config_apply_json(AppConfig& cfg, const char* data, size_t len);
std::string config_to_json(const AppConfig& cfg);

// Command-line timeout override. Non-positive or NaN falls back to
// `fallback_ms`; anything else is clamped to 100 ms .. 1 h.
std::chrono::milliseconds timeout_from_seconds(double seconds, uint32_t fallback_ms);

}  // namespace fleet
