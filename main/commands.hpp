#pragma once
#include "fleet_core/config.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace fleet::cli {

struct ScanOptions {
  std::string network{};
  std::string action{};
  std::optional<double> timeout_s{};
  std::optional<uint32_t> concurrent{};
};

struct BatchOptions {
  std::string command{};
  std::optional<int> track{};
  std::optional<int> volume{};
  bool global{false};
  bool all_devices{false};
  std::string filter_id{};
  std::vector<std::string> ids{};
  std::vector<std::string> macs{};
  std::string file{};
  std::string name{};
  std::string dir{};
  bool no_skip{false};
  std::optional<double> timeout_s{};
  std::optional<uint32_t> concurrent{};
};

struct DeviceOptions {
  std::string id{};
  std::string mac{};
  std::string command{};
  std::optional<int> track{};
  std::optional<int> volume{};
  bool global{false};
  std::string new_id{};
  std::optional<int> file_index{};
  std::string file_path{};
  std::optional<double> timeout_s{};
};

struct IdOptions {
  std::string command{};
  std::string id{};
  std::string mac{};
  std::string new_id{};
  std::string network{};
  std::optional<uint32_t> duration_s{};
  std::optional<std::string> prefix{};
  std::optional<int> start_num{};
  bool include_offline{false};
  bool yes{false};
  std::optional<double> timeout_s{};
  std::optional<uint32_t> concurrent{};
};

// Each returns the process exit code.
int run_scan(const AppConfig& cfg, const ScanOptions& opts, const std::atomic<bool>& stop);
int run_batch(const AppConfig& cfg, const BatchOptions& opts, const std::atomic<bool>& stop);
int run_device(const AppConfig& cfg, const DeviceOptions& opts, const std::atomic<bool>& stop);
int run_id(const AppConfig& cfg, const IdOptions& opts, const std::atomic<bool>& stop);

}  // namespace fleet::cli
