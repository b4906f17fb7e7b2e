#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fleet {

enum class MergeMode {
  Create,
  Add,
  Update,
};

enum class OperationStatus {
  Success,
  Partial,
  Error,
};

struct DeviceRecord {
  std::string mac_address{};
  std::string id{};
  std::string ip_address{};
  bool online{false};
  std::string last_seen{};
  std::optional<std::string> firmware_version{};
  std::optional<bool> wifi_connected{};
  std::optional<uint64_t> uptime_seconds{};
  // Keys of a persisted record this tool does not model, kept as raw JSON text.
  std::map<std::string, std::string> extra_fields{};
};

// Registry contents keyed by canonical MAC address.
using DeviceMap = std::map<std::string, DeviceRecord>;

struct OperationResult {
  std::string device_id{};
  std::string mac_address{};
  std::string ip_address{};
  OperationStatus status{OperationStatus::Error};
  int http_status{0};
  std::string response{};
  std::string error{};
  uint16_t steps_ok{0};
  uint16_t steps_total{0};

  bool success() const { return status == OperationStatus::Success; }
};

struct ScanStats {
  size_t total{0};
  size_t scanned{0};
  size_t found{0};
  size_t errors{0};
  double duration_s{0.0};
};

struct MergeStats {
  size_t added{0};
  size_t updated{0};
  size_t skipped{0};
  size_t marked_offline{0};
};

const char* merge_mode_name(MergeMode mode);
const char* operation_status_name(OperationStatus status);

// Accepts 12 hex digits, optionally separated by ':' or '-', in any case.
// Writes the AA:BB:CC:DD:EE:FF form.
bool mac_canonicalize(const std::string& text, std::string& out);

// Local time, ISO-8601 with microseconds.
std::string timestamp_now_iso();

// JSON numbers for counters and sizes: negatives become 0, values past 2^53
// saturate there.
uint64_t json_number_to_u64(double value);

}  // namespace fleet
