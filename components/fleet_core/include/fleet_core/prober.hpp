#pragma once
#include "fleet_core/address_range.hpp"
#include "fleet_core/err.hpp"
#include "fleet_core/types.hpp"
#include "fleet_core/window_runner.hpp"
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace fleet {

// Decodes a /api/status body. FLEET_ERR_INVALID_FORMAT for a body that is not
// a JSON object, FLEET_ERR_NOT_FOUND when it carries no valid MAC address.
fleet_err_t parse_status_body(const std::string& body, const std::string& ip_address, DeviceRecord& out);

class Prober {
public:
  explicit Prober(uint16_t port = 80) : port_(port) {}

  void set_progress_callback(ProgressCallback cb) { progress_ = std::move(cb); }
  void set_cancel_flag(const std::atomic<bool>* flag) { cancel_ = flag; }

  // Single GET /api/status. Absence, timeouts and non-200 answers all yield
  // nullopt.
  std::optional<DeviceRecord> probe(const std::string& address, std::chrono::milliseconds timeout) const;

  fleet_err_t probe_range(const AddressRange& range, size_t concurrency_limit, std::chrono::milliseconds timeout,
                          std::vector<DeviceRecord>& out);
  fleet_err_t probe_range(const std::vector<std::string>& addresses, size_t concurrency_limit,
                          std::chrono::milliseconds timeout, std::vector<DeviceRecord>& out);

  const ScanStats& last_stats() const { return stats_; }

private:
  fleet_err_t run(size_t total, const std::function<std::string(size_t)>& address_at, size_t concurrency_limit,
                  std::chrono::milliseconds timeout, std::vector<DeviceRecord>& out);

  uint16_t port_;
  ProgressCallback progress_{};
  const std::atomic<bool>* cancel_{nullptr};
  ScanStats stats_{};
};

}  // namespace fleet
