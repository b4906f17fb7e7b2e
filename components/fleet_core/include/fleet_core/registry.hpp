#pragma once
#include "fleet_core/err.hpp"
#include "fleet_core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace fleet {

fleet_err_t parse_merge_mode(const std::string& text, MergeMode& out);

// Persisted order: numeric IPv4 address, unparseable addresses last, ties by MAC.
std::vector<DeviceRecord> sorted_by_address(const DeviceMap& devices);

// Reconciles a discovery run with the known fleet.
//  create: the result is exactly the discovered set.
//  add:    known records go offline, rediscovered ones are merged field by
//          field and come back online, new MACs are inserted.
//  update: as add, but new MACs are dropped.
// Discovered records without a valid MAC are never keyed.
DeviceMap merge(const DeviceMap& existing, const std::vector<DeviceRecord>& discovered, MergeMode mode,
                MergeStats* stats = nullptr);

// Owns the MAC-keyed device map and its JSON snapshot on disk. Every mutating
// call writes the snapshot back before returning.
class Registry {
public:
  explicit Registry(std::string path) : path_(std::move(path)) {}

  // Missing file is an empty fleet.
  fleet_err_t load();
  // Missing file is FLEET_ERR_NOT_FOUND.
  fleet_err_t require_loaded();

  fleet_err_t apply_scan(const std::vector<DeviceRecord>& discovered, MergeMode mode,
                         const std::string& network_range, MergeStats* stats = nullptr);
  // Field-level update of a known MAC. Unknown MACs are FLEET_ERR_NOT_FOUND.
  fleet_err_t update_record(const DeviceRecord& record);
  fleet_err_t persist();

  std::vector<DeviceRecord> lookup_by_id(const std::string& id) const;
  std::optional<DeviceRecord> lookup_by_mac(const std::string& mac) const;

  const DeviceMap& devices() const { return devices_; }
  std::vector<DeviceRecord> list() const { return sorted_by_address(devices_); }
  size_t size() const { return devices_.size(); }
  size_t online_count() const;
  const std::string& path() const { return path_; }
  const std::string& scan_time() const { return scan_time_; }
  const std::string& scan_mode() const { return scan_mode_; }
  const std::string& network_range() const { return network_range_; }

private:
  std::string path_;
  DeviceMap devices_{};
  std::string scan_time_{};
  std::string scan_mode_{};
  std::string network_range_{};
};

}  // namespace fleet
