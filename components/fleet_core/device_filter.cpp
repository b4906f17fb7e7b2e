#include "fleet_core/device_filter.hpp"
#include "fleet_core/log.hpp"
#include <algorithm>
#include <optional>
#include <regex>
#include <set>

static const char* TAG = "filter";

namespace fleet {

fleet_err_t apply_filter(const std::vector<DeviceRecord>& devices, const DeviceFilter& filter,
                         std::vector<DeviceRecord>& out) {
  std::optional<std::regex> pattern;
  if (!filter.id_pattern.empty()) {
    try {
      pattern.emplace(filter.id_pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
      FLEET_LOGE(TAG, "Invalid ID pattern '{}': {}", filter.id_pattern, e.what());
      return FLEET_ERR_INVALID_ARG;
    }
  }
  std::set<std::string> macs;
  for (const auto& mac : filter.macs) {
    std::string canonical;
    if (!mac_canonicalize(mac, canonical)) {
      FLEET_LOGE(TAG, "Invalid MAC address '{}'", mac);
      return FLEET_ERR_INVALID_ARG;
    }
    macs.insert(canonical);
  }
  const std::set<std::string> ids(filter.ids.begin(), filter.ids.end());

  std::vector<DeviceRecord> selected;
  for (const auto& device : devices) {
    if (!filter.include_offline && !device.online) {
      continue;
    }
    if (pattern && !std::regex_search(device.id, *pattern)) {
      continue;
    }
    if (!ids.empty() && ids.count(device.id) == 0) {
      continue;
    }
    if (!macs.empty() && macs.count(device.mac_address) == 0) {
      continue;
    }
    selected.push_back(device);
  }
  FLEET_LOGD(TAG, "Selected {}/{} devices", selected.size(), devices.size());
  out = std::move(selected);
  return FLEET_OK;
}

}  // namespace fleet
