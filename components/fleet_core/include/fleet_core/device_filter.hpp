#pragma once
#include "fleet_core/err.hpp"
#include "fleet_core/types.hpp"
#include <string>
#include <vector>

namespace fleet {

// Ephemeral selection over the registry. Empty criteria select everything;
// all set criteria must hold.
struct DeviceFilter {
  bool include_offline{false};
  std::string id_pattern{};
  std::vector<std::string> ids{};
  std::vector<std::string> macs{};
};

// `id_pattern` is an ECMAScript regex searched anywhere in the ID. An invalid
// pattern or MAC is FLEET_ERR_INVALID_ARG.
fleet_err_t apply_filter(const std::vector<DeviceRecord>& devices, const DeviceFilter& filter,
                         std::vector<DeviceRecord>& out);

}  // namespace fleet
