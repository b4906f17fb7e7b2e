#include "fleet_core/identity_resolver.hpp"
#include "fleet_core/address_range.hpp"
#include "fleet_core/device_ops.hpp"
#include "fleet_core/log.hpp"
#include <algorithm>
#include <cstdio>
#include <map>
#include <thread>

static const char* TAG = "identity";

namespace fleet {

const char* provision_outcome_name(ProvisionOutcome outcome) {
  switch (outcome) {
    case ProvisionOutcome::Assigned:
      return "assigned";
    case ProvisionOutcome::NoneFound:
      return "none found";
    case ProvisionOutcome::MultipleFound:
      return "multiple found";
    case ProvisionOutcome::RequestFailed:
      return "request failed";
    case ProvisionOutcome::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

std::vector<DuplicateGroup> find_duplicates(const DeviceMap& devices) {
  std::map<std::string, std::vector<DeviceRecord>> by_id;
  for (const auto& [mac, record] : devices) {
    by_id[record.id].push_back(record);
  }
  std::vector<DuplicateGroup> groups;
  for (auto& [id, members] : by_id) {
    if (members.size() > 1) {
      groups.push_back(DuplicateGroup{id, std::move(members)});
    }
  }
  return groups;
}

std::string format_device_id(const std::string& prefix, int number) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%03d", number);
  return prefix + "-" + buf;
}

AutoAssignPlan plan_auto_assign(const DeviceMap& devices, const std::string& prefix, int start_num,
                                bool include_offline) {
  AutoAssignPlan plan;
  int number = start_num;
  // DeviceMap iterates in MAC order.
  for (const auto& [mac, record] : devices) {
    if (!record.online && !include_offline) {
      FLEET_LOGI(TAG, "Skipping offline device {}", mac);
      ++plan.skipped_offline;
      continue;
    }
    const std::string target = format_device_id(prefix, number++);
    if (record.id == target) {
      FLEET_LOGI(TAG, "Device {} already has ID {}", mac, target);
      ++plan.already_assigned;
      continue;
    }
    plan.assignments.push_back(IdAssignment{mac, record.ip_address, record.id, target});
  }
  return plan;
}

fleet_err_t select_device(const Registry& registry, const std::string& mac, const std::string& id,
                          DeviceRecord& out) {
  if (!mac.empty()) {
    auto found = registry.lookup_by_mac(mac);
    if (!found) {
      FLEET_LOGE(TAG, "Device with MAC {} not found in device map", mac);
      return FLEET_ERR_NOT_FOUND;
    }
    out = *found;
    return FLEET_OK;
  }
  if (id.empty()) {
    FLEET_LOGE(TAG, "Either a device ID or a MAC address is required");
    return FLEET_ERR_INVALID_ARG;
  }
  const auto matches = registry.lookup_by_id(id);
  if (matches.empty()) {
    FLEET_LOGE(TAG, "Device with ID {} not found in device map", id);
    return FLEET_ERR_NOT_FOUND;
  }
  if (matches.size() > 1) {
    FLEET_LOGE(TAG, "{} devices share ID {}, select by MAC instead:", matches.size(), id);
    for (const auto& d : matches) {
      FLEET_LOGE(TAG, "  MAC {} IP {}", d.mac_address, d.ip_address);
    }
    return FLEET_ERR_DUPLICATE;
  }
  out = matches.front();
  return FLEET_OK;
}

BatchDispatcher IdentityResolver::dispatcher() const {
  RequestOptions req;
  req.port = opts_.port;
  req.timeout = opts_.timeout;
  return BatchDispatcher(req);
}

std::vector<DuplicateGroup> IdentityResolver::find_duplicates() const {
  return ::fleet::find_duplicates(registry_.devices());
}

fleet_err_t IdentityResolver::assign_id(const std::string& mac, const std::string& new_id, OperationResult& out) {
  DeviceOperationPtr op;
  fleet_err_t err = ops::set_id(new_id, op);
  if (err != FLEET_OK) {
    return err;
  }
  auto device = registry_.lookup_by_mac(mac);
  if (!device) {
    FLEET_LOGE(TAG, "Device with MAC {} not found in device map", mac);
    return FLEET_ERR_NOT_FOUND;
  }
  if (!device->online) {
    FLEET_LOGW(TAG, "Device {} is marked offline, the request may fail", device->mac_address);
  }
  for (const auto& holder : registry_.lookup_by_id(new_id)) {
    if (holder.mac_address != device->mac_address) {
      FLEET_LOGW(TAG, "ID '{}' is already used by {}, this creates a duplicate", new_id, holder.mac_address);
    }
  }

  FLEET_LOGI(TAG, "Setting ID of {} ({}): {} -> {}", device->mac_address, device->ip_address, device->id, new_id);
  out = dispatcher().run_one(*device, *op);
  if (!out.success()) {
    FLEET_LOGE(TAG, "Failed to set ID on {}: {}", device->ip_address, out.error);
    return FLEET_FAIL;
  }
  DeviceRecord renamed = *device;
  renamed.id = new_id;
  renamed.online = true;
  renamed.last_seen = timestamp_now_iso();
  err = registry_.update_record(renamed);
  if (err != FLEET_OK) {
    FLEET_LOGE(TAG, "ID changed on device but device map update failed: {}", fleet_err_to_name(err));
    return err;
  }
  FLEET_LOGI(TAG, "Changed ID of {} from '{}' to '{}'", device->mac_address, device->id, new_id);
  return FLEET_OK;
}

AutoAssignPlan IdentityResolver::plan_auto_assign() const {
  return ::fleet::plan_auto_assign(registry_.devices(), opts_.prefix, opts_.start_num, opts_.include_offline);
}

fleet_err_t IdentityResolver::auto_assign(const ConfirmFn& confirm, AutoAssignPlan& plan, size_t& succeeded) {
  succeeded = 0;
  plan = plan_auto_assign();
  if (plan.assignments.empty()) {
    FLEET_LOGI(TAG, "No ID changes needed");
    return FLEET_OK;
  }
  if (!confirm || !confirm(plan)) {
    FLEET_LOGI(TAG, "Auto-assignment cancelled");
    return FLEET_ERR_CANCELLED;
  }
  for (const auto& assignment : plan.assignments) {
    if (cancelled()) {
      FLEET_LOGW(TAG, "Interrupted after {} assignments", succeeded);
      return FLEET_ERR_CANCELLED;
    }
    OperationResult result;
    if (assign_id(assignment.mac_address, assignment.new_id, result) == FLEET_OK) {
      ++succeeded;
    } else {
      FLEET_LOGE(TAG, "Failed to assign {} to {}", assignment.new_id, assignment.mac_address);
    }
  }
  FLEET_LOGI(TAG, "Auto-assignment complete: {}/{} successful", succeeded, plan.assignments.size());
  return succeeded == plan.assignments.size() ? FLEET_OK : FLEET_FAIL;
}

fleet_err_t IdentityResolver::provision_single(const std::string& cidr, const std::string& new_id,
                                               size_t concurrency, ProvisionReport& report) {
  report = ProvisionReport{};
  DeviceOperationPtr op;
  fleet_err_t err = ops::set_id(new_id, op);
  if (err != FLEET_OK) {
    return err;
  }
  AddressRange range;
  err = AddressRange::parse(cidr, range);
  if (err != FLEET_OK) {
    FLEET_LOGE(TAG, "Invalid network range '{}'", cidr);
    return err;
  }

  FLEET_LOGI(TAG, "Provisioning scan of {} ({} addresses)", range.to_string(), range.size());
  Prober prober(opts_.port);
  prober.set_cancel_flag(cancel_);
  err = prober.probe_range(range, concurrency, opts_.timeout, report.found);
  report.stats = prober.last_stats();
  if (err == FLEET_ERR_CANCELLED) {
    report.outcome = ProvisionOutcome::Cancelled;
    FLEET_LOGW(TAG, "Provisioning scan of {} cancelled", range.to_string());
    return err;
  }
  if (err != FLEET_OK) {
    report.outcome = ProvisionOutcome::RequestFailed;
    return err;
  }
  for (const auto& d : report.found) {
    FLEET_LOGI(TAG, "Found device at {}: ID={}, MAC={}", d.ip_address, d.id, d.mac_address);
  }

  if (report.found.empty()) {
    report.outcome = ProvisionOutcome::NoneFound;
    FLEET_LOGE(TAG, "No devices found on {}", range.to_string());
    return FLEET_ERR_NOT_FOUND;
  }
  if (report.found.size() > 1) {
    report.outcome = ProvisionOutcome::MultipleFound;
    FLEET_LOGE(TAG, "Found {} devices on {}, provisioning needs exactly one", report.found.size(),
               range.to_string());
    return FLEET_ERR_DUPLICATE;
  }

  const DeviceRecord& device = report.found.front();
  FLEET_LOGI(TAG, "Exactly one device at {} (MAC {}), ID {} -> {}", device.ip_address, device.mac_address, device.id,
             new_id);
  report.result = dispatcher().run_one(device, *op);
  if (!report.result.success()) {
    report.outcome = ProvisionOutcome::RequestFailed;
    FLEET_LOGE(TAG, "Failed to set ID: {}", report.result.error);
    return FLEET_FAIL;
  }
  report.outcome = ProvisionOutcome::Assigned;
  FLEET_LOGI(TAG, "Provisioned {} (MAC {}) as '{}'", device.ip_address, device.mac_address, new_id);

  if (registry_.lookup_by_mac(device.mac_address)) {
    DeviceRecord renamed = device;
    renamed.id = new_id;
    err = registry_.update_record(renamed);
    if (err != FLEET_OK) {
      FLEET_LOGW(TAG, "Device map not updated: {}", fleet_err_to_name(err));
    }
  } else {
    FLEET_LOGI(TAG, "Device {} is not in the device map yet, run an add scan to record it", device.mac_address);
  }
  return FLEET_OK;
}

fleet_err_t IdentityResolver::identify(const DeviceRecord& device, std::chrono::seconds duration,
                                       OperationResult& out) {
  if (!device.online) {
    FLEET_LOGW(TAG, "Device {} is marked offline, the request may fail", device.mac_address);
  }
  FLEET_LOGI(TAG, "Identify {} (MAC {}, IP {}) for {}s", device.id, device.mac_address, device.ip_address,
             duration.count());
  BatchDispatcher disp = dispatcher();

  const OperationResult stopped = disp.run_one(device, *ops::stop_all_tracks());
  if (!stopped.success()) {
    FLEET_LOGW(TAG, "Stopping current loops: {}", stopped.error);
  }
  out = disp.run_one(device, *ops::identify_start());
  if (!out.success()) {
    FLEET_LOGE(TAG, "Failed to start identify sound: {}", out.error);
    return FLEET_FAIL;
  }

  const auto until = std::chrono::steady_clock::now() + duration;
  while (std::chrono::steady_clock::now() < until) {
    if (cancelled()) {
      FLEET_LOGI(TAG, "Identify interrupted");
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  DeviceOperationPtr stop;
  if (ops::stop_track(0, stop) == FLEET_OK) {
    const OperationResult result = disp.run_one(device, *stop);
    if (!result.success()) {
      FLEET_LOGW(TAG, "Failed to stop identify sound: {}", result.error);
    }
  }
  FLEET_LOGI(TAG, "Identify finished on {}", device.id);
  return FLEET_OK;
}

}  // namespace fleet
