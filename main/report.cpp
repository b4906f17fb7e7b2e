#include "report.hpp"
#include "fleet_core/device_ops.hpp"
#include "fleet_core/prober.hpp"
#include "cJSON.h"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <map>

namespace fleet::cli {

namespace {

const std::string RULE(80, '-');
const std::string DOUBLE_RULE(80, '=');

std::string status_label(OperationStatus status) {
  switch (status) {
    case OperationStatus::Success:
      return "OK";
    case OperationStatus::Partial:
      return "PARTIAL";
    case OperationStatus::Error:
      return "FAILED";
  }
  return "FAILED";
}

std::string detail(const OperationResult& r) {
  if (r.status == OperationStatus::Success) {
    if (r.response == "skipped") {
      return "skipped (same size on device)";
    }
    return r.steps_total > 1 ? fmt::format("{}/{} steps", r.steps_ok, r.steps_total) : std::string("HTTP 200");
  }
  if (r.steps_total > 1) {
    return fmt::format("{}/{} steps, {}", r.steps_ok, r.steps_total, r.error);
  }
  return r.error;
}

std::string format_uptime(uint64_t secs) {
  return fmt::format("{}h {:02}m {:02}s", secs / 3600, (secs / 60) % 60, secs % 60);
}

}  // namespace

void print_scan_summary(const ScanStats& stats, const MergeStats& merge, size_t total_in_map) {
  fmt::print("\n{}\nSCAN COMPLETE\n{}\n", DOUBLE_RULE, RULE);
  fmt::print("Addresses scanned:     {}/{}\n", stats.scanned, stats.total);
  fmt::print("Devices found online:  {}\n", stats.found);
  if (stats.errors) {
    fmt::print("Invalid answers:       {}\n", stats.errors);
  }
  fmt::print("Added / updated:       {} / {}\n", merge.added, merge.updated);
  fmt::print("Skipped / offline:     {} / {}\n", merge.skipped, merge.marked_offline);
  fmt::print("Total devices in map:  {}\n", total_in_map);
  fmt::print("Scan duration:         {:.2f} s\n", stats.duration_s);
}

void print_results(const std::string& title, const std::vector<OperationResult>& results) {
  size_t ok = 0;
  size_t partial = 0;
  fmt::print("\n{}\n{}\n", title, DOUBLE_RULE);
  fmt::print("{:<16} {:<18} {:<15} {:<8} {}\n", "ID", "MAC Address", "IP Address", "Result", "Detail");
  fmt::print("{}\n", RULE);
  for (const auto& r : results) {
    fmt::print("{:<16} {:<18} {:<15} {:<8} {}\n", r.device_id, r.mac_address, r.ip_address, status_label(r.status),
               detail(r));
    if (r.status == OperationStatus::Success) {
      ++ok;
    } else if (r.status == OperationStatus::Partial) {
      ++partial;
    }
  }
  fmt::print("{}\n", RULE);
  fmt::print("Summary: {}/{} succeeded, {} partial, {} failed\n", ok, results.size(), partial,
             results.size() - ok - partial);
}

void print_status_results(const std::vector<OperationResult>& results) {
  fmt::print("\nDEVICE STATUS\n{}\n", DOUBLE_RULE);
  fmt::print("{:<16} {:<15} {:<8} {:<12} {:<6} {}\n", "ID", "IP Address", "Result", "Firmware", "WiFi", "Uptime");
  fmt::print("{}\n", RULE);
  size_t ok = 0;
  for (const auto& r : results) {
    DeviceRecord live;
    if (r.success() && parse_status_body(r.response, r.ip_address, live) == FLEET_OK) {
      ++ok;
      fmt::print("{:<16} {:<15} {:<8} {:<12} {:<6} {}\n", live.id, r.ip_address, "ONLINE",
                 live.firmware_version.value_or("N/A"),
                 live.wifi_connected ? (*live.wifi_connected ? "yes" : "no") : "N/A",
                 live.uptime_seconds ? format_uptime(*live.uptime_seconds) : std::string("N/A"));
    } else {
      fmt::print("{:<16} {:<15} {:<8} {}\n", r.device_id, r.ip_address, "FAILED",
                 r.error.empty() ? std::string("invalid status answer") : r.error);
    }
  }
  fmt::print("{}\n", RULE);
  fmt::print("Online: {}/{}\n", ok, results.size());
}

void print_file_listing(const std::vector<OperationResult>& results) {
  for (const auto& r : results) {
    fmt::print("\n{} ({})\n", r.device_id, r.ip_address);
    std::vector<RemoteFile> files;
    if (!r.success() || parse_file_list(r.response, files) != FLEET_OK) {
      fmt::print("  error: {}\n", r.error.empty() ? std::string("invalid file list") : r.error);
      continue;
    }
    if (files.empty()) {
      fmt::print("  (no files)\n");
    }
    for (const auto& f : files) {
      if (f.size > 0) {
        fmt::print("  - {:<40} {:<5} {:>8.2f} MB\n", f.name, f.type, f.size / (1024.0 * 1024.0));
      } else {
        fmt::print("  - {:<40} {:<5}\n", f.name, f.type);
      }
    }
  }
}

void print_loops(const OperationResult& result) {
  if (!result.success()) {
    fmt::print("Failed to read loops: {}\n", result.error);
    return;
  }
  cJSON* root = cJSON_ParseWithLength(result.response.c_str(), result.response.size());
  if (!root) {
    fmt::print("{}\n", result.response);
    return;
  }
  fmt::print("\nLOOPS on {} ({})\n{}\n", result.device_id, result.ip_address, RULE);
  const cJSON* loop = nullptr;
  cJSON_ArrayForEach(loop, cJSON_GetObjectItem(root, "loops")) {
    const cJSON* track = cJSON_GetObjectItem(loop, "track");
    const cJSON* file = cJSON_GetObjectItem(loop, "file");
    const cJSON* playing = cJSON_GetObjectItem(loop, "playing");
    const cJSON* volume = cJSON_GetObjectItem(loop, "volume");
    fmt::print("  Track {}: {:<30} {:<8} vol {}\n", cJSON_IsNumber(track) ? track->valueint : -1,
               cJSON_IsString(file) && file->valuestring[0] ? file->valuestring : "(none)",
               cJSON_IsTrue(playing) ? "playing" : "stopped",
               cJSON_IsNumber(volume) ? volume->valueint : 0);
  }
  if (const cJSON* global = cJSON_GetObjectItem(root, "global_volume"); cJSON_IsNumber(global)) {
    fmt::print("  Global volume: {}\n", global->valueint);
  }
  if (const cJSON* active = cJSON_GetObjectItem(root, "active_count"); cJSON_IsNumber(active)) {
    const cJSON* max_tracks = cJSON_GetObjectItem(root, "max_tracks");
    fmt::print("  Active: {}/{}\n", active->valueint,
               cJSON_IsNumber(max_tracks) ? max_tracks->valueint : TRACK_COUNT);
  }
  cJSON_Delete(root);
}

void print_device_list(const std::vector<DeviceRecord>& devices) {
  if (devices.empty()) {
    fmt::print("\nNo devices found in device map.\n");
    return;
  }
  std::map<std::string, size_t> id_count;
  for (const auto& d : devices) {
    ++id_count[d.id];
  }
  std::vector<DeviceRecord> sorted = devices;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const DeviceRecord& a, const DeviceRecord& b) { return a.id < b.id; });

  fmt::print("\nDEVICE LIST\n{}\n", DOUBLE_RULE);
  fmt::print("{:<20} {:<20} {:<15} {:<10} {}\n", "ID", "MAC Address", "IP Address", "Status", "Firmware");
  fmt::print("{}\n", RULE);
  size_t online = 0;
  for (const auto& d : sorted) {
    if (d.online) {
      ++online;
    }
    fmt::print("{:<20} {:<20} {:<15} {:<10} {}{}\n", d.id, d.mac_address, d.ip_address, d.online ? "ONLINE" : "OFFLINE",
               d.firmware_version.value_or("N/A"), id_count[d.id] > 1 ? " (duplicate)" : "");
  }
  fmt::print("{}\n", RULE);
  fmt::print("Total: {} devices ({} online, {} offline)\n", devices.size(), online, devices.size() - online);
}

void print_duplicates(const std::vector<DuplicateGroup>& groups) {
  if (groups.empty()) {
    fmt::print("\nNo duplicate IDs found.\n");
    return;
  }
  size_t total = 0;
  fmt::print("\nDUPLICATE IDs\n{}\n", DOUBLE_RULE);
  for (const auto& g : groups) {
    fmt::print("\nID '{}' is used by {} devices:\n", g.id, g.members.size());
    for (const auto& d : g.members) {
      fmt::print("  MAC {:<18} IP {:<15} {:<8} last seen {}\n", d.mac_address, d.ip_address,
                 d.online ? "online" : "offline", d.last_seen.empty() ? std::string("never") : d.last_seen);
    }
    total += g.members.size();
  }
  fmt::print("\n{}\n", DOUBLE_RULE);
  fmt::print("Summary: {} devices with {} duplicate ID(s)\n", total, groups.size());
  fmt::print("Assign unique IDs with: scape-fleet id --command set-id --mac <MAC> --new-id <ID>\n");
}

void print_plan(const AutoAssignPlan& plan) {
  fmt::print("\nPlanned ID assignments:\n{}\n", RULE);
  for (const auto& a : plan.assignments) {
    fmt::print("  {}: {} -> {}\n", a.mac_address, a.old_id, a.new_id);
  }
  fmt::print("{}\n", RULE);
  fmt::print("Total: {} devices will be updated ({} already correct, {} offline skipped)\n",
             plan.assignments.size(), plan.already_assigned, plan.skipped_offline);
}

void print_found_devices(const std::vector<DeviceRecord>& devices) {
  size_t index = 1;
  for (const auto& d : devices) {
    fmt::print("  {}. IP: {:<15} ID: {:<20} MAC: {}\n", index++, d.ip_address, d.id, d.mac_address);
  }
}

}  // namespace fleet::cli
