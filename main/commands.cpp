#include "commands.hpp"
#include "report.hpp"
#include "fleet_core.hpp"
#include <spdlog/fmt/fmt.h>
#include <cctype>
#include <cstdio>
#include <iostream>

static const char* TAG = "cli";

namespace fleet::cli {

namespace {

std::chrono::milliseconds pick_timeout(const std::optional<double>& seconds, uint32_t fallback_ms) {
  if (seconds) {
    return timeout_from_seconds(*seconds, fallback_ms);
  }
  return std::chrono::milliseconds(fallback_ms);
}

size_t pick_concurrency(const std::optional<uint32_t>& value, uint32_t fallback) {
  if (value && *value > 0) {
    return *value;
  }
  return fallback;
}

int exit_code(fleet_err_t err) {
  return err == FLEET_OK ? 0 : 1;
}

void log_progress(size_t done, size_t total) {
  FLEET_LOGD(TAG, "{}/{} ({:.1f}%)", done, total, total ? 100.0 * done / total : 100.0);
}

bool confirm_on_stdin(const AutoAssignPlan& plan) {
  print_plan(plan);
  fmt::print("\nProceed with auto-assignment? (y/n): ");
  std::fflush(stdout);
  std::string answer;
  if (!std::getline(std::cin, answer)) {
    return false;
  }
  return answer.size() == 1 && std::tolower(static_cast<unsigned char>(answer[0])) == 'y';
}

// Shared by batch and device: builds the operation for a command name.
fleet_err_t build_operation(const std::string& command, const std::optional<int>& track,
                            const std::optional<int>& volume, bool global, DeviceOperationPtr& op) {
  if (command == "status") {
    op = ops::status();
  } else if (command == "stop-all" || command == "stop") {
    op = ops::stop_all_tracks();
  } else if (command == "start-all" || command == "start") {
    op = ops::start_configured_tracks();
  } else if (command == "save-config") {
    op = ops::save_config();
  } else if (command == "load-config") {
    op = ops::load_config();
  } else if (command == "list-files") {
    op = ops::list_files();
  } else if (command == "get-loops") {
    op = ops::get_loops();
  } else if (command == "set-volume") {
    if (!volume) {
      FLEET_LOGE(TAG, "--volume is required for set-volume");
      return FLEET_ERR_INVALID_ARG;
    }
    if (global) {
      return ops::set_global_volume(*volume, op);
    }
    if (!track) {
      FLEET_LOGE(TAG, "--track is required for track volume (or use --global)");
      return FLEET_ERR_INVALID_ARG;
    }
    return ops::set_track_volume(*track, *volume, op);
  } else {
    FLEET_LOGE(TAG, "Unknown command '{}'", command);
    return FLEET_ERR_INVALID_ARG;
  }
  return FLEET_OK;
}

}  // namespace

int run_scan(const AppConfig& cfg, const ScanOptions& opts, const std::atomic<bool>& stop) {
  MergeMode mode;
  if (parse_merge_mode(opts.action, mode) != FLEET_OK) {
    FLEET_LOGE(TAG, "Invalid action '{}', expected create, add or update", opts.action);
    return 1;
  }
  AddressRange range;
  if (AddressRange::parse(opts.network, range) != FLEET_OK) {
    FLEET_LOGE(TAG, "Invalid network range '{}'", opts.network);
    return 1;
  }
  const auto timeout = pick_timeout(opts.timeout_s, cfg.scan.timeout_ms);
  const size_t concurrency = pick_concurrency(opts.concurrent, cfg.scan.concurrency);

  Registry registry(cfg.map_file);
  if (mode != MergeMode::Create) {
    const fleet_err_t err = registry.load();
    if (err != FLEET_OK) {
      FLEET_LOGE(TAG, "Cannot load {}: {}", cfg.map_file, fleet_err_to_name(err));
      return 1;
    }
    FLEET_LOGI(TAG, "Loaded {} devices from existing map", registry.size());
  }

  FLEET_LOGI(TAG, "Scanning {} ({} addresses), mode {}, timeout {} ms, {} concurrent", range.to_string(),
             range.size(), merge_mode_name(mode), timeout.count(), concurrency);
  Prober prober(cfg.device_port);
  prober.set_cancel_flag(&stop);
  prober.set_progress_callback(log_progress);
  std::vector<DeviceRecord> found;
  fleet_err_t err = prober.probe_range(range, concurrency, timeout, found);
  if (err == FLEET_ERR_CANCELLED) {
    FLEET_LOGW(TAG, "Scan interrupted after {}/{} addresses, device map left unchanged", prober.last_stats().scanned,
               range.size());
    return 1;
  }
  if (err != FLEET_OK) {
    FLEET_LOGE(TAG, "Scan failed: {}", fleet_err_to_name(err));
    return 1;
  }
  for (const auto& d : found) {
    FLEET_LOGI(TAG, "Found device at {}: ID={}, MAC={}", d.ip_address, d.id, d.mac_address);
  }

  MergeStats merge_stats;
  err = registry.apply_scan(found, mode, range.to_string(), &merge_stats);
  if (err != FLEET_OK) {
    return 1;
  }
  print_scan_summary(prober.last_stats(), merge_stats, registry.size());
  return 0;
}

int run_batch(const AppConfig& cfg, const BatchOptions& opts, const std::atomic<bool>& stop) {
  Registry registry(cfg.map_file);
  if (registry.require_loaded() != FLEET_OK) {
    return 1;
  }
  DeviceFilter filter;
  filter.include_offline = opts.all_devices || cfg.batch.include_offline;
  filter.id_pattern = opts.filter_id;
  filter.ids = opts.ids;
  filter.macs = opts.macs;
  std::vector<DeviceRecord> devices;
  if (apply_filter(registry.list(), filter, devices) != FLEET_OK) {
    return 1;
  }
  if (devices.empty()) {
    FLEET_LOGE(TAG, "No devices to control (check filters or run a scan first)");
    return 1;
  }
  FLEET_LOGI(TAG, "{} of {} devices selected", devices.size(), registry.size());

  RequestOptions req;
  req.port = cfg.device_port;
  req.timeout = pick_timeout(opts.timeout_s, cfg.batch.timeout_ms);
  const size_t concurrency = pick_concurrency(opts.concurrent, cfg.batch.concurrency);

  if (opts.command == "sync") {
    if (opts.dir.empty()) {
      FLEET_LOGE(TAG, "--dir is required for sync");
      return 1;
    }
    BatchDispatcher dispatcher(req);
    dispatcher.set_cancel_flag(&stop);
    dispatcher.set_progress_callback(log_progress);
    std::vector<SyncedFile> synced;
    const fleet_err_t err = sync_directory(dispatcher, devices, opts.dir,
                                           std::chrono::milliseconds(cfg.upload.timeout_ms), concurrency, synced);
    for (const auto& file : synced) {
      print_results(fmt::format("SYNC {}", file.name), file.results);
    }
    if (err == FLEET_ERR_CANCELLED) {
      FLEET_LOGW(TAG, "Interrupted, remaining files were not synced");
    }
    return exit_code(err);
  }

  DeviceOperationPtr op;
  fleet_err_t err = FLEET_OK;
  if (opts.command == "upload") {
    if (opts.file.empty()) {
      FLEET_LOGE(TAG, "--file is required for upload");
      return 1;
    }
    err = ops::upload_file(opts.file, opts.name, !opts.no_skip, std::chrono::milliseconds(cfg.upload.timeout_ms), op);
  } else if (opts.command == "delete-file") {
    if (opts.name.empty()) {
      FLEET_LOGE(TAG, "--name is required for delete-file");
      return 1;
    }
    err = ops::delete_file(opts.name, op);
  } else {
    err = build_operation(opts.command, opts.track, opts.volume, opts.global, op);
  }
  if (err != FLEET_OK) {
    return 1;
  }

  BatchDispatcher dispatcher(req);
  dispatcher.set_cancel_flag(&stop);
  dispatcher.set_progress_callback(log_progress);
  const auto results = dispatcher.dispatch(devices, *op, concurrency);

  if (opts.command == "status") {
    print_status_results(results);
  } else if (opts.command == "list-files") {
    print_file_listing(results);
  } else {
    print_results(fmt::format("BATCH {}", opts.command), results);
  }
  if (dispatcher.cancelled()) {
    FLEET_LOGW(TAG, "Interrupted, devices not reached are reported as cancelled");
    return 1;
  }
  return 0;
}

int run_device(const AppConfig& cfg, const DeviceOptions& opts, const std::atomic<bool>& stop) {
  Registry registry(cfg.map_file);
  if (registry.require_loaded() != FLEET_OK) {
    return 1;
  }
  DeviceRecord device;
  if (select_device(registry, opts.mac, opts.id, device) != FLEET_OK) {
    return 1;
  }
  if (!device.online) {
    FLEET_LOGW(TAG, "Device {} is marked offline, the request may fail", device.id);
  }
  const auto timeout = pick_timeout(opts.timeout_s, cfg.batch.timeout_ms);

  if (opts.command == "set-id") {
    if (opts.new_id.empty()) {
      FLEET_LOGE(TAG, "--new-id is required for set-id");
      return 1;
    }
    IdentityOptions id_opts;
    id_opts.port = cfg.device_port;
    id_opts.timeout = timeout;
    IdentityResolver resolver(registry, id_opts);
    resolver.set_cancel_flag(&stop);
    OperationResult result;
    const fleet_err_t err = resolver.assign_id(device.mac_address, opts.new_id, result);
    print_results("DEVICE set-id", {result});
    return exit_code(err);
  }

  DeviceOperationPtr op;
  fleet_err_t err = FLEET_OK;
  if (opts.command == "set-file") {
    if (!opts.track) {
      FLEET_LOGE(TAG, "--track is required for set-file");
      return 1;
    }
    std::optional<std::string> path;
    if (!opts.file_path.empty()) {
      path = opts.file_path;
    }
    err = ops::set_track_file(*opts.track, opts.file_index, path, op);
  } else {
    err = build_operation(opts.command, opts.track, opts.volume, opts.global, op);
  }
  if (err != FLEET_OK) {
    return 1;
  }

  RequestOptions req;
  req.port = cfg.device_port;
  req.timeout = timeout;
  BatchDispatcher dispatcher(req);
  FLEET_LOGI(TAG, "{} on {} ({}, {})", op->name(), device.id, device.mac_address, device.ip_address);
  const OperationResult result = dispatcher.run_one(device, *op);
  if (opts.command == "status") {
    print_status_results({result});
  } else if (opts.command == "get-loops") {
    print_loops(result);
  } else if (opts.command == "list-files") {
    print_file_listing({result});
  } else {
    print_results(fmt::format("DEVICE {}", opts.command), {result});
  }
  return result.success() ? 0 : 1;
}

int run_id(const AppConfig& cfg, const IdOptions& opts, const std::atomic<bool>& stop) {
  Registry registry(cfg.map_file);
  IdentityOptions id_opts;
  id_opts.port = cfg.device_port;
  id_opts.timeout = pick_timeout(opts.timeout_s, cfg.identity.timeout_ms);
  id_opts.prefix = opts.prefix.value_or(cfg.identity.prefix);
  id_opts.start_num = opts.start_num.value_or(cfg.identity.start_num);
  id_opts.include_offline = opts.include_offline;

  if (opts.command == "provision-single") {
    if (opts.network.empty() || opts.new_id.empty()) {
      FLEET_LOGE(TAG, "--network and --new-id are required for provision-single");
      return 1;
    }
    const fleet_err_t load_err = registry.load();
    if (load_err != FLEET_OK) {
      FLEET_LOGW(TAG, "Device map unavailable ({}), it will not be updated", fleet_err_to_name(load_err));
    }
    IdentityResolver resolver(registry, id_opts);
    resolver.set_cancel_flag(&stop);
    ProvisionReport report;
    const fleet_err_t err =
        resolver.provision_single(opts.network, opts.new_id, pick_concurrency(opts.concurrent, cfg.scan.concurrency),
                                  report);
    fmt::print("\nProvisioning result: {}\n", provision_outcome_name(report.outcome));
    if (report.outcome == ProvisionOutcome::MultipleFound) {
      print_found_devices(report.found);
      fmt::print("Keep only one device on the network, or use 'id --command set-id --mac <MAC>'.\n");
    }
    return exit_code(err);
  }

  if (registry.require_loaded() != FLEET_OK) {
    return 1;
  }
  IdentityResolver resolver(registry, id_opts);
  resolver.set_cancel_flag(&stop);

  if (opts.command == "find-duplicates") {
    print_duplicates(resolver.find_duplicates());
    return 0;
  }
  if (opts.command == "list-all") {
    print_device_list(registry.list());
    const auto groups = resolver.find_duplicates();
    if (!groups.empty()) {
      fmt::print("\nWarning: {} ID(s) have duplicates\n", groups.size());
    }
    return 0;
  }
  if (opts.command == "set-id") {
    if (opts.mac.empty() || opts.new_id.empty()) {
      FLEET_LOGE(TAG, "--mac and --new-id are required for set-id");
      return 1;
    }
    OperationResult result;
    return exit_code(resolver.assign_id(opts.mac, opts.new_id, result));
  }
  if (opts.command == "auto-assign") {
    AutoAssignPlan plan;
    size_t succeeded = 0;
    const bool assume_yes = opts.yes;
    const fleet_err_t err = resolver.auto_assign(
        [assume_yes](const AutoAssignPlan& p) {
          if (assume_yes) {
            print_plan(p);
            return true;
          }
          return confirm_on_stdin(p);
        },
        plan, succeeded);
    if (!plan.assignments.empty()) {
      fmt::print("\nAuto-assignment: {}/{} successful\n", succeeded, plan.assignments.size());
    }
    return exit_code(err);
  }
  if (opts.command == "identify") {
    DeviceRecord device;
    if (select_device(registry, opts.mac, opts.id, device) != FLEET_OK) {
      return 1;
    }
    OperationResult result;
    const uint32_t duration = opts.duration_s.value_or(cfg.identity.identify_duration_s);
    return exit_code(resolver.identify(device, std::chrono::seconds(duration), result));
  }
  FLEET_LOGE(TAG, "Unknown id command '{}'", opts.command);
  return 1;
}

}  // namespace fleet::cli
