#include "commands.hpp"
#include "fleet_core/config.hpp"
#include "fleet_core/log.hpp"
#include "CLI/CLI.hpp"
#include <atomic>
#include <csignal>

static const char* TAG = "main";

namespace {

std::atomic<bool> g_stop{false};

void handle_signal(int) {
  g_stop.store(true);
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App app{"scape-fleet: discover, track and control networked loop players"};
  app.require_subcommand(1);

  std::string config_path;
  std::string map_file;
  bool verbose = false;
  app.add_option("--config", config_path, "Tool configuration JSON");
  app.add_option("--map-file,-f", map_file, "Device map JSON (default: device_map.json)");
  app.add_flag("-v,--verbose", verbose, "Enable debug logging");

  fleet::cli::ScanOptions scan;
  auto* scan_cmd = app.add_subcommand("scan", "Probe a network range and update the device map");
  scan_cmd->add_option("--net,--network", scan.network, "Network range in CIDR form, e.g. 192.168.1.0/24")
      ->required();
  scan_cmd->add_option("--action,--mode", scan.action, "create (new map), add (merge) or update (known only)")
      ->required()
      ->check(CLI::IsMember({"create", "add", "update"}, CLI::ignore_case));
  scan_cmd->add_option("--timeout", scan.timeout_s, "Per-address timeout in seconds");
  scan_cmd->add_option("--concurrent", scan.concurrent, "Addresses probed at once");

  fleet::cli::BatchOptions batch;
  auto* batch_cmd = app.add_subcommand("batch", "Run one command on many devices");
  batch_cmd->add_option("--command,-c", batch.command, "Command to run")
      ->required()
      ->check(CLI::IsMember({"status", "stop-all", "start-all", "set-volume", "save-config", "load-config",
                             "list-files", "upload", "delete-file", "sync"}));
  batch_cmd->add_option("--track", batch.track, "Track number (0-2)");
  batch_cmd->add_option("--volume", batch.volume, "Volume (0-100)");
  batch_cmd->add_flag("--global", batch.global, "Set global instead of track volume");
  batch_cmd->add_flag("--all-devices", batch.all_devices, "Include devices marked offline");
  batch_cmd->add_option("--filter-id", batch.filter_id, "Regex matched against device IDs");
  batch_cmd->add_option("--ids", batch.ids, "Explicit device IDs")->delimiter(',');
  batch_cmd->add_option("--macs", batch.macs, "Explicit MAC addresses")->delimiter(',');
  batch_cmd->add_option("--file", batch.file, "Local file for upload");
  batch_cmd->add_option("--name", batch.name, "Remote file name for upload or delete-file");
  batch_cmd->add_option("--dir", batch.dir, "Local directory whose audio files sync uploads");
  batch_cmd->add_flag("--no-skip", batch.no_skip, "Upload even if the device has a file of the same size");
  batch_cmd->add_option("--timeout", batch.timeout_s, "Request timeout in seconds");
  batch_cmd->add_option("--concurrent", batch.concurrent, "Devices contacted at once");

  fleet::cli::DeviceOptions device;
  auto* device_cmd = app.add_subcommand("device", "Run one command on a single device");
  auto* id_opt = device_cmd->add_option("--id,-i", device.id, "Device ID (must be unique)");
  auto* mac_opt = device_cmd->add_option("--mac,-m", device.mac, "Device MAC address");
  id_opt->excludes(mac_opt);
  device_cmd->add_option("--command,-c", device.command, "Command to run")
      ->required()
      ->check(CLI::IsMember({"status", "stop", "start", "set-volume", "set-id", "save-config", "load-config",
                             "get-loops", "set-file", "list-files"}));
  device_cmd->add_option("--track", device.track, "Track number (0-2)");
  device_cmd->add_option("--volume", device.volume, "Volume (0-100)");
  device_cmd->add_flag("--global", device.global, "Set global instead of track volume");
  device_cmd->add_option("--new-id", device.new_id, "New device ID for set-id");
  device_cmd->add_option("--file-index", device.file_index, "File index from the device file list");
  device_cmd->add_option("--file-path", device.file_path, "File path on the device");
  device_cmd->add_option("--timeout", device.timeout_s, "Request timeout in seconds");

  fleet::cli::IdOptions ident;
  auto* id_cmd = app.add_subcommand("id", "Find duplicate IDs and assign new ones");
  id_cmd->add_option("--command,-c", ident.command, "Command to run")
      ->required()
      ->check(CLI::IsMember({"find-duplicates", "list-all", "set-id", "auto-assign", "provision-single", "identify"}));
  id_cmd->add_option("--id,-i", ident.id, "Device ID");
  id_cmd->add_option("--mac,-m", ident.mac, "Device MAC address");
  id_cmd->add_option("--new-id,-n", ident.new_id, "New device ID");
  id_cmd->add_option("--network", ident.network, "Network range for provision-single");
  id_cmd->add_option("--duration,-d", ident.duration_s, "Identify sound duration in seconds");
  id_cmd->add_option("--prefix,-p", ident.prefix, "Prefix for auto-assigned IDs");
  id_cmd->add_option("--start-num,-s", ident.start_num, "First number for auto-assigned IDs");
  id_cmd->add_flag("--include-offline", ident.include_offline, "Auto-assign offline devices too");
  id_cmd->add_flag("--yes,-y", ident.yes, "Do not ask before auto-assigning");
  id_cmd->add_option("--timeout,-t", ident.timeout_s, "Request timeout in seconds");
  id_cmd->add_option("--concurrent", ident.concurrent, "Addresses probed at once for provision-single");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  fleet::AppConfig cfg;
  if (!config_path.empty()) {
    const fleet::fleet_err_t err = fleet::config_load(config_path, cfg);
    if (err != fleet::FLEET_OK) {
      FLEET_LOGE(TAG, "Config {} unusable: {}", config_path, fleet::fleet_err_to_name(err));
      return 1;
    }
  }
  if (!map_file.empty()) {
    cfg.map_file = map_file;
  }
  spdlog::level::level_enum level = spdlog::level::info;
  if (!fleet::log_parse_level(cfg.log_level, level)) {
    FLEET_LOGW(TAG, "Unknown log level '{}', using info", cfg.log_level);
    level = spdlog::level::info;
  }
  fleet::log_set_level(verbose ? spdlog::level::debug : level);

  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);

  if (*scan_cmd) {
    return fleet::cli::run_scan(cfg, scan, g_stop);
  }
  if (*batch_cmd) {
    return fleet::cli::run_batch(cfg, batch, g_stop);
  }
  if (*device_cmd) {
    if (device.id.empty() && device.mac.empty()) {
      FLEET_LOGE(TAG, "device needs --id or --mac");
      return 1;
    }
    return fleet::cli::run_device(cfg, device, g_stop);
  }
  if (*id_cmd) {
    return fleet::cli::run_id(cfg, ident, g_stop);
  }
  return 1;
}
