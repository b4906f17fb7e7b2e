#include "fleet_core/registry.hpp"
#include "fleet_core/address_range.hpp"
#include "fleet_core/file_util.hpp"
#include "fleet_core/log.hpp"
#include "cJSON.h"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <tuple>

static const char* TAG = "registry";

namespace fleet {

namespace {

const char* const KNOWN_KEYS[] = {
    "mac_address", "id", "ip_address", "online", "last_seen", "firmware_version", "wifi_connected", "uptime_seconds",
};

bool is_known_key(const char* key) {
  for (const char* known : KNOWN_KEYS) {
    if (std::strcmp(known, key) == 0) {
      return true;
    }
  }
  return false;
}

std::string print_item(const cJSON* item) {
  char* txt = cJSON_PrintUnformatted(item);
  std::string out = txt ? txt : "null";
  if (txt) {
    cJSON_free(txt);
  }
  return out;
}

bool decode_record(const cJSON* obj, DeviceRecord& out) {
  if (!cJSON_IsObject(obj)) {
    return false;
  }
  DeviceRecord record{};
  std::string mac;
  if (cJSON* item = cJSON_GetObjectItem(obj, "mac_address"); cJSON_IsString(item)) {
    mac = item->valuestring;
  }
  if (!mac_canonicalize(mac, record.mac_address)) {
    return false;
  }
  record.id = "UNKNOWN";
  if (cJSON* item = cJSON_GetObjectItem(obj, "id"); cJSON_IsString(item)) record.id = item->valuestring;
  if (cJSON* item = cJSON_GetObjectItem(obj, "ip_address"); cJSON_IsString(item)) record.ip_address = item->valuestring;
  if (cJSON* item = cJSON_GetObjectItem(obj, "online"); cJSON_IsBool(item)) record.online = cJSON_IsTrue(item);
  if (cJSON* item = cJSON_GetObjectItem(obj, "last_seen"); cJSON_IsString(item)) record.last_seen = item->valuestring;
  if (cJSON* item = cJSON_GetObjectItem(obj, "firmware_version"); cJSON_IsString(item)) {
    record.firmware_version = item->valuestring;
  }
  if (cJSON* item = cJSON_GetObjectItem(obj, "wifi_connected"); cJSON_IsBool(item)) {
    record.wifi_connected = cJSON_IsTrue(item);
  }
  if (cJSON* item = cJSON_GetObjectItem(obj, "uptime_seconds"); cJSON_IsNumber(item)) {
    record.uptime_seconds = json_number_to_u64(item->valuedouble);
  }
  for (const cJSON* child = obj->child; child; child = child->next) {
    if (child->string && !is_known_key(child->string)) {
      record.extra_fields[child->string] = print_item(child);
    }
  }
  out = std::move(record);
  return true;
}

void encode_record(const DeviceRecord& record, cJSON* arr) {
  cJSON* obj = cJSON_CreateObject();
  cJSON_AddStringToObject(obj, "mac_address", record.mac_address.c_str());
  cJSON_AddStringToObject(obj, "id", record.id.c_str());
  cJSON_AddStringToObject(obj, "ip_address", record.ip_address.c_str());
  cJSON_AddBoolToObject(obj, "online", record.online);
  cJSON_AddStringToObject(obj, "last_seen", record.last_seen.c_str());
  if (record.firmware_version) {
    cJSON_AddStringToObject(obj, "firmware_version", record.firmware_version->c_str());
  }
  if (record.wifi_connected) {
    cJSON_AddBoolToObject(obj, "wifi_connected", *record.wifi_connected);
  }
  if (record.uptime_seconds) {
    cJSON_AddNumberToObject(obj, "uptime_seconds", static_cast<double>(*record.uptime_seconds));
  }
  for (const auto& [key, raw] : record.extra_fields) {
    if (is_known_key(key.c_str())) {
      continue;
    }
    if (cJSON* value = cJSON_Parse(raw.c_str())) {
      cJSON_AddItemToObject(obj, key.c_str(), value);
    }
  }
  cJSON_AddItemToArray(arr, obj);
}

// Overlays what a probe reported onto a known record.
void merge_fields(DeviceRecord& into, const DeviceRecord& from) {
  if (!from.id.empty()) into.id = from.id;
  if (!from.ip_address.empty()) into.ip_address = from.ip_address;
  if (!from.last_seen.empty()) into.last_seen = from.last_seen;
  if (from.firmware_version) into.firmware_version = from.firmware_version;
  if (from.wifi_connected) into.wifi_connected = from.wifi_connected;
  if (from.uptime_seconds) into.uptime_seconds = from.uptime_seconds;
  for (const auto& [key, raw] : from.extra_fields) {
    into.extra_fields[key] = raw;
  }
}

std::string lowercase_copy(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return text;
}

}  // namespace

fleet_err_t parse_merge_mode(const std::string& text, MergeMode& out) {
  const std::string mode = lowercase_copy(text);
  if (mode == "create") {
    out = MergeMode::Create;
  } else if (mode == "add") {
    out = MergeMode::Add;
  } else if (mode == "update") {
    out = MergeMode::Update;
  } else {
    return FLEET_ERR_INVALID_MODE;
  }
  return FLEET_OK;
}

std::vector<DeviceRecord> sorted_by_address(const DeviceMap& devices) {
  std::vector<DeviceRecord> out;
  out.reserve(devices.size());
  for (const auto& [mac, record] : devices) {
    out.push_back(record);
  }
  auto key = [](const DeviceRecord& r) {
    uint32_t addr = 0;
    const bool valid = ipv4_parse(r.ip_address, addr);
    return std::make_tuple(!valid, valid ? addr : 0u);
  };
  std::stable_sort(out.begin(), out.end(), [&key](const DeviceRecord& a, const DeviceRecord& b) {
    const auto ka = key(a);
    const auto kb = key(b);
    if (ka != kb) {
      return ka < kb;
    }
    return a.mac_address < b.mac_address;
  });
  return out;
}

DeviceMap merge(const DeviceMap& existing, const std::vector<DeviceRecord>& discovered, MergeMode mode,
                MergeStats* stats) {
  MergeStats local{};
  DeviceMap result;
  if (mode != MergeMode::Create) {
    result = existing;
    for (auto& [mac, record] : result) {
      record.online = false;
    }
  }

  for (const auto& found : discovered) {
    std::string mac;
    if (!mac_canonicalize(found.mac_address, mac)) {
      FLEET_LOGW(TAG, "Discovered record at {} has no valid MAC, rejected", found.ip_address);
      ++local.skipped;
      continue;
    }
    auto it = result.find(mac);
    if (mode == MergeMode::Create || it == result.end()) {
      if (mode == MergeMode::Update) {
        FLEET_LOGI(TAG, "Skipping new device {} ({}) in update mode", mac, found.ip_address);
        ++local.skipped;
        continue;
      }
      if (it == result.end()) {
        ++local.added;
      }
      DeviceRecord record = found;
      record.mac_address = mac;
      record.online = true;
      result[mac] = std::move(record);
      continue;
    }
    merge_fields(it->second, found);
    it->second.online = true;
    ++local.updated;
  }

  if (mode != MergeMode::Create) {
    for (const auto& [mac, record] : result) {
      if (!record.online) {
        ++local.marked_offline;
      }
    }
  }
  FLEET_LOGI(TAG, "Merge ({}): {} added, {} updated, {} skipped, {} offline", merge_mode_name(mode), local.added,
             local.updated, local.skipped, local.marked_offline);
  if (stats) {
    *stats = local;
  }
  return result;
}

fleet_err_t Registry::load() {
  std::string blob;
  fleet_err_t err = file_read_all(path_, blob);
  if (err == FLEET_ERR_NOT_FOUND) {
    FLEET_LOGI(TAG, "No device map at {}, starting empty", path_);
    devices_.clear();
    return FLEET_OK;
  }
  if (err != FLEET_OK) {
    return err;
  }

  cJSON* root = cJSON_ParseWithLength(blob.data(), blob.size());
  if (!root) {
    FLEET_LOGE(TAG, "Failed to parse device map {}", path_);
    return FLEET_ERR_INVALID_FORMAT;
  }
  const cJSON* list = nullptr;
  if (cJSON_IsArray(root)) {
    list = root;
  } else if (cJSON_IsObject(root)) {
    list = cJSON_GetObjectItem(root, "devices");
    if (cJSON* item = cJSON_GetObjectItem(root, "scan_time"); cJSON_IsString(item)) scan_time_ = item->valuestring;
    if (cJSON* item = cJSON_GetObjectItem(root, "scan_mode"); cJSON_IsString(item)) scan_mode_ = item->valuestring;
    if (cJSON* item = cJSON_GetObjectItem(root, "network_range"); cJSON_IsString(item)) {
      network_range_ = item->valuestring;
    }
  }
  if (list && !cJSON_IsArray(list)) {
    cJSON_Delete(root);
    FLEET_LOGE(TAG, "Device map {} has a non-array devices entry", path_);
    return FLEET_ERR_INVALID_FORMAT;
  }

  DeviceMap loaded;
  const cJSON* node = nullptr;
  cJSON_ArrayForEach(node, list) {
    DeviceRecord record;
    if (!decode_record(node, record)) {
      FLEET_LOGW(TAG, "Skipping device map entry without a valid MAC address");
      continue;
    }
    loaded[record.mac_address] = std::move(record);
  }
  cJSON_Delete(root);

  devices_ = std::move(loaded);
  FLEET_LOGI(TAG, "Loaded {} devices from {}", devices_.size(), path_);
  return FLEET_OK;
}

fleet_err_t Registry::require_loaded() {
  if (!file_exists(path_)) {
    FLEET_LOGE(TAG, "Device map {} not found, run a scan first", path_);
    return FLEET_ERR_NOT_FOUND;
  }
  return load();
}

fleet_err_t Registry::apply_scan(const std::vector<DeviceRecord>& discovered, MergeMode mode,
                                 const std::string& network_range, MergeStats* stats) {
  devices_ = merge(devices_, discovered, mode, stats);
  scan_time_ = timestamp_now_iso();
  scan_mode_ = merge_mode_name(mode);
  network_range_ = network_range;
  return persist();
}

fleet_err_t Registry::update_record(const DeviceRecord& record) {
  std::string mac;
  if (!mac_canonicalize(record.mac_address, mac)) {
    return FLEET_ERR_INVALID_ARG;
  }
  auto it = devices_.find(mac);
  if (it == devices_.end()) {
    FLEET_LOGW(TAG, "Refusing to add unknown device {} outside a scan", mac);
    return FLEET_ERR_NOT_FOUND;
  }
  merge_fields(it->second, record);
  it->second.online = record.online;
  return persist();
}

fleet_err_t Registry::persist() {
  cJSON* root = cJSON_CreateObject();
  cJSON_AddStringToObject(root, "scan_time", scan_time_.c_str());
  cJSON_AddStringToObject(root, "scan_mode", scan_mode_.c_str());
  cJSON_AddStringToObject(root, "network_range", network_range_.c_str());
  cJSON_AddNumberToObject(root, "device_count", static_cast<double>(devices_.size()));
  cJSON* arr = cJSON_AddArrayToObject(root, "devices");
  for (const auto& record : sorted_by_address(devices_)) {
    encode_record(record, arr);
  }
  char* txt = cJSON_Print(root);
  std::string out = txt ? txt : "{}";
  if (txt) {
    cJSON_free(txt);
  }
  cJSON_Delete(root);
  out.push_back('\n');

  const fleet_err_t err = file_write_atomic(path_, out);
  if (err != FLEET_OK) {
    FLEET_LOGE(TAG, "Failed to save device map {}: {}", path_, fleet_err_to_name(err));
    return err;
  }
  const size_t online = online_count();
  FLEET_LOGI(TAG, "Saved {} devices to {} ({} online, {} offline)", devices_.size(), path_, online,
             devices_.size() - online);
  return FLEET_OK;
}

std::vector<DeviceRecord> Registry::lookup_by_id(const std::string& id) const {
  std::vector<DeviceRecord> out;
  for (const auto& [mac, record] : devices_) {
    if (record.id == id) {
      out.push_back(record);
    }
  }
  return out;
}

std::optional<DeviceRecord> Registry::lookup_by_mac(const std::string& mac) const {
  std::string key;
  if (!mac_canonicalize(mac, key)) {
    return std::nullopt;
  }
  auto it = devices_.find(key);
  if (it == devices_.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t Registry::online_count() const {
  size_t online = 0;
  for (const auto& [mac, record] : devices_) {
    if (record.online) {
      ++online;
    }
  }
  return online;
}

}  // namespace fleet
