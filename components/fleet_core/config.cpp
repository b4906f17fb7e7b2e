#include "fleet_core/config.hpp"
#include "fleet_core/file_util.hpp"
#include "fleet_core/log.hpp"
#include "cJSON.h"
#include <algorithm>

static const char* TAG = "config";

namespace fleet {

namespace {

uint32_t clamp_u32(const cJSON* item, uint32_t min_value, uint32_t max_value) {
  const double value = std::clamp(item->valuedouble, static_cast<double>(min_value), static_cast<double>(max_value));
  return static_cast<uint32_t>(value);
}

bool decode_json(AppConfig& cfg, const char* json, size_t len) {
  cJSON* root = cJSON_ParseWithLength(json, len);
  if (!root) {
    FLEET_LOGW(TAG, "Failed to parse config JSON");
    return false;
  }
  if (!cJSON_IsObject(root)) {
    FLEET_LOGW(TAG, "Config JSON is not an object");
    cJSON_Delete(root);
    return false;
  }

  if (cJSON* map = cJSON_GetObjectItem(root, "map_file"); cJSON_IsString(map) && map->valuestring[0] != '\0') {
    cfg.map_file = map->valuestring;
  }
  if (cJSON* port = cJSON_GetObjectItem(root, "device_port"); cJSON_IsNumber(port)) {
    cfg.device_port = static_cast<uint16_t>(clamp_u32(port, 1, 65535));
  }
  if (cJSON* level = cJSON_GetObjectItem(root, "log_level"); cJSON_IsString(level)) {
    cfg.log_level = level->valuestring;
  }

  if (cJSON* scan = cJSON_GetObjectItem(root, "scan"); cJSON_IsObject(scan)) {
    if (cJSON* t = cJSON_GetObjectItem(scan, "timeout_ms"); cJSON_IsNumber(t)) cfg.scan.timeout_ms = clamp_u32(t, 100, 600000);
    if (cJSON* c = cJSON_GetObjectItem(scan, "concurrency"); cJSON_IsNumber(c)) cfg.scan.concurrency = clamp_u32(c, 1, 4096);
  }

  if (cJSON* batch = cJSON_GetObjectItem(root, "batch"); cJSON_IsObject(batch)) {
    if (cJSON* t = cJSON_GetObjectItem(batch, "timeout_ms"); cJSON_IsNumber(t)) cfg.batch.timeout_ms = clamp_u32(t, 100, 600000);
    if (cJSON* c = cJSON_GetObjectItem(batch, "concurrency"); cJSON_IsNumber(c)) cfg.batch.concurrency = clamp_u32(c, 1, 4096);
    if (cJSON* off = cJSON_GetObjectItem(batch, "include_offline"); cJSON_IsBool(off)) {
      cfg.batch.include_offline = cJSON_IsTrue(off);
    }
  }

  if (cJSON* ident = cJSON_GetObjectItem(root, "identity"); cJSON_IsObject(ident)) {
    if (cJSON* t = cJSON_GetObjectItem(ident, "timeout_ms"); cJSON_IsNumber(t)) cfg.identity.timeout_ms = clamp_u32(t, 100, 600000);
    if (cJSON* prefix = cJSON_GetObjectItem(ident, "prefix"); cJSON_IsString(prefix) && prefix->valuestring[0] != '\0') {
      cfg.identity.prefix = prefix->valuestring;
    }
    if (cJSON* start = cJSON_GetObjectItem(ident, "start_num"); cJSON_IsNumber(start)) {
      cfg.identity.start_num = static_cast<int>(clamp_u32(start, 0, 999));
    }
    if (cJSON* dur = cJSON_GetObjectItem(ident, "identify_duration_s"); cJSON_IsNumber(dur)) {
      cfg.identity.identify_duration_s = clamp_u32(dur, 1, 3600);
    }
  }

  if (cJSON* upload = cJSON_GetObjectItem(root, "upload"); cJSON_IsObject(upload)) {
    if (cJSON* t = cJSON_GetObjectItem(upload, "timeout_ms"); cJSON_IsNumber(t)) cfg.upload.timeout_ms = clamp_u32(t, 1000, 3600000);
  }

  cJSON_Delete(root);
  return true;
}

std::string encode_json(const AppConfig& cfg) {
  cJSON* root = cJSON_CreateObject();
  cJSON_AddStringToObject(root, "map_file", cfg.map_file.c_str());
  cJSON_AddNumberToObject(root, "device_port", cfg.device_port);
  cJSON_AddStringToObject(root, "log_level", cfg.log_level.c_str());

  cJSON* scan = cJSON_AddObjectToObject(root, "scan");
  cJSON_AddNumberToObject(scan, "timeout_ms", cfg.scan.timeout_ms);
  cJSON_AddNumberToObject(scan, "concurrency", cfg.scan.concurrency);

  cJSON* batch = cJSON_AddObjectToObject(root, "batch");
  cJSON_AddNumberToObject(batch, "timeout_ms", cfg.batch.timeout_ms);
  cJSON_AddNumberToObject(batch, "concurrency", cfg.batch.concurrency);
  cJSON_AddBoolToObject(batch, "include_offline", cfg.batch.include_offline);

  cJSON* ident = cJSON_AddObjectToObject(root, "identity");
  cJSON_AddNumberToObject(ident, "timeout_ms", cfg.identity.timeout_ms);
  cJSON_AddStringToObject(ident, "prefix", cfg.identity.prefix.c_str());
  cJSON_AddNumberToObject(ident, "start_num", cfg.identity.start_num);
  cJSON_AddNumberToObject(ident, "identify_duration_s", cfg.identity.identify_duration_s);

  cJSON* upload = cJSON_AddObjectToObject(root, "upload");
  cJSON_AddNumberToObject(upload, "timeout_ms", cfg.upload.timeout_ms);

  char* txt = cJSON_Print(root);
  std::string out = txt ? txt : "{}";
  if (txt) {
    cJSON_free(txt);
  }
  cJSON_Delete(root);
  return out;
}

}  // namespace

void config_reset_defaults(AppConfig& cfg) {
  cfg = AppConfig{};
}

fleet_err_t config_load(const std::string& path, AppConfig& cfg) {
  std::string blob;
  const fleet_err_t err = file_read_all(path, blob);
  if (err == FLEET_ERR_NOT_FOUND) {
    FLEET_LOGI(TAG, "Config {} not found, using defaults", path);
    return FLEET_OK;
  }
  if (err != FLEET_OK) {
    return err;
  }
  if (!decode_json(cfg, blob.data(), blob.size())) {
    FLEET_LOGE(TAG, "Config {} is malformed", path);
    return FLEET_ERR_INVALID_FORMAT;
  }
  return FLEET_OK;
}

fleet_err_t config_save(const std::string& path, const AppConfig& cfg) {
  return file_write_atomic(path, encode_json(cfg) + "\n");
}

fleet_err_t config_apply_json(AppConfig& cfg, const char* data, size_t len) {
  if (!data || len == 0) {
    return FLEET_ERR_INVALID_ARG;
  }
  return decode_json(cfg, data, len) ? FLEET_OK : FLEET_ERR_INVALID_FORMAT;
}

std::string config_to_json(const AppConfig& cfg) {
  return encode_json(cfg);
}

std::chrono::milliseconds timeout_from_seconds(double seconds, uint32_t fallback_ms) {
  if (!(seconds > 0.0)) {
    return std::chrono::milliseconds(fallback_ms);
  }
  const double ms = std::clamp(seconds * 1000.0, 100.0, 3600000.0);
  return std::chrono::milliseconds(static_cast<int64_t>(ms));
}

}  // namespace fleet
