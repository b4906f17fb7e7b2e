#include "fleet_core/prober.hpp"
#include "fleet_core/http_client.hpp"
#include "fleet_core/log.hpp"
#include "cJSON.h"
#include <map>

static const char* TAG = "prober";

namespace fleet {

namespace {

enum class ProbeOutcome : uint8_t {
  Absent,
  Found,
  Invalid,
};

struct ProbeSlot {
  ProbeOutcome outcome{ProbeOutcome::Absent};
  DeviceRecord record{};
};

ProbeSlot classify(const std::string& address, const HttpResponse& resp) {
  ProbeSlot slot;
  if (!resp.ok()) {
    FLEET_LOGD(TAG, "{}: no device ({})", address, resp.error);
    return slot;
  }
  const fleet_err_t err = parse_status_body(resp.body, address, slot.record);
  if (err == FLEET_OK) {
    slot.outcome = ProbeOutcome::Found;
  } else if (err == FLEET_ERR_NOT_FOUND) {
    FLEET_LOGW(TAG, "{}: status answer without a valid MAC address, ignored", address);
    slot.outcome = ProbeOutcome::Invalid;
  } else {
    FLEET_LOGD(TAG, "{}: unparseable status answer", address);
    slot.outcome = ProbeOutcome::Invalid;
  }
  return slot;
}

}  // namespace

fleet_err_t parse_status_body(const std::string& body, const std::string& ip_address, DeviceRecord& out) {
  cJSON* root = cJSON_ParseWithLength(body.c_str(), body.size());
  if (!root) {
    return FLEET_ERR_INVALID_FORMAT;
  }
  if (!cJSON_IsObject(root)) {
    cJSON_Delete(root);
    return FLEET_ERR_INVALID_FORMAT;
  }

  DeviceRecord record{};
  std::string mac;
  if (cJSON* item = cJSON_GetObjectItem(root, "mac_address"); cJSON_IsString(item)) {
    mac = item->valuestring;
  }
  if (!mac_canonicalize(mac, record.mac_address)) {
    cJSON_Delete(root);
    return FLEET_ERR_NOT_FOUND;
  }
  record.id = "UNKNOWN";
  if (cJSON* item = cJSON_GetObjectItem(root, "id"); cJSON_IsString(item)) {
    record.id = item->valuestring;
  }
  if (cJSON* item = cJSON_GetObjectItem(root, "firmware_version"); cJSON_IsString(item)) {
    record.firmware_version = item->valuestring;
  }
  if (cJSON* item = cJSON_GetObjectItem(root, "wifi_connected"); cJSON_IsBool(item)) {
    record.wifi_connected = cJSON_IsTrue(item);
  }
  if (cJSON* item = cJSON_GetObjectItem(root, "uptime_seconds"); cJSON_IsNumber(item)) {
    if (item->valuedouble >= 0) {
      record.uptime_seconds = json_number_to_u64(item->valuedouble);
    }
  }
  cJSON_Delete(root);

  record.ip_address = ip_address;
  record.online = true;
  record.last_seen = timestamp_now_iso();
  out = std::move(record);
  return FLEET_OK;
}

std::optional<DeviceRecord> Prober::probe(const std::string& address, std::chrono::milliseconds timeout) const {
  const HttpResponse resp = http_request(address, port_, http_get("/api/status"), timeout);
  ProbeSlot slot = classify(address, resp);
  if (slot.outcome != ProbeOutcome::Found) {
    return std::nullopt;
  }
  return slot.record;
}

fleet_err_t Prober::probe_range(const AddressRange& range, size_t concurrency_limit,
                                std::chrono::milliseconds timeout, std::vector<DeviceRecord>& out) {
  return run(range.size(), [&range](size_t i) { return range.at(i); }, concurrency_limit, timeout, out);
}

fleet_err_t Prober::probe_range(const std::vector<std::string>& addresses, size_t concurrency_limit,
                                std::chrono::milliseconds timeout, std::vector<DeviceRecord>& out) {
  return run(addresses.size(), [&addresses](size_t i) { return addresses[i]; }, concurrency_limit, timeout, out);
}

fleet_err_t Prober::run(size_t total, const std::function<std::string(size_t)>& address_at,
                        size_t concurrency_limit, std::chrono::milliseconds timeout,
                        std::vector<DeviceRecord>& out) {
  out.clear();
  stats_ = ScanStats{};
  stats_.total = total;
  if (concurrency_limit == 0) {
    return FLEET_ERR_INVALID_ARG;
  }
  const auto started = std::chrono::steady_clock::now();
  FLEET_LOGI(TAG, "Probing {} addresses, {} at a time, timeout {} ms", total, concurrency_limit, timeout.count());

  std::vector<ProbeSlot> window_slots(concurrency_limit);
  std::map<std::string, size_t> index_by_mac;
  size_t window_base = 0;

  auto launch = [&](boost::asio::io_context& io, size_t index) {
    if (index % concurrency_limit == 0) {
      window_base = index;
      for (auto& slot : window_slots) {
        slot = ProbeSlot{};
      }
    }
    const std::string address = address_at(index);
    ProbeSlot* slot = &window_slots[index - window_base];
    http_async_request(io, address, port_, http_get("/api/status"), timeout,
                       [slot, address](HttpResponse resp) { *slot = classify(address, resp); });
  };

  auto progress = [&](size_t done, size_t all) {
    // Window drained: fold its slots into the result in address order.
    const size_t count = done - window_base;
    for (size_t i = 0; i < count; ++i) {
      auto& slot = window_slots[i];
      if (slot.outcome == ProbeOutcome::Invalid) {
        ++stats_.errors;
      } else if (slot.outcome == ProbeOutcome::Found) {
        auto it = index_by_mac.find(slot.record.mac_address);
        if (it != index_by_mac.end()) {
          FLEET_LOGW(TAG, "MAC {} answered at {} and {}, keeping the later", slot.record.mac_address,
                     out[it->second].ip_address, slot.record.ip_address);
          out[it->second] = std::move(slot.record);
        } else {
          index_by_mac.emplace(slot.record.mac_address, out.size());
          out.push_back(std::move(slot.record));
        }
      }
    }
    stats_.scanned = done;
    stats_.found = out.size();
    FLEET_LOGI(TAG, "Progress: {}/{} scanned, {} found", done, all, out.size());
    if (progress_) {
      progress_(done, all);
    }
  };

  size_t completed = 0;
  const fleet_err_t err = run_windows(total, concurrency_limit, launch, progress, cancel_, completed);
  stats_.scanned = completed;
  stats_.found = out.size();
  stats_.duration_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
  FLEET_LOGI(TAG, "Scan finished: {} found, {} errors, {}/{} scanned in {:.1f}s", stats_.found, stats_.errors,
             stats_.scanned, stats_.total, stats_.duration_s);
  return err;
}

}  // namespace fleet
