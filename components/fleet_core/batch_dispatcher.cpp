#include "fleet_core/batch_dispatcher.hpp"
#include "fleet_core/log.hpp"

static const char* TAG = "dispatch";

namespace fleet {

OperationResult make_result(const DeviceRecord& device) {
  OperationResult result{};
  result.device_id = device.id;
  result.mac_address = device.mac_address;
  result.ip_address = device.ip_address;
  return result;
}

OperationStatus classify_steps(uint16_t ok, uint16_t total) {
  if (ok >= total) {
    return OperationStatus::Success;
  }
  if (ok == 0) {
    return OperationStatus::Error;
  }
  return OperationStatus::Partial;
}

std::vector<OperationResult> BatchDispatcher::dispatch(const std::vector<DeviceRecord>& devices,
                                                       const DeviceOperation& op, size_t concurrency_limit) {
  cancelled_ = false;
  std::vector<OperationResult> results;
  results.reserve(devices.size());
  for (const auto& device : devices) {
    OperationResult pending = make_result(device);
    pending.error = "cancelled";
    results.push_back(std::move(pending));
  }
  if (devices.empty()) {
    return results;
  }
  if (concurrency_limit == 0) {
    concurrency_limit = 1;
  }
  FLEET_LOGI(TAG, "{} on {} devices, {} at a time", op.name(), devices.size(), concurrency_limit);

  auto launch = [&](boost::asio::io_context& io, size_t index) {
    op.start(io, devices[index], opts_, [&results, index](OperationResult result) {
      results[index] = std::move(result);
    });
  };
  size_t completed = 0;
  const fleet_err_t err = run_windows(devices.size(), concurrency_limit, launch, progress_, cancel_, completed);
  if (err == FLEET_ERR_CANCELLED) {
    cancelled_ = true;
    FLEET_LOGW(TAG, "{}: {} devices not attempted", op.name(), devices.size() - completed);
  }

  size_t ok = 0;
  size_t partial = 0;
  for (const auto& result : results) {
    if (result.status == OperationStatus::Success) {
      ++ok;
    } else if (result.status == OperationStatus::Partial) {
      ++partial;
    }
  }
  FLEET_LOGI(TAG, "{}: {}/{} succeeded, {} partial, {} failed", op.name(), ok, results.size(), partial,
             results.size() - ok - partial);
  return results;
}

OperationResult BatchDispatcher::run_one(const DeviceRecord& device, const DeviceOperation& op) {
  boost::asio::io_context io;
  OperationResult result = make_result(device);
  result.error = "not completed";
  op.start(io, device, opts_, [&result](OperationResult r) { result = std::move(r); });
  io.run();
  return result;
}

}  // namespace fleet
