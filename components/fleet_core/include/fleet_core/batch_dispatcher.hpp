#pragma once
#include "fleet_core/types.hpp"
#include "fleet_core/window_runner.hpp"
#include <boost/asio/io_context.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace fleet {

struct RequestOptions {
  uint16_t port{80};
  std::chrono::milliseconds timeout{5000};
};

using ResultHandler = std::function<void(OperationResult)>;

// One command against one device. start() queues its requests on `io` and
// calls `done` exactly once from within io.run(); it must not block.
class DeviceOperation {
public:
  virtual ~DeviceOperation() = default;
  virtual const char* name() const = 0;
  virtual void start(boost::asio::io_context& io, const DeviceRecord& device, const RequestOptions& opts,
                     ResultHandler done) const = 0;
};

// Result skeleton carrying the device identity.
OperationResult make_result(const DeviceRecord& device);

// success when every step succeeded, error when none did, partial otherwise.
OperationStatus classify_steps(uint16_t ok, uint16_t total);

class BatchDispatcher {
public:
  explicit BatchDispatcher(RequestOptions opts = {}) : opts_(opts) {}

  void set_progress_callback(ProgressCallback cb) { progress_ = std::move(cb); }
  void set_cancel_flag(const std::atomic<bool>* flag) { cancel_ = flag; }

  // Exactly one result per device, in input order. Devices of windows that
  // never started report an error with cause "cancelled".
  std::vector<OperationResult> dispatch(const std::vector<DeviceRecord>& devices, const DeviceOperation& op,
                                        size_t concurrency_limit);
  OperationResult run_one(const DeviceRecord& device, const DeviceOperation& op);

  bool cancelled() const { return cancelled_; }
  const RequestOptions& options() const { return opts_; }

private:
  RequestOptions opts_;
  ProgressCallback progress_{};
  const std::atomic<bool>* cancel_{nullptr};
  bool cancelled_{false};
};

}  // namespace fleet
