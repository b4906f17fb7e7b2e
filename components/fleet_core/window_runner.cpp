#include "fleet_core/window_runner.hpp"
#include "fleet_core/log.hpp"
#include <algorithm>

static const char* TAG = "window";

namespace fleet {

fleet_err_t run_windows(size_t total, size_t window, const WindowLaunch& launch, const ProgressCallback& progress,
                        const std::atomic<bool>* cancel, size_t& completed) {
  completed = 0;
  if (window == 0 || !launch) {
    return FLEET_ERR_INVALID_ARG;
  }
  boost::asio::io_context io;
  for (size_t start = 0; start < total; start += window) {
    if (cancel && cancel->load()) {
      FLEET_LOGW(TAG, "Cancelled after {}/{} items", completed, total);
      return FLEET_ERR_CANCELLED;
    }
    const size_t end = std::min(total, start + window);
    for (size_t i = start; i < end; ++i) {
      launch(io, i);
    }
    io.run();
    io.restart();
    completed = end;
    if (progress) {
      progress(completed, total);
    }
  }
  return FLEET_OK;
}

}  // namespace fleet
