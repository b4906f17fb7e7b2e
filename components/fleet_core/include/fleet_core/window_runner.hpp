#pragma once
#include "fleet_core/err.hpp"
#include <boost/asio/io_context.hpp>
#include <atomic>
#include <cstddef>
#include <functional>

namespace fleet {

using ProgressCallback = std::function<void(size_t done, size_t total)>;

// Queues the asynchronous work for item `index` on the window's io_context.
using WindowLaunch = std::function<void(boost::asio::io_context& io, size_t index)>;

// Runs items [0, total) in fixed windows of `window` items. All items of a
// window share one io_context; the next window starts only after run()
// returned, so at most `window` items are in flight. A set cancel flag stops
// new windows and yields FLEET_ERR_CANCELLED; `completed` is the number of
// items whose window ran.
fleet_err_t run_windows(size_t total, size_t window, const WindowLaunch& launch, const ProgressCallback& progress,
                        const std::atomic<bool>* cancel, size_t& completed);

}  // namespace fleet
