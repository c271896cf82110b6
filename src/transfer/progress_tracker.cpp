#include "transfer/progress_tracker.hpp"
#include <boost/log/trivial.hpp>

namespace netfs {
namespace transfer {

ProgressTracker::ProgressTracker(ProgressCallback callback, uint64_t total_bytes, uint64_t step_bytes)
  : callback_(std::move(callback))
  , total_(total_bytes)
  , step_(step_bytes == 0 ? DEFAULT_STEP_BYTES : step_bytes)
  , last_report_time_(Clock::now()) {
}

bool ProgressTracker::update(uint64_t bytes_so_far) {
  if (cancelled_) {
    return false;
  }
  current_ = bytes_so_far;
  if (current_ <= last_reported_ || current_ - last_reported_ < step_) {
    return true;
  }
  return report();
}

bool ProgressTracker::finish() {
  if (cancelled_) {
    return false;
  }
  if (reports_ > 0 && current_ == last_reported_) {
    return true;
  }
  return report();
}

ChunkCallback ProgressTracker::chunk_callback(uint64_t base) {
  return [this, base](uint64_t bytes_so_far) { return update(base + bytes_so_far); };
}

bool ProgressTracker::report() {
  const auto now = Clock::now();
  const double seconds = std::chrono::duration<double>(now - last_report_time_).count();
  const uint64_t delta = current_ > last_reported_ ? current_ - last_reported_ : 0;

  TransferProgress progress;
  progress.bytes_transferred = current_;
  progress.total_bytes = total_;
  progress.bytes_per_second = seconds > 0.0 ? static_cast<double>(delta) / seconds : 0.0;

  last_reported_ = current_;
  last_report_time_ = now;
  ++reports_;

  if (callback_ && !callback_(progress)) {
    BOOST_LOG_TRIVIAL(info) << "ProgressTracker: Cancelled at " << current_ << " of " << total_ << " bytes";
    cancelled_ = true;
    return false;
  }
  return true;
}

} // namespace transfer
} // namespace netfs
