#ifndef NETFS_PROGRESS_TRACKER_HPP
#define NETFS_PROGRESS_TRACKER_HPP

#include <chrono>
#include <cstdint>
#include "core/types.hpp"

namespace netfs {
namespace transfer {

// Throttles a ProgressCallback to one report per step_bytes transferred.
class ProgressTracker {
public:
  using Clock = std::chrono::steady_clock;

  static constexpr uint64_t DEFAULT_STEP_BYTES = 100 * 1024;

  ProgressTracker(ProgressCallback callback, uint64_t total_bytes,
                  uint64_t step_bytes = DEFAULT_STEP_BYTES);

  // Records the running byte count. Returns false once the callback asked
  // to cancel.
  bool update(uint64_t bytes_so_far);
  // Reports the final count unless it was the last one reported
  bool finish();

  // Adapter for client write/download loops. base is added to every count
  // so several legs can feed one tracker.
  ChunkCallback chunk_callback(uint64_t base = 0);

  bool cancelled() const { return cancelled_; }
  uint64_t bytes_transferred() const { return current_; }
  uint64_t total_bytes() const { return total_; }
  std::size_t report_count() const { return reports_; }

private:
  bool report();

  ProgressCallback callback_;
  uint64_t total_;
  uint64_t step_;
  uint64_t current_{0};
  uint64_t last_reported_{0};
  Clock::time_point last_report_time_;
  std::size_t reports_{0};
  bool cancelled_{false};
};

} // namespace transfer
} // namespace netfs

#endif // NETFS_PROGRESS_TRACKER_HPP
