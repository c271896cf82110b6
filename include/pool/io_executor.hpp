#ifndef NETFS_IO_EXECUTOR_HPP
#define NETFS_IO_EXECUTOR_HPP

#include <atomic>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <type_traits>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace netfs {
namespace pool {

// Dedicated thread pool for blocking protocol I/O. Callers get a future
// and never run protocol code on their own thread.
class IoExecutor {
public:
  // Delete copy constructor and assignment operator
  IoExecutor(const IoExecutor&) = delete;
  IoExecutor& operator=(const IoExecutor&) = delete;

  explicit IoExecutor(std::size_t threads);
  ~IoExecutor();

  template <typename Fn>
  auto submit(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
    using R = std::invoke_result_t<std::decay_t<Fn>>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
    auto future = task->get_future();

    // Posting under the lock orders every accepted task before shutdown's wait
    std::lock_guard<std::mutex> lock(submit_mutex_);
    if (stopped_) {
      throw std::runtime_error("IoExecutor: submit after shutdown");
    }
    boost::asio::post(pool_, [task]() { (*task)(); });
    return future;
  }

  boost::asio::thread_pool::executor_type executor() { return pool_.get_executor(); }
  bool is_stopped() const { return stopped_; }
  std::size_t thread_count() const { return threads_; }

  // Waits for queued work, then joins the threads. Idempotent.
  void shutdown();

private:
  std::size_t threads_;
  boost::asio::thread_pool pool_;
  std::atomic<bool> stopped_{false};
  std::mutex submit_mutex_;
};

} // namespace pool
} // namespace netfs

#endif // NETFS_IO_EXECUTOR_HPP
