#include "pool/io_executor.hpp"
#include <boost/log/trivial.hpp>

namespace netfs {
namespace pool {

IoExecutor::IoExecutor(std::size_t threads)
  : threads_(threads == 0 ? 1 : threads)
  , pool_(threads_) {
  BOOST_LOG_TRIVIAL(info) << "IoExecutor: Started " << threads_ << " I/O threads";
}

IoExecutor::~IoExecutor() {
  shutdown();
}

void IoExecutor::shutdown() {
  {
    std::lock_guard<std::mutex> lock(submit_mutex_);
    if (stopped_.exchange(true)) {
      return;
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "IoExecutor: Waiting for queued work";
  pool_.wait();
  BOOST_LOG_TRIVIAL(info) << "IoExecutor: Stopped";
}

} // namespace pool
} // namespace netfs
