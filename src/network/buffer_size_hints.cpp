#include "network/buffer_size_hints.hpp"
#include <boost/log/trivial.hpp>

namespace netfs {
namespace network {

BufferSizeHints::BufferSizeHints(std::size_t default_size)
  : default_size_(default_size == 0 ? DEFAULT_BUFFER_SIZE : default_size) {
}

std::size_t BufferSizeHints::recommended(const std::string& endpoint) const {
  return recommended(endpoint, default_size_);
}

std::size_t BufferSizeHints::recommended(const std::string& endpoint, std::size_t fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sizes_.find(endpoint);
  return it == sizes_.end() ? fallback : it->second;
}

void BufferSizeHints::set(const std::string& endpoint, std::size_t size) {
  if (size == 0) {
    BOOST_LOG_TRIVIAL(warning) << "BufferSizeHints: Ignoring zero buffer size for " << endpoint;
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  sizes_[endpoint] = size;
  BOOST_LOG_TRIVIAL(debug) << "BufferSizeHints: " << endpoint << " -> " << size << " bytes";
}

void BufferSizeHints::clear(const std::string& endpoint) {
  std::lock_guard<std::mutex> lock(mutex_);
  sizes_.erase(endpoint);
}

} // namespace network
} // namespace netfs
