#ifndef NETFS_BUFFER_SIZE_HINTS_HPP
#define NETFS_BUFFER_SIZE_HINTS_HPP

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace netfs {
namespace network {

// Process wide table of recommended read-ahead sizes per endpoint
// ("sftp://host:22"). Readers query it once when they open.
class BufferSizeHints {
public:
  static constexpr std::size_t DEFAULT_BUFFER_SIZE = 64 * 1024;

  explicit BufferSizeHints(std::size_t default_size = DEFAULT_BUFFER_SIZE);

  std::size_t recommended(const std::string& endpoint) const;
  std::size_t recommended(const std::string& endpoint, std::size_t fallback) const;
  void set(const std::string& endpoint, std::size_t size);
  void clear(const std::string& endpoint);

private:
  std::size_t default_size_;
  std::unordered_map<std::string, std::size_t> sizes_;
  mutable std::mutex mutex_;
};

} // namespace network
} // namespace netfs

#endif // NETFS_BUFFER_SIZE_HINTS_HPP
