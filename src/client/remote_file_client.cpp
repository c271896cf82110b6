#include "client/remote_file_client.hpp"

namespace netfs {
namespace client {

Result<bool> RemoteFileClient::exists(const std::string& path) {
  auto entry = stat(path);
  if (entry.ok()) {
    return Result<bool>::success(true);
  }
  if (entry.error().reason == ErrorReason::NOT_FOUND) {
    return Result<bool>::success(false);
  }
  return entry.error();
}

Result<std::size_t> RemoteFileClient::read_range(const std::string& path, uint64_t offset,
                                                 char* buffer, std::size_t length) {
  auto stream = open_read(path, offset);
  if (!stream.ok()) {
    return stream.error();
  }

  std::size_t total = 0;
  while (total < length) {
    auto n = stream.value()->read(buffer + total, length - total);
    if (!n.ok()) {
      stream.value()->close();
      return n.error();
    }
    if (n.value() == 0) {
      break;
    }
    total += n.value();
  }

  stream.value()->close();
  return Result<std::size_t>::success(total);
}

std::string parent_path_of(const std::string& path) {
  const auto slash = path.rfind('/');
  if (slash == std::string::npos || slash == 0) {
    return "/";
  }
  return path.substr(0, slash);
}

std::string file_name_of(const std::string& path) {
  const auto slash = path.rfind('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string join_path(const std::string& dir, const std::string& name) {
  if (dir.empty() || dir == "/") {
    return "/" + name;
  }
  return dir.back() == '/' ? dir + name : dir + "/" + name;
}

} // namespace client
} // namespace netfs
