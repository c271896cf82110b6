#ifndef NETFS_REMOTE_FILE_CLIENT_HPP
#define NETFS_REMOTE_FILE_CLIENT_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>
#include "core/result.hpp"
#include "core/types.hpp"

namespace netfs {
namespace client {

struct ClientOptions {
  std::chrono::seconds connect_timeout{10};
  std::chrono::seconds io_timeout{60};
  std::string known_hosts_file;
};

// Open read handle on a remote file
class ReadStream {
public:
  virtual ~ReadStream() = default;

  // Reads up to len bytes; 0 means end of file
  virtual Result<std::size_t> read(char* buffer, std::size_t len) = 0;
  // True when seek() is a cheap positioning call
  virtual bool is_seekable() const = 0;
  virtual Result<void> seek(uint64_t offset) = 0;
  virtual uint64_t position() const = 0;
  // Releases the remote handle. Idempotent.
  virtual void close() = 0;
};

// Uniform operation set over one authenticated session. A client is not
// internally synchronized; the pool serializes access to a shared one.
// Paths are absolute and, for SMB, relative to the share.
class RemoteFileClient {
public:
  virtual ~RemoteFileClient() = default;

  virtual Protocol protocol() const = 0;


  // ---- SESSION ----
  virtual Result<void> connect(const ConnectionInfo& info, const Credentials& credentials) = 0;
  virtual bool is_connected() const = 0;
  // Tears down handle, session and transport in that order. Every step is
  // logged and a failing step does not stop the next one.
  virtual void disconnect() = 0;
  virtual Result<void> test_connection() = 0;
  // True when open_read can position at any offset without reopening
  virtual bool supports_random_access() const = 0;


  // ---- QUERY OPERATIONS ----
  virtual Result<std::vector<FileEntry>> list(const std::string& path) = 0;
  virtual Result<FileEntry> stat(const std::string& path) = 0;
  // Maps a NOT_FOUND stat to false
  virtual Result<bool> exists(const std::string& path);


  // ---- DATA OPERATIONS ----
  virtual Result<std::unique_ptr<ReadStream>> open_read(const std::string& path, uint64_t offset) = 0;
  // Reads up to length bytes at offset; returns the exact count read
  virtual Result<std::size_t> read_range(const std::string& path, uint64_t offset,
                                         char* buffer, std::size_t length);
  // Writes size bytes from data, creating or truncating path. The
  // callback is invoked per chunk and may cancel by returning false.
  virtual Result<uint64_t> write(const std::string& path, std::istream& data, uint64_t size,
                                 const ChunkCallback& on_chunk) = 0;


  // ---- MUTATING OPERATIONS ----
  virtual Result<void> remove(const std::string& path) = 0;
  virtual Result<void> remove_directory(const std::string& path) = 0;
  // Succeeds when the directory already exists
  virtual Result<void> mkdir(const std::string& path) = 0;
  virtual Result<void> rename(const std::string& from, const std::string& to) = 0;
};

// Shared helpers for client implementations
std::string parent_path_of(const std::string& path);
std::string file_name_of(const std::string& path);
std::string join_path(const std::string& dir, const std::string& name);

} // namespace client
} // namespace netfs

#endif // NETFS_REMOTE_FILE_CLIENT_HPP
