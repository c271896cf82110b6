#ifndef NETFS_TYPES_HPP
#define NETFS_TYPES_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace netfs {

enum class Protocol {
  LOCAL,
  SMB,
  SFTP,
  FTP,
  DOCUMENT_TREE
};

const char* protocol_to_scheme(Protocol protocol);
std::optional<Protocol> protocol_from_scheme(const std::string& scheme);
uint16_t default_port(Protocol protocol);
bool is_remote(Protocol protocol);

// ---- CONNECTION IDENTITY ----
struct ConnectionInfo {
  Protocol protocol{Protocol::LOCAL};
  std::string host;
  uint16_t port{0};
  // SMB share name, empty for the other protocols
  std::string share;

  // Pool lookup key, e.g. "smb://nas:445/media"
  std::string key() const;
  // Buffer hint key, e.g. "sftp://host:22"
  std::string endpoint() const;
};

// Already resolved, read-only input supplied by the credential store
struct Credentials {
  std::string id;
  Protocol protocol{Protocol::LOCAL};
  std::string server;
  uint16_t port{0};
  std::string username;
  std::string password;
  std::string private_key_path;
  std::string private_key_passphrase;
  std::string domain;
  std::string share;

  // Identity used to detect a pooled session opened with other credentials
  std::string fingerprint() const;
};

struct FileEntry {
  std::string name;
  std::string path;
  bool is_directory{false};
  uint64_t size{0};
  // Milliseconds since the epoch, 0 when the server does not report it
  int64_t last_modified{0};
};

struct TransferProgress {
  uint64_t bytes_transferred{0};
  // 0 when the total is unknown
  uint64_t total_bytes{0};
  double bytes_per_second{0.0};
};

// Returning false asks the transfer to stop at the next chunk boundary
using ProgressCallback = std::function<bool(const TransferProgress&)>;

// Low level per-chunk hook used by protocol clients while streaming
using ChunkCallback = std::function<bool(uint64_t bytes_so_far)>;

} // namespace netfs

#endif // NETFS_TYPES_HPP
