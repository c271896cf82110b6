#ifndef NETFS_URI_HPP
#define NETFS_URI_HPP

#include <string>
#include "core/result.hpp"
#include "core/types.hpp"

namespace netfs {

// Location of a file on any supported backend.
//
//   smb://host[:port]/share/dir/file
//   sftp://host[:port]/dir/file
//   ftp://host[:port]/dir/file
//   content://authority/dir/file
//   file:///dir/file  or  /dir/file
//
// An optional "?cred=<id>" query pins the credentials to use.
struct RemoteUri {
  Protocol protocol{Protocol::LOCAL};
  std::string host;
  uint16_t port{0};
  std::string share;
  // Normalized absolute path, relative to the share for SMB
  std::string path{"/"};
  std::string credentials_id;

  static Result<RemoteUri> parse(const std::string& text);

  ConnectionInfo connection_info() const;
  std::string to_string() const;
  // to_string() without the credentials query; identifies the file itself
  std::string location() const;

  // ---- PATH HELPERS ----
  std::string file_name() const;
  RemoteUri parent() const;
  RemoteUri child(const std::string& name) const;
  bool is_root() const { return path == "/"; }
  // Same pooled connection, so a server side rename is possible
  bool same_connection(const RemoteUri& other) const;
};

std::string percent_decode(const std::string& text);
std::string percent_encode_path(const std::string& path);
// Collapses "//", "." and ".." and strips a trailing slash
std::string normalize_path(const std::string& path);

} // namespace netfs

#endif // NETFS_URI_HPP
