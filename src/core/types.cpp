#include "core/types.hpp"
#include <algorithm>
#include <cctype>

namespace netfs {

const char* protocol_to_scheme(Protocol protocol) {
  switch (protocol) {
    case Protocol::LOCAL: return "file";
    case Protocol::SMB: return "smb";
    case Protocol::SFTP: return "sftp";
    case Protocol::FTP: return "ftp";
    case Protocol::DOCUMENT_TREE: return "content";
    default: return "unknown";
  }
}

std::optional<Protocol> protocol_from_scheme(const std::string& scheme) {
  std::string lower(scheme);
  std::transform(lower.begin(), lower.end(), lower.begin(),
    [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "file") return Protocol::LOCAL;
  if (lower == "smb") return Protocol::SMB;
  if (lower == "sftp") return Protocol::SFTP;
  if (lower == "ftp") return Protocol::FTP;
  if (lower == "content") return Protocol::DOCUMENT_TREE;
  return std::nullopt;
}

uint16_t default_port(Protocol protocol) {
  switch (protocol) {
    case Protocol::SMB: return 445;
    case Protocol::SFTP: return 22;
    case Protocol::FTP: return 21;
    default: return 0;
  }
}

bool is_remote(Protocol protocol) {
  return protocol == Protocol::SMB || protocol == Protocol::SFTP || protocol == Protocol::FTP;
}

std::string ConnectionInfo::key() const {
  std::string result = endpoint();
  if (!share.empty()) {
    result += "/" + share;
  }
  return result;
}

std::string ConnectionInfo::endpoint() const {
  return std::string(protocol_to_scheme(protocol)) + "://" + host + ":" + std::to_string(port);
}

std::string Credentials::fingerprint() const {
  // No secrets, safe to log
  return domain + "\\" + username + "@" + server + ":" + std::to_string(port) + "#" + id;
}

} // namespace netfs
