#include "client/sftp_client.hpp"
#include "client/listing_parser.hpp"

namespace netfs {
namespace client {

std::string quote_sftp_path(const std::string& path) {
  std::string quoted = "\"";
  for (char c : path) {
    if (c == '"' || c == '\\') {
      quoted.push_back('\\');
    }
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

SftpClient::SftpClient(ClientOptions options)
  : CurlClient(Protocol::SFTP, std::move(options), "SftpClient") {
}

Result<std::vector<FileEntry>> SftpClient::list_directory(const std::string& path) {
  // libcurl returns "ls -l" style lines for SFTP directory URLs
  auto text = fetch_listing(path, nullptr);
  if (!text.ok()) {
    return text.error();
  }
  return Result<std::vector<FileEntry>>::success(parse_unix_listing(text.value(), path));
}

std::vector<std::string> SftpClient::delete_commands(const std::string& path) const {
  return {"rm " + quote_sftp_path(path)};
}

std::vector<std::string> SftpClient::remove_directory_commands(const std::string& path) const {
  return {"rmdir " + quote_sftp_path(path)};
}

std::vector<std::string> SftpClient::mkdir_commands(const std::string& path) const {
  return {"mkdir " + quote_sftp_path(path)};
}

std::vector<std::string> SftpClient::rename_commands(const std::string& from, const std::string& to) const {
  return {"rename " + quote_sftp_path(from) + " " + quote_sftp_path(to)};
}

} // namespace client
} // namespace netfs
