#ifndef NETFS_SFTP_CLIENT_HPP
#define NETFS_SFTP_CLIENT_HPP

#include "client/curl_client.hpp"

namespace netfs {
namespace client {

class SftpClient : public CurlClient {
public:
  explicit SftpClient(ClientOptions options);

protected:
  Result<std::vector<FileEntry>> list_directory(const std::string& path) override;

  std::vector<std::string> delete_commands(const std::string& path) const override;
  std::vector<std::string> remove_directory_commands(const std::string& path) const override;
  std::vector<std::string> mkdir_commands(const std::string& path) const override;
  std::vector<std::string> rename_commands(const std::string& from, const std::string& to) const override;
};

// Double-quotes a path for an SFTP quote command
std::string quote_sftp_path(const std::string& path);

} // namespace client
} // namespace netfs

#endif // NETFS_SFTP_CLIENT_HPP
