#ifndef NETFS_FTP_CLIENT_HPP
#define NETFS_FTP_CLIENT_HPP

#include "client/curl_client.hpp"

namespace netfs {
namespace client {

class FtpClient : public CurlClient {
public:
  explicit FtpClient(ClientOptions options);

protected:
  // MLSD first, plain LIST once the server turned MLSD down
  Result<std::vector<FileEntry>> list_directory(const std::string& path) override;

  std::vector<std::string> delete_commands(const std::string& path) const override;
  std::vector<std::string> remove_directory_commands(const std::string& path) const override;
  std::vector<std::string> mkdir_commands(const std::string& path) const override;
  std::vector<std::string> rename_commands(const std::string& from, const std::string& to) const override;

private:
  bool mlsd_supported_{true};
};

} // namespace client
} // namespace netfs

#endif // NETFS_FTP_CLIENT_HPP
