#ifndef NETFS_CURL_CLIENT_HPP
#define NETFS_CURL_CLIENT_HPP

#include <memory>
#include <string>
#include <vector>
#include "client/curl_session.hpp"
#include "client/remote_file_client.hpp"

namespace netfs {
namespace client {

// Shared libcurl implementation of the client interface. FTP and SFTP
// only expose forward streams: open_read starts a transfer at the offset
// and a different offset means a new transfer.
class CurlClient : public RemoteFileClient {
public:
  CurlClient(Protocol protocol, ClientOptions options, std::string log_name);
  ~CurlClient() override;

  Protocol protocol() const override { return protocol_; }


  // ---- SESSION ----
  Result<void> connect(const ConnectionInfo& info, const Credentials& credentials) override;
  bool is_connected() const override;
  void disconnect() override;
  Result<void> test_connection() override;
  bool supports_random_access() const override { return false; }


  // ---- QUERY OPERATIONS ----
  Result<std::vector<FileEntry>> list(const std::string& path) override;
  // Looks the entry up in its parent listing
  Result<FileEntry> stat(const std::string& path) override;


  // ---- DATA OPERATIONS ----
  Result<std::unique_ptr<ReadStream>> open_read(const std::string& path, uint64_t offset) override;
  // Uses a ranged request instead of a stream
  Result<std::size_t> read_range(const std::string& path, uint64_t offset,
                                 char* buffer, std::size_t length) override;
  Result<uint64_t> write(const std::string& path, std::istream& data, uint64_t size,
                         const ChunkCallback& on_chunk) override;


  // ---- MUTATING OPERATIONS ----
  Result<void> remove(const std::string& path) override;
  Result<void> remove_directory(const std::string& path) override;
  Result<void> mkdir(const std::string& path) override;
  Result<void> rename(const std::string& from, const std::string& to) override;

protected:
  // ---- PROTOCOL HOOKS ----
  virtual Result<std::vector<FileEntry>> list_directory(const std::string& path) = 0;
  virtual std::vector<std::string> delete_commands(const std::string& path) const = 0;
  virtual std::vector<std::string> remove_directory_commands(const std::string& path) const = 0;
  virtual std::vector<std::string> mkdir_commands(const std::string& path) const = 0;
  virtual std::vector<std::string> rename_commands(const std::string& from, const std::string& to) const = 0;

  // Downloads a directory listing as text
  Result<std::string> fetch_listing(const std::string& path, const char* custom_request);
  Result<void> require_session(const std::string& context) const;

  // ---- PARAMETERS ----
  Protocol protocol_;
  ClientOptions options_;
  std::string log_name_;
  ConnectionInfo info_;
  std::shared_ptr<CurlSession> session_;
};

} // namespace client
} // namespace netfs

#endif // NETFS_CURL_CLIENT_HPP
