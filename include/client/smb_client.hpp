#ifndef NETFS_SMB_CLIENT_HPP
#define NETFS_SMB_CLIENT_HPP

#include <memory>
#include <string>
#include "client/remote_file_client.hpp"

namespace netfs {
namespace client {

// Context, open handles and auth data live in the source file so that
// only it depends on libsmbclient
struct SmbContext;

// SMB2/3 share access through the libsmbclient context API. Handles are
// random access: open_read positions with lseek.
class SmbClient : public RemoteFileClient {
public:
  explicit SmbClient(ClientOptions options);
  ~SmbClient() override;

  Protocol protocol() const override { return Protocol::SMB; }


  // ---- SESSION ----
  Result<void> connect(const ConnectionInfo& info, const Credentials& credentials) override;
  bool is_connected() const override;
  // Open file handles, then cached server sessions, then the context
  void disconnect() override;
  Result<void> test_connection() override;
  bool supports_random_access() const override { return true; }


  // ---- QUERY OPERATIONS ----
  Result<std::vector<FileEntry>> list(const std::string& path) override;
  Result<FileEntry> stat(const std::string& path) override;


  // ---- DATA OPERATIONS ----
  Result<std::unique_ptr<ReadStream>> open_read(const std::string& path, uint64_t offset) override;
  Result<uint64_t> write(const std::string& path, std::istream& data, uint64_t size,
                         const ChunkCallback& on_chunk) override;


  // ---- MUTATING OPERATIONS ----
  Result<void> remove(const std::string& path) override;
  Result<void> remove_directory(const std::string& path) override;
  Result<void> mkdir(const std::string& path) override;
  Result<void> rename(const std::string& from, const std::string& to) override;

private:
  // ---- PARAMETERS ----
  ClientOptions options_;
  ConnectionInfo info_;
  std::shared_ptr<SmbContext> context_;

  // ---- INTERNAL HELPERS ----
  std::string url_for(const std::string& path) const;
  Result<void> require_context(const std::string& context) const;
  // Marks the session dead when errno reports a transport failure
  Error fail(int err, const std::string& context);
};

} // namespace client
} // namespace netfs

#endif // NETFS_SMB_CLIENT_HPP
