#ifndef NETFS_LOCAL_CLIENT_HPP
#define NETFS_LOCAL_CLIENT_HPP

#include <filesystem>
#include "client/remote_file_client.hpp"

namespace netfs {
namespace client {

// Local filesystem behind the client interface. Stateless, so one
// instance may be shared between threads.
class LocalClient : public RemoteFileClient {
public:
  Protocol protocol() const override { return Protocol::LOCAL; }

  Result<void> connect(const ConnectionInfo& info, const Credentials& credentials) override;
  bool is_connected() const override { return true; }
  void disconnect() override {}
  Result<void> test_connection() override { return Result<void>::success(); }
  bool supports_random_access() const override { return true; }

  Result<std::vector<FileEntry>> list(const std::string& path) override;
  Result<FileEntry> stat(const std::string& path) override;

  Result<std::unique_ptr<ReadStream>> open_read(const std::string& path, uint64_t offset) override;
  Result<uint64_t> write(const std::string& path, std::istream& data, uint64_t size,
                         const ChunkCallback& on_chunk) override;

  Result<void> remove(const std::string& path) override;
  Result<void> remove_directory(const std::string& path) override;
  Result<void> mkdir(const std::string& path) override;
  // Fails with CROSS_DEVICE when both paths are not on one file system
  Result<void> rename(const std::string& from, const std::string& to) override;

  static FileEntry make_entry(const std::filesystem::directory_entry& entry);
};

int64_t to_epoch_millis(std::filesystem::file_time_type time);

} // namespace client
} // namespace netfs

#endif // NETFS_LOCAL_CLIENT_HPP
