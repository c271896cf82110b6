#ifndef NETFS_REMOTE_FILE_SYSTEM_HPP
#define NETFS_REMOTE_FILE_SYSTEM_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "client/local_client.hpp"
#include "core/uri.hpp"
#include "credentials/credential_store.hpp"
#include "pool/connection_pool.hpp"

namespace netfs {
namespace network {

// URI level file operations. Resolves credentials, checks a session out
// of the pool and runs the client call on it; local paths skip the pool.
// Every call blocks and is meant to run on an I/O thread.
class RemoteFileSystem {
public:
  RemoteFileSystem(pool::ConnectionPool& pool, const credentials::CredentialStore& credentials);


  // ---- QUERY OPERATIONS ----
  Result<std::vector<FileEntry>> list(const RemoteUri& uri);
  Result<FileEntry> stat(const RemoteUri& uri);
  Result<bool> exists(const RemoteUri& uri);
  Result<void> test_connection(const RemoteUri& uri);


  // ---- DATA OPERATIONS ----
  Result<std::size_t> read_range(const RemoteUri& uri, uint64_t offset, char* buffer, std::size_t length);
  // Streams the remote file into target, truncating it
  Result<uint64_t> download(const RemoteUri& source, const std::filesystem::path& target,
                            const ChunkCallback& on_chunk);
  Result<uint64_t> upload(const std::filesystem::path& source, const RemoteUri& target,
                          const ChunkCallback& on_chunk);


  // ---- MUTATING OPERATIONS ----
  // Directories are removed with their contents
  Result<void> remove(const RemoteUri& uri);
  Result<void> mkdir(const RemoteUri& uri);
  // Server side rename, both URIs must share a connection
  Result<void> rename(const RemoteUri& from, const RemoteUri& to);


  // Runs fn(client) against the session serving uri
  template <typename Fn>
  auto run(const RemoteUri& uri, Fn&& fn) -> decltype(fn(std::declval<client::RemoteFileClient&>()));

private:
  pool::ConnectionPool& pool_;
  const credentials::CredentialStore& credentials_;
  // From the factory, a plain LocalClient when none is registered
  std::unique_ptr<client::RemoteFileClient> local_;

  static Result<void> remove_tree(client::RemoteFileClient& client, const std::string& path);
};

template <typename Fn>
auto RemoteFileSystem::run(const RemoteUri& uri, Fn&& fn)
    -> decltype(fn(std::declval<client::RemoteFileClient&>())) {
  if (uri.protocol == Protocol::LOCAL) {
    return std::forward<Fn>(fn)(*local_);
  }

  auto resolved = credentials::resolve_credentials(credentials_, uri);
  if (!resolved.ok()) {
    return resolved.error();
  }
  return pool_.with_connection(uri.connection_info(), resolved.value(), std::forward<Fn>(fn));
}

} // namespace network
} // namespace netfs

#endif // NETFS_REMOTE_FILE_SYSTEM_HPP
