#ifndef NETFS_CLIENT_FACTORY_HPP
#define NETFS_CLIENT_FACTORY_HPP

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include "client/remote_file_client.hpp"

namespace netfs {
namespace client {

// Creates an unconnected client for a protocol. Built-in creators cover
// local, FTP, SFTP and (when built with libsmbclient) SMB; a platform
// registers its document tree client through register_creator.
class ClientFactory {
public:
  using Creator = std::function<std::unique_ptr<RemoteFileClient>(const ClientOptions&)>;

  explicit ClientFactory(ClientOptions options = {});

  // nullptr when no creator handles the protocol
  std::unique_ptr<RemoteFileClient> create(Protocol protocol) const;
  Result<std::unique_ptr<RemoteFileClient>> create_checked(Protocol protocol) const;

  void register_creator(Protocol protocol, Creator creator);
  bool supports(Protocol protocol) const;

  const ClientOptions& options() const { return options_; }

private:
  ClientOptions options_;
  std::map<Protocol, Creator> creators_;
  mutable std::mutex mutex_;
};

} // namespace client
} // namespace netfs

#endif // NETFS_CLIENT_FACTORY_HPP
