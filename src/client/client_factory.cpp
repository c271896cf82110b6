#include "client/client_factory.hpp"
#include <boost/log/trivial.hpp>
#include "client/ftp_client.hpp"
#include "client/local_client.hpp"
#include "client/sftp_client.hpp"
#ifdef NETFS_WITH_SMB
#include "client/smb_client.hpp"
#endif

namespace netfs {
namespace client {

ClientFactory::ClientFactory(ClientOptions options)
  : options_(std::move(options)) {
  creators_[Protocol::LOCAL] = [](const ClientOptions&) {
    return std::make_unique<LocalClient>();
  };
  creators_[Protocol::FTP] = [](const ClientOptions& opts) {
    return std::make_unique<FtpClient>(opts);
  };
  creators_[Protocol::SFTP] = [](const ClientOptions& opts) {
    return std::make_unique<SftpClient>(opts);
  };
#ifdef NETFS_WITH_SMB
  creators_[Protocol::SMB] = [](const ClientOptions& opts) {
    return std::make_unique<SmbClient>(opts);
  };
#endif
}

std::unique_ptr<RemoteFileClient> ClientFactory::create(Protocol protocol) const {
  Creator creator;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = creators_.find(protocol);
    if (it == creators_.end()) {
      return nullptr;
    }
    creator = it->second;
  }
  return creator(options_);
}

Result<std::unique_ptr<RemoteFileClient>> ClientFactory::create_checked(Protocol protocol) const {
  auto client = create(protocol);
  if (!client) {
    BOOST_LOG_TRIVIAL(error) << "ClientFactory: No client for scheme " << protocol_to_scheme(protocol);
    return make_error(ErrorKind::PROTOCOL_ERROR, ErrorReason::UNSUPPORTED,
      std::string("Scheme '") + protocol_to_scheme(protocol) + "' is not supported in this build");
  }
  return Result<std::unique_ptr<RemoteFileClient>>::success(std::move(client));
}

void ClientFactory::register_creator(Protocol protocol, Creator creator) {
  std::lock_guard<std::mutex> lock(mutex_);
  creators_[protocol] = std::move(creator);
  BOOST_LOG_TRIVIAL(debug) << "ClientFactory: Registered client for " << protocol_to_scheme(protocol);
}

bool ClientFactory::supports(Protocol protocol) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return creators_.count(protocol) > 0;
}

} // namespace client
} // namespace netfs
