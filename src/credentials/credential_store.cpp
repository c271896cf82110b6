#include "credentials/credential_store.hpp"
#include <boost/log/trivial.hpp>

namespace netfs {
namespace credentials {

void InMemoryCredentialStore::add(const Credentials& credentials) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[credentials.id] = credentials;
  BOOST_LOG_TRIVIAL(debug) << "CredentialStore: Stored credentials " << credentials.id
                           << " for " << protocol_to_scheme(credentials.protocol) << "://"
                           << credentials.server << ":" << credentials.port;
}

bool InMemoryCredentialStore::remove(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.erase(id) > 0;
}

std::vector<Credentials> InMemoryCredentialStore::all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Credentials> result;
  for (const auto& [id, credentials] : entries_) {
    result.push_back(credentials);
  }
  return result;
}

std::optional<Credentials> InMemoryCredentialStore::find_by_id(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<Credentials> InMemoryCredentialStore::find_by_endpoint(Protocol protocol, const std::string& host,
                                                                     uint16_t port) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [id, credentials] : entries_) {
    if (credentials.protocol == protocol && credentials.server == host && credentials.port == port) {
      return credentials;
    }
  }
  return std::nullopt;
}

Result<Credentials> resolve_credentials(const CredentialStore& store, const RemoteUri& uri) {
  if (!is_remote(uri.protocol)) {
    return Result<Credentials>::success(Credentials{});
  }

  std::optional<Credentials> found;
  if (!uri.credentials_id.empty()) {
    found = store.find_by_id(uri.credentials_id);
  } else {
    found = store.find_by_endpoint(uri.protocol, uri.host, uri.port);
  }

  if (!found) {
    BOOST_LOG_TRIVIAL(warning) << "CredentialStore: No credentials for " << uri.connection_info().endpoint();
    return make_error(ErrorKind::VALIDATION_ERROR, ErrorReason::MISSING_CREDENTIALS,
      "No credentials for " + uri.connection_info().endpoint(),
      uri.credentials_id.empty() ? "lookup by endpoint" : "unknown id '" + uri.credentials_id + "'");
  }
  return Result<Credentials>::success(*found);
}

} // namespace credentials
} // namespace netfs
