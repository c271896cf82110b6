#ifndef NETFS_CREDENTIAL_STORE_HPP
#define NETFS_CREDENTIAL_STORE_HPP

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/result.hpp"
#include "core/types.hpp"
#include "core/uri.hpp"

namespace netfs {
namespace credentials {

// Read side of the credential database. Implementations must be safe to
// call from the I/O threads.
class CredentialStore {
public:
  virtual ~CredentialStore() = default;

  virtual std::optional<Credentials> find_by_id(const std::string& id) const = 0;
  virtual std::optional<Credentials> find_by_endpoint(Protocol protocol, const std::string& host,
                                                      uint16_t port) const = 0;
};

class InMemoryCredentialStore : public CredentialStore {
public:
  // Replaces an entry with the same id
  void add(const Credentials& credentials);
  bool remove(const std::string& id);
  std::vector<Credentials> all() const;

  std::optional<Credentials> find_by_id(const std::string& id) const override;
  std::optional<Credentials> find_by_endpoint(Protocol protocol, const std::string& host,
                                              uint16_t port) const override;

private:
  std::map<std::string, Credentials> entries_;
  mutable std::mutex mutex_;
};

// Explicit id first, then (protocol, host, port). Local and document tree
// URIs need no credentials and get an empty set.
Result<Credentials> resolve_credentials(const CredentialStore& store, const RemoteUri& uri);

} // namespace credentials
} // namespace netfs

#endif // NETFS_CREDENTIAL_STORE_HPP
