#ifndef NETFS_CONNECTION_POOL_HPP
#define NETFS_CONNECTION_POOL_HPP

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include "client/client_factory.hpp"
#include "client/remote_file_client.hpp"
#include "core/result.hpp"

namespace netfs {
namespace pool {

// One authenticated session owned by the pool. Holding usage_mutex is the
// right to call into `client`; the session itself is not synchronized.
struct PooledConnection {
  PooledConnection(ConnectionInfo info, std::string credentials_fingerprint,
                   std::unique_ptr<client::RemoteFileClient> client);
  ~PooledConnection();

  const ConnectionInfo info;
  const std::string credentials_fingerprint;
  std::unique_ptr<client::RemoteFileClient> client;

  // Guarded by the pool mutex
  std::chrono::steady_clock::time_point last_used;

  // Guarded by usage_mutex
  std::mutex usage_mutex;
  bool retired{false};
  std::optional<Error> connect_error;
};

class ConnectionPool {
public:
  using Clock = std::chrono::steady_clock;

  // Delete copy constructor and assignment operator
  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ConnectionPool(const client::ClientFactory& factory, std::chrono::milliseconds idle_timeout);
  ~ConnectionPool();


  // ---- CONNECTION MANAGEMENT ----
  // Returns the live connection for info.key(), replacing a stale one.
  // Only the lookup/insert/evict decision runs under the pool lock; a new
  // session authenticates outside it while holding its own usage_mutex,
  // so concurrent callers for the same key wait for that one attempt.
  // A busy session is shared only with callers holding the same
  // credentials; others wait for it to be released and replace it.
  Result<std::shared_ptr<PooledConnection>> acquire(const ConnectionInfo& info, const Credentials& credentials);

  // Runs fn(client) with exclusive use of the pooled session. A
  // connection-kind failure from fn retires the session.
  template <typename Fn>
  auto with_connection(const ConnectionInfo& info, const Credentials& credentials, Fn&& fn)
      -> decltype(fn(std::declval<client::RemoteFileClient&>()));

  // Drops the entry for key, closing it now unless it is in use
  void invalidate(const std::string& key);


  // ---- IDLE EVICTION ----
  // Closes entries idle past the threshold or reporting a dead
  // transport; returns how many were evicted
  std::size_t sweep_idle();
  void start_idle_sweep(const boost::asio::any_io_executor& executor, std::chrono::milliseconds interval);
  void stop_idle_sweep();


  // ---- UTILITY METHODS ----
  const client::ClientFactory& factory() const { return factory_; }
  std::size_t size() const;
  bool contains(const std::string& key) const;
  void shutdown();

private:
  // ---- PARAMETERS ----
  static constexpr int MAX_ACQUIRE_ATTEMPTS = 3;
  const client::ClientFactory& factory_;
  std::chrono::milliseconds idle_timeout_;

  // Connections map and access mutex
  std::map<std::string, std::shared_ptr<PooledConnection>> connections_;
  mutable std::mutex mutex_;
  bool shut_down_{false};

  // Periodic sweep
  std::unique_ptr<boost::asio::steady_timer> sweep_timer_;
  std::chrono::milliseconds sweep_interval_{0};
  bool sweeping_{false};
  std::mutex sweep_mutex_;


  // ---- INTERNAL HELPERS ----
  // Caller holds connection->usage_mutex
  void retire(const std::shared_ptr<PooledConnection>& connection, const std::string& reason);
  void touch(const std::shared_ptr<PooledConnection>& connection);
  void schedule_sweep();
  static void close_connection(PooledConnection& connection, const std::string& reason);
};

template <typename Fn>
auto ConnectionPool::with_connection(const ConnectionInfo& info, const Credentials& credentials, Fn&& fn)
    -> decltype(fn(std::declval<client::RemoteFileClient&>())) {
  std::shared_ptr<PooledConnection> connection;
  std::unique_lock<std::mutex> usage;
  for (int attempt = 1;; ++attempt) {
    auto acquired = acquire(info, credentials);
    if (!acquired.ok()) {
      return acquired.error();
    }
    connection = std::move(acquired).value();

    usage = std::unique_lock<std::mutex>(connection->usage_mutex);
    if (!connection->retired) {
      break;
    }
    if (connection->connect_error) {
      return *connection->connect_error;
    }
    // Replaced while queued behind another user
    if (attempt == MAX_ACQUIRE_ATTEMPTS) {
      return make_error(ErrorKind::CONNECTION_ERROR, ErrorReason::DISCONNECTED,
        "Connection to " + info.key() + " was closed");
    }
    usage.unlock();
  }

  auto result = std::forward<Fn>(fn)(*connection->client);
  if (!result.ok() && result.error().is_connection_error()) {
    retire(connection, result.error().to_string());
  } else {
    touch(connection);
  }
  return result;
}

} // namespace pool
} // namespace netfs

#endif // NETFS_CONNECTION_POOL_HPP
