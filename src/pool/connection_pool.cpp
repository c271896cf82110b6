#include "pool/connection_pool.hpp"
#include <vector>
#include <boost/log/trivial.hpp>

namespace netfs {
namespace pool {

//==============================================
// POOLED CONNECTION
//==============================================

PooledConnection::PooledConnection(ConnectionInfo info, std::string credentials_fingerprint,
                                   std::unique_ptr<client::RemoteFileClient> client)
  : info(std::move(info))
  , credentials_fingerprint(std::move(credentials_fingerprint))
  , client(std::move(client))
  , last_used(std::chrono::steady_clock::now()) {
}

PooledConnection::~PooledConnection() {
  if (client && client->is_connected()) {
    BOOST_LOG_TRIVIAL(debug) << "ConnectionPool: Closing released connection " << info.key();
    client->disconnect();
  }
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ConnectionPool::ConnectionPool(const client::ClientFactory& factory, std::chrono::milliseconds idle_timeout)
  : factory_(factory)
  , idle_timeout_(idle_timeout) {
  BOOST_LOG_TRIVIAL(info) << "ConnectionPool: Initialized with idle timeout " << idle_timeout_.count() << "ms";
}

ConnectionPool::~ConnectionPool() {
  shutdown();
}


//==============================================
// CONNECTION MANAGEMENT
//==============================================

Result<std::shared_ptr<PooledConnection>> ConnectionPool::acquire(const ConnectionInfo& info,
                                                                  const Credentials& credentials) {
  using ConnectionResult = Result<std::shared_ptr<PooledConnection>>;
  const std::string key = info.key();
  const std::string fingerprint = credentials.fingerprint();

  std::shared_ptr<PooledConnection> fresh;
  std::unique_lock<std::mutex> fresh_usage;
  while (!fresh) {
    std::shared_ptr<PooledConnection> contested;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (shut_down_) {
        return make_error(ErrorKind::CONNECTION_ERROR, ErrorReason::DISCONNECTED,
          "Connection pool is shut down");
      }

      const auto now = Clock::now();
      auto it = connections_.find(key);
      if (it != connections_.end()) {
        auto existing = it->second;
        std::unique_lock<std::mutex> usage(existing->usage_mutex, std::try_to_lock);

        if (!usage.owns_lock()) {
          // Busy means alive, but only the same credentials queue behind the current user
          if (existing->credentials_fingerprint == fingerprint) {
            existing->last_used = now;
            BOOST_LOG_TRIVIAL(debug) << "ConnectionPool: Sharing busy connection " << key;
            return ConnectionResult::success(existing);
          }
          contested = existing;
        } else {
          std::string reason;
          if (!existing->client->is_connected()) {
            reason = "transport disconnected";
          } else if (now - existing->last_used >= idle_timeout_) {
            reason = "idle past threshold";
          } else if (existing->credentials_fingerprint != fingerprint) {
            reason = "credentials changed";
          }

          if (reason.empty()) {
            existing->last_used = now;
            BOOST_LOG_TRIVIAL(debug) << "ConnectionPool: Reusing connection " << key;
            return ConnectionResult::success(existing);
          }

          BOOST_LOG_TRIVIAL(warning) << "ConnectionPool: Connection " << key << " is stale (" << reason
                                     << "), closing it";
          existing->retired = true;
          close_connection(*existing, reason);
          connections_.erase(it);
        }
      }

      if (!contested) {
        auto created = factory_.create_checked(info.protocol);
        if (!created.ok()) {
          return created.error();
        }

        fresh = std::make_shared<PooledConnection>(info, fingerprint, std::move(created).value());
        fresh_usage = std::unique_lock<std::mutex>(fresh->usage_mutex);
        connections_[key] = fresh;
      }
    }

    if (contested) {
      // Wait outside the pool lock for the other user to release it
      BOOST_LOG_TRIVIAL(info) << "ConnectionPool: Connection " << key
                              << " is in use with other credentials, waiting to replace it";
      std::unique_lock<std::mutex> usage(contested->usage_mutex);
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = connections_.find(key);
      if (it != connections_.end() && it->second == contested) {
        contested->retired = true;
        close_connection(*contested, "credentials changed");
        connections_.erase(it);
      }
    }
  }

  BOOST_LOG_TRIVIAL(info) << "ConnectionPool: Opening connection " << key;
  auto connected = fresh->client->connect(info, credentials);
  if (!connected.ok()) {
    BOOST_LOG_TRIVIAL(error) << "ConnectionPool: Cannot connect " << key << ": " << connected.error().to_string();
    fresh->retired = true;
    fresh->connect_error = connected.error();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = connections_.find(key);
      if (it != connections_.end() && it->second == fresh) {
        connections_.erase(it);
      }
    }
    return connected.error();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    fresh->last_used = Clock::now();
  }
  return ConnectionResult::success(fresh);
}

void ConnectionPool::invalidate(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(key);
  if (it == connections_.end()) {
    return;
  }

  auto connection = it->second;
  connections_.erase(it);

  std::unique_lock<std::mutex> usage(connection->usage_mutex, std::try_to_lock);
  if (usage.owns_lock()) {
    connection->retired = true;
    close_connection(*connection, "invalidated");
  } else {
    // Closed by ~PooledConnection once the current user releases it
    BOOST_LOG_TRIVIAL(info) << "ConnectionPool: Invalidated busy connection " << key;
  }
}


//==============================================
// IDLE EVICTION
//==============================================

std::size_t ConnectionPool::sweep_idle() {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = Clock::now();
  std::size_t evicted = 0;

  for (auto it = connections_.begin(); it != connections_.end();) {
    auto& connection = it->second;
    std::unique_lock<std::mutex> usage(connection->usage_mutex, std::try_to_lock);
    if (!usage.owns_lock()) {
      ++it;
      continue;
    }

    const bool disconnected = !connection->client->is_connected();
    const bool idle = now - connection->last_used >= idle_timeout_;
    if (!disconnected && !idle) {
      ++it;
      continue;
    }

    connection->retired = true;
    close_connection(*connection, disconnected ? "transport disconnected" : "idle");
    usage.unlock();
    it = connections_.erase(it);
    ++evicted;
  }

  if (evicted > 0) {
    BOOST_LOG_TRIVIAL(info) << "ConnectionPool: Swept " << evicted << " connections, "
                            << connections_.size() << " remain";
  }
  return evicted;
}

void ConnectionPool::start_idle_sweep(const boost::asio::any_io_executor& executor,
                                      std::chrono::milliseconds interval) {
  std::lock_guard<std::mutex> lock(sweep_mutex_);
  if (sweeping_) {
    return;
  }
  sweep_timer_ = std::make_unique<boost::asio::steady_timer>(executor);
  sweep_interval_ = interval;
  sweeping_ = true;
  BOOST_LOG_TRIVIAL(debug) << "ConnectionPool: Idle sweep every " << interval.count() << "ms";
  schedule_sweep();
}

void ConnectionPool::stop_idle_sweep() {
  std::lock_guard<std::mutex> lock(sweep_mutex_);
  if (!sweeping_) {
    return;
  }
  sweeping_ = false;
  sweep_timer_->cancel();
  BOOST_LOG_TRIVIAL(debug) << "ConnectionPool: Idle sweep stopped";
}

void ConnectionPool::schedule_sweep() {
  // Caller holds sweep_mutex_
  sweep_timer_->expires_after(sweep_interval_);
  sweep_timer_->async_wait([this](const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    sweep_idle();
    std::lock_guard<std::mutex> lock(sweep_mutex_);
    if (sweeping_) {
      schedule_sweep();
    }
  });
}


//==============================================
// UTILITY METHODS
//==============================================

std::size_t ConnectionPool::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

bool ConnectionPool::contains(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.count(key) > 0;
}

void ConnectionPool::shutdown() {
  stop_idle_sweep();

  std::lock_guard<std::mutex> lock(mutex_);
  if (shut_down_) {
    return;
  }
  shut_down_ = true;
  BOOST_LOG_TRIVIAL(info) << "ConnectionPool: Shutting down, closing " << connections_.size() << " connections";

  for (auto& [key, connection] : connections_) {
    std::unique_lock<std::mutex> usage(connection->usage_mutex, std::try_to_lock);
    if (usage.owns_lock()) {
      connection->retired = true;
      close_connection(*connection, "shutdown");
    }
  }
  connections_.clear();
}


//==============================================
// INTERNAL HELPERS
//==============================================

void ConnectionPool::retire(const std::shared_ptr<PooledConnection>& connection, const std::string& reason) {
  connection->retired = true;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection->info.key());
    if (it != connections_.end() && it->second == connection) {
      connections_.erase(it);
    }
  }
  close_connection(*connection, reason);
}

void ConnectionPool::touch(const std::shared_ptr<PooledConnection>& connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  connection->last_used = Clock::now();
}

void ConnectionPool::close_connection(PooledConnection& connection, const std::string& reason) {
  BOOST_LOG_TRIVIAL(info) << "ConnectionPool: Closing " << connection.info.key() << " (" << reason << ")";
  connection.client->disconnect();
}

} // namespace pool
} // namespace netfs
