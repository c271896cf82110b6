#ifndef NETFS_FILE_ACCESS_MANAGER_HPP
#define NETFS_FILE_ACCESS_MANAGER_HPP

#include <atomic>
#include <filesystem>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>
#include "cache/unified_file_cache.hpp"
#include "client/client_factory.hpp"
#include "core/config.hpp"
#include "credentials/credential_store.hpp"
#include "network/buffer_size_hints.hpp"
#include "network/remote_file_system.hpp"
#include "pool/connection_pool.hpp"
#include "pool/io_executor.hpp"
#include "reader/network_reader.hpp"
#include "scanner/media_scanner.hpp"
#include "transfer/transfer_dispatcher.hpp"

namespace netfs {
namespace service {

// Owns the whole layer for one process: I/O threads, client factory,
// connection pool, buffer hints, cache, dispatcher and scanner. Every
// operation runs on the I/O threads and hands back a future; callers
// never run protocol code on their own thread.
class FileAccessManager {
public:
  // Delete copy constructor and assignment operator
  FileAccessManager(const FileAccessManager&) = delete;
  FileAccessManager& operator=(const FileAccessManager&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // The credential store must outlive the manager
  FileAccessManager(const Config& config, const credentials::CredentialStore& credentials);
  ~FileAccessManager();


  // ---- QUERY OPERATIONS ----
  std::future<Result<std::vector<FileEntry>>> list(const std::string& uri);
  std::future<Result<FileEntry>> stat(const std::string& uri);
  std::future<Result<bool>> exists(const std::string& uri);
  std::future<Result<void>> test_connection(const std::string& uri);
  // At most config().max_read_bytes are returned per call
  std::future<Result<std::vector<char>>> read_range(const std::string& uri, uint64_t offset, std::size_t length);


  // ---- TRANSFERS ----
  // The progress callback runs on an I/O thread
  std::future<Result<transfer::TransferOutcome>> copy(const std::string& source, const std::string& destination,
                                                      bool overwrite, ProgressCallback progress = {});
  std::future<Result<transfer::TransferOutcome>> move(const std::string& source, const std::string& destination,
                                                      bool overwrite, ProgressCallback progress = {});
  std::future<Result<void>> remove(const std::string& uri);
  std::future<Result<void>> mkdir(const std::string& uri);
  std::future<Result<RemoteUri>> rename(const std::string& uri, const std::string& new_name);
  std::future<Result<RemoteUri>> move_to_trash(const std::string& uri, const std::string& root);


  // ---- SCANNING ----
  // listener, when given, must stay alive until the future is ready
  std::future<Result<std::vector<scanner::MediaFile>>> scan(const std::string& root, scanner::ScanOptions options,
                                                            scanner::ScanProgressListener* listener = nullptr);
  std::future<Result<scanner::ScanPage>> scan_page(const std::string& root, scanner::ScanOptions options,
                                                   std::size_t offset, std::size_t limit);
  std::future<Result<std::size_t>> count(const std::string& root, scanner::ScanOptions options);


  // ---- CACHE AND STREAMING ----
  // Local copy of a remote file through the shared cache
  std::future<Result<std::filesystem::path>> fetch_to_cache(const std::string& uri);
  // Unopened reader with its own session; use it from one thread
  std::unique_ptr<reader::NetworkReader> create_reader() const;


  // ---- COMPONENTS ----
  client::ClientFactory& client_factory() { return factory_; }
  pool::ConnectionPool& connection_pool() { return pool_; }
  network::BufferSizeHints& buffer_hints() { return hints_; }
  network::RemoteFileSystem& file_system() { return fs_; }
  cache::UnifiedFileCache& file_cache() { return cache_; }
  transfer::TransferDispatcher& dispatcher() { return dispatcher_; }
  scanner::MediaScanner& media_scanner() { return scanner_; }
  const Config& config() const { return config_; }


  // Stops the idle sweep, drains the I/O threads, then closes every
  // pooled session. Idempotent. Later calls fail with INTERRUPTED.
  void shutdown();

private:
  // ---- PARAMETERS ----
  Config config_;
  const credentials::CredentialStore& credentials_;

  pool::IoExecutor executor_;
  client::ClientFactory factory_;
  network::BufferSizeHints hints_;
  pool::ConnectionPool pool_;
  network::RemoteFileSystem fs_;
  cache::UnifiedFileCache cache_;
  transfer::TransferDispatcher dispatcher_;
  scanner::MediaScanner scanner_;

  std::atomic<bool> shut_down_{false};


  // ---- INTERNAL HELPERS ----
  template <typename Fn>
  auto post(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>>;

  Result<transfer::TransferRequest> make_request(const std::string& source, const std::string& destination,
                                                 bool overwrite, ProgressCallback progress) const;
};

template <typename Fn>
auto FileAccessManager::post(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
  using R = std::invoke_result_t<std::decay_t<Fn>>;
  try {
    return executor_.submit(std::forward<Fn>(fn));
  } catch (const std::runtime_error& e) {
    std::promise<R> rejected;
    rejected.set_value(R(make_error(ErrorKind::IO_ERROR, ErrorReason::INTERRUPTED,
      "FileAccessManager is shut down", e.what())));
    return rejected.get_future();
  }
}

} // namespace service
} // namespace netfs

#endif // NETFS_FILE_ACCESS_MANAGER_HPP
