#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include "core/result.hpp"

namespace netfs {
namespace cache {

struct CacheStats {
  std::size_t file_count{0};
  uint64_t total_bytes{0};
  uint64_t max_bytes{0};
};

// On-disk cache shared by every consumer of remote bytes. Entries are flat
// files named "{sha256(path)}_{size}" in one directory; the listing is the
// only index. An entry is valid while its length equals the expected size
// and its age is below the TTL, and is deleted on the first read that
// finds it invalid.
class UnifiedFileCache {
public:
  // Writes the remote bytes to the given target file
  using Downloader = std::function<Result<void>(const std::filesystem::path& target)>;

  static constexpr std::chrono::hours DEFAULT_TTL{24};
  static constexpr uint64_t DEFAULT_MAX_BYTES = 500ull * 1024 * 1024;
  // Eviction stops once the entries fit in this share of max_bytes
  static constexpr double EVICTION_TARGET = 0.8;


  // ---- CONSTRUCTOR ----
  // max_bytes of 0 leaves the size unbounded
  explicit UnifiedFileCache(const std::filesystem::path& cache_dir,
                            std::chrono::seconds ttl = DEFAULT_TTL,
                            uint64_t max_bytes = DEFAULT_MAX_BYTES);


  // ---- LOOKUP ----
  std::optional<std::filesystem::path> get_cached_file(const std::string& path, uint64_t size);
  bool is_cached(const std::string& path, uint64_t size);
  // Location an entry would have, for callers streaming straight into it.
  // Creates the cache directory when missing.
  std::filesystem::path get_cache_file(const std::string& path, uint64_t size);
  // Throws CacheError when hashing fails
  std::string key(const std::string& path, uint64_t size) const;


  // ---- UPDATES ----
  // Copies source_file into the cache; no-op when it already is the entry
  Result<std::filesystem::path> put_file(const std::string& path, uint64_t size,
                                         const std::filesystem::path& source_file);
  // Returns the entry, downloading it once. Concurrent callers for the
  // same key wait for the download already in flight.
  Result<std::filesystem::path> fetch(const std::string& path, uint64_t size, const Downloader& downloader);


  // ---- MAINTENANCE ----
  // Best effort; failures are logged. Returns the number of files deleted.
  std::size_t clear_all();
  std::size_t evict_expired();
  // Deletes the entry for (path, size); false when there was none
  bool invalidate(const std::string& path, uint64_t size);
  // Above max_bytes, deletes the oldest entries until the total is at or
  // below EVICTION_TARGET * max_bytes. Runs after every put_file and fetch.
  std::size_t evict_if_needed();
  CacheStats stats() const;
  const std::filesystem::path& directory() const { return cache_dir_; }
  std::chrono::seconds ttl() const { return ttl_; }
  uint64_t max_bytes() const { return max_bytes_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path cache_dir_;
  std::chrono::seconds ttl_;
  uint64_t max_bytes_;

  // Downloads in flight, keyed like the entries
  std::map<std::string, std::shared_future<Result<std::filesystem::path>>> inflight_;
  std::mutex inflight_mutex_;


  // ---- INTERNAL HELPERS ----
  // Generate SHA-256 hash of the remote path using OpenSSL EVP
  std::string hash_path(const std::string& path) const;
  bool is_expired(const std::filesystem::path& file) const;
  // evict_if_needed, sparing the entry just written
  std::size_t evict_over_limit(const std::filesystem::path& keep);
  void check_directory_exists() const;
  Result<std::filesystem::path> download_into_cache(const std::string& path, uint64_t size,
                                                    const Downloader& downloader);
  // Parses "{hash}_{size}"; false for foreign files and partial downloads
  static bool parse_entry_name(const std::string& name, uint64_t& size);
};

class CacheError : public std::runtime_error {
public:
  explicit CacheError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace cache
} // namespace netfs
