#include "cache/unified_file_cache.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <vector>
#include <sstream>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace netfs {
namespace cache {

namespace {
constexpr const char* PART_SUFFIX = ".part";
}

//==============================================
// CONSTRUCTOR
//==============================================

UnifiedFileCache::UnifiedFileCache(const std::filesystem::path& cache_dir, std::chrono::seconds ttl,
                                   uint64_t max_bytes)
  : cache_dir_(cache_dir)
  , ttl_(ttl)
  , max_bytes_(max_bytes) {
  BOOST_LOG_TRIVIAL(info) << "UnifiedFileCache: Initializing cache at " << cache_dir_
                          << " with TTL " << ttl_.count() << "s, limit " << max_bytes_ << " bytes";
}


//==============================================
// LOOKUP
//==============================================

std::optional<std::filesystem::path> UnifiedFileCache::get_cached_file(const std::string& path, uint64_t size) {
  std::filesystem::path file;
  try {
    file = cache_dir_ / key(path, size);
  } catch (const CacheError& e) {
    BOOST_LOG_TRIVIAL(error) << "UnifiedFileCache: " << e.what();
    return std::nullopt;
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(file, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "UnifiedFileCache: Miss for " << path << " (" << size << " bytes)";
    return std::nullopt;
  }

  const auto actual = std::filesystem::file_size(file, ec);
  std::string invalid_reason;
  if (ec) {
    invalid_reason = "unreadable: " + ec.message();
  } else if (actual != size) {
    invalid_reason = "size " + std::to_string(actual) + " != expected " + std::to_string(size);
  } else if (is_expired(file)) {
    invalid_reason = "older than TTL";
  }

  if (!invalid_reason.empty()) {
    BOOST_LOG_TRIVIAL(info) << "UnifiedFileCache: Dropping entry for " << path << ": " << invalid_reason;
    std::filesystem::remove(file, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "UnifiedFileCache: Cannot delete " << file << ": " << ec.message();
    }
    return std::nullopt;
  }

  BOOST_LOG_TRIVIAL(debug) << "UnifiedFileCache: Hit for " << path << " -> " << file.filename();
  return file;
}

bool UnifiedFileCache::is_cached(const std::string& path, uint64_t size) {
  return get_cached_file(path, size).has_value();
}

std::filesystem::path UnifiedFileCache::get_cache_file(const std::string& path, uint64_t size) {
  check_directory_exists();
  return cache_dir_ / key(path, size);
}

std::string UnifiedFileCache::key(const std::string& path, uint64_t size) const {
  return hash_path(path) + "_" + std::to_string(size);
}


//==============================================
// UPDATES
//==============================================

Result<std::filesystem::path> UnifiedFileCache::put_file(const std::string& path, uint64_t size,
                                                         const std::filesystem::path& source_file) {
  std::filesystem::path target;
  try {
    target = get_cache_file(path, size);
  } catch (const std::exception& e) {
    return make_error(ErrorKind::IO_ERROR, ErrorReason::UNSPECIFIED, "Cannot prepare cache entry", e.what());
  }

  std::error_code ec;
  if (std::filesystem::exists(target, ec) && std::filesystem::equivalent(source_file, target, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "UnifiedFileCache: " << source_file << " already is the cache entry";
    return Result<std::filesystem::path>::success(target);
  }

  // Copy beside the entry, then rename so readers never see a partial file
  std::filesystem::path part = target;
  part += PART_SUFFIX;
  std::filesystem::copy_file(source_file, part, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(part, ignored);
    return error_from_errno(ec.value(), "Cannot copy " + source_file.string() + " into cache");
  }
  std::filesystem::rename(part, target, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(part, ignored);
    return error_from_errno(ec.value(), "Cannot move cache entry into place");
  }

  BOOST_LOG_TRIVIAL(info) << "UnifiedFileCache: Stored " << path << " (" << size << " bytes) as "
                          << target.filename();
  evict_over_limit(target);
  return Result<std::filesystem::path>::success(target);
}

Result<std::filesystem::path> UnifiedFileCache::fetch(const std::string& path, uint64_t size,
                                                      const Downloader& downloader) {
  if (auto hit = get_cached_file(path, size)) {
    return Result<std::filesystem::path>::success(*hit);
  }

  std::string entry_key;
  try {
    entry_key = key(path, size);
  } catch (const CacheError& e) {
    return make_error(ErrorKind::IO_ERROR, ErrorReason::UNSPECIFIED, "Cannot compute cache key", e.what());
  }

  std::promise<Result<std::filesystem::path>> promise;
  std::shared_future<Result<std::filesystem::path>> pending;
  bool owner = false;
  {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    auto it = inflight_.find(entry_key);
    if (it != inflight_.end()) {
      pending = it->second;
    } else {
      pending = promise.get_future().share();
      inflight_.emplace(entry_key, pending);
      owner = true;
    }
  }

  if (!owner) {
    BOOST_LOG_TRIVIAL(debug) << "UnifiedFileCache: Waiting for in-flight download of " << path;
    return pending.get();
  }

  // Unregisters the download and wakes the waiters on every exit path
  struct InflightRelease {
    UnifiedFileCache& cache;
    const std::string& key;
    std::promise<Result<std::filesystem::path>>& promise;
    bool fulfilled{false};

    ~InflightRelease() {
      if (!fulfilled) {
        promise.set_value(make_error(ErrorKind::IO_ERROR, ErrorReason::INTERRUPTED,
          "Cache download was aborted"));
      }
      std::lock_guard<std::mutex> lock(cache.inflight_mutex_);
      cache.inflight_.erase(key);
    }
  } release{*this, entry_key, promise};

  // Another owner may have finished between the miss and the registration
  Result<std::filesystem::path> result = make_error(ErrorKind::IO_ERROR, ErrorReason::UNSPECIFIED, "not run");
  if (auto hit = get_cached_file(path, size)) {
    result = Result<std::filesystem::path>::success(*hit);
  } else {
    result = download_into_cache(path, size, downloader);
    if (result.ok()) {
      evict_over_limit(result.value());
    }
  }

  promise.set_value(result);
  release.fulfilled = true;
  return result;
}


//==============================================
// MAINTENANCE
//==============================================

std::size_t UnifiedFileCache::clear_all() {
  BOOST_LOG_TRIVIAL(info) << "UnifiedFileCache: Clearing cache at " << cache_dir_;
  std::size_t deleted = 0;
  std::error_code ec;

  std::filesystem::directory_iterator it(cache_dir_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "UnifiedFileCache: Nothing to clear: " << ec.message();
    return 0;
  }

  for (const auto end = std::filesystem::directory_iterator(); it != end; it.increment(ec)) {
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "UnifiedFileCache: Listing failed during clear: " << ec.message();
      break;
    }
    std::error_code remove_ec;
    if (std::filesystem::remove(it->path(), remove_ec)) {
      ++deleted;
    } else if (remove_ec) {
      BOOST_LOG_TRIVIAL(warning) << "UnifiedFileCache: Cannot delete " << it->path() << ": " << remove_ec.message();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "UnifiedFileCache: Deleted " << deleted << " files";
  return deleted;
}

std::size_t UnifiedFileCache::evict_expired() {
  std::size_t evicted = 0;
  std::error_code ec;

  std::filesystem::directory_iterator it(cache_dir_, ec);
  if (ec) {
    return 0;
  }
  for (const auto end = std::filesystem::directory_iterator(); it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    uint64_t size = 0;
    if (!parse_entry_name(it->path().filename().string(), size) || !is_expired(it->path())) {
      continue;
    }
    std::error_code remove_ec;
    if (std::filesystem::remove(it->path(), remove_ec)) {
      ++evicted;
    }
  }

  if (evicted > 0) {
    BOOST_LOG_TRIVIAL(info) << "UnifiedFileCache: Evicted " << evicted << " expired entries";
  }
  return evicted;
}

bool UnifiedFileCache::invalidate(const std::string& path, uint64_t size) {
  std::filesystem::path file;
  try {
    file = cache_dir_ / key(path, size);
  } catch (const CacheError& e) {
    BOOST_LOG_TRIVIAL(error) << "UnifiedFileCache: " << e.what();
    return false;
  }

  std::error_code ec;
  const bool removed = std::filesystem::remove(file, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "UnifiedFileCache: Cannot delete " << file << ": " << ec.message();
  } else if (removed) {
    BOOST_LOG_TRIVIAL(info) << "UnifiedFileCache: Invalidated " << path << " (" << size << " bytes)";
  }
  return removed;
}

std::size_t UnifiedFileCache::evict_if_needed() {
  return evict_over_limit({});
}

CacheStats UnifiedFileCache::stats() const {
  CacheStats stats;
  stats.max_bytes = max_bytes_;
  std::error_code ec;

  std::filesystem::directory_iterator it(cache_dir_, ec);
  if (ec) {
    return stats;
  }
  for (const auto end = std::filesystem::directory_iterator(); it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    uint64_t size = 0;
    if (!parse_entry_name(it->path().filename().string(), size)) {
      continue;
    }
    std::error_code size_ec;
    const auto actual = std::filesystem::file_size(it->path(), size_ec);
    ++stats.file_count;
    stats.total_bytes += size_ec ? 0 : actual;
  }
  return stats;
}


//==============================================
// INTERNAL HELPERS
//==============================================

std::string UnifiedFileCache::hash_path(const std::string& path) const {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw CacheError("UnifiedFileCache: Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) ||
      !EVP_DigestUpdate(ctx, path.data(), path.size()) ||
      !EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
    EVP_MD_CTX_free(ctx);
    throw CacheError("UnifiedFileCache: Failed to hash path");
  }
  EVP_MD_CTX_free(ctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

bool UnifiedFileCache::is_expired(const std::filesystem::path& file) const {
  std::error_code ec;
  const auto modified = std::filesystem::last_write_time(file, ec);
  if (ec) {
    return true;
  }
  const auto age = std::filesystem::file_time_type::clock::now() - modified;
  return age >= ttl_;
}

std::size_t UnifiedFileCache::evict_over_limit(const std::filesystem::path& keep) {
  if (max_bytes_ == 0) {
    return 0;
  }

  struct Candidate {
    std::filesystem::path file;
    uint64_t bytes;
    std::filesystem::file_time_type modified;
  };
  std::vector<Candidate> candidates;
  uint64_t total = 0;

  std::error_code ec;
  std::filesystem::directory_iterator it(cache_dir_, ec);
  if (ec) {
    return 0;
  }
  for (const auto end = std::filesystem::directory_iterator(); it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    uint64_t size = 0;
    if (!parse_entry_name(it->path().filename().string(), size)) {
      continue;
    }
    std::error_code stat_ec;
    const auto bytes = std::filesystem::file_size(it->path(), stat_ec);
    const auto modified = std::filesystem::last_write_time(it->path(), stat_ec);
    if (stat_ec) {
      continue;
    }
    total += bytes;
    if (it->path() != keep) {
      candidates.push_back({it->path(), bytes, modified});
    }
  }

  if (total <= max_bytes_) {
    return 0;
  }

  const auto target = static_cast<uint64_t>(static_cast<double>(max_bytes_) * EVICTION_TARGET);
  BOOST_LOG_TRIVIAL(info) << "UnifiedFileCache: " << total << " bytes exceed the limit of " << max_bytes_
                          << ", evicting down to " << target;

  std::sort(candidates.begin(), candidates.end(),
    [](const Candidate& a, const Candidate& b) { return a.modified < b.modified; });

  std::size_t evicted = 0;
  for (const auto& candidate : candidates) {
    if (total <= target) {
      break;
    }
    std::error_code remove_ec;
    if (std::filesystem::remove(candidate.file, remove_ec)) {
      total -= candidate.bytes;
      ++evicted;
    } else if (remove_ec) {
      BOOST_LOG_TRIVIAL(warning) << "UnifiedFileCache: Cannot evict " << candidate.file << ": "
                                 << remove_ec.message();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "UnifiedFileCache: Evicted " << evicted << " entries, " << total << " bytes remain";
  return evicted;
}

void UnifiedFileCache::check_directory_exists() const {
  std::error_code ec;
  if (!std::filesystem::exists(cache_dir_, ec)) {
    std::filesystem::create_directories(cache_dir_, ec);
    if (ec) {
      throw CacheError("UnifiedFileCache: Cannot create " + cache_dir_.string() + ": " + ec.message());
    }
    BOOST_LOG_TRIVIAL(debug) << "UnifiedFileCache: Created cache directory " << cache_dir_;
  }
}

Result<std::filesystem::path> UnifiedFileCache::download_into_cache(const std::string& path, uint64_t size,
                                                                    const Downloader& downloader) {
  std::filesystem::path target;
  try {
    target = get_cache_file(path, size);
  } catch (const std::exception& e) {
    return make_error(ErrorKind::IO_ERROR, ErrorReason::UNSPECIFIED, "Cannot prepare cache entry", e.what());
  }

  std::filesystem::path part = target;
  part += PART_SUFFIX;
  BOOST_LOG_TRIVIAL(info) << "UnifiedFileCache: Downloading " << path << " into cache";

  Result<void> downloaded;
  try {
    downloaded = downloader(part);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "UnifiedFileCache: Download of " << path << " failed: " << e.what();
    downloaded = make_error(ErrorKind::IO_ERROR, ErrorReason::UNSPECIFIED, "Cannot download " + path, e.what());
  }
  std::error_code ec;
  if (!downloaded.ok()) {
    std::filesystem::remove(part, ec);
    return downloaded.error();
  }

  const auto actual = std::filesystem::file_size(part, ec);
  if (ec || actual != size) {
    std::filesystem::remove(part, ec);
    return make_error(ErrorKind::IO_ERROR, ErrorReason::SIZE_MISMATCH,
      "Downloaded " + std::to_string(actual) + " bytes of " + path + ", expected " + std::to_string(size));
  }

  std::filesystem::rename(part, target, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(part, ignored);
    return error_from_errno(ec.value(), "Cannot move cache entry into place");
  }
  return Result<std::filesystem::path>::success(target);
}

bool UnifiedFileCache::parse_entry_name(const std::string& name, uint64_t& size) {
  const auto underscore = name.find('_');
  if (underscore != 64 || underscore + 1 >= name.size()) {
    return false;
  }
  for (std::size_t i = 0; i < underscore; ++i) {
    if (!std::isxdigit(static_cast<unsigned char>(name[i]))) {
      return false;
    }
  }
  uint64_t value = 0;
  for (std::size_t i = underscore + 1; i < name.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(name[i]))) {
      return false;
    }
    value = value * 10 + static_cast<uint64_t>(name[i] - '0');
  }
  size = value;
  return true;
}

} // namespace cache
} // namespace netfs
