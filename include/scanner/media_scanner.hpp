#ifndef NETFS_MEDIA_SCANNER_HPP
#define NETFS_MEDIA_SCANNER_HPP

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "network/remote_file_system.hpp"
#include "scanner/media_type.hpp"

namespace netfs {
namespace scanner {

struct MediaFile {
  RemoteUri uri;
  FileEntry entry;
  MediaType type{MediaType::IMAGE};
};

struct ScanOptions {
  // Empty means every known type
  std::set<MediaType> types;
  std::optional<SizeFilter> size_filter;
  bool recursive{true};
};

struct ScanPage {
  std::vector<MediaFile> files;
  bool has_more{false};
};

// Progress sink and stop flag for one scan
class ScanProgressListener {
public:
  virtual ~ScanProgressListener() = default;

  // Called every progress_interval files
  virtual void on_progress(std::size_t scanned, const std::string& current_file) = 0;
  // Polled before each directory is expanded
  virtual bool should_stop() const { return false; }
};

// Breadth-first enumeration over any root the RemoteFileSystem can list.
// Folders named ".trash" are never entered.
class MediaScanner {
public:
  static constexpr std::size_t DEFAULT_PROGRESS_INTERVAL = 10;

  explicit MediaScanner(network::RemoteFileSystem& fs,
                        std::size_t progress_interval = DEFAULT_PROGRESS_INTERVAL);

  // Matching files in no particular order. A stop request returns what was
  // collected so far. An unreadable root is an error; unreadable
  // subdirectories are skipped.
  Result<std::vector<MediaFile>> scan(const RemoteUri& root, const ScanOptions& options,
                                      ScanProgressListener* listener = nullptr);

  // Slice of the full scan sorted by path. Every page repeats the whole
  // enumeration, there is no server side paging.
  Result<ScanPage> scan_page(const RemoteUri& root, const ScanOptions& options,
                             std::size_t offset, std::size_t limit,
                             ScanProgressListener* listener = nullptr);

  Result<std::size_t> count(const RemoteUri& root, const ScanOptions& options);

  // Single file with its media type; VALIDATION_ERROR for directories and
  // unknown extensions
  Result<MediaFile> find_file(const RemoteUri& uri);

  // Creates and deletes a marker file under root
  Result<bool> is_writable(const RemoteUri& root);

private:
  network::RemoteFileSystem& fs_;
  std::size_t progress_interval_;
};

} // namespace scanner
} // namespace netfs

#endif // NETFS_MEDIA_SCANNER_HPP
