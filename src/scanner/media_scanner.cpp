#include "scanner/media_scanner.hpp"
#include <algorithm>
#include <chrono>
#include <deque>
#include <iterator>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace netfs {
namespace scanner {

namespace {
constexpr const char* TRASH_FOLDER = ".trash";
}

MediaScanner::MediaScanner(network::RemoteFileSystem& fs, std::size_t progress_interval)
  : fs_(fs)
  , progress_interval_(progress_interval == 0 ? DEFAULT_PROGRESS_INTERVAL : progress_interval) {
}


//==============================================
// SCANNING
//==============================================

Result<std::vector<MediaFile>> MediaScanner::scan(const RemoteUri& root, const ScanOptions& options,
                                                  ScanProgressListener* listener) {
  const std::set<MediaType>& types = options.types.empty() ? all_media_types() : options.types;
  BOOST_LOG_TRIVIAL(info) << "MediaScanner: Scanning " << root.location()
                          << (options.recursive ? " recursively" : "");

  std::vector<MediaFile> found;
  std::deque<RemoteUri> pending{root};
  std::size_t scanned = 0;
  std::size_t directories = 0;

  while (!pending.empty()) {
    if (listener && listener->should_stop()) {
      BOOST_LOG_TRIVIAL(info) << "MediaScanner: Stop requested after " << scanned << " files, "
                              << pending.size() << " directories left";
      break;
    }

    const RemoteUri dir = std::move(pending.front());
    pending.pop_front();

    auto entries = fs_.list(dir);
    if (!entries.ok()) {
      if (directories == 0) {
        BOOST_LOG_TRIVIAL(error) << "MediaScanner: Cannot list root " << dir.location() << ": "
                                 << entries.error().to_string();
        return entries.error();
      }
      BOOST_LOG_TRIVIAL(warning) << "MediaScanner: Skipping " << dir.location() << ": "
                                 << entries.error().to_string();
      continue;
    }
    ++directories;

    for (const auto& entry : entries.value()) {
      if (entry.is_directory) {
        if (options.recursive && entry.name != TRASH_FOLDER) {
          pending.push_back(dir.child(entry.name));
        }
        continue;
      }

      ++scanned;
      if (listener && scanned % progress_interval_ == 0) {
        listener->on_progress(scanned, entry.name);
      }

      auto type = media_type_from_name(entry.name);
      if (!type || types.count(*type) == 0) {
        continue;
      }
      if (options.size_filter && !is_size_in_range(entry.size, *type, *options.size_filter)) {
        continue;
      }
      found.push_back(MediaFile{dir.child(entry.name), entry, *type});
    }
  }

  BOOST_LOG_TRIVIAL(info) << "MediaScanner: " << found.size() << " of " << scanned << " files matched in "
                          << directories << " directories under " << root.location();
  return Result<std::vector<MediaFile>>::success(std::move(found));
}

Result<ScanPage> MediaScanner::scan_page(const RemoteUri& root, const ScanOptions& options,
                                         std::size_t offset, std::size_t limit,
                                         ScanProgressListener* listener) {
  auto all = scan(root, options, listener);
  if (!all.ok()) {
    return all.error();
  }

  std::vector<MediaFile>& files = all.value();
  std::sort(files.begin(), files.end(),
    [](const MediaFile& a, const MediaFile& b) { return a.uri.path < b.uri.path; });

  ScanPage page;
  if (offset < files.size()) {
    const std::size_t end = offset + std::min(limit, files.size() - offset);
    page.files.assign(std::make_move_iterator(files.begin() + static_cast<std::ptrdiff_t>(offset)),
                      std::make_move_iterator(files.begin() + static_cast<std::ptrdiff_t>(end)));
    page.has_more = end < files.size();
  }
  return Result<ScanPage>::success(std::move(page));
}

Result<std::size_t> MediaScanner::count(const RemoteUri& root, const ScanOptions& options) {
  auto all = scan(root, options);
  if (!all.ok()) {
    return all.error();
  }
  return Result<std::size_t>::success(all.value().size());
}


//==============================================
// SINGLE ENTRIES
//==============================================

Result<MediaFile> MediaScanner::find_file(const RemoteUri& uri) {
  auto entry = fs_.stat(uri);
  if (!entry.ok()) {
    return entry.error();
  }
  if (entry.value().is_directory) {
    return make_error(ErrorKind::VALIDATION_ERROR, ErrorReason::UNSUPPORTED, uri.location() + " is a directory");
  }
  auto type = media_type_from_name(entry.value().name);
  if (!type) {
    return make_error(ErrorKind::VALIDATION_ERROR, ErrorReason::UNSUPPORTED,
      uri.location() + " is not a supported media file");
  }
  return Result<MediaFile>::success(MediaFile{uri, entry.value(), *type});
}

Result<bool> MediaScanner::is_writable(const RemoteUri& root) {
  const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
  const RemoteUri marker = root.child(".netfs-write-test-" + std::to_string(ticks));

  auto written = fs_.run(marker, [&marker](client::RemoteFileClient& client) -> Result<uint64_t> {
    std::istringstream empty;
    return client.write(marker.path, empty, 0, ChunkCallback());
  });
  if (!written.ok()) {
    if (written.error().reason == ErrorReason::PERMISSION_DENIED ||
        written.error().reason == ErrorReason::QUOTA_EXCEEDED ||
        written.error().reason == ErrorReason::DISK_FULL) {
      BOOST_LOG_TRIVIAL(info) << "MediaScanner: " << root.location() << " is not writable: "
                              << written.error().to_string();
      return Result<bool>::success(false);
    }
    return written.error();
  }

  auto removed = fs_.remove(marker);
  if (!removed.ok()) {
    BOOST_LOG_TRIVIAL(warning) << "MediaScanner: Cannot delete write probe " << marker.location() << ": "
                               << removed.error().to_string();
  }
  return Result<bool>::success(true);
}

} // namespace scanner
} // namespace netfs
