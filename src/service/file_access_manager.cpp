#include "service/file_access_manager.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace netfs {
namespace service {

namespace {

client::ClientOptions client_options(const Config& config) {
  client::ClientOptions options;
  options.connect_timeout = config.connect_timeout;
  options.io_timeout = config.io_timeout;
  options.known_hosts_file = config.known_hosts_file;
  return options;
}

transfer::TransferOptions transfer_options(const Config& config) {
  transfer::TransferOptions options;
  options.temp_dir = config.temp_dir;
  options.progress_step_bytes = config.progress_step_bytes;
  return options;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileAccessManager::FileAccessManager(const Config& config, const credentials::CredentialStore& credentials)
  : config_(config)
  , credentials_(credentials)
  , executor_(config.io_threads)
  , factory_(client_options(config))
  , hints_(config.default_buffer_size)
  , pool_(factory_, config.idle_timeout)
  , fs_(pool_, credentials)
  , cache_(config.cache_dir, config.cache_ttl, config.cache_max_bytes)
  , dispatcher_(fs_, &cache_, transfer_options(config))
  , scanner_(fs_, config.scan_progress_interval) {
  pool_.start_idle_sweep(executor_.executor(), config.sweep_interval);
  BOOST_LOG_TRIVIAL(info) << "FileAccessManager: Ready with cache at " << config_.cache_dir;
}

FileAccessManager::~FileAccessManager() {
  shutdown();
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::future<Result<std::vector<FileEntry>>> FileAccessManager::list(const std::string& uri) {
  return post([this, uri]() -> Result<std::vector<FileEntry>> {
    auto parsed = RemoteUri::parse(uri);
    if (!parsed.ok()) {
      return parsed.error();
    }
    return fs_.list(parsed.value());
  });
}

std::future<Result<FileEntry>> FileAccessManager::stat(const std::string& uri) {
  return post([this, uri]() -> Result<FileEntry> {
    auto parsed = RemoteUri::parse(uri);
    if (!parsed.ok()) {
      return parsed.error();
    }
    return fs_.stat(parsed.value());
  });
}

std::future<Result<bool>> FileAccessManager::exists(const std::string& uri) {
  return post([this, uri]() -> Result<bool> {
    auto parsed = RemoteUri::parse(uri);
    if (!parsed.ok()) {
      return parsed.error();
    }
    return dispatcher_.exists(parsed.value());
  });
}

std::future<Result<void>> FileAccessManager::test_connection(const std::string& uri) {
  return post([this, uri]() -> Result<void> {
    auto parsed = RemoteUri::parse(uri);
    if (!parsed.ok()) {
      return parsed.error();
    }
    return fs_.test_connection(parsed.value());
  });
}

std::future<Result<std::vector<char>>> FileAccessManager::read_range(const std::string& uri, uint64_t offset,
                                                                     std::size_t length) {
  return post([this, uri, offset, length]() -> Result<std::vector<char>> {
    auto parsed = RemoteUri::parse(uri);
    if (!parsed.ok()) {
      return parsed.error();
    }
    // Longer requests return a short read, like any partial read
    std::vector<char> buffer(std::min(length, config_.max_read_bytes));
    auto n = fs_.read_range(parsed.value(), offset, buffer.data(), buffer.size());
    if (!n.ok()) {
      return n.error();
    }
    buffer.resize(n.value());
    return Result<std::vector<char>>::success(std::move(buffer));
  });
}


//==============================================
// TRANSFERS
//==============================================

std::future<Result<transfer::TransferOutcome>> FileAccessManager::copy(const std::string& source,
                                                                       const std::string& destination,
                                                                       bool overwrite, ProgressCallback progress) {
  return post([this, source, destination, overwrite, progress]() -> Result<transfer::TransferOutcome> {
    auto request = make_request(source, destination, overwrite, progress);
    if (!request.ok()) {
      return request.error();
    }
    return dispatcher_.copy(request.value());
  });
}

std::future<Result<transfer::TransferOutcome>> FileAccessManager::move(const std::string& source,
                                                                       const std::string& destination,
                                                                       bool overwrite, ProgressCallback progress) {
  return post([this, source, destination, overwrite, progress]() -> Result<transfer::TransferOutcome> {
    auto request = make_request(source, destination, overwrite, progress);
    if (!request.ok()) {
      return request.error();
    }
    return dispatcher_.move(request.value());
  });
}

std::future<Result<void>> FileAccessManager::remove(const std::string& uri) {
  return post([this, uri]() -> Result<void> {
    auto parsed = RemoteUri::parse(uri);
    if (!parsed.ok()) {
      return parsed.error();
    }
    return dispatcher_.remove(parsed.value());
  });
}

std::future<Result<void>> FileAccessManager::mkdir(const std::string& uri) {
  return post([this, uri]() -> Result<void> {
    auto parsed = RemoteUri::parse(uri);
    if (!parsed.ok()) {
      return parsed.error();
    }
    return fs_.mkdir(parsed.value());
  });
}

std::future<Result<RemoteUri>> FileAccessManager::rename(const std::string& uri, const std::string& new_name) {
  return post([this, uri, new_name]() -> Result<RemoteUri> {
    auto parsed = RemoteUri::parse(uri);
    if (!parsed.ok()) {
      return parsed.error();
    }
    return dispatcher_.rename(parsed.value(), new_name);
  });
}

std::future<Result<RemoteUri>> FileAccessManager::move_to_trash(const std::string& uri, const std::string& root) {
  return post([this, uri, root]() -> Result<RemoteUri> {
    auto parsed = RemoteUri::parse(uri);
    if (!parsed.ok()) {
      return parsed.error();
    }
    auto parsed_root = RemoteUri::parse(root);
    if (!parsed_root.ok()) {
      return parsed_root.error();
    }
    return dispatcher_.move_to_trash(parsed.value(), parsed_root.value());
  });
}


//==============================================
// SCANNING
//==============================================

std::future<Result<std::vector<scanner::MediaFile>>> FileAccessManager::scan(
    const std::string& root, scanner::ScanOptions options, scanner::ScanProgressListener* listener) {
  return post([this, root, options, listener]() -> Result<std::vector<scanner::MediaFile>> {
    auto parsed = RemoteUri::parse(root);
    if (!parsed.ok()) {
      return parsed.error();
    }
    return scanner_.scan(parsed.value(), options, listener);
  });
}

std::future<Result<scanner::ScanPage>> FileAccessManager::scan_page(const std::string& root,
                                                                    scanner::ScanOptions options,
                                                                    std::size_t offset, std::size_t limit) {
  return post([this, root, options, offset, limit]() -> Result<scanner::ScanPage> {
    auto parsed = RemoteUri::parse(root);
    if (!parsed.ok()) {
      return parsed.error();
    }
    return scanner_.scan_page(parsed.value(), options, offset, limit);
  });
}

std::future<Result<std::size_t>> FileAccessManager::count(const std::string& root, scanner::ScanOptions options) {
  return post([this, root, options]() -> Result<std::size_t> {
    auto parsed = RemoteUri::parse(root);
    if (!parsed.ok()) {
      return parsed.error();
    }
    return scanner_.count(parsed.value(), options);
  });
}


//==============================================
// CACHE AND STREAMING
//==============================================

std::future<Result<std::filesystem::path>> FileAccessManager::fetch_to_cache(const std::string& uri) {
  return post([this, uri]() -> Result<std::filesystem::path> {
    auto parsed = RemoteUri::parse(uri);
    if (!parsed.ok()) {
      return parsed.error();
    }
    const RemoteUri source = parsed.value();

    auto entry = fs_.stat(source);
    if (!entry.ok()) {
      return entry.error();
    }
    if (entry.value().is_directory) {
      return make_error(ErrorKind::VALIDATION_ERROR, ErrorReason::UNSUPPORTED, source.location() + " is a directory");
    }

    return cache_.fetch(source.location(), entry.value().size,
      [this, &source](const std::filesystem::path& target) -> Result<void> {
        auto downloaded = fs_.download(source, target, ChunkCallback());
        if (!downloaded.ok()) {
          return downloaded.error();
        }
        return Result<void>::success();
      });
  });
}

std::unique_ptr<reader::NetworkReader> FileAccessManager::create_reader() const {
  return std::make_unique<reader::NetworkReader>(factory_, credentials_, hints_);
}


//==============================================
// SHUTDOWN
//==============================================

void FileAccessManager::shutdown() {
  if (shut_down_.exchange(true)) {
    return;
  }
  BOOST_LOG_TRIVIAL(info) << "FileAccessManager: Shutting down";

  // A pending sweep timer would keep the I/O threads from draining
  pool_.stop_idle_sweep();
  executor_.shutdown();
  pool_.shutdown();
  BOOST_LOG_TRIVIAL(info) << "FileAccessManager: Stopped";
}


//==============================================
// INTERNAL HELPERS
//==============================================

Result<transfer::TransferRequest> FileAccessManager::make_request(const std::string& source,
                                                                  const std::string& destination,
                                                                  bool overwrite, ProgressCallback progress) const {
  auto parsed_source = RemoteUri::parse(source);
  if (!parsed_source.ok()) {
    return parsed_source.error();
  }
  auto parsed_destination = RemoteUri::parse(destination);
  if (!parsed_destination.ok()) {
    return parsed_destination.error();
  }

  transfer::TransferRequest request;
  request.source = parsed_source.value();
  request.destination = parsed_destination.value();
  request.overwrite = overwrite;
  request.progress = std::move(progress);
  return Result<transfer::TransferRequest>::success(std::move(request));
}

} // namespace service
} // namespace netfs
