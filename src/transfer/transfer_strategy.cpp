#include "transfer/transfer_strategy.hpp"
#include <atomic>
#include <chrono>
#include <boost/log/trivial.hpp>

namespace netfs {
namespace transfer {

namespace {

// Relay file on local disk, removed when the transfer ends either way
class ScopedTempFile {
public:
  explicit ScopedTempFile(std::filesystem::path path) : path_(std::move(path)) {}
  ~ScopedTempFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Transfer: Cannot delete temp file " << path_ << ": " << ec.message();
    }
  }

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

std::filesystem::path make_temp_path(const std::filesystem::path& dir, const std::string& name) {
  static std::atomic<uint64_t> counter{0};
  const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
  return dir / ("netfs-relay-" + std::to_string(ticks) + "-" + std::to_string(counter++) + "-" + name);
}

} // namespace

const char* transfer_status_to_string(TransferStatus status) {
  switch (status) {
    case TransferStatus::SUCCESS: return "SUCCESS";
    case TransferStatus::PARTIAL_SUCCESS: return "PARTIAL_SUCCESS";
    default: return "UNKNOWN";
  }
}


//==============================================
// STRATEGY BASE
//==============================================

StrategyBase::StrategyBase(network::RemoteFileSystem& fs, TransferOptions options)
  : fs_(fs)
  , options_(std::move(options)) {
}

Result<TransferOutcome> StrategyBase::move(const TransferRequest& request) {
  auto copied = copy(request);
  if (!copied.ok()) {
    return copied;
  }
  TransferOutcome outcome = copied.value();
  finish_move(request, outcome);
  return Result<TransferOutcome>::success(outcome);
}

Result<FileEntry> StrategyBase::prepare(const TransferRequest& request) {
  if (request.source.location() == request.destination.location()) {
    return make_error(ErrorKind::VALIDATION_ERROR, ErrorReason::UNSPECIFIED,
      "Source and destination are the same file: " + request.source.location());
  }

  auto source = fs_.stat(request.source);
  if (!source.ok()) {
    return source.error();
  }
  if (source.value().is_directory) {
    return make_error(ErrorKind::VALIDATION_ERROR, ErrorReason::UNSUPPORTED,
      request.source.location() + " is a directory");
  }

  auto destination = fs_.stat(request.destination);
  if (destination.ok()) {
    if (destination.value().is_directory) {
      return make_error(ErrorKind::VALIDATION_ERROR, ErrorReason::DESTINATION_EXISTS,
        request.destination.location() + " is an existing directory");
    }
    if (!request.overwrite) {
      return make_error(ErrorKind::VALIDATION_ERROR, ErrorReason::DESTINATION_EXISTS,
        request.destination.location() + " already exists");
    }
  } else if (destination.error().reason != ErrorReason::NOT_FOUND) {
    return destination.error();
  }

  return source;
}

RemoteUri StrategyBase::staging_uri(const RemoteUri& destination) {
  RemoteUri staged(destination);
  staged.path += PART_SUFFIX;
  return staged;
}

Result<void> StrategyBase::commit(const RemoteUri& staged, const TransferRequest& request, uint64_t expected_size) {
  auto entry = fs_.stat(staged);
  if (!entry.ok()) {
    discard(staged);
    return entry.error();
  }
  if (entry.value().size != expected_size) {
    discard(staged);
    return make_error(ErrorKind::IO_ERROR, ErrorReason::SIZE_MISMATCH,
      "Wrote " + std::to_string(entry.value().size) + " of " + std::to_string(expected_size) +
      " bytes to " + request.destination.location());
  }

  // A local rename replaces the target atomically; remote servers may
  // refuse to rename over an existing file
  if (request.overwrite && request.destination.protocol != Protocol::LOCAL) {
    auto exists = fs_.exists(request.destination);
    if (!exists.ok()) {
      discard(staged);
      return exists.error();
    }
    if (exists.value()) {
      auto removed = fs_.remove(request.destination);
      if (!removed.ok()) {
        discard(staged);
        return removed;
      }
    }
  }

  auto renamed = fs_.rename(staged, request.destination);
  if (!renamed.ok()) {
    discard(staged);
    return renamed;
  }
  return Result<void>::success();
}

void StrategyBase::discard(const RemoteUri& staged) {
  auto exists = fs_.exists(staged);
  if (exists.ok() && !exists.value()) {
    return;
  }
  auto removed = fs_.remove(staged);
  if (!removed.ok()) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer: Cannot delete staging file " << staged.location() << ": "
                               << removed.error().to_string();
  }
}

void StrategyBase::finish_move(const TransferRequest& request, TransferOutcome& outcome) {
  auto removed = fs_.remove(request.source);
  if (removed.ok()) {
    BOOST_LOG_TRIVIAL(debug) << "Transfer: Deleted move source " << request.source.location();
    return;
  }

  BOOST_LOG_TRIVIAL(warning) << "Transfer: Copied " << request.source.location() << " to "
                             << request.destination.location() << " but the source could not be deleted: "
                             << removed.error().to_string();
  outcome.status = TransferStatus::PARTIAL_SUCCESS;
  outcome.source_cleanup_pending = true;
  outcome.cleanup_error = removed.error();
}

Result<TransferOutcome> StrategyBase::relay_copy(const TransferRequest& request) {
  auto source = prepare(request);
  if (!source.ok()) {
    return source.error();
  }
  const uint64_t size = source.value().size;

  // Both legs feed one tracker, every byte crosses the network twice
  ProgressTracker tracker(request.progress, size * 2, options_.progress_step_bytes);
  ScopedTempFile temp(make_temp_path(options_.temp_dir, request.source.file_name()));

  BOOST_LOG_TRIVIAL(debug) << "Transfer: Relaying " << request.source.location() << " through " << temp.path();
  auto downloaded = fs_.download(request.source, temp.path(), tracker.chunk_callback(0));
  if (!downloaded.ok()) {
    return downloaded.error();
  }
  if (downloaded.value() != size) {
    return make_error(ErrorKind::IO_ERROR, ErrorReason::SIZE_MISMATCH,
      "Read " + std::to_string(downloaded.value()) + " of " + std::to_string(size) +
      " bytes from " + request.source.location());
  }

  const RemoteUri staged = staging_uri(request.destination);
  auto uploaded = fs_.upload(temp.path(), staged, tracker.chunk_callback(size));
  if (!uploaded.ok()) {
    discard(staged);
    return uploaded.error();
  }

  auto committed = commit(staged, request, size);
  if (!committed.ok()) {
    return committed.error();
  }
  tracker.finish();
  return Result<TransferOutcome>::success(completed(request, size));
}

TransferOutcome StrategyBase::completed(const TransferRequest& request, uint64_t bytes) const {
  TransferOutcome outcome;
  outcome.bytes_transferred = bytes;
  outcome.destination = request.destination;
  return outcome;
}

} // namespace transfer
} // namespace netfs
