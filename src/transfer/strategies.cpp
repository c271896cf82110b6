#include "transfer/transfer_strategy.hpp"
#include <boost/log/trivial.hpp>

namespace netfs {
namespace transfer {

//==============================================
// LOCAL
//==============================================

bool LocalTransferStrategy::supports(Protocol source, Protocol destination) const {
  return source == Protocol::LOCAL && destination == Protocol::LOCAL;
}

Result<TransferOutcome> LocalTransferStrategy::copy(const TransferRequest& request) {
  auto source = prepare(request);
  if (!source.ok()) {
    return source.error();
  }
  const uint64_t size = source.value().size;

  ProgressTracker tracker(request.progress, size, options_.progress_step_bytes);
  const RemoteUri staged = staging_uri(request.destination);
  auto written = fs_.upload(request.source.path, staged, tracker.chunk_callback());
  if (!written.ok()) {
    discard(staged);
    return written.error();
  }

  auto committed = commit(staged, request, size);
  if (!committed.ok()) {
    return committed.error();
  }
  tracker.finish();
  return Result<TransferOutcome>::success(completed(request, size));
}

Result<TransferOutcome> LocalTransferStrategy::move(const TransferRequest& request) {
  auto source = prepare(request);
  if (!source.ok()) {
    return source.error();
  }

  auto renamed = fs_.rename(request.source, request.destination);
  if (!renamed.ok()) {
    if (renamed.error().reason != ErrorReason::CROSS_DEVICE) {
      return renamed.error();
    }
    BOOST_LOG_TRIVIAL(info) << "LocalStrategy: " << request.source.location()
                            << " is on another file system, moving by copy";
    return StrategyBase::move(request);
  }

  TransferOutcome outcome = completed(request, source.value().size);
  outcome.server_side = true;
  return Result<TransferOutcome>::success(outcome);
}


//==============================================
// UPLOAD
//==============================================

bool UploadTransferStrategy::supports(Protocol source, Protocol destination) const {
  return source == Protocol::LOCAL && destination != Protocol::LOCAL;
}

Result<TransferOutcome> UploadTransferStrategy::copy(const TransferRequest& request) {
  auto source = prepare(request);
  if (!source.ok()) {
    return source.error();
  }
  const uint64_t size = source.value().size;

  ProgressTracker tracker(request.progress, size, options_.progress_step_bytes);
  const RemoteUri staged = staging_uri(request.destination);
  auto uploaded = fs_.upload(request.source.path, staged, tracker.chunk_callback());
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


//==============================================
// DOWNLOAD
//==============================================

DownloadTransferStrategy::DownloadTransferStrategy(network::RemoteFileSystem& fs, TransferOptions options,
                                                   cache::UnifiedFileCache* cache)
  : StrategyBase(fs, std::move(options))
  , cache_(cache) {
}

bool DownloadTransferStrategy::supports(Protocol source, Protocol destination) const {
  return source != Protocol::LOCAL && destination == Protocol::LOCAL;
}

Result<TransferOutcome> DownloadTransferStrategy::copy(const TransferRequest& request) {
  auto source = prepare(request);
  if (!source.ok()) {
    return source.error();
  }
  const uint64_t size = source.value().size;

  ProgressTracker tracker(request.progress, size, options_.progress_step_bytes);
  const RemoteUri staged = staging_uri(request.destination);

  std::optional<std::filesystem::path> cached;
  if (cache_) {
    cached = cache_->get_cached_file(request.source.location(), size);
  }

  Result<uint64_t> written = cached
    ? fs_.upload(*cached, staged, tracker.chunk_callback())
    : fs_.download(request.source, staged.path, tracker.chunk_callback());
  if (cached) {
    BOOST_LOG_TRIVIAL(debug) << "DownloadStrategy: Served " << request.source.location() << " from cache";
  }
  if (!written.ok()) {
    discard(staged);
    return written.error();
  }

  auto committed = commit(staged, request, size);
  if (!committed.ok()) {
    return committed.error();
  }
  tracker.finish();
  return Result<TransferOutcome>::success(completed(request, size));
}


//==============================================
// SAME PROTOCOL
//==============================================

bool SameProtocolTransferStrategy::supports(Protocol source, Protocol destination) const {
  return source == destination && source != Protocol::LOCAL;
}

Result<TransferOutcome> SameProtocolTransferStrategy::copy(const TransferRequest& request) {
  return relay_copy(request);
}

Result<TransferOutcome> SameProtocolTransferStrategy::move(const TransferRequest& request) {
  if (!request.source.same_connection(request.destination)) {
    return StrategyBase::move(request);
  }

  auto source = prepare(request);
  if (!source.ok()) {
    return source.error();
  }

  if (request.overwrite) {
    auto exists = fs_.exists(request.destination);
    if (!exists.ok()) {
      return exists.error();
    }
    if (exists.value()) {
      auto removed = fs_.remove(request.destination);
      if (!removed.ok()) {
        return removed.error();
      }
    }
  }

  auto renamed = fs_.rename(request.source, request.destination);
  if (!renamed.ok()) {
    if (renamed.error().is_connection_error()) {
      return renamed.error();
    }
    BOOST_LOG_TRIVIAL(info) << "SameProtocolStrategy: Server rename refused (" << renamed.error().to_string()
                            << "), falling back to copy and delete";
    return StrategyBase::move(request);
  }

  TransferOutcome outcome = completed(request, source.value().size);
  outcome.server_side = true;
  return Result<TransferOutcome>::success(outcome);
}


//==============================================
// CROSS PROTOCOL
//==============================================

bool CrossProtocolTransferStrategy::supports(Protocol source, Protocol destination) const {
  return source != destination && source != Protocol::LOCAL && destination != Protocol::LOCAL;
}

Result<TransferOutcome> CrossProtocolTransferStrategy::copy(const TransferRequest& request) {
  return relay_copy(request);
}

} // namespace transfer
} // namespace netfs
