#include "transfer/transfer_dispatcher.hpp"
#include <chrono>
#include <boost/log/trivial.hpp>

namespace netfs {
namespace transfer {

TransferDispatcher::TransferDispatcher(network::RemoteFileSystem& fs, cache::UnifiedFileCache* cache,
                                       TransferOptions options)
  : fs_(fs) {
  strategies_.push_back(std::make_unique<LocalTransferStrategy>(fs, options));
  strategies_.push_back(std::make_unique<UploadTransferStrategy>(fs, options));
  strategies_.push_back(std::make_unique<DownloadTransferStrategy>(fs, options, cache));
  strategies_.push_back(std::make_unique<SameProtocolTransferStrategy>(fs, options));
  strategies_.push_back(std::make_unique<CrossProtocolTransferStrategy>(fs, options));
}


//==============================================
// STRATEGY SELECTION
//==============================================

void TransferDispatcher::register_strategy(std::unique_ptr<TransferStrategy> strategy) {
  BOOST_LOG_TRIVIAL(debug) << "TransferDispatcher: Registered strategy " << strategy->name();
  strategies_.insert(strategies_.begin(), std::move(strategy));
}

bool TransferDispatcher::supports(Protocol source, Protocol destination) const {
  return select(source, destination).ok();
}

Result<TransferStrategy*> TransferDispatcher::select(Protocol source, Protocol destination) const {
  for (const auto& strategy : strategies_) {
    if (strategy->supports(source, destination)) {
      return Result<TransferStrategy*>::success(strategy.get());
    }
  }
  return make_error(ErrorKind::VALIDATION_ERROR, ErrorReason::NO_STRATEGY,
    std::string("No transfer strategy for ") + protocol_to_scheme(source) + " -> " + protocol_to_scheme(destination));
}


//==============================================
// TRANSFERS
//==============================================

Result<TransferOutcome> TransferDispatcher::copy(const TransferRequest& request) {
  auto strategy = select(request.source.protocol, request.destination.protocol);
  if (!strategy.ok()) {
    BOOST_LOG_TRIVIAL(error) << "TransferDispatcher: " << strategy.error().message;
    return strategy.error();
  }

  BOOST_LOG_TRIVIAL(info) << "TransferDispatcher: Copy " << request.source.location() << " -> "
                          << request.destination.location() << " via " << strategy.value()->name();
  auto outcome = strategy.value()->copy(request);
  if (!outcome.ok()) {
    BOOST_LOG_TRIVIAL(error) << "TransferDispatcher: Copy failed: " << outcome.error().to_string();
  }
  return outcome;
}

Result<TransferOutcome> TransferDispatcher::move(const TransferRequest& request) {
  auto strategy = select(request.source.protocol, request.destination.protocol);
  if (!strategy.ok()) {
    BOOST_LOG_TRIVIAL(error) << "TransferDispatcher: " << strategy.error().message;
    return strategy.error();
  }

  BOOST_LOG_TRIVIAL(info) << "TransferDispatcher: Move " << request.source.location() << " -> "
                          << request.destination.location() << " via " << strategy.value()->name();
  auto outcome = strategy.value()->move(request);
  if (!outcome.ok()) {
    BOOST_LOG_TRIVIAL(error) << "TransferDispatcher: Move failed: " << outcome.error().to_string();
  } else if (outcome.value().source_cleanup_pending) {
    BOOST_LOG_TRIVIAL(warning) << "TransferDispatcher: Move finished, source cleanup pending for "
                               << request.source.location();
  }
  return outcome;
}


//==============================================
// SINGLE FILE OPERATIONS
//==============================================

Result<void> TransferDispatcher::remove(const RemoteUri& uri) {
  return fs_.remove(uri);
}

Result<bool> TransferDispatcher::exists(const RemoteUri& uri) {
  return fs_.exists(uri);
}

Result<RemoteUri> TransferDispatcher::rename(const RemoteUri& uri, const std::string& new_name) {
  if (new_name.empty() || new_name == "." || new_name == ".." || new_name.find('/') != std::string::npos) {
    return make_error(ErrorKind::VALIDATION_ERROR, ErrorReason::UNSPECIFIED, "Invalid file name: '" + new_name + "'");
  }
  if (uri.is_root()) {
    return make_error(ErrorKind::VALIDATION_ERROR, ErrorReason::UNSUPPORTED, "Cannot rename the root");
  }

  const RemoteUri target = uri.parent().child(new_name);
  auto taken = fs_.exists(target);
  if (!taken.ok()) {
    return taken.error();
  }
  if (taken.value()) {
    return make_error(ErrorKind::VALIDATION_ERROR, ErrorReason::DESTINATION_EXISTS,
      target.location() + " already exists");
  }

  auto renamed = fs_.rename(uri, target);
  if (!renamed.ok()) {
    return renamed.error();
  }
  BOOST_LOG_TRIVIAL(info) << "TransferDispatcher: Renamed " << uri.location() << " to " << new_name;
  return Result<RemoteUri>::success(target);
}

Result<RemoteUri> TransferDispatcher::move_to_trash(const RemoteUri& uri, const RemoteUri& root) {
  const RemoteUri trash = root.child(TRASH_FOLDER);
  auto created = fs_.mkdir(trash);
  if (!created.ok()) {
    return created.error();
  }

  RemoteUri target = trash.child(uri.file_name());
  auto taken = fs_.exists(target);
  if (!taken.ok()) {
    return taken.error();
  }
  if (taken.value()) {
    const auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
    target = trash.child(uri.file_name() + "." + std::to_string(stamp));
  }

  TransferRequest request;
  request.source = uri;
  request.destination = target;
  auto moved = move(request);
  if (!moved.ok()) {
    return moved.error();
  }
  if (moved.value().source_cleanup_pending) {
    return make_error(ErrorKind::PROTOCOL_ERROR, ErrorReason::UNSPECIFIED,
      "Copied to trash but could not delete " + uri.location(),
      moved.value().cleanup_error ? moved.value().cleanup_error->to_string() : std::string());
  }
  return Result<RemoteUri>::success(target);
}

} // namespace transfer
} // namespace netfs
