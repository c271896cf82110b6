#ifndef NETFS_TRANSFER_STRATEGY_HPP
#define NETFS_TRANSFER_STRATEGY_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "cache/unified_file_cache.hpp"
#include "core/result.hpp"
#include "core/uri.hpp"
#include "network/remote_file_system.hpp"
#include "transfer/progress_tracker.hpp"

namespace netfs {
namespace transfer {

struct TransferRequest {
  RemoteUri source;
  RemoteUri destination;
  bool overwrite{false};
  ProgressCallback progress;
};

enum class TransferStatus {
  SUCCESS,
  // Destination is complete but the source of a move could not be deleted
  PARTIAL_SUCCESS
};

const char* transfer_status_to_string(TransferStatus status);

struct TransferOutcome {
  TransferStatus status{TransferStatus::SUCCESS};
  uint64_t bytes_transferred{0};
  RemoteUri destination;
  bool source_cleanup_pending{false};
  std::optional<Error> cleanup_error;
  // Completed by a rename on the server, no bytes moved
  bool server_side{false};
};

struct TransferOptions {
  std::filesystem::path temp_dir{std::filesystem::temp_directory_path()};
  uint64_t progress_step_bytes{ProgressTracker::DEFAULT_STEP_BYTES};
};

// Copy/move implementation for one family of (source, destination)
// protocol pairs.
class TransferStrategy {
public:
  virtual ~TransferStrategy() = default;

  virtual const char* name() const = 0;
  virtual bool supports(Protocol source, Protocol destination) const = 0;

  // Fails without side effects when the destination exists and overwrite
  // is false. On success the destination holds exactly the source bytes.
  virtual Result<TransferOutcome> copy(const TransferRequest& request) = 0;
  // Copy, then delete the source once the copy is confirmed
  virtual Result<TransferOutcome> move(const TransferRequest& request) = 0;
};

// Shared plumbing: destination checks, the staging file and the commit.
// Bytes are written to "<destination>.netfs-part" and renamed over the
// destination only after the staged size matches the source size.
class StrategyBase : public TransferStrategy {
public:
  static constexpr const char* PART_SUFFIX = ".netfs-part";

  StrategyBase(network::RemoteFileSystem& fs, TransferOptions options);

  Result<TransferOutcome> move(const TransferRequest& request) override;

protected:
  network::RemoteFileSystem& fs_;
  TransferOptions options_;

  // Source entry, after rejecting directories, self copies and an
  // existing destination without overwrite
  Result<FileEntry> prepare(const TransferRequest& request);
  static RemoteUri staging_uri(const RemoteUri& destination);
  // Verifies the staged size and renames it over the destination. The
  // staging file is removed on any failure.
  Result<void> commit(const RemoteUri& staged, const TransferRequest& request, uint64_t expected_size);
  void discard(const RemoteUri& staged);
  // Deletes the source of a finished copy; a failure turns the outcome
  // into PARTIAL_SUCCESS instead of an error
  void finish_move(const TransferRequest& request, TransferOutcome& outcome);
  // Copies by relaying through a temp file on local disk
  Result<TransferOutcome> relay_copy(const TransferRequest& request);
  TransferOutcome completed(const TransferRequest& request, uint64_t bytes) const;
};

// ---- CONCRETE STRATEGIES ----

// Local disk to local disk. Moves are a rename; across file systems they
// are a staged copy followed by deleting the source.
class LocalTransferStrategy : public StrategyBase {
public:
  using StrategyBase::StrategyBase;

  const char* name() const override { return "local"; }
  bool supports(Protocol source, Protocol destination) const override;
  Result<TransferOutcome> copy(const TransferRequest& request) override;
  Result<TransferOutcome> move(const TransferRequest& request) override;
};

class UploadTransferStrategy : public StrategyBase {
public:
  using StrategyBase::StrategyBase;

  const char* name() const override { return "upload"; }
  bool supports(Protocol source, Protocol destination) const override;
  Result<TransferOutcome> copy(const TransferRequest& request) override;
};

// Remote to local disk. A valid cache entry for the source is copied
// instead of downloading again.
class DownloadTransferStrategy : public StrategyBase {
public:
  DownloadTransferStrategy(network::RemoteFileSystem& fs, TransferOptions options,
                           cache::UnifiedFileCache* cache);

  const char* name() const override { return "download"; }
  bool supports(Protocol source, Protocol destination) const override;
  Result<TransferOutcome> copy(const TransferRequest& request) override;

private:
  cache::UnifiedFileCache* cache_;
};

// Both ends on one protocol. Moves within one connection are a server
// side rename; everything else relays through a temp file.
class SameProtocolTransferStrategy : public StrategyBase {
public:
  using StrategyBase::StrategyBase;

  const char* name() const override { return "same-protocol"; }
  bool supports(Protocol source, Protocol destination) const override;
  Result<TransferOutcome> copy(const TransferRequest& request) override;
  Result<TransferOutcome> move(const TransferRequest& request) override;
};

class CrossProtocolTransferStrategy : public StrategyBase {
public:
  using StrategyBase::StrategyBase;

  const char* name() const override { return "cross-protocol"; }
  bool supports(Protocol source, Protocol destination) const override;
  Result<TransferOutcome> copy(const TransferRequest& request) override;
};

} // namespace transfer
} // namespace netfs

#endif // NETFS_TRANSFER_STRATEGY_HPP
