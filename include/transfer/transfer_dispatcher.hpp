#ifndef NETFS_TRANSFER_DISPATCHER_HPP
#define NETFS_TRANSFER_DISPATCHER_HPP

#include <memory>
#include <string>
#include <vector>
#include "transfer/transfer_strategy.hpp"

namespace netfs {
namespace transfer {

// Routes copy/move to the first strategy supporting the (source,
// destination) protocol pair, and carries the single-file operations
// (remove, exists, rename, trash) that need no strategy.
class TransferDispatcher {
public:
  static constexpr const char* TRASH_FOLDER = ".trash";

  // Delete copy constructor and assignment operator
  TransferDispatcher(const TransferDispatcher&) = delete;
  TransferDispatcher& operator=(const TransferDispatcher&) = delete;

  // Registers the built-in strategies. cache may be null.
  TransferDispatcher(network::RemoteFileSystem& fs, cache::UnifiedFileCache* cache,
                     TransferOptions options = {});


  // ---- STRATEGY SELECTION ----
  // Takes precedence over the strategies registered before it
  void register_strategy(std::unique_ptr<TransferStrategy> strategy);
  bool supports(Protocol source, Protocol destination) const;
  // VALIDATION_ERROR/NO_STRATEGY when nothing handles the pair
  Result<TransferStrategy*> select(Protocol source, Protocol destination) const;


  // ---- TRANSFERS ----
  Result<TransferOutcome> copy(const TransferRequest& request);
  Result<TransferOutcome> move(const TransferRequest& request);


  // ---- SINGLE FILE OPERATIONS ----
  Result<void> remove(const RemoteUri& uri);
  Result<bool> exists(const RemoteUri& uri);
  // Renames within the parent directory; returns the new location
  Result<RemoteUri> rename(const RemoteUri& uri, const std::string& new_name);
  // Moves uri into "<root>/.trash", adding a suffix when the name is
  // taken there. Returns where the file went.
  Result<RemoteUri> move_to_trash(const RemoteUri& uri, const RemoteUri& root);

private:
  network::RemoteFileSystem& fs_;
  std::vector<std::unique_ptr<TransferStrategy>> strategies_;
};

} // namespace transfer
} // namespace netfs

#endif // NETFS_TRANSFER_DISPATCHER_HPP
