#ifndef NETFS_NETWORK_READER_HPP
#define NETFS_NETWORK_READER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "client/client_factory.hpp"
#include "core/uri.hpp"
#include "credentials/credential_store.hpp"
#include "network/buffer_size_hints.hpp"

namespace netfs {
namespace reader {

// Presents one remote file as a seekable byte source for a streaming
// media consumer. Failures are reported as negative sentinels, which the
// consumer treats as end of input.
//
// Each instance owns one exclusive session created from the factory, not
// from the pool, and is not synchronized: read_at() from two threads on
// the same instance is unsupported. Open one reader per consumer.
//
// Protocols with random access (local, SMB) seek within the open handle.
// FTP and SFTP only offer a forward stream from an offset, so a read that
// is not contiguous with the previous one closes the stream and opens a
// new transfer at the requested offset. Each reopen costs a round trip
// and is counted in reopen_count().
class NetworkReader {
public:
  static constexpr int64_t END_OF_STREAM = -1;
  static constexpr int64_t READ_ERROR = -2;

  // Delete copy constructor and assignment operator
  NetworkReader(const NetworkReader&) = delete;
  NetworkReader& operator=(const NetworkReader&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  NetworkReader(const client::ClientFactory& factory,
                const credentials::CredentialStore& credentials,
                const network::BufferSizeHints& hints);
  ~NetworkReader();


  // ---- READER CONTRACT ----
  // Parses the URI and resolves credentials. Connecting is deferred to
  // the first read or size query.
  Result<void> open(const std::string& uri);
  Result<void> open(const RemoteUri& uri);

  // Copies up to length bytes at position into buffer. Returns the count,
  // END_OF_STREAM once position >= size, or READ_ERROR. Never reads past
  // the end of the file.
  int64_t read_at(uint64_t position, char* buffer, std::size_t length);

  // Total size in bytes, or READ_ERROR
  int64_t get_size();

  // Tears down stream, then the session. Idempotent.
  void close();


  // ---- UTILITY METHODS ----
  bool is_open() const { return opened_; }
  const RemoteUri& uri() const { return uri_; }
  std::size_t buffer_size() const { return buffer_.size(); }
  uint64_t reopen_count() const { return reopens_; }
  const std::optional<Error>& last_error() const { return last_error_; }

private:
  // ---- PARAMETERS ----
  const client::ClientFactory& factory_;
  const credentials::CredentialStore& credentials_;
  const network::BufferSizeHints& hints_;

  RemoteUri uri_;
  Credentials resolved_;
  bool opened_{false};

  // Exclusive session and the current read handle
  std::unique_ptr<client::RemoteFileClient> client_;
  std::unique_ptr<client::ReadStream> stream_;
  // File offset of the next byte stream_ will return
  uint64_t stream_position_{0};
  std::optional<uint64_t> total_size_;

  // Read-ahead window holding [window_start_, window_start_ + window_length_)
  std::vector<char> buffer_;
  uint64_t window_start_{0};
  std::size_t window_length_{0};

  uint64_t reopens_{0};
  std::optional<Error> last_error_;


  // ---- INTERNAL HELPERS ----
  Result<void> ensure_connected();
  Result<void> position_stream(uint64_t position);
  Result<std::size_t> fill_window(uint64_t position);
  void close_stream();
  int64_t fail(const Error& error);
};

} // namespace reader
} // namespace netfs

#endif // NETFS_NETWORK_READER_HPP
