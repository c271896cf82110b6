#include "reader/network_reader.hpp"
#include <algorithm>
#include <cstring>
#include <boost/log/trivial.hpp>

namespace netfs {
namespace reader {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

NetworkReader::NetworkReader(const client::ClientFactory& factory,
                             const credentials::CredentialStore& credentials,
                             const network::BufferSizeHints& hints)
  : factory_(factory)
  , credentials_(credentials)
  , hints_(hints) {
}

NetworkReader::~NetworkReader() {
  close();
}


//==============================================
// READER CONTRACT
//==============================================

Result<void> NetworkReader::open(const std::string& uri) {
  auto parsed = RemoteUri::parse(uri);
  if (!parsed.ok()) {
    BOOST_LOG_TRIVIAL(error) << "NetworkReader: " << parsed.error().to_string();
    last_error_ = parsed.error();
    return parsed.error();
  }
  return open(parsed.value());
}

Result<void> NetworkReader::open(const RemoteUri& uri) {
  if (opened_) {
    close();
  }

  auto resolved = credentials::resolve_credentials(credentials_, uri);
  if (!resolved.ok()) {
    BOOST_LOG_TRIVIAL(error) << "NetworkReader: Cannot open " << uri.to_string() << ": "
                             << resolved.error().to_string();
    last_error_ = resolved.error();
    return resolved.error();
  }

  uri_ = uri;
  resolved_ = resolved.value();
  total_size_.reset();
  window_start_ = 0;
  window_length_ = 0;
  reopens_ = 0;
  last_error_.reset();

  // Queried once; later hint changes apply to readers opened afterwards
  const std::size_t buffer_size = hints_.recommended(uri_.connection_info().endpoint());
  buffer_.assign(std::max<std::size_t>(buffer_size, 1), 0);
  opened_ = true;

  BOOST_LOG_TRIVIAL(debug) << "NetworkReader: Opened " << uri_.to_string() << " with "
                           << buffer_.size() / 1024 << " KB read-ahead";
  return Result<void>::success();
}

int64_t NetworkReader::read_at(uint64_t position, char* buffer, std::size_t length) {
  if (!opened_) {
    return fail(make_error(ErrorKind::VALIDATION_ERROR, ErrorReason::UNSPECIFIED, "Reader is not open"));
  }
  if (length == 0) {
    return 0;
  }

  auto connected = ensure_connected();
  if (!connected.ok()) {
    return fail(connected.error());
  }

  const uint64_t total = *total_size_;
  if (position >= total) {
    return END_OF_STREAM;
  }
  const std::size_t wanted = static_cast<std::size_t>(std::min<uint64_t>(length, total - position));

  std::size_t done = 0;
  while (done < wanted) {
    const uint64_t offset = position + done;

    if (offset >= window_start_ && offset < window_start_ + window_length_) {
      const std::size_t skip = static_cast<std::size_t>(offset - window_start_);
      const std::size_t n = std::min(wanted - done, window_length_ - skip);
      std::memcpy(buffer + done, buffer_.data() + skip, n);
      done += n;
      continue;
    }

    auto filled = fill_window(offset);
    if (!filled.ok()) {
      return fail(filled.error());
    }
    if (filled.value() == 0) {
      // Remote file shrank since the size was read
      BOOST_LOG_TRIVIAL(warning) << "NetworkReader: Stream for " << uri_.path << " ended at " << offset
                                 << " before reported size " << total;
      break;
    }
  }

  if (done == 0) {
    return END_OF_STREAM;
  }
  return static_cast<int64_t>(done);
}

int64_t NetworkReader::get_size() {
  if (!opened_) {
    return fail(make_error(ErrorKind::VALIDATION_ERROR, ErrorReason::UNSPECIFIED, "Reader is not open"));
  }
  auto connected = ensure_connected();
  if (!connected.ok()) {
    return fail(connected.error());
  }
  return static_cast<int64_t>(*total_size_);
}

void NetworkReader::close() {
  if (!opened_ && !client_ && !stream_) {
    return;
  }

  close_stream();

  if (client_) {
    BOOST_LOG_TRIVIAL(debug) << "NetworkReader: Closing session for " << uri_.to_string();
    client_->disconnect();
    client_.reset();
  }

  opened_ = false;
  window_length_ = 0;
  buffer_.clear();
  buffer_.shrink_to_fit();

  if (reopens_ > 0) {
    BOOST_LOG_TRIVIAL(info) << "NetworkReader: " << uri_.path << " needed " << reopens_
                            << " stream reopens for non-contiguous reads";
  }
}


//==============================================
// INTERNAL HELPERS
//==============================================

Result<void> NetworkReader::ensure_connected() {
  if (!client_ || !client_->is_connected()) {
    // A broken stream belongs to the old session
    close_stream();

    if (!client_) {
      auto created = factory_.create_checked(uri_.protocol);
      if (!created.ok()) {
        return created.error();
      }
      client_ = std::move(created).value();
    }

    BOOST_LOG_TRIVIAL(debug) << "NetworkReader: Connecting to " << uri_.connection_info().key();
    auto connected = client_->connect(uri_.connection_info(), resolved_);
    if (!connected.ok()) {
      return connected;
    }
  }

  if (!total_size_) {
    auto entry = client_->stat(uri_.path);
    if (!entry.ok()) {
      return entry.error();
    }
    if (entry.value().is_directory) {
      return make_error(ErrorKind::VALIDATION_ERROR, ErrorReason::UNSUPPORTED,
        uri_.path + " is a directory");
    }
    total_size_ = entry.value().size;
  }
  return Result<void>::success();
}

Result<void> NetworkReader::position_stream(uint64_t position) {
  if (stream_ && stream_position_ == position) {
    return Result<void>::success();
  }

  if (stream_ && stream_->is_seekable()) {
    auto sought = stream_->seek(position);
    if (!sought.ok()) {
      return sought;
    }
    stream_position_ = position;
    return Result<void>::success();
  }

  if (stream_) {
    BOOST_LOG_TRIVIAL(debug) << "NetworkReader: Non-contiguous read at " << position << " (stream at "
                             << stream_position_ << "), reopening " << uri_.path;
    close_stream();
    ++reopens_;
  }

  auto opened = client_->open_read(uri_.path, position);
  if (!opened.ok()) {
    return opened.error();
  }
  stream_ = std::move(opened).value();
  stream_position_ = position;
  return Result<void>::success();
}

Result<std::size_t> NetworkReader::fill_window(uint64_t position) {
  auto positioned = position_stream(position);
  if (!positioned.ok()) {
    return positioned.error();
  }

  auto n = stream_->read(buffer_.data(), buffer_.size());
  if (!n.ok()) {
    return n.error();
  }

  window_start_ = position;
  window_length_ = n.value();
  stream_position_ += n.value();
  return n;
}

void NetworkReader::close_stream() {
  if (stream_) {
    stream_->close();
    stream_.reset();
  }
}

int64_t NetworkReader::fail(const Error& error) {
  BOOST_LOG_TRIVIAL(error) << "NetworkReader: Read of " << uri_.to_string() << " failed: " << error.to_string();
  last_error_ = error;

  // The next call starts from a fresh handle, and a fresh session when the
  // transport went away
  close_stream();
  if (client_ && error.is_connection_error()) {
    client_->disconnect();
  }
  return READ_ERROR;
}

} // namespace reader
} // namespace netfs
