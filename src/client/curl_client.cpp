#include "client/curl_client.hpp"
#include <algorithm>
#include <cstring>
#include <boost/log/trivial.hpp>

namespace netfs {
namespace client {

namespace {

class CurlReadStream : public ReadStream {
public:
  CurlReadStream(std::shared_ptr<CurlSession> session, uint64_t offset)
    : session_(std::move(session))
    , generation_(session_->stream_generation())
    , position_(offset) {}

  ~CurlReadStream() override { close(); }

  Result<std::size_t> read(char* buffer, std::size_t len) override {
    if (!owns_stream()) {
      return make_error(ErrorKind::CONNECTION_ERROR, ErrorReason::DISCONNECTED,
        "Stream was closed by its session");
    }
    auto n = session_->read_stream(buffer, len);
    if (n.ok()) {
      position_ += n.value();
    }
    return n;
  }

  bool is_seekable() const override { return false; }

  Result<void> seek(uint64_t offset) override {
    return make_error(ErrorKind::PROTOCOL_ERROR, ErrorReason::UNSUPPORTED,
      "Sequential stream cannot seek to " + std::to_string(offset));
  }

  uint64_t position() const override { return position_; }

  void close() override {
    if (owns_stream()) {
      session_->end_stream();
    }
    closed_ = true;
  }

private:
  bool owns_stream() const {
    return !closed_ && session_->streaming() && session_->stream_generation() == generation_;
  }

  std::shared_ptr<CurlSession> session_;
  uint64_t generation_;
  uint64_t position_;
  bool closed_{false};
};

struct RangeSink {
  char* buffer;
  std::size_t capacity;
  std::size_t filled;
};

size_t range_write_callback(char* data, size_t size, size_t nmemb, void* user) {
  auto* sink = static_cast<RangeSink*>(user);
  const std::size_t n = size * nmemb;
  const std::size_t take = std::min(n, sink->capacity - sink->filled);
  std::memcpy(sink->buffer + sink->filled, data, take);
  sink->filled += take;
  // Surplus bytes are dropped, returning less would abort with a write error
  return n;
}

size_t string_write_callback(char* data, size_t size, size_t nmemb, void* user) {
  static_cast<std::string*>(user)->append(data, size * nmemb);
  return size * nmemb;
}

struct UploadSource {
  std::istream* in;
  uint64_t size;
  uint64_t sent;
  const ChunkCallback* on_chunk;
  bool cancelled;
};

size_t upload_read_callback(char* buffer, size_t size, size_t nitems, void* user) {
  auto* source = static_cast<UploadSource*>(user);
  std::size_t want = size * nitems;
  if (source->size > 0) {
    if (source->sent >= source->size) {
      return 0;
    }
    want = static_cast<std::size_t>(std::min<uint64_t>(want, source->size - source->sent));
  }

  source->in->read(buffer, static_cast<std::streamsize>(want));
  const auto n = static_cast<std::size_t>(source->in->gcount());
  if (source->in->bad()) {
    return CURL_READFUNC_ABORT;
  }
  source->sent += n;

  if (n > 0 && *source->on_chunk && !(*source->on_chunk)(source->sent)) {
    source->cancelled = true;
    return CURL_READFUNC_ABORT;
  }
  return n;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CurlClient::CurlClient(Protocol protocol, ClientOptions options, std::string log_name)
  : protocol_(protocol)
  , options_(std::move(options))
  , log_name_(std::move(log_name)) {
}

CurlClient::~CurlClient() {
  disconnect();
}


//==============================================
// SESSION
//==============================================

Result<void> CurlClient::connect(const ConnectionInfo& info, const Credentials& credentials) {
  BOOST_LOG_TRIVIAL(info) << log_name_ << ": Connecting to " << info.endpoint()
                          << " as " << (credentials.username.empty() ? "<anonymous>" : credentials.username);
  disconnect();

  info_ = info;
  session_ = std::make_shared<CurlSession>(protocol_, options_);
  if (auto opened = session_->open(info, credentials); !opened.ok()) {
    session_.reset();
    return opened;
  }

  if (protocol_ == Protocol::SFTP && options_.known_hosts_file.empty()) {
    BOOST_LOG_TRIVIAL(warning) << log_name_ << ": No known_hosts file configured, host key of "
                               << info.host << " is not verified";
  }

  // The first request performs the login
  if (auto tested = test_connection(); !tested.ok()) {
    BOOST_LOG_TRIVIAL(error) << log_name_ << ": Connection to " << info.endpoint()
                             << " failed: " << tested.error().to_string();
    session_->close();
    session_.reset();
    return tested;
  }

  BOOST_LOG_TRIVIAL(info) << log_name_ << ": Connected to " << info.endpoint();
  return Result<void>::success();
}

bool CurlClient::is_connected() const {
  return session_ && session_->is_healthy();
}

void CurlClient::disconnect() {
  if (!session_) {
    return;
  }
  BOOST_LOG_TRIVIAL(info) << log_name_ << ": Disconnecting from " << info_.endpoint();
  session_->close();
  session_.reset();
}

Result<void> CurlClient::test_connection() {
  if (auto ready = require_session("Connection test"); !ready.ok()) {
    return ready;
  }
  return session_->perform(session_->url_for("/", true), [](CURL* easy) {
    curl_easy_setopt(easy, CURLOPT_NOBODY, 1L);
  }, "Connection test against " + info_.endpoint());
}


//==============================================
// QUERY OPERATIONS
//==============================================

Result<std::vector<FileEntry>> CurlClient::list(const std::string& path) {
  if (auto ready = require_session("Listing " + path); !ready.ok()) {
    return ready.error();
  }
  return list_directory(path);
}

Result<FileEntry> CurlClient::stat(const std::string& path) {
  if (path.empty() || path == "/") {
    FileEntry root;
    root.name = "";
    root.path = "/";
    root.is_directory = true;
    return Result<FileEntry>::success(root);
  }

  auto entries = list(parent_path_of(path));
  if (!entries.ok()) {
    if (entries.error().kind == ErrorKind::PROTOCOL_ERROR) {
      return make_error(ErrorKind::PROTOCOL_ERROR, ErrorReason::NOT_FOUND,
        "No such file: " + path, entries.error().cause);
    }
    return entries.error();
  }

  const std::string name = file_name_of(path);
  for (auto& entry : entries.value()) {
    if (entry.name == name) {
      return Result<FileEntry>::success(entry);
    }
  }
  return make_error(ErrorKind::PROTOCOL_ERROR, ErrorReason::NOT_FOUND, "No such file: " + path);
}

Result<std::string> CurlClient::fetch_listing(const std::string& path, const char* custom_request) {
  std::string text;
  auto result = session_->perform(session_->url_for(path, true), [&text, custom_request](CURL* easy) {
    if (custom_request) {
      curl_easy_setopt(easy, CURLOPT_CUSTOMREQUEST, custom_request);
    }
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &string_write_callback);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, &text);
  }, "Listing " + path);

  if (!result.ok()) {
    return result.error();
  }
  return Result<std::string>::success(std::move(text));
}


//==============================================
// DATA OPERATIONS
//==============================================

Result<std::unique_ptr<ReadStream>> CurlClient::open_read(const std::string& path, uint64_t offset) {
  if (auto ready = require_session("Reading " + path); !ready.ok()) {
    return ready.error();
  }

  auto begun = session_->begin_stream(session_->url_for(path, false), offset, "Reading " + path);
  if (!begun.ok()) {
    return begun.error();
  }

  std::unique_ptr<ReadStream> stream = std::make_unique<CurlReadStream>(session_, offset);
  return Result<std::unique_ptr<ReadStream>>::success(std::move(stream));
}

Result<std::size_t> CurlClient::read_range(const std::string& path, uint64_t offset,
                                           char* buffer, std::size_t length) {
  if (length == 0) {
    return Result<std::size_t>::success(0);
  }
  if (auto ready = require_session("Reading " + path); !ready.ok()) {
    return ready.error();
  }

  RangeSink sink{buffer, length, 0};
  const std::string range = std::to_string(offset) + "-" + std::to_string(offset + length - 1);

  auto result = session_->perform(session_->url_for(path, false), [&sink, &range](CURL* easy) {
    curl_easy_setopt(easy, CURLOPT_RANGE, range.c_str());
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &range_write_callback);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, &sink);
  }, "Reading " + path + " [" + range + "]");

  if (!result.ok()) {
    // Ranges starting past the end of the file
    const CURLcode code = session_->last_result();
    if (code == CURLE_BAD_DOWNLOAD_RESUME || code == CURLE_RANGE_ERROR) {
      return Result<std::size_t>::success(0);
    }
    return result.error();
  }
  return Result<std::size_t>::success(sink.filled);
}

Result<uint64_t> CurlClient::write(const std::string& path, std::istream& data, uint64_t size,
                                   const ChunkCallback& on_chunk) {
  if (auto ready = require_session("Writing " + path); !ready.ok()) {
    return ready.error();
  }

  UploadSource source{&data, size, 0, &on_chunk, false};
  auto result = session_->perform(session_->url_for(path, false), [&source, size](CURL* easy) {
    curl_easy_setopt(easy, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(easy, CURLOPT_READFUNCTION, &upload_read_callback);
    curl_easy_setopt(easy, CURLOPT_READDATA, &source);
    if (size > 0) {
      curl_easy_setopt(easy, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
    }
  }, "Writing " + path);

  if (!result.ok()) {
    if (source.cancelled) {
      return make_error(ErrorKind::CANCELLED, ErrorReason::UNSPECIFIED, "Write to " + path + " cancelled");
    }
    return result.error();
  }

  BOOST_LOG_TRIVIAL(debug) << log_name_ << ": Wrote " << source.sent << " bytes to " << path;
  return Result<uint64_t>::success(source.sent);
}


//==============================================
// MUTATING OPERATIONS
//==============================================

Result<void> CurlClient::remove(const std::string& path) {
  if (auto ready = require_session("Deleting " + path); !ready.ok()) {
    return ready;
  }
  return session_->run_quote(delete_commands(path), "Deleting " + path);
}

Result<void> CurlClient::remove_directory(const std::string& path) {
  if (auto ready = require_session("Deleting directory " + path); !ready.ok()) {
    return ready;
  }
  return session_->run_quote(remove_directory_commands(path), "Deleting directory " + path);
}

Result<void> CurlClient::mkdir(const std::string& path) {
  if (auto ready = require_session("Creating directory " + path); !ready.ok()) {
    return ready;
  }

  auto created = session_->run_quote(mkdir_commands(path), "Creating directory " + path);
  if (created.ok() || created.error().kind != ErrorKind::PROTOCOL_ERROR) {
    return created;
  }

  // Servers reject MKD on an existing directory
  auto existing = stat(path);
  if (existing.ok() && existing.value().is_directory) {
    return Result<void>::success();
  }
  return created;
}

Result<void> CurlClient::rename(const std::string& from, const std::string& to) {
  if (auto ready = require_session("Renaming " + from); !ready.ok()) {
    return ready;
  }
  return session_->run_quote(rename_commands(from, to), "Renaming " + from + " to " + to);
}

Result<void> CurlClient::require_session(const std::string& context) const {
  if (!session_ || !session_->is_open()) {
    return make_error(ErrorKind::CONNECTION_ERROR, ErrorReason::DISCONNECTED,
      context + ": not connected to " + info_.endpoint());
  }
  return Result<void>::success();
}

} // namespace client
} // namespace netfs
