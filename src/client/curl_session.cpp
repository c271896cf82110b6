#include "client/curl_session.hpp"
#include <algorithm>
#include <cstring>
#include <mutex>
#include <boost/log/trivial.hpp>
#include "core/uri.hpp"

namespace netfs {
namespace client {

void ensure_curl_initialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
      BOOST_LOG_TRIVIAL(error) << "CurlSession: curl_global_init failed: " << curl_easy_strerror(rc);
      return;
    }
    const auto* info = curl_version_info(CURLVERSION_NOW);
    BOOST_LOG_TRIVIAL(info) << "CurlSession: libcurl " << info->version
                            << (info->libssh_version ? std::string(", ") + info->libssh_version : std::string());
  });
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CurlSession::CurlSession(Protocol protocol, ClientOptions options)
  : protocol_(protocol)
  , options_(std::move(options)) {
  error_buffer_[0] = '\0';
}

CurlSession::~CurlSession() {
  close();
}


//==============================================
// SESSION CONTROL
//==============================================

Result<void> CurlSession::open(const ConnectionInfo& info, const Credentials& credentials) {
  ensure_curl_initialized();
  close();

  info_ = info;
  credentials_ = credentials;

  easy_ = curl_easy_init();
  multi_ = curl_multi_init();
  if (!easy_ || !multi_) {
    close();
    return make_error(ErrorKind::CONNECTION_ERROR, ErrorReason::UNSPECIFIED,
      "Cannot allocate libcurl handles for " + info.endpoint());
  }

  healthy_ = true;
  BOOST_LOG_TRIVIAL(debug) << "CurlSession: Opened handles for " << info.endpoint();
  return Result<void>::success();
}

void CurlSession::close() {
  if (stream_active_) {
    BOOST_LOG_TRIVIAL(debug) << "CurlSession: Closing stream handle";
    end_stream();
  }

  if (easy_) {
    BOOST_LOG_TRIVIAL(debug) << "CurlSession: Closing session handle for " << info_.endpoint();
    curl_easy_cleanup(easy_);
    easy_ = nullptr;
  }

  if (multi_) {
    BOOST_LOG_TRIVIAL(debug) << "CurlSession: Closing transport for " << info_.endpoint();
    const CURLMcode mc = curl_multi_cleanup(multi_);
    if (mc != CURLM_OK) {
      BOOST_LOG_TRIVIAL(warning) << "CurlSession: Transport cleanup failed: " << curl_multi_strerror(mc);
    }
    multi_ = nullptr;
  }

  healthy_ = false;
}


//==============================================
// REQUESTS
//==============================================

std::string CurlSession::url_for(const std::string& path, bool directory) const {
  const bool ipv6 = info_.host.find(':') != std::string::npos;
  std::string url = std::string(protocol_to_scheme(protocol_)) + "://" +
    (ipv6 ? "[" + info_.host + "]" : info_.host) + ":" + std::to_string(info_.port);

  const std::string encoded = percent_encode_path(path.empty() ? "/" : path);
  if (protocol_ == Protocol::FTP) {
    // %2F makes the path absolute instead of relative to the login directory
    url += "/%2F" + encoded.substr(1);
  } else {
    url += encoded;
  }

  if (directory && url.back() != '/') {
    url += '/';
  }
  return url;
}

Result<void> CurlSession::perform(const std::string& url, const std::function<void(CURL*)>& configure,
                                  const std::string& context) {
  if (!is_open()) {
    return make_error(ErrorKind::CONNECTION_ERROR, ErrorReason::DISCONNECTED, context + ": session is closed");
  }
  if (stream_active_) {
    return make_error(ErrorKind::PROTOCOL_ERROR, ErrorReason::UNSUPPORTED,
      context + ": session is busy with an open stream");
  }

  last_result_ = CURLE_OK;
  apply_defaults(true);
  curl_easy_setopt(easy_, CURLOPT_URL, url.c_str());
  if (configure) {
    configure(easy_);
  }

  if (auto attached = attach(context); !attached.ok()) {
    return attached;
  }

  for (;;) {
    auto done = pump();
    if (!done.ok()) {
      detach();
      return done.error();
    }
    if (done.value()) {
      break;
    }
    wait_for_activity(std::chrono::milliseconds(1000));
  }

  const CURLcode result = transfer_result_;
  curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &response_code_);
  detach();
  return finish(result, context);
}

Result<void> CurlSession::run_quote(const std::vector<std::string>& commands, const std::string& context) {
  struct curl_slist* quote = nullptr;
  for (const auto& command : commands) {
    struct curl_slist* next = curl_slist_append(quote, command.c_str());
    if (!next) {
      curl_slist_free_all(quote);
      return make_error(ErrorKind::IO_ERROR, ErrorReason::UNSPECIFIED, context + ": out of memory");
    }
    quote = next;
    BOOST_LOG_TRIVIAL(debug) << "CurlSession: Quote command: " << command;
  }

  auto result = perform(url_for("/", true), [quote](CURL* easy) {
    curl_easy_setopt(easy, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(easy, CURLOPT_QUOTE, quote);
  }, context);

  curl_slist_free_all(quote);
  return result;
}


//==============================================
// STREAMING
//==============================================

Result<void> CurlSession::begin_stream(const std::string& url, uint64_t offset, const std::string& context) {
  if (!is_open()) {
    return make_error(ErrorKind::CONNECTION_ERROR, ErrorReason::DISCONNECTED, context + ": session is closed");
  }
  if (stream_active_) {
    end_stream();
  }

  // No low speed limit here: the consumer may pause between reads, the
  // stall check in read_stream only counts time spent waiting for data
  apply_defaults(false);
  curl_easy_setopt(easy_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(easy_, CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(offset));
  curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &CurlSession::stream_write_callback);
  curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);

  stream_buffer_.clear();
  stream_offset_ = 0;
  stream_context_ = context;

  if (auto attached = attach(context); !attached.ok()) {
    return attached;
  }

  stream_active_ = true;
  ++stream_generation_;
  BOOST_LOG_TRIVIAL(debug) << "CurlSession: Stream opened at offset " << offset << ": " << context;
  return Result<void>::success();
}

Result<std::size_t> CurlSession::read_stream(char* buffer, std::size_t len) {
  if (!stream_active_) {
    return make_error(ErrorKind::IO_ERROR, ErrorReason::UNSPECIFIED, "Read on a closed stream");
  }

  auto last_data = std::chrono::steady_clock::now();
  while (stream_offset_ == stream_buffer_.size() && !transfer_done_) {
    const std::size_t before = stream_buffer_.size();
    auto done = pump();
    if (!done.ok()) {
      healthy_ = false;
      return done.error();
    }
    if (stream_buffer_.size() > before || done.value()) {
      break;
    }
    if (std::chrono::steady_clock::now() - last_data > options_.io_timeout) {
      healthy_ = false;
      return make_error(ErrorKind::CONNECTION_ERROR, ErrorReason::TIMEOUT,
        stream_context_ + ": no data received for " + std::to_string(options_.io_timeout.count()) + "s");
    }
    wait_for_activity(std::chrono::milliseconds(200));
  }

  const std::size_t available = stream_buffer_.size() - stream_offset_;
  if (available > 0) {
    const std::size_t n = std::min(len, available);
    std::memcpy(buffer, stream_buffer_.data() + stream_offset_, n);
    stream_offset_ += n;
    if (stream_offset_ == stream_buffer_.size()) {
      stream_buffer_.clear();
      stream_offset_ = 0;
    }
    return Result<std::size_t>::success(n);
  }

  if (transfer_result_ != CURLE_OK) {
    curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &response_code_);
    Error error = translate(transfer_result_, stream_context_);
    if (error.is_connection_error()) {
      healthy_ = false;
    }
    return error;
  }
  return Result<std::size_t>::success(0);
}

void CurlSession::end_stream() {
  if (!stream_active_) {
    return;
  }
  detach();
  stream_active_ = false;
  stream_buffer_.clear();
  stream_offset_ = 0;
  BOOST_LOG_TRIVIAL(debug) << "CurlSession: Stream closed: " << stream_context_;
}

size_t CurlSession::stream_write_callback(char* data, size_t size, size_t nmemb, void* user) {
  auto* session = static_cast<CurlSession*>(user);
  session->stream_buffer_.append(data, size * nmemb);
  return size * nmemb;
}


//==============================================
// ERROR MAPPING
//==============================================

Error CurlSession::translate(CURLcode code, const std::string& context) const {
  std::string cause = curl_easy_strerror(code);
  if (error_buffer_[0] != '\0') {
    cause += ": ";
    cause += error_buffer_;
  }
  if (response_code_ != 0) {
    cause += " (server reply " + std::to_string(response_code_) + ")";
  }

  const std::string detail(error_buffer_);
  auto protocol_reason = [&]() {
    if (response_code_ == 550 || detail.find("No such file") != std::string::npos) {
      return ErrorReason::NOT_FOUND;
    }
    if (response_code_ == 530 || response_code_ == 532 || response_code_ == 553 ||
        detail.find("ermission denied") != std::string::npos) {
      return ErrorReason::PERMISSION_DENIED;
    }
    if (response_code_ == 552 || detail.find("quota") != std::string::npos) {
      return ErrorReason::QUOTA_EXCEEDED;
    }
    return ErrorReason::UNSPECIFIED;
  };

  switch (code) {
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
      return make_error(ErrorKind::CONNECTION_ERROR, ErrorReason::UNREACHABLE, context, cause);
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_FTP_ACCEPT_TIMEOUT:
      return make_error(ErrorKind::CONNECTION_ERROR, ErrorReason::TIMEOUT, context, cause);
    case CURLE_LOGIN_DENIED:
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_SSH:
      return make_error(ErrorKind::CONNECTION_ERROR, ErrorReason::AUTH_FAILED, context, cause);
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_PARTIAL_FILE:
    case CURLE_FTP_WEIRD_SERVER_REPLY:
      return make_error(ErrorKind::CONNECTION_ERROR, ErrorReason::DISCONNECTED, context, cause);
    case CURLE_REMOTE_FILE_NOT_FOUND:
      return make_error(ErrorKind::PROTOCOL_ERROR, ErrorReason::NOT_FOUND, context, cause);
    case CURLE_REMOTE_ACCESS_DENIED:
      return make_error(ErrorKind::PROTOCOL_ERROR, ErrorReason::PERMISSION_DENIED, context, cause);
    case CURLE_REMOTE_DISK_FULL:
      return make_error(ErrorKind::PROTOCOL_ERROR, ErrorReason::QUOTA_EXCEEDED, context, cause);
    case CURLE_FTP_COULDNT_RETR_FILE:
    case CURLE_QUOTE_ERROR:
    case CURLE_UPLOAD_FAILED:
      return make_error(ErrorKind::PROTOCOL_ERROR, protocol_reason(), context, cause);
    case CURLE_ABORTED_BY_CALLBACK:
      return make_error(ErrorKind::CANCELLED, ErrorReason::UNSPECIFIED, context, cause);
    case CURLE_WRITE_ERROR:
    case CURLE_READ_ERROR:
      return make_error(ErrorKind::IO_ERROR, ErrorReason::UNSPECIFIED, context, cause);
    case CURLE_UNSUPPORTED_PROTOCOL:
      return make_error(ErrorKind::PROTOCOL_ERROR, ErrorReason::UNSUPPORTED, context, cause);
    default:
      return make_error(ErrorKind::PROTOCOL_ERROR, protocol_reason(), context, cause);
  }
}


//==============================================
// INTERNAL HELPERS
//==============================================

void CurlSession::apply_defaults(bool enforce_low_speed) {
  curl_easy_reset(easy_);
  error_buffer_[0] = '\0';
  response_code_ = 0;

  curl_easy_setopt(easy_, CURLOPT_ERRORBUFFER, error_buffer_);
  curl_easy_setopt(easy_, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(easy_, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout.count()));
  curl_easy_setopt(easy_, CURLOPT_TCP_KEEPALIVE, 1L);

  if (enforce_low_speed) {
    curl_easy_setopt(easy_, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(easy_, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.io_timeout.count()));
  }

  if (!credentials_.username.empty()) {
    curl_easy_setopt(easy_, CURLOPT_USERNAME, credentials_.username.c_str());
  }
  if (!credentials_.password.empty()) {
    curl_easy_setopt(easy_, CURLOPT_PASSWORD, credentials_.password.c_str());
  }

  if (protocol_ == Protocol::FTP) {
    curl_easy_setopt(easy_, CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_SINGLECWD));
    curl_easy_setopt(easy_, CURLOPT_SERVER_RESPONSE_TIMEOUT, static_cast<long>(options_.io_timeout.count()));
    curl_easy_setopt(easy_, CURLOPT_FTP_USE_EPSV, 1L);
  } else if (protocol_ == Protocol::SFTP) {
    curl_easy_setopt(easy_, CURLOPT_SSH_AUTH_TYPES,
      static_cast<long>(CURLSSH_AUTH_PUBLICKEY | CURLSSH_AUTH_PASSWORD | CURLSSH_AUTH_KEYBOARD));
    if (!credentials_.private_key_path.empty()) {
      curl_easy_setopt(easy_, CURLOPT_SSH_PRIVATE_KEYFILE, credentials_.private_key_path.c_str());
      if (!credentials_.private_key_passphrase.empty()) {
        curl_easy_setopt(easy_, CURLOPT_KEYPASSWD, credentials_.private_key_passphrase.c_str());
      }
    }
    if (!options_.known_hosts_file.empty()) {
      curl_easy_setopt(easy_, CURLOPT_SSH_KNOWNHOSTS, options_.known_hosts_file.c_str());
    }
  }
}

Result<void> CurlSession::attach(const std::string& context) {
  transfer_done_ = false;
  transfer_result_ = CURLE_OK;
  const CURLMcode mc = curl_multi_add_handle(multi_, easy_);
  if (mc != CURLM_OK) {
    return make_error(ErrorKind::PROTOCOL_ERROR, ErrorReason::UNSPECIFIED, context, curl_multi_strerror(mc));
  }
  return Result<void>::success();
}

void CurlSession::detach() {
  const CURLMcode mc = curl_multi_remove_handle(multi_, easy_);
  if (mc != CURLM_OK) {
    BOOST_LOG_TRIVIAL(warning) << "CurlSession: Removing handle failed: " << curl_multi_strerror(mc);
  }
}

Result<bool> CurlSession::pump() {
  int running = 0;
  const CURLMcode mc = curl_multi_perform(multi_, &running);
  if (mc != CURLM_OK) {
    return make_error(ErrorKind::PROTOCOL_ERROR, ErrorReason::UNSPECIFIED,
      "libcurl multi interface failure", curl_multi_strerror(mc));
  }

  int queued = 0;
  while (CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
    if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_) {
      transfer_done_ = true;
      transfer_result_ = msg->data.result;
    }
  }
  return Result<bool>::success(transfer_done_);
}

void CurlSession::wait_for_activity(std::chrono::milliseconds timeout) {
  const CURLMcode mc = curl_multi_poll(multi_, nullptr, 0, static_cast<int>(timeout.count()), nullptr);
  if (mc != CURLM_OK) {
    BOOST_LOG_TRIVIAL(warning) << "CurlSession: Poll failed: " << curl_multi_strerror(mc);
  }
}

Result<void> CurlSession::finish(CURLcode code, const std::string& context) {
  last_result_ = code;
  if (code == CURLE_OK) {
    return Result<void>::success();
  }
  Error error = translate(code, context);
  if (error.is_connection_error()) {
    healthy_ = false;
  }
  BOOST_LOG_TRIVIAL(debug) << "CurlSession: " << error.to_string();
  return error;
}

} // namespace client
} // namespace netfs
