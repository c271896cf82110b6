#ifndef NETFS_CURL_SESSION_HPP
#define NETFS_CURL_SESSION_HPP

#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include <curl/curl.h>
#include "client/remote_file_client.hpp"

namespace netfs {
namespace client {

// One authenticated libcurl session (FTP control connection or SSH
// session). Every request runs through a private multi handle so the
// connection cache, and therefore the login, survives between requests
// and between streams.
class CurlSession {
public:
  // Delete copy constructor and assignment operator
  CurlSession(const CurlSession&) = delete;
  CurlSession& operator=(const CurlSession&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CurlSession(Protocol protocol, ClientOptions options);
  ~CurlSession();


  // ---- SESSION CONTROL ----
  Result<void> open(const ConnectionInfo& info, const Credentials& credentials);
  // Stream handle, then easy handle, then the multi handle holding the
  // connection. Idempotent.
  void close();
  bool is_open() const { return easy_ != nullptr; }
  // False once a request failed at transport level
  bool is_healthy() const { return is_open() && healthy_; }


  // ---- REQUESTS ----
  // Escaped URL for an absolute server path
  std::string url_for(const std::string& path, bool directory) const;
  // Blocking request with the session defaults plus `configure`
  Result<void> perform(const std::string& url, const std::function<void(CURL*)>& configure,
                       const std::string& context);
  // Runs protocol commands (DELE, MKD, rm, rename, ...) on the session
  Result<void> run_quote(const std::vector<std::string>& commands, const std::string& context);


  // ---- STREAMING ----
  Result<void> begin_stream(const std::string& url, uint64_t offset, const std::string& context);
  // 0 at end of file
  Result<std::size_t> read_stream(char* buffer, std::size_t len);
  void end_stream();
  bool streaming() const { return stream_active_; }
  // Bumped on every begin_stream, lets a stale stream object detect reuse
  uint64_t stream_generation() const { return stream_generation_; }


  // ---- ERROR MAPPING ----
  Error translate(CURLcode code, const std::string& context) const;
  long last_response_code() const { return response_code_; }
  CURLcode last_result() const { return last_result_; }

private:
  // ---- PARAMETERS ----
  Protocol protocol_;
  ClientOptions options_;
  ConnectionInfo info_;
  Credentials credentials_;

  CURL* easy_{nullptr};
  CURLM* multi_{nullptr};
  char error_buffer_[CURL_ERROR_SIZE];
  long response_code_{0};
  CURLcode last_result_{CURLE_OK};
  bool healthy_{false};

  // State of the transfer currently attached to the multi handle
  bool transfer_done_{false};
  CURLcode transfer_result_{CURLE_OK};

  // Streaming state
  bool stream_active_{false};
  std::string stream_context_;
  std::string stream_buffer_;
  std::size_t stream_offset_{0};
  uint64_t stream_generation_{0};


  // ---- INTERNAL HELPERS ----
  void apply_defaults(bool enforce_low_speed);
  Result<void> attach(const std::string& context);
  void detach();
  // Drives the multi handle once; returns true when the transfer completed
  Result<bool> pump();
  void wait_for_activity(std::chrono::milliseconds timeout);
  Result<void> finish(CURLcode code, const std::string& context);

  static size_t stream_write_callback(char* data, size_t size, size_t nmemb, void* user);
};

// Ensures curl_global_init ran exactly once
void ensure_curl_initialized();

} // namespace client
} // namespace netfs

#endif // NETFS_CURL_SESSION_HPP
