#include "client/ftp_client.hpp"
#include <boost/log/trivial.hpp>
#include "client/listing_parser.hpp"

namespace netfs {
namespace client {

FtpClient::FtpClient(ClientOptions options)
  : CurlClient(Protocol::FTP, std::move(options), "FtpClient") {
}

Result<std::vector<FileEntry>> FtpClient::list_directory(const std::string& path) {
  if (mlsd_supported_) {
    auto text = fetch_listing(path, "MLSD");
    if (text.ok()) {
      return Result<std::vector<FileEntry>>::success(parse_mlsd_listing(text.value(), path));
    }
    // 500/502 replies mean the command is unknown, anything else is real
    const long reply = session_->last_response_code();
    if (reply != 500 && reply != 502 && reply != 504) {
      return text.error();
    }
    BOOST_LOG_TRIVIAL(info) << "FtpClient: " << info_.endpoint() << " does not support MLSD, using LIST";
    mlsd_supported_ = false;
  }

  auto text = fetch_listing(path, nullptr);
  if (!text.ok()) {
    return text.error();
  }
  return Result<std::vector<FileEntry>>::success(parse_unix_listing(text.value(), path));
}

std::vector<std::string> FtpClient::delete_commands(const std::string& path) const {
  return {"DELE " + path};
}

std::vector<std::string> FtpClient::remove_directory_commands(const std::string& path) const {
  return {"RMD " + path};
}

std::vector<std::string> FtpClient::mkdir_commands(const std::string& path) const {
  return {"MKD " + path};
}

std::vector<std::string> FtpClient::rename_commands(const std::string& from, const std::string& to) const {
  return {"RNFR " + from, "RNTO " + to};
}

} // namespace client
} // namespace netfs
