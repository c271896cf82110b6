#include "client/smb_client.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <set>
#include <sys/stat.h>
#include <vector>
#include <libsmbclient.h>
#include <boost/log/trivial.hpp>
#include "core/uri.hpp"

namespace netfs {
namespace client {

struct SmbContext {
  SMBCCTX* ctx{nullptr};
  std::string username;
  std::string password;
  std::string domain;
  std::set<SMBCFILE*> open_files;
  bool alive{false};
};

namespace {

constexpr std::size_t CHUNK_SIZE = 64 * 1024;
constexpr uint16_t FILE_ATTRIBUTE_DIRECTORY_BIT = 0x10;

void auth_callback(SMBCCTX* ctx, const char* /*server*/, const char* /*share*/,
                   char* workgroup, int workgroup_len, char* username, int username_len,
                   char* password, int password_len) {
  auto* context = static_cast<SmbContext*>(smbc_getOptionUserData(ctx));
  if (!context) {
    return;
  }
  if (!context->domain.empty()) {
    std::snprintf(workgroup, static_cast<std::size_t>(workgroup_len), "%s", context->domain.c_str());
  }
  std::snprintf(username, static_cast<std::size_t>(username_len), "%s", context->username.c_str());
  std::snprintf(password, static_cast<std::size_t>(password_len), "%s", context->password.c_str());
}

int64_t to_millis(const struct timespec& ts) {
  return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

class SmbReadStream : public ReadStream {
public:
  SmbReadStream(std::shared_ptr<SmbContext> context, SMBCFILE* file, uint64_t offset)
    : context_(std::move(context)), file_(file), position_(offset) {}

  ~SmbReadStream() override { close(); }

  Result<std::size_t> read(char* buffer, std::size_t len) override {
    if (!is_open()) {
      return make_error(ErrorKind::CONNECTION_ERROR, ErrorReason::DISCONNECTED, "SMB handle is closed");
    }
    const ssize_t n = smbc_getFunctionRead(context_->ctx)(context_->ctx, file_, buffer, len);
    if (n < 0) {
      return error_from_errno(errno, "SMB read failed");
    }
    position_ += static_cast<uint64_t>(n);
    return Result<std::size_t>::success(static_cast<std::size_t>(n));
  }

  bool is_seekable() const override { return true; }

  Result<void> seek(uint64_t offset) override {
    if (!is_open()) {
      return make_error(ErrorKind::CONNECTION_ERROR, ErrorReason::DISCONNECTED, "SMB handle is closed");
    }
    const off_t result = smbc_getFunctionLseek(context_->ctx)(context_->ctx, file_,
                                                              static_cast<off_t>(offset), SEEK_SET);
    if (result < 0) {
      return error_from_errno(errno, "SMB seek to " + std::to_string(offset) + " failed");
    }
    position_ = offset;
    return Result<void>::success();
  }

  uint64_t position() const override { return position_; }

  void close() override {
    if (!is_open()) {
      return;
    }
    if (smbc_getFunctionClose(context_->ctx)(context_->ctx, file_) < 0) {
      BOOST_LOG_TRIVIAL(warning) << "SmbClient: Closing file handle failed: " << std::strerror(errno);
    }
    context_->open_files.erase(file_);
    file_ = nullptr;
  }

private:
  bool is_open() const {
    return file_ && context_->alive && context_->open_files.count(file_) > 0;
  }

  std::shared_ptr<SmbContext> context_;
  SMBCFILE* file_;
  uint64_t position_;
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SmbClient::SmbClient(ClientOptions options)
  : options_(std::move(options)) {
}

SmbClient::~SmbClient() {
  disconnect();
}


//==============================================
// SESSION
//==============================================

Result<void> SmbClient::connect(const ConnectionInfo& info, const Credentials& credentials) {
  BOOST_LOG_TRIVIAL(info) << "SmbClient: Connecting to " << info.key() << " as "
                          << (credentials.domain.empty() ? "" : credentials.domain + "\\") << credentials.username;
  disconnect();
  info_ = info;

  auto context = std::make_shared<SmbContext>();
  context->username = credentials.username;
  context->password = credentials.password;
  context->domain = credentials.domain;

  SMBCCTX* ctx = smbc_new_context();
  if (!ctx) {
    return error_from_errno(errno, "Cannot allocate SMB context");
  }

  smbc_setOptionUserData(ctx, context.get());
  smbc_setFunctionAuthDataWithContext(ctx, &auth_callback);
  smbc_setOptionNoAutoAnonymousLogin(ctx, 1);
  smbc_setTimeout(ctx, static_cast<int>(
    std::chrono::duration_cast<std::chrono::milliseconds>(options_.connect_timeout).count()));

  if (!smbc_init_context(ctx)) {
    const int err = errno;
    smbc_free_context(ctx, 1);
    return error_from_errno(err, "Cannot initialize SMB context");
  }

  context->ctx = ctx;
  context->alive = true;
  context_ = context;

  // Opening the share root performs negotiation, session setup and tree connect
  SMBCFILE* dir = smbc_getFunctionOpendir(ctx)(ctx, url_for("/").c_str());
  if (!dir) {
    const int err = errno;
    Error error = error_from_errno(err, "Cannot connect to " + info.key());
    if (err == EACCES || err == EPERM) {
      error.kind = ErrorKind::CONNECTION_ERROR;
      error.reason = ErrorReason::AUTH_FAILED;
    }
    BOOST_LOG_TRIVIAL(error) << "SmbClient: " << error.to_string();
    disconnect();
    return error;
  }
  smbc_getFunctionClosedir(ctx)(ctx, dir);

  smbc_setTimeout(ctx, static_cast<int>(
    std::chrono::duration_cast<std::chrono::milliseconds>(options_.io_timeout).count()));

  BOOST_LOG_TRIVIAL(info) << "SmbClient: Connected to " << info.key();
  return Result<void>::success();
}

bool SmbClient::is_connected() const {
  return context_ && context_->alive;
}

void SmbClient::disconnect() {
  if (!context_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "SmbClient: Disconnecting from " << info_.key();
  SMBCCTX* ctx = context_->ctx;

  if (ctx) {
    // Step 1: file handles
    for (SMBCFILE* file : context_->open_files) {
      if (smbc_getFunctionClose(ctx)(ctx, file) < 0) {
        BOOST_LOG_TRIVIAL(warning) << "SmbClient: Closing file handle failed: " << std::strerror(errno);
      }
    }
    context_->open_files.clear();
    BOOST_LOG_TRIVIAL(debug) << "SmbClient: File handles closed";

    // Step 2: tree connects and sessions
    if (smbc_getFunctionPurgeCachedServers(ctx)(ctx) != 0) {
      BOOST_LOG_TRIVIAL(warning) << "SmbClient: Purging cached sessions failed";
    } else {
      BOOST_LOG_TRIVIAL(debug) << "SmbClient: Sessions closed";
    }

    // Step 3: transport
    if (smbc_free_context(ctx, 1) != 0) {
      BOOST_LOG_TRIVIAL(warning) << "SmbClient: Freeing context failed: " << std::strerror(errno);
    } else {
      BOOST_LOG_TRIVIAL(debug) << "SmbClient: Transport closed";
    }
  }

  context_->ctx = nullptr;
  context_->alive = false;
  context_.reset();
}

Result<void> SmbClient::test_connection() {
  auto root = stat("/");
  if (!root.ok()) {
    return root.error();
  }
  return Result<void>::success();
}


//==============================================
// QUERY OPERATIONS
//==============================================

Result<std::vector<FileEntry>> SmbClient::list(const std::string& path) {
  if (auto ready = require_context("Listing " + path); !ready.ok()) {
    return ready.error();
  }

  SMBCCTX* ctx = context_->ctx;
  SMBCFILE* dir = smbc_getFunctionOpendir(ctx)(ctx, url_for(path).c_str());
  if (!dir) {
    return fail(errno, "Cannot list " + path);
  }

  std::vector<FileEntry> entries;
  errno = 0;
  while (const struct libsmb_file_info* info = smbc_getFunctionReaddirPlus(ctx)(ctx, dir)) {
    const std::string name = info->name ? info->name : "";
    if (name.empty() || name == "." || name == "..") {
      continue;
    }
    FileEntry entry;
    entry.name = name;
    entry.path = join_path(path, name);
    entry.is_directory = (info->attrs & FILE_ATTRIBUTE_DIRECTORY_BIT) != 0;
    entry.size = entry.is_directory ? 0 : info->size;
    entry.last_modified = to_millis(info->mtime_ts);
    entries.push_back(std::move(entry));
  }
  const int err = errno;
  smbc_getFunctionClosedir(ctx)(ctx, dir);

  if (err != 0 && err != ENOENT) {
    return fail(err, "Listing " + path + " failed");
  }
  return Result<std::vector<FileEntry>>::success(std::move(entries));
}

Result<FileEntry> SmbClient::stat(const std::string& path) {
  if (auto ready = require_context("Stat " + path); !ready.ok()) {
    return ready.error();
  }

  struct stat st {};
  if (smbc_getFunctionStat(context_->ctx)(context_->ctx, url_for(path).c_str(), &st) < 0) {
    return fail(errno, "Cannot stat " + path);
  }

  FileEntry entry;
  entry.name = file_name_of(path);
  entry.path = path;
  entry.is_directory = S_ISDIR(st.st_mode);
  entry.size = entry.is_directory ? 0 : static_cast<uint64_t>(st.st_size);
  entry.last_modified = static_cast<int64_t>(st.st_mtime) * 1000;
  return Result<FileEntry>::success(entry);
}


//==============================================
// DATA OPERATIONS
//==============================================

Result<std::unique_ptr<ReadStream>> SmbClient::open_read(const std::string& path, uint64_t offset) {
  if (auto ready = require_context("Reading " + path); !ready.ok()) {
    return ready.error();
  }

  SMBCCTX* ctx = context_->ctx;
  SMBCFILE* file = smbc_getFunctionOpen(ctx)(ctx, url_for(path).c_str(), O_RDONLY, 0);
  if (!file) {
    return fail(errno, "Cannot open " + path);
  }
  context_->open_files.insert(file);

  auto stream = std::make_unique<SmbReadStream>(context_, file, 0);
  if (offset > 0) {
    if (auto positioned = stream->seek(offset); !positioned.ok()) {
      stream->close();
      return positioned.error();
    }
  }
  std::unique_ptr<ReadStream> result = std::move(stream);
  return Result<std::unique_ptr<ReadStream>>::success(std::move(result));
}

Result<uint64_t> SmbClient::write(const std::string& path, std::istream& data, uint64_t size,
                                  const ChunkCallback& on_chunk) {
  if (auto ready = require_context("Writing " + path); !ready.ok()) {
    return ready.error();
  }

  SMBCCTX* ctx = context_->ctx;
  SMBCFILE* file = smbc_getFunctionOpen(ctx)(ctx, url_for(path).c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (!file) {
    return fail(errno, "Cannot create " + path);
  }
  context_->open_files.insert(file);

  auto close_file = [this, ctx, file]() {
    context_->open_files.erase(file);
    return smbc_getFunctionClose(ctx)(ctx, file);
  };

  std::vector<char> buffer(CHUNK_SIZE);
  uint64_t written = 0;
  for (;;) {
    std::size_t want = buffer.size();
    if (size > 0) {
      if (written >= size) {
        break;
      }
      want = static_cast<std::size_t>(std::min<uint64_t>(want, size - written));
    }
    data.read(buffer.data(), static_cast<std::streamsize>(want));
    const auto n = static_cast<std::size_t>(data.gcount());
    if (n == 0) {
      break;
    }

    std::size_t offset = 0;
    while (offset < n) {
      const ssize_t w = smbc_getFunctionWrite(ctx)(ctx, file, buffer.data() + offset, n - offset);
      if (w < 0) {
        const int err = errno;
        close_file();
        return fail(err, "Write to " + path + " failed");
      }
      offset += static_cast<std::size_t>(w);
    }
    written += n;

    if (on_chunk && !on_chunk(written)) {
      close_file();
      return make_error(ErrorKind::CANCELLED, ErrorReason::UNSPECIFIED, "Write to " + path + " cancelled");
    }
  }

  if (close_file() < 0) {
    return fail(errno, "Closing " + path + " failed");
  }
  return Result<uint64_t>::success(written);
}


//==============================================
// MUTATING OPERATIONS
//==============================================

Result<void> SmbClient::remove(const std::string& path) {
  if (auto ready = require_context("Deleting " + path); !ready.ok()) {
    return ready;
  }
  if (smbc_getFunctionUnlink(context_->ctx)(context_->ctx, url_for(path).c_str()) < 0) {
    return fail(errno, "Cannot delete " + path);
  }
  return Result<void>::success();
}

Result<void> SmbClient::remove_directory(const std::string& path) {
  if (auto ready = require_context("Deleting directory " + path); !ready.ok()) {
    return ready;
  }
  if (smbc_getFunctionRmdir(context_->ctx)(context_->ctx, url_for(path).c_str()) < 0) {
    return fail(errno, "Cannot delete directory " + path);
  }
  return Result<void>::success();
}

Result<void> SmbClient::mkdir(const std::string& path) {
  if (auto ready = require_context("Creating directory " + path); !ready.ok()) {
    return ready;
  }
  if (smbc_getFunctionMkdir(context_->ctx)(context_->ctx, url_for(path).c_str(), 0755) < 0) {
    if (errno == EEXIST) {
      return Result<void>::success();
    }
    return fail(errno, "Cannot create directory " + path);
  }
  return Result<void>::success();
}

Result<void> SmbClient::rename(const std::string& from, const std::string& to) {
  if (auto ready = require_context("Renaming " + from); !ready.ok()) {
    return ready;
  }
  SMBCCTX* ctx = context_->ctx;
  if (smbc_getFunctionRename(ctx)(ctx, url_for(from).c_str(), ctx, url_for(to).c_str()) < 0) {
    return fail(errno, "Cannot rename " + from + " to " + to);
  }
  return Result<void>::success();
}


//==============================================
// INTERNAL HELPERS
//==============================================

std::string SmbClient::url_for(const std::string& path) const {
  std::string url = "smb://" + info_.host;
  if (info_.port != 0 && info_.port != default_port(Protocol::SMB)) {
    url += ":" + std::to_string(info_.port);
  }
  url += "/" + percent_encode_path(info_.share);
  if (!path.empty() && path != "/") {
    url += percent_encode_path(path);
  }
  return url;
}

Result<void> SmbClient::require_context(const std::string& context) const {
  if (!context_ || !context_->alive) {
    return make_error(ErrorKind::CONNECTION_ERROR, ErrorReason::DISCONNECTED,
      context + ": not connected to " + info_.key());
  }
  return Result<void>::success();
}

Error SmbClient::fail(int err, const std::string& context) {
  Error error = error_from_errno(err, context);
  if (error.is_connection_error() && context_) {
    BOOST_LOG_TRIVIAL(warning) << "SmbClient: Transport failure on " << info_.key() << ": " << error.to_string();
    context_->alive = false;
  }
  return error;
}

} // namespace client
} // namespace netfs
