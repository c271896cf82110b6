#include "client/local_client.hpp"
#include <algorithm>
#include <cerrno>
#include <fstream>

namespace netfs {
namespace client {

namespace {

constexpr std::size_t CHUNK_SIZE = 64 * 1024;

class LocalReadStream : public ReadStream {
public:
  LocalReadStream(std::ifstream file, uint64_t offset)
    : file_(std::move(file)), position_(offset) {}

  Result<std::size_t> read(char* buffer, std::size_t len) override {
    if (!file_.is_open()) {
      return make_error(ErrorKind::IO_ERROR, ErrorReason::UNSPECIFIED, "Read on a closed stream");
    }
    file_.read(buffer, static_cast<std::streamsize>(len));
    const auto n = static_cast<std::size_t>(file_.gcount());
    if (file_.bad()) {
      return make_error(ErrorKind::IO_ERROR, ErrorReason::UNSPECIFIED, "Local read failed");
    }
    // A short read sets eofbit and failbit; clear them so seek() keeps working
    if (file_.eof()) {
      file_.clear();
    }
    position_ += n;
    return Result<std::size_t>::success(n);
  }

  bool is_seekable() const override { return true; }

  Result<void> seek(uint64_t offset) override {
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offset));
    if (!file_) {
      return make_error(ErrorKind::IO_ERROR, ErrorReason::UNSPECIFIED,
        "Local seek to " + std::to_string(offset) + " failed");
    }
    position_ = offset;
    return Result<void>::success();
  }

  uint64_t position() const override { return position_; }

  void close() override {
    if (file_.is_open()) {
      file_.close();
    }
  }

private:
  std::ifstream file_;
  uint64_t position_;
};

Error from_error_code(const std::error_code& ec, const std::string& context) {
  return error_from_errno(ec.value(), context);
}

} // namespace

int64_t to_epoch_millis(std::filesystem::file_time_type time) {
  using namespace std::chrono;
  const auto system_time = time_point_cast<system_clock::duration>(
    time - std::filesystem::file_time_type::clock::now() + system_clock::now());
  return duration_cast<milliseconds>(system_time.time_since_epoch()).count();
}

FileEntry LocalClient::make_entry(const std::filesystem::directory_entry& entry) {
  std::error_code ec;
  FileEntry result;
  result.name = entry.path().filename().string();
  result.path = entry.path().string();
  result.is_directory = entry.is_directory(ec);
  if (!result.is_directory) {
    const auto size = entry.file_size(ec);
    result.size = ec ? 0 : size;
  }
  const auto mtime = entry.last_write_time(ec);
  result.last_modified = ec ? 0 : to_epoch_millis(mtime);
  return result;
}


//==============================================
// SESSION
//==============================================

Result<void> LocalClient::connect(const ConnectionInfo&, const Credentials&) {
  return Result<void>::success();
}


//==============================================
// QUERY OPERATIONS
//==============================================

Result<std::vector<FileEntry>> LocalClient::list(const std::string& path) {
  std::error_code ec;
  std::filesystem::directory_iterator it(path, ec);
  if (ec) {
    return from_error_code(ec, "Cannot list " + path);
  }

  std::vector<FileEntry> entries;
  for (const auto end = std::filesystem::directory_iterator(); it != end; it.increment(ec)) {
    if (ec) {
      return from_error_code(ec, "Listing " + path + " failed");
    }
    entries.push_back(make_entry(*it));
  }
  if (ec) {
    return from_error_code(ec, "Listing " + path + " failed");
  }
  return Result<std::vector<FileEntry>>::success(std::move(entries));
}

Result<FileEntry> LocalClient::stat(const std::string& path) {
  std::error_code ec;
  std::filesystem::directory_entry entry(path, ec);
  if (ec || !entry.exists(ec)) {
    return make_error(ErrorKind::PROTOCOL_ERROR, ErrorReason::NOT_FOUND, "No such file: " + path);
  }
  return Result<FileEntry>::success(make_entry(entry));
}


//==============================================
// DATA OPERATIONS
//==============================================

Result<std::unique_ptr<ReadStream>> LocalClient::open_read(const std::string& path, uint64_t offset) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return make_error(ErrorKind::PROTOCOL_ERROR, ErrorReason::NOT_FOUND, "No such file: " + path);
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return error_from_errno(errno, "Cannot open " + path);
  }
  if (offset > 0) {
    file.seekg(static_cast<std::streamoff>(offset));
  }

  std::unique_ptr<ReadStream> stream = std::make_unique<LocalReadStream>(std::move(file), offset);
  return Result<std::unique_ptr<ReadStream>>::success(std::move(stream));
}

Result<uint64_t> LocalClient::write(const std::string& path, std::istream& data, uint64_t size,
                                    const ChunkCallback& on_chunk) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    return error_from_errno(errno, "Cannot create " + path);
  }

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
    const auto n = data.gcount();
    if (n <= 0) {
      break;
    }
    file.write(buffer.data(), n);
    if (!file) {
      return error_from_errno(errno == 0 ? EIO : errno, "Write to " + path + " failed");
    }
    written += static_cast<uint64_t>(n);
    if (on_chunk && !on_chunk(written)) {
      return make_error(ErrorKind::CANCELLED, ErrorReason::UNSPECIFIED, "Write to " + path + " cancelled");
    }
  }

  file.close();
  if (!file) {
    return error_from_errno(errno == 0 ? EIO : errno, "Closing " + path + " failed");
  }
  return Result<uint64_t>::success(written);
}


//==============================================
// MUTATING OPERATIONS
//==============================================

Result<void> LocalClient::remove(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::remove(path, ec)) {
    if (ec) {
      return from_error_code(ec, "Cannot delete " + path);
    }
    return make_error(ErrorKind::PROTOCOL_ERROR, ErrorReason::NOT_FOUND, "No such file: " + path);
  }
  return Result<void>::success();
}

Result<void> LocalClient::remove_directory(const std::string& path) {
  std::error_code ec;
  if (std::filesystem::remove_all(path, ec) == static_cast<std::uintmax_t>(-1) || ec) {
    return from_error_code(ec, "Cannot delete directory " + path);
  }
  return Result<void>::success();
}

Result<void> LocalClient::mkdir(const std::string& path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return from_error_code(ec, "Cannot create directory " + path);
  }
  return Result<void>::success();
}

Result<void> LocalClient::rename(const std::string& from, const std::string& to) {
  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if (ec) {
    return from_error_code(ec, "Cannot rename " + from + " to " + to);
  }
  return Result<void>::success();
}

} // namespace client
} // namespace netfs
