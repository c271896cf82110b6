#include "network/remote_file_system.hpp"
#include <cerrno>
#include <fstream>
#include <boost/log/trivial.hpp>

namespace netfs {
namespace network {

namespace {
constexpr std::size_t CHUNK_SIZE = 64 * 1024;
}

RemoteFileSystem::RemoteFileSystem(pool::ConnectionPool& pool, const credentials::CredentialStore& credentials)
  : pool_(pool)
  , credentials_(credentials)
  , local_(pool.factory().create(Protocol::LOCAL)) {
  if (!local_) {
    local_ = std::make_unique<client::LocalClient>();
  }
}


//==============================================
// QUERY OPERATIONS
//==============================================

Result<std::vector<FileEntry>> RemoteFileSystem::list(const RemoteUri& uri) {
  BOOST_LOG_TRIVIAL(debug) << "RemoteFileSystem: Listing " << uri.to_string();
  return run(uri, [&uri](client::RemoteFileClient& client) { return client.list(uri.path); });
}

Result<FileEntry> RemoteFileSystem::stat(const RemoteUri& uri) {
  return run(uri, [&uri](client::RemoteFileClient& client) { return client.stat(uri.path); });
}

Result<bool> RemoteFileSystem::exists(const RemoteUri& uri) {
  return run(uri, [&uri](client::RemoteFileClient& client) { return client.exists(uri.path); });
}

Result<void> RemoteFileSystem::test_connection(const RemoteUri& uri) {
  BOOST_LOG_TRIVIAL(info) << "RemoteFileSystem: Testing connection to " << uri.connection_info().key();
  return run(uri, [](client::RemoteFileClient& client) { return client.test_connection(); });
}


//==============================================
// DATA OPERATIONS
//==============================================

Result<std::size_t> RemoteFileSystem::read_range(const RemoteUri& uri, uint64_t offset,
                                                 char* buffer, std::size_t length) {
  return run(uri, [&](client::RemoteFileClient& client) {
    return client.read_range(uri.path, offset, buffer, length);
  });
}

Result<uint64_t> RemoteFileSystem::download(const RemoteUri& source, const std::filesystem::path& target,
                                            const ChunkCallback& on_chunk) {
  BOOST_LOG_TRIVIAL(info) << "RemoteFileSystem: Downloading " << source.to_string() << " to " << target;

  std::ofstream out(target, std::ios::binary | std::ios::trunc);
  if (!out) {
    return error_from_errno(errno, "Cannot create " + target.string());
  }

  auto copied = run(source, [&](client::RemoteFileClient& client) -> Result<uint64_t> {
    auto stream = client.open_read(source.path, 0);
    if (!stream.ok()) {
      return stream.error();
    }

    std::vector<char> buffer(CHUNK_SIZE);
    uint64_t total = 0;
    for (;;) {
      auto n = stream.value()->read(buffer.data(), buffer.size());
      if (!n.ok()) {
        stream.value()->close();
        return n.error();
      }
      if (n.value() == 0) {
        break;
      }
      out.write(buffer.data(), static_cast<std::streamsize>(n.value()));
      if (!out) {
        stream.value()->close();
        return error_from_errno(errno == 0 ? EIO : errno, "Write to " + target.string() + " failed");
      }
      total += n.value();
      if (on_chunk && !on_chunk(total)) {
        stream.value()->close();
        return make_error(ErrorKind::CANCELLED, ErrorReason::UNSPECIFIED,
          "Download of " + source.to_string() + " cancelled");
      }
    }
    stream.value()->close();
    return Result<uint64_t>::success(total);
  });

  out.close();
  if (copied.ok() && !out) {
    return error_from_errno(errno == 0 ? EIO : errno, "Closing " + target.string() + " failed");
  }
  return copied;
}

Result<uint64_t> RemoteFileSystem::upload(const std::filesystem::path& source, const RemoteUri& target,
                                          const ChunkCallback& on_chunk) {
  BOOST_LOG_TRIVIAL(info) << "RemoteFileSystem: Uploading " << source << " to " << target.to_string();

  std::error_code ec;
  const auto size = std::filesystem::file_size(source, ec);
  if (ec) {
    return error_from_errno(ec.value(), "Cannot read " + source.string());
  }

  std::ifstream in(source, std::ios::binary);
  if (!in) {
    return error_from_errno(errno, "Cannot open " + source.string());
  }

  return run(target, [&](client::RemoteFileClient& client) {
    return client.write(target.path, in, size, on_chunk);
  });
}


//==============================================
// MUTATING OPERATIONS
//==============================================

Result<void> RemoteFileSystem::remove(const RemoteUri& uri) {
  BOOST_LOG_TRIVIAL(info) << "RemoteFileSystem: Deleting " << uri.to_string();
  return run(uri, [&uri](client::RemoteFileClient& client) -> Result<void> {
    auto entry = client.stat(uri.path);
    if (!entry.ok()) {
      return entry.error();
    }
    if (entry.value().is_directory) {
      return remove_tree(client, uri.path);
    }
    return client.remove(uri.path);
  });
}

Result<void> RemoteFileSystem::mkdir(const RemoteUri& uri) {
  BOOST_LOG_TRIVIAL(info) << "RemoteFileSystem: Creating directory " << uri.to_string();
  return run(uri, [&uri](client::RemoteFileClient& client) { return client.mkdir(uri.path); });
}

Result<void> RemoteFileSystem::rename(const RemoteUri& from, const RemoteUri& to) {
  if (from.protocol != to.protocol || !from.same_connection(to)) {
    return make_error(ErrorKind::VALIDATION_ERROR, ErrorReason::UNSUPPORTED,
      "Rename needs both paths on one connection: " + from.to_string() + " -> " + to.to_string());
  }
  BOOST_LOG_TRIVIAL(info) << "RemoteFileSystem: Renaming " << from.to_string() << " to " << to.path;
  return run(from, [&](client::RemoteFileClient& client) { return client.rename(from.path, to.path); });
}

Result<void> RemoteFileSystem::remove_tree(client::RemoteFileClient& client, const std::string& path) {
  if (client.protocol() == Protocol::LOCAL) {
    return client.remove_directory(path);
  }

  auto entries = client.list(path);
  if (!entries.ok()) {
    return entries.error();
  }
  for (const auto& entry : entries.value()) {
    auto removed = entry.is_directory ? remove_tree(client, entry.path) : client.remove(entry.path);
    if (!removed.ok()) {
      return removed;
    }
  }
  return client.remove_directory(path);
}

} // namespace network
} // namespace netfs
