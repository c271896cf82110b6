#include <gtest/gtest.h>
#include <cerrno>
#include "transfer/transfer_dispatcher.hpp"
#include "test_utils.hpp"

using namespace netfs;
using namespace netfs::transfer;

namespace {

// Claims local to local copies ahead of the built-in strategy
class RecordingStrategy : public TransferStrategy {
public:
  const char* name() const override { return "recording"; }
  bool supports(Protocol source, Protocol destination) const override {
    return source == Protocol::LOCAL && destination == Protocol::LOCAL;
  }
  Result<TransferOutcome> copy(const TransferRequest& request) override {
    ++copies;
    TransferOutcome outcome;
    outcome.destination = request.destination;
    return Result<TransferOutcome>::success(outcome);
  }
  Result<TransferOutcome> move(const TransferRequest& request) override { return copy(request); }

  int copies{0};
};

// Local disk where the move source sits on another file system
class CrossDeviceClient : public client::LocalClient {
public:
  CrossDeviceClient(std::string foreign, bool removable)
    : foreign_(std::move(foreign)), removable_(removable) {}

  Result<void> rename(const std::string& from, const std::string& to) override {
    if (from == foreign_) {
      return error_from_errno(EXDEV, "Cannot rename " + from + " to " + to);
    }
    return client::LocalClient::rename(from, to);
  }

  Result<void> remove(const std::string& path) override {
    if (path == foreign_ && !removable_) {
      return error_from_errno(EACCES, "Cannot delete " + path);
    }
    return client::LocalClient::remove(path);
  }

private:
  std::string foreign_;
  bool removable_;
};

} // namespace

class TransferDispatcherTest : public ::testing::Test {
protected:
  TempDir dir{"transfer_dispatcher_test"};
  std::shared_ptr<FakeServer> sftp_server;
  std::shared_ptr<FakeServer> ftp_server;
  client::ClientFactory factory;
  credentials::InMemoryCredentialStore store;
  std::unique_ptr<pool::ConnectionPool> pool;
  std::unique_ptr<network::RemoteFileSystem> fs;
  std::unique_ptr<cache::UnifiedFileCache> cache;
  std::unique_ptr<TransferDispatcher> dispatcher;

  void SetUp() override {
    quiet_logging();
    for (const char* sub : {"sftp", "ftp", "local", "tmp"}) {
      std::filesystem::create_directories(dir / sub);
    }
    sftp_server = std::make_shared<FakeServer>(dir / "sftp");
    ftp_server = std::make_shared<FakeServer>(dir / "ftp");
    use_fake_server(factory, Protocol::SFTP, sftp_server, false);
    use_fake_server(factory, Protocol::FTP, ftp_server, false);
    store.add(make_credentials("files", Protocol::SFTP, "files.local"));
    store.add(make_credentials("pub", Protocol::FTP, "ftp.local"));

    pool = std::make_unique<pool::ConnectionPool>(factory, std::chrono::seconds(30));
    fs = std::make_unique<network::RemoteFileSystem>(*pool, store);
    cache = std::make_unique<cache::UnifiedFileCache>(dir / "cache");

    TransferOptions options;
    options.temp_dir = dir / "tmp";
    options.progress_step_bytes = 1024;
    dispatcher = std::make_unique<TransferDispatcher>(*fs, cache.get(), options);
  }

  // Rebuilds the file system so local paths go through client
  void use_cross_device_disk(const std::filesystem::path& foreign, bool removable) {
    const std::string path = foreign.string();
    factory.register_creator(Protocol::LOCAL, [path, removable](const client::ClientOptions&) {
      return std::unique_ptr<client::RemoteFileClient>(std::make_unique<CrossDeviceClient>(path, removable));
    });
    fs = std::make_unique<network::RemoteFileSystem>(*pool, store);
    TransferOptions options;
    options.temp_dir = dir / "tmp";
    options.progress_step_bytes = 1024;
    dispatcher = std::make_unique<TransferDispatcher>(*fs, cache.get(), options);
  }

  void TearDown() override {
    dispatcher.reset();
    pool->shutdown();
  }

  RemoteUri local(const std::string& name) const {
    return parse((dir / "local" / name).string());
  }

  static RemoteUri parse(const std::string& text) {
    auto uri = RemoteUri::parse(text);
    EXPECT_TRUE(uri.ok()) << text;
    return uri.ok() ? uri.value() : RemoteUri{};
  }

  static TransferRequest request(const RemoteUri& source, const RemoteUri& destination, bool overwrite = false) {
    TransferRequest result;
    result.source = source;
    result.destination = destination;
    result.overwrite = overwrite;
    return result;
  }

  static bool has_part_files(const std::filesystem::path& root) {
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
      if (entry.path().string().find(StrategyBase::PART_SUFFIX) != std::string::npos) {
        return true;
      }
    }
    return false;
  }
};

TEST_F(TransferDispatcherTest, SelectsStrategyPerProtocolPair) {
  auto pick = [this](Protocol source, Protocol destination) -> std::string {
    auto strategy = dispatcher->select(source, destination);
    return strategy.ok() ? strategy.value()->name() : "none";
  };

  const std::string local = pick(Protocol::LOCAL, Protocol::LOCAL);
  const std::string upload = pick(Protocol::LOCAL, Protocol::SFTP);
  const std::string download = pick(Protocol::SMB, Protocol::LOCAL);
  const std::string same = pick(Protocol::FTP, Protocol::FTP);
  const std::string cross = pick(Protocol::SFTP, Protocol::SMB);

  EXPECT_NE(local, "none");
  EXPECT_NE(upload, local);
  EXPECT_NE(download, upload);
  EXPECT_NE(same, download);
  EXPECT_NE(cross, same);
  EXPECT_EQ(pick(Protocol::DOCUMENT_TREE, Protocol::LOCAL), download);
  EXPECT_EQ(pick(Protocol::SMB, Protocol::DOCUMENT_TREE), cross);
  EXPECT_TRUE(dispatcher->supports(Protocol::LOCAL, Protocol::DOCUMENT_TREE));
}

TEST_F(TransferDispatcherTest, RegisteredStrategyTakesPrecedence) {
  auto custom = std::make_unique<RecordingStrategy>();
  auto* recording = custom.get();
  dispatcher->register_strategy(std::move(custom));

  write_file(dir / "local" / "a.txt", "abc");
  auto outcome = dispatcher->copy(request(local("a.txt"), local("b.txt")));
  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(recording->copies, 1);
  EXPECT_FALSE(std::filesystem::exists(dir / "local" / "b.txt"));
}

TEST_F(TransferDispatcherTest, CopyWithoutOverwriteLeavesDestinationUntouched) {
  write_file(dir / "local" / "src.bin", make_content(5000, 'a'));
  write_file(dir / "local" / "dst.bin", "existing");

  auto refused = dispatcher->copy(request(local("src.bin"), local("dst.bin"), false));
  ASSERT_FALSE(refused.ok());
  EXPECT_EQ(refused.error().reason, ErrorReason::DESTINATION_EXISTS);
  EXPECT_EQ(read_file(dir / "local" / "dst.bin"), "existing");

  auto replaced = dispatcher->copy(request(local("src.bin"), local("dst.bin"), true));
  ASSERT_TRUE(replaced.ok()) << replaced.error().to_string();
  EXPECT_EQ(replaced.value().status, TransferStatus::SUCCESS);
  EXPECT_EQ(replaced.value().bytes_transferred, 5000u);
  EXPECT_EQ(read_file(dir / "local" / "dst.bin"), make_content(5000, 'a'));
  EXPECT_FALSE(has_part_files(dir.path()));
}

TEST_F(TransferDispatcherTest, OverwriteOnRemoteDestination) {
  write_file(dir / "local" / "src.bin", make_content(3000, 'k'));
  write_file(dir / "sftp" / "dst.bin", "old remote bytes");

  auto refused = dispatcher->copy(request(local("src.bin"), parse("sftp://files.local/dst.bin")));
  ASSERT_FALSE(refused.ok());
  EXPECT_EQ(read_file(dir / "sftp" / "dst.bin"), "old remote bytes");

  auto replaced = dispatcher->copy(request(local("src.bin"), parse("sftp://files.local/dst.bin"), true));
  ASSERT_TRUE(replaced.ok()) << replaced.error().to_string();
  EXPECT_EQ(read_file(dir / "sftp" / "dst.bin"), make_content(3000, 'k'));
  EXPECT_FALSE(has_part_files(dir.path()));
}

TEST_F(TransferDispatcherTest, DownloadToLocal) {
  write_file(dir / "sftp" / "photos" / "img.jpg", make_content(70000, 'p'));

  auto outcome = dispatcher->copy(request(parse("sftp://files.local/photos/img.jpg"), local("img.jpg")));
  ASSERT_TRUE(outcome.ok()) << outcome.error().to_string();
  EXPECT_EQ(read_file(dir / "local" / "img.jpg"), make_content(70000, 'p'));
  EXPECT_TRUE(std::filesystem::exists(dir / "sftp" / "photos" / "img.jpg"));
}

TEST_F(TransferDispatcherTest, DownloadPrefersCachedCopy) {
  const auto source = parse("sftp://files.local/movie.mkv");
  write_file(dir / "sftp" / "movie.mkv", make_content(2048, 'r'));
  write_file(dir / "staged.bin", make_content(2048, 'c'));
  ASSERT_TRUE(cache->put_file(source.location(), 2048, dir / "staged.bin").ok());

  const int opens_before = sftp_server->open_reads;
  auto outcome = dispatcher->copy(request(source, local("movie.mkv")));
  ASSERT_TRUE(outcome.ok()) << outcome.error().to_string();
  EXPECT_EQ(read_file(dir / "local" / "movie.mkv"), make_content(2048, 'c'));
  EXPECT_EQ(sftp_server->open_reads.load(), opens_before);
}

TEST_F(TransferDispatcherTest, CrossProtocolCopyReportsBothLegs) {
  write_file(dir / "sftp" / "doc.pdf", make_content(10000, 'd'));

  TransferProgress last;
  int reports = 0;
  auto req = request(parse("sftp://files.local/doc.pdf"), parse("ftp://ftp.local/doc.pdf"));
  req.progress = [&](const TransferProgress& p) {
    last = p;
    ++reports;
    return true;
  };

  auto outcome = dispatcher->copy(req);
  ASSERT_TRUE(outcome.ok()) << outcome.error().to_string();
  EXPECT_EQ(read_file(dir / "ftp" / "doc.pdf"), make_content(10000, 'd'));
  EXPECT_GT(reports, 0);
  EXPECT_EQ(last.total_bytes, 20000u);
  EXPECT_EQ(last.bytes_transferred, 20000u);
  EXPECT_TRUE(std::filesystem::is_empty(dir / "tmp"));
}

TEST_F(TransferDispatcherTest, CrossProtocolMoveFlagsUndeletableSource) {
  write_file(dir / "sftp" / "keep.bin", make_content(4000, 'q'));
  sftp_server->fail_remove_of("/keep.bin");

  auto outcome = dispatcher->move(request(parse("sftp://files.local/keep.bin"), parse("ftp://ftp.local/keep.bin")));
  ASSERT_TRUE(outcome.ok()) << outcome.error().to_string();
  EXPECT_EQ(outcome.value().status, TransferStatus::PARTIAL_SUCCESS);
  EXPECT_TRUE(outcome.value().source_cleanup_pending);
  ASSERT_TRUE(outcome.value().cleanup_error.has_value());
  EXPECT_EQ(outcome.value().cleanup_error->reason, ErrorReason::PERMISSION_DENIED);

  EXPECT_EQ(read_file(dir / "ftp" / "keep.bin"), make_content(4000, 'q'));
  EXPECT_TRUE(std::filesystem::exists(dir / "sftp" / "keep.bin"));
}

TEST_F(TransferDispatcherTest, CrossProtocolMoveDeletesSource) {
  write_file(dir / "ftp" / "a.txt", "payload");

  auto outcome = dispatcher->move(request(parse("ftp://ftp.local/a.txt"), parse("sftp://files.local/a.txt")));
  ASSERT_TRUE(outcome.ok()) << outcome.error().to_string();
  EXPECT_EQ(outcome.value().status, TransferStatus::SUCCESS);
  EXPECT_FALSE(outcome.value().server_side);
  EXPECT_FALSE(std::filesystem::exists(dir / "ftp" / "a.txt"));
  EXPECT_EQ(read_file(dir / "sftp" / "a.txt"), "payload");
}

TEST_F(TransferDispatcherTest, SameConnectionMoveIsServerRename) {
  write_file(dir / "sftp" / "in" / "clip.mp4", make_content(9000));
  std::filesystem::create_directories(dir / "sftp" / "out");

  const int opens_before = sftp_server->open_reads;
  auto outcome = dispatcher->move(request(parse("sftp://files.local/in/clip.mp4"),
                                          parse("sftp://files.local/out/clip.mp4")));
  ASSERT_TRUE(outcome.ok()) << outcome.error().to_string();
  EXPECT_TRUE(outcome.value().server_side);
  EXPECT_EQ(sftp_server->open_reads.load(), opens_before);
  EXPECT_FALSE(std::filesystem::exists(dir / "sftp" / "in" / "clip.mp4"));
  EXPECT_EQ(read_file(dir / "sftp" / "out" / "clip.mp4"), make_content(9000));
}

TEST_F(TransferDispatcherTest, LocalMoveRenames) {
  write_file(dir / "local" / "from.txt", "x");
  auto outcome = dispatcher->move(request(local("from.txt"), local("to.txt")));
  ASSERT_TRUE(outcome.ok());
  EXPECT_TRUE(outcome.value().server_side);
  EXPECT_FALSE(std::filesystem::exists(dir / "local" / "from.txt"));
  EXPECT_EQ(read_file(dir / "local" / "to.txt"), "x");
}

TEST_F(TransferDispatcherTest, CrossDeviceMoveCopiesThenDeletes) {
  use_cross_device_disk(dir / "local" / "from.bin", true);
  write_file(dir / "local" / "from.bin", make_content(5000));
  write_file(dir / "local" / "to.bin", "old");

  auto outcome = dispatcher->move(request(local("from.bin"), local("to.bin"), true));
  ASSERT_TRUE(outcome.ok()) << outcome.error().to_string();
  EXPECT_EQ(outcome.value().status, TransferStatus::SUCCESS);
  EXPECT_FALSE(outcome.value().server_side);
  EXPECT_EQ(outcome.value().bytes_transferred, 5000u);
  EXPECT_EQ(read_file(dir / "local" / "to.bin"), make_content(5000));
  EXPECT_FALSE(std::filesystem::exists(dir / "local" / "from.bin"));
  EXPECT_FALSE(has_part_files(dir / "local"));
}

TEST_F(TransferDispatcherTest, CrossDeviceMoveFlagsUndeletableSource) {
  use_cross_device_disk(dir / "local" / "from.bin", false);
  write_file(dir / "local" / "from.bin", make_content(5000));

  auto outcome = dispatcher->move(request(local("from.bin"), local("to.bin")));
  ASSERT_TRUE(outcome.ok()) << outcome.error().to_string();
  EXPECT_EQ(outcome.value().status, TransferStatus::PARTIAL_SUCCESS);
  EXPECT_TRUE(outcome.value().source_cleanup_pending);
  ASSERT_TRUE(outcome.value().cleanup_error.has_value());
  EXPECT_EQ(outcome.value().cleanup_error->reason, ErrorReason::PERMISSION_DENIED);
  EXPECT_EQ(read_file(dir / "local" / "to.bin"), make_content(5000));
  EXPECT_TRUE(std::filesystem::exists(dir / "local" / "from.bin"));
}

TEST_F(TransferDispatcherTest, CancelledUploadLeavesNothingBehind) {
  write_file(dir / "local" / "big.bin", make_content(300 * 1024));

  auto req = request(local("big.bin"), parse("sftp://files.local/big.bin"));
  req.progress = [](const TransferProgress&) { return false; };

  auto outcome = dispatcher->copy(req);
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.error().kind, ErrorKind::CANCELLED);
  EXPECT_FALSE(std::filesystem::exists(dir / "sftp" / "big.bin"));
  EXPECT_FALSE(has_part_files(dir / "sftp"));
}

TEST_F(TransferDispatcherTest, RejectsDirectoriesAndSelfCopies) {
  std::filesystem::create_directories(dir / "local" / "folder");
  write_file(dir / "local" / "same.txt", "s");

  auto folder = dispatcher->copy(request(local("folder"), local("folder2")));
  ASSERT_FALSE(folder.ok());
  EXPECT_EQ(folder.error().kind, ErrorKind::VALIDATION_ERROR);

  auto self = dispatcher->copy(request(local("same.txt"), local("same.txt"), true));
  ASSERT_FALSE(self.ok());
  EXPECT_EQ(read_file(dir / "local" / "same.txt"), "s");

  auto missing = dispatcher->copy(request(local("absent.txt"), local("copy.txt")));
  ASSERT_FALSE(missing.ok());
  EXPECT_EQ(missing.error().reason, ErrorReason::NOT_FOUND);
}

TEST_F(TransferDispatcherTest, RenameWithinDirectory) {
  write_file(dir / "sftp" / "a.txt", "1");
  write_file(dir / "sftp" / "b.txt", "2");

  auto renamed = dispatcher->rename(parse("sftp://files.local/a.txt"), "c.txt");
  ASSERT_TRUE(renamed.ok()) << renamed.error().to_string();
  EXPECT_EQ(renamed.value().path, "/c.txt");
  EXPECT_EQ(read_file(dir / "sftp" / "c.txt"), "1");

  auto taken = dispatcher->rename(parse("sftp://files.local/c.txt"), "b.txt");
  ASSERT_FALSE(taken.ok());
  EXPECT_EQ(taken.error().reason, ErrorReason::DESTINATION_EXISTS);

  auto invalid = dispatcher->rename(parse("sftp://files.local/c.txt"), "x/y.txt");
  ASSERT_FALSE(invalid.ok());
  EXPECT_EQ(invalid.error().kind, ErrorKind::VALIDATION_ERROR);
}

TEST_F(TransferDispatcherTest, MoveToTrashAvoidsNameClashes) {
  write_file(dir / "ftp" / "music" / "song.mp3", "first");
  const auto root = parse("ftp://ftp.local/music");

  auto first = dispatcher->move_to_trash(parse("ftp://ftp.local/music/song.mp3"), root);
  ASSERT_TRUE(first.ok()) << first.error().to_string();
  EXPECT_EQ(first.value().path, "/music/.trash/song.mp3");
  EXPECT_EQ(read_file(dir / "ftp" / "music" / ".trash" / "song.mp3"), "first");

  write_file(dir / "ftp" / "music" / "song.mp3", "second");
  auto second = dispatcher->move_to_trash(parse("ftp://ftp.local/music/song.mp3"), root);
  ASSERT_TRUE(second.ok()) << second.error().to_string();
  EXPECT_NE(second.value().path, first.value().path);
  EXPECT_EQ(read_file(dir / "ftp" / "music" / ".trash" / "song.mp3"), "first");
  EXPECT_FALSE(std::filesystem::exists(dir / "ftp" / "music" / "song.mp3"));
}

TEST_F(TransferDispatcherTest, RemoveAndExists) {
  write_file(dir / "sftp" / "tree" / "a.txt", "a");
  write_file(dir / "sftp" / "tree" / "sub" / "b.txt", "b");

  auto present = dispatcher->exists(parse("sftp://files.local/tree/sub/b.txt"));
  ASSERT_TRUE(present.ok());
  EXPECT_TRUE(present.value());

  ASSERT_TRUE(dispatcher->remove(parse("sftp://files.local/tree")).ok());
  EXPECT_FALSE(std::filesystem::exists(dir / "sftp" / "tree"));

  auto gone = dispatcher->exists(parse("sftp://files.local/tree"));
  ASSERT_TRUE(gone.ok());
  EXPECT_FALSE(gone.value());
}
