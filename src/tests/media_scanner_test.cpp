#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <limits>
#include "scanner/media_scanner.hpp"
#include "test_utils.hpp"

using namespace netfs;
using namespace netfs::scanner;
using ::testing::_;
using ::testing::AtLeast;
using ::testing::Return;

namespace {

class CountingListener : public ScanProgressListener {
public:
  void on_progress(std::size_t scanned, const std::string&) override {
    calls.push_back(scanned);
  }

  std::vector<std::size_t> calls;
};

class MockListener : public ScanProgressListener {
public:
  MOCK_METHOD(void, on_progress, (std::size_t, const std::string&), (override));
  MOCK_METHOD(bool, should_stop, (), (const, override));
};

} // namespace

class MediaScannerTest : public ::testing::Test {
protected:
  TempDir dir{"media_scanner_test"};
  std::shared_ptr<FakeServer> server;
  client::ClientFactory factory;
  credentials::InMemoryCredentialStore store;
  std::unique_ptr<pool::ConnectionPool> pool;
  std::unique_ptr<network::RemoteFileSystem> fs;
  std::unique_ptr<MediaScanner> scanner;

  void SetUp() override {
    quiet_logging();
    std::filesystem::create_directories(dir / "smb");
    server = std::make_shared<FakeServer>(dir / "smb");
    use_fake_server(factory, Protocol::SMB, server, true);
    auto nas = make_credentials("nas", Protocol::SMB, "nas");
    nas.share = "media";
    store.add(nas);

    pool = std::make_unique<pool::ConnectionPool>(factory, std::chrono::seconds(30));
    fs = std::make_unique<network::RemoteFileSystem>(*pool, store);
    scanner = std::make_unique<MediaScanner>(*fs, 10);
  }

  void TearDown() override {
    pool->shutdown();
  }

  static RemoteUri parse(const std::string& text) {
    auto uri = RemoteUri::parse(text);
    EXPECT_TRUE(uri.ok()) << text;
    return uri.ok() ? uri.value() : RemoteUri{};
  }

  RemoteUri root() const { return parse("smb://nas/media/"); }

  void add(const std::string& relative, std::size_t size = 16) {
    write_file(dir / "smb" / relative, make_content(size));
  }
};

TEST_F(MediaScannerTest, SkipsTrashAndThrottlesProgress) {
  for (int i = 0; i < 50; ++i) {
    add("photos/img" + std::to_string(i) + ".jpg");
  }
  for (int i = 0; i < 40; ++i) {
    add("photos/2023/pic" + std::to_string(i) + ".png");
  }
  for (int i = 0; i < 20; ++i) {
    add("videos/clip" + std::to_string(i) + ".mp4");
  }
  for (int i = 0; i < 10; ++i) {
    add("photos/.trash/old" + std::to_string(i) + ".jpg");
  }

  CountingListener listener;
  auto files = scanner->scan(root(), ScanOptions{}, &listener);
  ASSERT_TRUE(files.ok()) << files.error().to_string();
  EXPECT_EQ(files.value().size(), 110u);
  EXPECT_LT(listener.calls.size(), 15u);
  EXPECT_EQ(listener.calls.size(), 11u);
  for (const auto& file : files.value()) {
    EXPECT_EQ(file.uri.path.find("/.trash/"), std::string::npos) << file.uri.path;
  }
}

TEST_F(MediaScannerTest, FiltersByTypeAndSize) {
  add("a.jpg", 500);
  add("b.jpg", 5000);
  add("c.mp4", 100);
  add("d.mp3", 100);
  add("e.pdf", 1);
  add("f.bin", 100);

  ScanOptions images;
  images.types = {MediaType::IMAGE};
  auto only_images = scanner->scan(root(), images);
  ASSERT_TRUE(only_images.ok());
  EXPECT_EQ(only_images.value().size(), 2u);

  ScanOptions sized;
  SizeFilter filter;
  filter.image = SizeRange{1000, 10000};
  filter.video = SizeRange{1000, 10000};
  sized.size_filter = filter;
  auto filtered = scanner->scan(root(), sized);
  ASSERT_TRUE(filtered.ok());

  std::vector<std::string> names;
  for (const auto& file : filtered.value()) {
    names.push_back(file.entry.name);
  }
  std::sort(names.begin(), names.end());
  EXPECT_EQ(names, (std::vector<std::string>{"b.jpg", "d.mp3", "e.pdf"}));
}

TEST_F(MediaScannerTest, NonRecursiveStaysAtRoot) {
  add("top.mp3");
  add("nested/deep.mp3");

  ScanOptions flat;
  flat.recursive = false;
  auto files = scanner->scan(root(), flat);
  ASSERT_TRUE(files.ok());
  ASSERT_EQ(files.value().size(), 1u);
  EXPECT_EQ(files.value()[0].uri.path, "/top.mp3");
  EXPECT_EQ(files.value()[0].type, MediaType::AUDIO);
}

TEST_F(MediaScannerTest, PagesAreSortedSlices) {
  for (int i = 0; i < 25; ++i) {
    add("docs/file" + std::string(i < 10 ? "0" : "") + std::to_string(i) + ".txt");
  }

  auto first = scanner->scan_page(root(), ScanOptions{}, 0, 10);
  ASSERT_TRUE(first.ok());
  ASSERT_EQ(first.value().files.size(), 10u);
  EXPECT_TRUE(first.value().has_more);
  EXPECT_EQ(first.value().files.front().uri.path, "/docs/file00.txt");

  auto last = scanner->scan_page(root(), ScanOptions{}, 20, 10);
  ASSERT_TRUE(last.ok());
  ASSERT_EQ(last.value().files.size(), 5u);
  EXPECT_FALSE(last.value().has_more);
  EXPECT_EQ(last.value().files.back().uri.path, "/docs/file24.txt");

  auto beyond = scanner->scan_page(root(), ScanOptions{}, 40, 10);
  ASSERT_TRUE(beyond.ok());
  EXPECT_TRUE(beyond.value().files.empty());
  EXPECT_FALSE(beyond.value().has_more);

  auto total = scanner->count(root(), ScanOptions{});
  ASSERT_TRUE(total.ok());
  EXPECT_EQ(total.value(), 25u);
}

TEST_F(MediaScannerTest, UnboundedPageLimitReturnsTheRest) {
  add("a.jpg");
  add("b.jpg");
  add("c.jpg");

  auto rest = scanner->scan_page(root(), ScanOptions{}, 2, std::numeric_limits<std::size_t>::max());
  ASSERT_TRUE(rest.ok());
  ASSERT_EQ(rest.value().files.size(), 1u);
  EXPECT_EQ(rest.value().files[0].uri.path.substr(rest.value().files[0].uri.path.size() - 5), "c.jpg");
  EXPECT_FALSE(rest.value().has_more);
}

TEST_F(MediaScannerTest, StopRequestEndsScanEarly) {
  add("one/a.jpg");
  add("two/b.jpg");

  MockListener listener;
  EXPECT_CALL(listener, should_stop()).WillOnce(Return(false)).WillRepeatedly(Return(true));
  EXPECT_CALL(listener, on_progress(_, _)).Times(0);

  auto files = scanner->scan(root(), ScanOptions{}, &listener);
  ASSERT_TRUE(files.ok());
  // Only the root was listed, and it holds no files
  EXPECT_TRUE(files.value().empty());
}

TEST_F(MediaScannerTest, ListenerPolledPerDirectory) {
  add("x/a.jpg");
  add("y/b.jpg");

  MockListener listener;
  EXPECT_CALL(listener, should_stop()).Times(AtLeast(3)).WillRepeatedly(Return(false));
  auto files = scanner->scan(root(), ScanOptions{}, &listener);
  ASSERT_TRUE(files.ok());
  EXPECT_EQ(files.value().size(), 2u);
}

TEST_F(MediaScannerTest, UnreadableRootIsError) {
  auto files = scanner->scan(parse("smb://nas/media/missing"), ScanOptions{});
  ASSERT_FALSE(files.ok());
  EXPECT_EQ(files.error().reason, ErrorReason::NOT_FOUND);
}

TEST_F(MediaScannerTest, UnreachableServerIsConnectionError) {
  server->dropped = true;
  auto files = scanner->scan(root(), ScanOptions{});
  ASSERT_FALSE(files.ok());
  EXPECT_EQ(files.error().kind, ErrorKind::CONNECTION_ERROR);
}

TEST_F(MediaScannerTest, FindFileResolvesType) {
  add("music/song.ogg", 321);
  add("music/data.bin");
  std::filesystem::create_directories(dir / "smb" / "music" / "album.mp3");

  auto song = scanner->find_file(parse("smb://nas/media/music/song.ogg"));
  ASSERT_TRUE(song.ok()) << song.error().to_string();
  EXPECT_EQ(song.value().type, MediaType::AUDIO);
  EXPECT_EQ(song.value().entry.size, 321u);

  auto unknown = scanner->find_file(parse("smb://nas/media/music/data.bin"));
  ASSERT_FALSE(unknown.ok());
  EXPECT_EQ(unknown.error().kind, ErrorKind::VALIDATION_ERROR);

  auto folder = scanner->find_file(parse("smb://nas/media/music/album.mp3"));
  ASSERT_FALSE(folder.ok());
  EXPECT_EQ(folder.error().kind, ErrorKind::VALIDATION_ERROR);
}

TEST_F(MediaScannerTest, WritableProbeCleansUp) {
  auto writable = scanner->is_writable(root());
  ASSERT_TRUE(writable.ok()) << writable.error().to_string();
  EXPECT_TRUE(writable.value());
  EXPECT_TRUE(std::filesystem::is_empty(dir / "smb"));

  auto missing = scanner->is_writable(parse("smb://nas/media/absent"));
  ASSERT_FALSE(missing.ok());
}
