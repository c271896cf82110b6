#include <gtest/gtest.h>
#include <algorithm>
#include <sstream>
#include "client/local_client.hpp"
#include "test_utils.hpp"

using namespace netfs;
using namespace netfs::client;

class LocalClientTest : public ::testing::Test {
protected:
  TempDir dir{"local_client_test"};
  LocalClient client;

  void SetUp() override {
    quiet_logging();
  }

  std::string path(const std::string& name) const {
    return (dir / name).string();
  }
};

TEST_F(LocalClientTest, ListReportsFilesAndDirectories) {
  write_file(dir / "a.txt", "hello");
  std::filesystem::create_directories(dir / "sub");

  auto entries = client.list(dir.path().string());
  ASSERT_TRUE(entries.ok()) << entries.error().to_string();
  ASSERT_EQ(entries.value().size(), 2u);

  auto file = std::find_if(entries.value().begin(), entries.value().end(),
    [](const FileEntry& e) { return e.name == "a.txt"; });
  ASSERT_NE(file, entries.value().end());
  EXPECT_FALSE(file->is_directory);
  EXPECT_EQ(file->size, 5u);
  EXPECT_GT(file->last_modified, 0);

  auto sub = std::find_if(entries.value().begin(), entries.value().end(),
    [](const FileEntry& e) { return e.name == "sub"; });
  ASSERT_NE(sub, entries.value().end());
  EXPECT_TRUE(sub->is_directory);
}

TEST_F(LocalClientTest, ListMissingDirectoryIsNotFound) {
  auto entries = client.list(path("missing"));
  ASSERT_FALSE(entries.ok());
  EXPECT_EQ(entries.error().reason, ErrorReason::NOT_FOUND);
}

TEST_F(LocalClientTest, StatAndExists) {
  write_file(dir / "b.bin", make_content(1000));

  auto entry = client.stat(path("b.bin"));
  ASSERT_TRUE(entry.ok());
  EXPECT_EQ(entry.value().size, 1000u);
  EXPECT_EQ(entry.value().name, "b.bin");

  auto missing = client.stat(path("nope"));
  ASSERT_FALSE(missing.ok());
  EXPECT_EQ(missing.error().reason, ErrorReason::NOT_FOUND);

  auto yes = client.exists(path("b.bin"));
  auto no = client.exists(path("nope"));
  ASSERT_TRUE(yes.ok());
  ASSERT_TRUE(no.ok());
  EXPECT_TRUE(yes.value());
  EXPECT_FALSE(no.value());
}

TEST_F(LocalClientTest, ReadRangeAtOffset) {
  const auto content = make_content(4096);
  write_file(dir / "c.bin", content);

  std::vector<char> buffer(100);
  auto n = client.read_range(path("c.bin"), 1000, buffer.data(), buffer.size());
  ASSERT_TRUE(n.ok());
  ASSERT_EQ(n.value(), 100u);
  EXPECT_EQ(std::string(buffer.data(), 100), content.substr(1000, 100));

  // Past the end only the remaining bytes come back
  n = client.read_range(path("c.bin"), 4090, buffer.data(), buffer.size());
  ASSERT_TRUE(n.ok());
  EXPECT_EQ(n.value(), 6u);
}

TEST_F(LocalClientTest, StreamSeeksBackwards) {
  const auto content = make_content(256);
  write_file(dir / "d.bin", content);

  auto stream = client.open_read(path("d.bin"), 200);
  ASSERT_TRUE(stream.ok());
  EXPECT_TRUE(stream.value()->is_seekable());

  char buffer[100];
  auto n = stream.value()->read(buffer, sizeof(buffer));
  ASSERT_TRUE(n.ok());
  EXPECT_EQ(n.value(), 56u);
  EXPECT_EQ(stream.value()->position(), 256u);

  ASSERT_TRUE(stream.value()->seek(10).ok());
  n = stream.value()->read(buffer, 10);
  ASSERT_TRUE(n.ok());
  EXPECT_EQ(std::string(buffer, 10), content.substr(10, 10));
  stream.value()->close();
  stream.value()->close();
}

TEST_F(LocalClientTest, WriteReportsChunksAndHonoursCancel) {
  const auto content = make_content(200 * 1024);
  std::istringstream input(content);
  std::vector<uint64_t> seen;

  auto written = client.write(path("out.bin"), input, content.size(),
    [&seen](uint64_t so_far) { seen.push_back(so_far); return true; });
  ASSERT_TRUE(written.ok());
  EXPECT_EQ(written.value(), content.size());
  EXPECT_EQ(read_file(dir / "out.bin"), content);
  ASSERT_FALSE(seen.empty());
  EXPECT_EQ(seen.back(), content.size());

  std::istringstream again(content);
  auto cancelled = client.write(path("cancel.bin"), again, content.size(),
    [](uint64_t) { return false; });
  ASSERT_FALSE(cancelled.ok());
  EXPECT_EQ(cancelled.error().kind, ErrorKind::CANCELLED);
}

TEST_F(LocalClientTest, MkdirRenameAndRemove) {
  ASSERT_TRUE(client.mkdir(path("x/y")).ok());
  ASSERT_TRUE(client.mkdir(path("x/y")).ok());
  EXPECT_TRUE(std::filesystem::is_directory(dir / "x" / "y"));

  write_file(dir / "x" / "y" / "f.txt", "data");
  ASSERT_TRUE(client.rename(path("x/y/f.txt"), path("x/g.txt")).ok());
  EXPECT_FALSE(std::filesystem::exists(dir / "x" / "y" / "f.txt"));
  EXPECT_EQ(read_file(dir / "x" / "g.txt"), "data");

  ASSERT_TRUE(client.remove(path("x/g.txt")).ok());
  auto again = client.remove(path("x/g.txt"));
  ASSERT_FALSE(again.ok());
  EXPECT_EQ(again.error().reason, ErrorReason::NOT_FOUND);

  ASSERT_TRUE(client.remove_directory(path("x")).ok());
  EXPECT_FALSE(std::filesystem::exists(dir / "x"));
}

TEST(PathHelpersTest, JoinParentAndName) {
  EXPECT_EQ(join_path("/", "a"), "/a");
  EXPECT_EQ(join_path("/a", "b"), "/a/b");
  EXPECT_EQ(join_path("/a/", "b"), "/a/b");
  EXPECT_EQ(parent_path_of("/a/b"), "/a");
  EXPECT_EQ(parent_path_of("/a"), "/");
  EXPECT_EQ(file_name_of("/a/b.txt"), "b.txt");
}
