#include <gtest/gtest.h>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>
#include "cache/unified_file_cache.hpp"
#include "test_utils.hpp"

using namespace netfs;
using namespace netfs::cache;

class UnifiedFileCacheTest : public ::testing::Test {
protected:
  TempDir dir{"unified_file_cache_test"};
  std::filesystem::path cache_dir;
  std::unique_ptr<UnifiedFileCache> cache;

  void SetUp() override {
    quiet_logging();
    cache_dir = dir / "cache";
    cache = std::make_unique<UnifiedFileCache>(cache_dir, std::chrono::hours(24));
  }

  std::filesystem::path source(const std::string& name, std::size_t size) {
    auto file = dir / "src" / name;
    write_file(file, make_content(size));
    return file;
  }

  static UnifiedFileCache::Downloader write_bytes(const std::string& content) {
    return [content](const std::filesystem::path& target) -> Result<void> {
      write_file(target, content);
      return Result<void>::success();
    };
  }
};

TEST_F(UnifiedFileCacheTest, KeyIsHashAndSize) {
  const auto k = cache->key("smb://nas:445/media/a.mp4", 1000);
  ASSERT_EQ(k.size(), 64u + 5u);
  EXPECT_EQ(k.substr(64), "_1000");
  EXPECT_EQ(k, cache->key("smb://nas:445/media/a.mp4", 1000));
  EXPECT_NE(k.substr(0, 64), cache->key("smb://nas:445/media/b.mp4", 1000).substr(0, 64));

  // SHA-256 of the empty string
  EXPECT_EQ(cache->key("", 0),
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855_0");
}

TEST_F(UnifiedFileCacheTest, MissWithoutPut) {
  EXPECT_FALSE(cache->get_cached_file("/a.jpg", 10).has_value());
  EXPECT_FALSE(cache->is_cached("/a.jpg", 10));
}

TEST_F(UnifiedFileCacheTest, HitAfterPutAndSizeIsPartOfKey) {
  auto stored = cache->put_file("sftp://host:22/P", 1000, source("p.bin", 1000));
  ASSERT_TRUE(stored.ok()) << stored.error().to_string();

  auto first = cache->get_cached_file("sftp://host:22/P", 1000);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, stored.value());
  EXPECT_EQ(std::filesystem::file_size(*first), 1000u);

  auto second = cache->get_cached_file("sftp://host:22/P", 1000);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*second, *first);

  EXPECT_FALSE(cache->get_cached_file("sftp://host:22/P", 2000).has_value());
  // The 1000-byte entry survives the miss for another size
  EXPECT_TRUE(cache->is_cached("sftp://host:22/P", 1000));
}

TEST_F(UnifiedFileCacheTest, TruncatedEntryIsDeletedOnRead) {
  auto stored = cache->put_file("/movie.mkv", 1000, source("m.bin", 1000));
  ASSERT_TRUE(stored.ok());

  std::filesystem::resize_file(stored.value(), 400);
  EXPECT_FALSE(cache->get_cached_file("/movie.mkv", 1000).has_value());
  EXPECT_FALSE(std::filesystem::exists(stored.value()));
}

TEST_F(UnifiedFileCacheTest, GrownEntryIsDeletedOnRead) {
  auto stored = cache->put_file("/movie.mkv", 100, source("m.bin", 100));
  ASSERT_TRUE(stored.ok());

  write_file(stored.value(), make_content(150));
  EXPECT_FALSE(cache->get_cached_file("/movie.mkv", 100).has_value());
  EXPECT_FALSE(std::filesystem::exists(stored.value()));
}

TEST_F(UnifiedFileCacheTest, ZeroTtlExpiresEverything) {
  UnifiedFileCache expiring(cache_dir, std::chrono::seconds(0));
  auto stored = expiring.put_file("/a.txt", 10, source("a.txt", 10));
  ASSERT_TRUE(stored.ok());

  EXPECT_FALSE(expiring.get_cached_file("/a.txt", 10).has_value());
  EXPECT_FALSE(std::filesystem::exists(stored.value()));
}

TEST_F(UnifiedFileCacheTest, EvictExpiredSkipsForeignFiles) {
  UnifiedFileCache expiring(cache_dir, std::chrono::seconds(0));
  ASSERT_TRUE(expiring.put_file("/a.txt", 10, source("a.txt", 10)).ok());
  ASSERT_TRUE(expiring.put_file("/b.txt", 20, source("b.txt", 20)).ok());
  write_file(cache_dir / "notes.txt", "keep");

  EXPECT_EQ(expiring.evict_expired(), 2u);
  EXPECT_TRUE(std::filesystem::exists(cache_dir / "notes.txt"));
}

TEST_F(UnifiedFileCacheTest, PutOfTheEntryItselfIsNoOp) {
  auto target = cache->get_cache_file("/self.bin", 64);
  write_file(target, make_content(64));

  auto stored = cache->put_file("/self.bin", 64, target);
  ASSERT_TRUE(stored.ok());
  EXPECT_EQ(stored.value(), target);
  EXPECT_EQ(read_file(target), make_content(64));
}

TEST_F(UnifiedFileCacheTest, PutOfMissingSourceFails) {
  auto stored = cache->put_file("/ghost", 5, dir / "nothing-here");
  ASSERT_FALSE(stored.ok());
  EXPECT_FALSE(cache->is_cached("/ghost", 5));
  EXPECT_EQ(cache->stats().file_count, 0u);
}

TEST_F(UnifiedFileCacheTest, FetchDownloadsOnceThenHits) {
  int calls = 0;
  const auto content = make_content(300);
  auto downloader = [&calls, &content](const std::filesystem::path& target) -> Result<void> {
    ++calls;
    write_file(target, content);
    return Result<void>::success();
  };

  auto first = cache->fetch("/doc.pdf", 300, downloader);
  ASSERT_TRUE(first.ok()) << first.error().to_string();
  auto second = cache->fetch("/doc.pdf", 300, downloader);
  ASSERT_TRUE(second.ok());

  EXPECT_EQ(calls, 1);
  EXPECT_EQ(first.value(), second.value());
  EXPECT_EQ(read_file(first.value()), content);
}

TEST_F(UnifiedFileCacheTest, ConcurrentFetchesShareOneDownload) {
  std::atomic<int> calls{0};
  const auto content = make_content(4096);
  auto downloader = [&calls, &content](const std::filesystem::path& target) -> Result<void> {
    ++calls;
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    write_file(target, content);
    return Result<void>::success();
  };

  std::atomic<int> successes{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 6; ++i) {
    threads.emplace_back([&]() {
      auto result = cache->fetch("/video.mp4", 4096, downloader);
      if (result.ok() && read_file(result.value()) == content) {
        ++successes;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(successes.load(), 6);
  EXPECT_EQ(calls.load(), 1);
}

TEST_F(UnifiedFileCacheTest, FetchRejectsShortDownload) {
  auto result = cache->fetch("/short.bin", 100, write_bytes(make_content(60)));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, ErrorKind::IO_ERROR);
  EXPECT_EQ(result.error().reason, ErrorReason::SIZE_MISMATCH);
  EXPECT_FALSE(cache->is_cached("/short.bin", 100));
  EXPECT_EQ(cache->stats().file_count, 0u);
}

TEST_F(UnifiedFileCacheTest, FetchPropagatesDownloaderError) {
  auto result = cache->fetch("/remote.bin", 10, [](const std::filesystem::path&) -> Result<void> {
    return make_error(ErrorKind::CONNECTION_ERROR, ErrorReason::TIMEOUT, "Read timed out");
  });
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().reason, ErrorReason::TIMEOUT);

  // A later fetch for the same key runs again
  auto retry = cache->fetch("/remote.bin", 10, write_bytes(make_content(10)));
  EXPECT_TRUE(retry.ok());
}

TEST_F(UnifiedFileCacheTest, StatsAndClearAll) {
  EXPECT_EQ(cache->stats().file_count, 0u);
  ASSERT_TRUE(cache->put_file("/a", 10, source("a", 10)).ok());
  ASSERT_TRUE(cache->put_file("/b", 30, source("b", 30)).ok());

  auto stats = cache->stats();
  EXPECT_EQ(stats.file_count, 2u);
  EXPECT_EQ(stats.total_bytes, 40u);

  EXPECT_EQ(cache->clear_all(), 2u);
  EXPECT_EQ(cache->stats().file_count, 0u);
  EXPECT_FALSE(cache->is_cached("/a", 10));
}

TEST_F(UnifiedFileCacheTest, ClearOnMissingDirectoryIsHarmless) {
  UnifiedFileCache absent(dir / "never-created");
  EXPECT_EQ(absent.clear_all(), 0u);
  EXPECT_EQ(absent.stats().file_count, 0u);
}

TEST_F(UnifiedFileCacheTest, ThrowingDownloaderIsReportedAndReleasesTheKey) {
  auto failed = cache->fetch("/p", 10, [](const std::filesystem::path& target) -> Result<void> {
    write_file(target, "half");
    throw std::runtime_error("boom");
  });
  ASSERT_FALSE(failed.ok());
  EXPECT_EQ(failed.error().kind, ErrorKind::IO_ERROR);
  EXPECT_EQ(failed.error().cause, "boom");
  EXPECT_EQ(cache->stats().file_count, 0u);

  auto retry = cache->fetch("/p", 10, write_bytes(make_content(10)));
  ASSERT_TRUE(retry.ok()) << retry.error().to_string();
  EXPECT_EQ(read_file(retry.value()), make_content(10));
}

TEST_F(UnifiedFileCacheTest, WaitersWakeWhenDownloaderThrows) {
  auto owner = std::async(std::launch::async, [this]() {
    return cache->fetch("/slow", 10, [](const std::filesystem::path&) -> Result<void> {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      throw std::runtime_error("lost");
    });
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  auto waiter = std::async(std::launch::async, [this]() {
    return cache->fetch("/slow", 10, write_bytes(make_content(10)));
  });

  ASSERT_EQ(owner.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  ASSERT_EQ(waiter.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_FALSE(owner.get().ok());
  waiter.get();

  EXPECT_TRUE(cache->fetch("/slow", 10, write_bytes(make_content(10))).ok());
}

TEST_F(UnifiedFileCacheTest, SizeLimitEvictsOldestEntries) {
  UnifiedFileCache bounded(cache_dir, std::chrono::hours(24), 1000);
  const auto now = std::filesystem::file_time_type::clock::now();

  auto a = bounded.put_file("/a", 400, source("a", 400));
  ASSERT_TRUE(a.ok());
  std::filesystem::last_write_time(a.value(), now - std::chrono::hours(2));
  auto b = bounded.put_file("/b", 400, source("b", 400));
  ASSERT_TRUE(b.ok());
  std::filesystem::last_write_time(b.value(), now - std::chrono::hours(1));
  EXPECT_EQ(bounded.stats().total_bytes, 800u);

  ASSERT_TRUE(bounded.put_file("/c", 400, source("c", 400)).ok());

  // 1200 bytes over a 1000 byte limit: the oldest goes, leaving 800
  EXPECT_FALSE(bounded.is_cached("/a", 400));
  EXPECT_TRUE(bounded.is_cached("/b", 400));
  EXPECT_TRUE(bounded.is_cached("/c", 400));
  EXPECT_EQ(bounded.stats().total_bytes, 800u);
}

TEST_F(UnifiedFileCacheTest, FetchAlsoEnforcesTheLimit) {
  UnifiedFileCache bounded(cache_dir, std::chrono::hours(24), 1000);
  auto old = bounded.put_file("/old", 600, source("old", 600));
  ASSERT_TRUE(old.ok());
  std::filesystem::last_write_time(old.value(),
    std::filesystem::file_time_type::clock::now() - std::chrono::hours(1));

  auto fetched = bounded.fetch("/new", 600, write_bytes(make_content(600)));
  ASSERT_TRUE(fetched.ok());
  EXPECT_FALSE(std::filesystem::exists(old.value()));
  EXPECT_TRUE(bounded.is_cached("/new", 600));
}

TEST_F(UnifiedFileCacheTest, EntryLargerThanTheLimitIsKept) {
  UnifiedFileCache bounded(cache_dir, std::chrono::hours(24), 100);
  ASSERT_TRUE(bounded.put_file("/big", 300, source("big", 300)).ok());
  EXPECT_TRUE(bounded.is_cached("/big", 300));
  EXPECT_EQ(bounded.evict_if_needed(), 0u);
}

TEST_F(UnifiedFileCacheTest, InvalidateDropsOneEntry) {
  ASSERT_TRUE(cache->put_file("/doc", 10, source("d10", 10)).ok());
  ASSERT_TRUE(cache->put_file("/doc", 20, source("d20", 20)).ok());

  EXPECT_TRUE(cache->invalidate("/doc", 10));
  EXPECT_FALSE(cache->invalidate("/doc", 10));
  EXPECT_FALSE(cache->is_cached("/doc", 10));
  EXPECT_TRUE(cache->is_cached("/doc", 20));
}

TEST_F(UnifiedFileCacheTest, StatsReportTheLimit) {
  EXPECT_EQ(cache->stats().max_bytes, UnifiedFileCache::DEFAULT_MAX_BYTES);
  UnifiedFileCache unbounded(cache_dir, std::chrono::hours(24), 0);
  EXPECT_EQ(unbounded.stats().max_bytes, 0u);
}
