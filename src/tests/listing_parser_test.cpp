#include <gtest/gtest.h>
#include "client/listing_parser.hpp"

using namespace netfs;
using namespace netfs::client;

namespace {
// 2024-06-01 00:00:00 UTC
constexpr std::time_t NOW = 1717200000;
}

TEST(ListingParserTest, MlsdFileAndDirectory) {
  const std::string text =
    "type=cdir;modify=20240101000000; .\r\n"
    "type=pdir;modify=20240101000000; ..\r\n"
    "type=file;size=1024;modify=20240101120000; name.txt\r\n"
    "type=dir;modify=20230505050505; sub dir\r\n";

  const auto entries = parse_mlsd_listing(text, "/pub");
  ASSERT_EQ(entries.size(), 2u);

  EXPECT_EQ(entries[0].name, "name.txt");
  EXPECT_EQ(entries[0].path, "/pub/name.txt");
  EXPECT_EQ(entries[0].size, 1024u);
  EXPECT_FALSE(entries[0].is_directory);
  EXPECT_EQ(entries[0].last_modified, 1704110400000LL);

  EXPECT_EQ(entries[1].name, "sub dir");
  EXPECT_TRUE(entries[1].is_directory);
}

TEST(ListingParserTest, MlsdRejectsLineWithoutName) {
  EXPECT_FALSE(parse_mlsd_line("type=file;size=3;", "/").has_value());
}

TEST(ListingParserTest, UnixTimeOfDayUsesCurrentYear) {
  auto entry = parse_unix_line("-rw-r--r--   1 user group  1024 Jan 15 12:30 name.txt", "/", NOW);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->name, "name.txt");
  EXPECT_EQ(entry->path, "/name.txt");
  EXPECT_EQ(entry->size, 1024u);
  EXPECT_EQ(entry->last_modified, 1705321800000LL);
}

TEST(ListingParserTest, UnixFutureTimeOfDayMeansLastYear) {
  auto entry = parse_unix_line("-rw-r--r-- 1 u g 5 Dec 20 10:00 old.txt", "/", NOW);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->last_modified, 1703066400000LL);
}

TEST(ListingParserTest, UnixDirectoriesLinksAndSpaces) {
  const std::string text =
    "total 12\n"
    "drwxr-xr-x 2 u g 4096 Mar  3  2021 photos\n"
    "lrwxrwxrwx 1 u g 7 Jan  1  2020 latest -> photos\n"
    "-rw-r--r-- 1 u g 10 Feb  2 03:04 my file.mp4\n"
    "drwxr-xr-x 2 u g 4096 Mar  3  2021 .\n";

  const auto entries = parse_unix_listing(text, "/media", NOW);
  ASSERT_EQ(entries.size(), 3u);

  EXPECT_EQ(entries[0].name, "photos");
  EXPECT_TRUE(entries[0].is_directory);
  EXPECT_EQ(entries[0].size, 0u);

  EXPECT_EQ(entries[1].name, "latest");
  EXPECT_FALSE(entries[1].is_directory);

  EXPECT_EQ(entries[2].name, "my file.mp4");
  EXPECT_EQ(entries[2].path, "/media/my file.mp4");
  EXPECT_EQ(entries[2].size, 10u);
}

TEST(ListingParserTest, UnixGarbageIsSkipped) {
  EXPECT_FALSE(parse_unix_line("not a listing line", "/", NOW).has_value());
  EXPECT_FALSE(parse_unix_line("", "/", NOW).has_value());
}
