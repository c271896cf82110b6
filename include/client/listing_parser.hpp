#ifndef NETFS_LISTING_PARSER_HPP
#define NETFS_LISTING_PARSER_HPP

#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include "core/types.hpp"

namespace netfs {
namespace client {

// ---- MLSD (RFC 3659) ----
// "type=file;size=1024;modify=20240101120000; name.txt"
std::optional<FileEntry> parse_mlsd_line(const std::string& line, const std::string& dir);
std::vector<FileEntry> parse_mlsd_listing(const std::string& text, const std::string& dir);

// ---- UNIX LONG LISTING ----
// "-rw-r--r--   1 user group  1024 Jan 15 12:30 name.txt", as returned
// by FTP LIST and by SFTP directory reads. `now` decides the year of
// entries that only carry a time of day.
std::optional<FileEntry> parse_unix_line(const std::string& line, const std::string& dir,
                                         std::time_t now = std::time(nullptr));
std::vector<FileEntry> parse_unix_listing(const std::string& text, const std::string& dir,
                                          std::time_t now = std::time(nullptr));

} // namespace client
} // namespace netfs

#endif // NETFS_LISTING_PARSER_HPP
