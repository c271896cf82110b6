#include "client/listing_parser.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>
#include <boost/log/trivial.hpp>
#include "client/remote_file_client.hpp"

namespace netfs {
namespace client {

namespace {

bool is_number(const std::string& text) {
  return !text.empty() && std::all_of(text.begin(), text.end(),
    [](unsigned char c) { return std::isdigit(c); });
}

int month_index(const std::string& text) {
  static const char* months[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                 "jul", "aug", "sep", "oct", "nov", "dec"};
  if (text.size() != 3) {
    return -1;
  }
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
    [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (int i = 0; i < 12; ++i) {
    if (lower == months[i]) {
      return i;
    }
  }
  return -1;
}

int64_t to_millis(std::tm& tm) {
  const std::time_t t = timegm(&tm);
  return t == static_cast<std::time_t>(-1) ? 0 : static_cast<int64_t>(t) * 1000;
}

// "20240101120000" or "20240101120000.123", always UTC
int64_t parse_mlsd_time(const std::string& text) {
  if (text.size() < 14 || !is_number(text.substr(0, 14))) {
    return 0;
  }
  std::tm tm{};
  tm.tm_year = std::stoi(text.substr(0, 4)) - 1900;
  tm.tm_mon = std::stoi(text.substr(4, 2)) - 1;
  tm.tm_mday = std::stoi(text.substr(6, 2));
  tm.tm_hour = std::stoi(text.substr(8, 2));
  tm.tm_min = std::stoi(text.substr(10, 2));
  tm.tm_sec = std::stoi(text.substr(12, 2));
  return to_millis(tm);
}

struct Token {
  std::string text;
  std::size_t end;
};

std::vector<Token> tokenize(const std::string& line) {
  std::vector<Token> tokens;
  std::size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) {
      ++i;
    }
    const std::size_t start = i;
    while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i]))) {
      ++i;
    }
    if (i > start) {
      tokens.push_back({line.substr(start, i - start), i});
    }
  }
  return tokens;
}

std::string strip_line_end(std::string line) {
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
    line.pop_back();
  }
  return line;
}

} // namespace

//==============================================
// MLSD
//==============================================

std::optional<FileEntry> parse_mlsd_line(const std::string& raw, const std::string& dir) {
  const std::string line = strip_line_end(raw);
  const auto separator = line.find(' ');
  if (separator == std::string::npos || separator + 1 >= line.size()) {
    return std::nullopt;
  }

  FileEntry entry;
  entry.name = line.substr(separator + 1);

  std::istringstream facts(line.substr(0, separator));
  std::string fact;
  std::string type;
  while (std::getline(facts, fact, ';')) {
    const auto eq = fact.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    std::string key = fact.substr(0, eq);
    std::transform(key.begin(), key.end(), key.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const std::string value = fact.substr(eq + 1);

    if (key == "type") {
      type = value;
      std::transform(type.begin(), type.end(), type.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    } else if (key == "size" && is_number(value)) {
      entry.size = std::stoull(value);
    } else if (key == "modify") {
      entry.last_modified = parse_mlsd_time(value);
    }
  }

  // Current and parent directory entries
  if (type == "cdir" || type == "pdir" || entry.name == "." || entry.name == "..") {
    return std::nullopt;
  }
  entry.is_directory = type == "dir";
  entry.path = join_path(dir, entry.name);
  return entry;
}

std::vector<FileEntry> parse_mlsd_listing(const std::string& text, const std::string& dir) {
  std::vector<FileEntry> entries;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (auto entry = parse_mlsd_line(line, dir)) {
      entries.push_back(std::move(*entry));
    }
  }
  return entries;
}


//==============================================
// UNIX LONG LISTING
//==============================================

std::optional<FileEntry> parse_unix_line(const std::string& raw, const std::string& dir, std::time_t now) {
  const std::string line = strip_line_end(raw);
  const auto tokens = tokenize(line);
  if (tokens.size() < 6) {
    return std::nullopt;
  }

  const char kind = tokens[0].text[0];
  if (kind != '-' && kind != 'd' && kind != 'l') {
    return std::nullopt;  // "total 42" and unsupported entry kinds
  }

  // Locate "<size> <Mon> <day> <time|year>", the owner and group columns
  // are not reliable across servers
  for (std::size_t i = 2; i + 2 < tokens.size(); ++i) {
    const int month = month_index(tokens[i].text);
    if (month < 0 || !is_number(tokens[i - 1].text) || !is_number(tokens[i + 1].text)) {
      continue;
    }

    const auto& when = tokens[i + 2];
    std::size_t name_start = when.end;
    while (name_start < line.size() && line[name_start] == ' ') {
      ++name_start;
    }
    if (name_start >= line.size()) {
      return std::nullopt;
    }

    FileEntry entry;
    entry.name = line.substr(name_start);
    if (kind == 'l') {
      const auto arrow = entry.name.find(" -> ");
      if (arrow != std::string::npos) {
        entry.name = entry.name.substr(0, arrow);
      }
    }
    if (entry.name == "." || entry.name == "..") {
      return std::nullopt;
    }

    entry.is_directory = kind == 'd';
    entry.size = entry.is_directory ? 0 : std::stoull(tokens[i - 1].text);
    entry.path = join_path(dir, entry.name);

    std::tm now_tm{};
    gmtime_r(&now, &now_tm);

    std::tm tm{};
    tm.tm_mon = month;
    tm.tm_mday = std::stoi(tokens[i + 1].text);
    const auto colon = when.text.find(':');
    if (colon != std::string::npos) {
      tm.tm_hour = std::atoi(when.text.substr(0, colon).c_str());
      tm.tm_min = std::atoi(when.text.substr(colon + 1).c_str());
      tm.tm_year = now_tm.tm_year;
      // Time-of-day entries are within the last six months
      std::tm probe = tm;
      if (timegm(&probe) > now + 24 * 3600) {
        tm.tm_year -= 1;
      }
    } else if (is_number(when.text)) {
      tm.tm_year = std::stoi(when.text) - 1900;
    }
    entry.last_modified = to_millis(tm);
    return entry;
  }

  BOOST_LOG_TRIVIAL(debug) << "ListingParser: Unrecognized listing line: " << line;
  return std::nullopt;
}

std::vector<FileEntry> parse_unix_listing(const std::string& text, const std::string& dir, std::time_t now) {
  std::vector<FileEntry> entries;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (auto entry = parse_unix_line(line, dir, now)) {
      entries.push_back(std::move(*entry));
    }
  }
  return entries;
}

} // namespace client
} // namespace netfs
