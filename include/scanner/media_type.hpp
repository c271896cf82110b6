#ifndef NETFS_MEDIA_TYPE_HPP
#define NETFS_MEDIA_TYPE_HPP

#include <cstdint>
#include <limits>
#include <optional>
#include <set>
#include <string>

namespace netfs {
namespace scanner {

enum class MediaType {
  IMAGE,
  GIF,
  VIDEO,
  AUDIO,
  TEXT,
  PDF,
  EPUB
};

const char* media_type_to_string(MediaType type);
std::optional<MediaType> media_type_from_string(const std::string& text);

// Resolved from the extension, case-insensitive
std::optional<MediaType> media_type_from_name(const std::string& file_name);
const std::set<MediaType>& all_media_types();

// Inclusive byte range
struct SizeRange {
  uint64_t min{0};
  uint64_t max{std::numeric_limits<uint64_t>::max()};

  bool contains(uint64_t size) const { return size >= min && size <= max; }
};

// Images and gifs share a range. Text, pdf and epub are never filtered.
struct SizeFilter {
  SizeRange image;
  SizeRange video;
  SizeRange audio;
};

bool is_size_in_range(uint64_t size, MediaType type, const SizeFilter& filter);

} // namespace scanner
} // namespace netfs

#endif // NETFS_MEDIA_TYPE_HPP
