#include "scanner/media_type.hpp"
#include <algorithm>
#include <cctype>
#include <map>

namespace netfs {
namespace scanner {

namespace {

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
    [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

const std::map<std::string, MediaType>& extension_table() {
  static const std::map<std::string, MediaType> table = [] {
    std::map<std::string, MediaType> t;
    for (const char* ext : {"jpg", "jpeg", "png", "webp", "heic", "heif", "bmp", "avif"}) {
      t.emplace(ext, MediaType::IMAGE);
    }
    t.emplace("gif", MediaType::GIF);
    for (const char* ext : {"mp4", "mkv", "mov", "webm", "3gp", "flv", "wmv", "m4v", "avi", "mpg", "mpeg",
                            "ts", "m2ts", "vob", "ogv", "divx", "m2v", "mts"}) {
      t.emplace(ext, MediaType::VIDEO);
    }
    for (const char* ext : {"mp3", "m4a", "flac", "aac", "ogg", "wma", "opus", "amr", "awb", "ac3", "ec3",
                            "ac4", "adts", "thd", "mka", "oga", "caf", "alac", "mid", "midi"}) {
      t.emplace(ext, MediaType::AUDIO);
    }
    for (const char* ext : {"txt", "md", "log", "json", "xml", "csv", "conf", "ini", "properties", "yml", "yaml"}) {
      t.emplace(ext, MediaType::TEXT);
    }
    t.emplace("pdf", MediaType::PDF);
    t.emplace("epub", MediaType::EPUB);
    return t;
  }();
  return table;
}

} // namespace

const char* media_type_to_string(MediaType type) {
  switch (type) {
    case MediaType::IMAGE: return "image";
    case MediaType::GIF: return "gif";
    case MediaType::VIDEO: return "video";
    case MediaType::AUDIO: return "audio";
    case MediaType::TEXT: return "text";
    case MediaType::PDF: return "pdf";
    case MediaType::EPUB: return "epub";
    default: return "unknown";
  }
}

std::optional<MediaType> media_type_from_string(const std::string& text) {
  const std::string lower = to_lower(text);
  for (MediaType type : all_media_types()) {
    if (lower == media_type_to_string(type)) {
      return type;
    }
  }
  return std::nullopt;
}

std::optional<MediaType> media_type_from_name(const std::string& file_name) {
  const auto dot = file_name.rfind('.');
  if (dot == std::string::npos || dot + 1 == file_name.size()) {
    return std::nullopt;
  }
  const auto& table = extension_table();
  auto it = table.find(to_lower(file_name.substr(dot + 1)));
  if (it == table.end()) {
    return std::nullopt;
  }
  return it->second;
}

const std::set<MediaType>& all_media_types() {
  static const std::set<MediaType> types = {
    MediaType::IMAGE, MediaType::GIF, MediaType::VIDEO, MediaType::AUDIO,
    MediaType::TEXT, MediaType::PDF, MediaType::EPUB
  };
  return types;
}

bool is_size_in_range(uint64_t size, MediaType type, const SizeFilter& filter) {
  switch (type) {
    case MediaType::IMAGE:
    case MediaType::GIF:
      return filter.image.contains(size);
    case MediaType::VIDEO:
      return filter.video.contains(size);
    case MediaType::AUDIO:
      return filter.audio.contains(size);
    default:
      return true;
  }
}

} // namespace scanner
} // namespace netfs
