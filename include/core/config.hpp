#ifndef NETFS_CONFIG_HPP
#define NETFS_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <boost/log/trivial.hpp>

namespace netfs {

struct Config {
  // ---- CONNECTIONS ----
  std::chrono::seconds connect_timeout{10};
  std::chrono::seconds io_timeout{60};
  // Pooled sessions unused for longer than this are evicted
  std::chrono::seconds idle_timeout{30};
  std::chrono::seconds sweep_interval{10};
  std::size_t io_threads{4};
  std::string known_hosts_file;

  // ---- CACHE ----
  std::filesystem::path cache_dir{std::filesystem::temp_directory_path() / "unified_network_cache"};
  std::chrono::hours cache_ttl{24};
  // Oldest entries are evicted above this size, 0 for no limit
  uint64_t cache_max_bytes{500ull * 1024 * 1024};

  // ---- TRANSFERS AND STREAMING ----
  std::filesystem::path temp_dir{std::filesystem::temp_directory_path()};
  uint64_t progress_step_bytes{100 * 1024};
  std::size_t default_buffer_size{64 * 1024};
  // Longest single read_range request
  std::size_t max_read_bytes{16 * 1024 * 1024};

  // ---- SCANNING ----
  std::size_t scan_progress_interval{10};

  // ---- LOGGING ----
  std::string log_file{"netfs.log"};
  boost::log::trivial::severity_level log_level{boost::log::trivial::info};
  bool log_to_console{false};
};

} // namespace netfs

#endif // NETFS_CONFIG_HPP
