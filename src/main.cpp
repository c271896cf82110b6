#include "cli/cli.hpp"
#include "core/config.hpp"
#include "logger/logger.hpp"
#include "service/file_access_manager.hpp"
#include <iostream>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  netfs::Config config;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options]\n"
        << "Options:\n"
        << "  --cache-dir <dir>          Shared file cache directory\n"
        << "  --cache-max-mb <mb>        Cache size limit, 0 for none (default 500)\n"
        << "  --log-file <file>          Log file (default netfs.log)\n"
        << "  --log-level <level>        trace, debug, info, warning, error or fatal\n"
        << "  --threads <n>              I/O threads (default 4)\n"
        << "  --idle-timeout <sec>       Close pooled connections idle this long (default 30)\n"
        << "  --connect-timeout <sec>    Connect timeout (default 10)\n"
        << "  --io-timeout <sec>         Read/write stall timeout (default 60)\n"
        << "  --known-hosts <file>       SSH known_hosts file for SFTP\n"
        << "Example: " << program_name << " --cache-dir /tmp/netfs-cache --log-level debug\n";
}

bool parse_seconds(const std::string& value, std::chrono::seconds& out) {
  try {
    const long parsed = std::stol(value);
    if (parsed <= 0) {
      return false;
    }
    out = std::chrono::seconds(parsed);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> flags = {
    "--cache-dir", "--cache-max-mb", "--log-file", "--log-level", "--threads",
    "--idle-timeout", "--connect-timeout", "--io-timeout", "--known-hosts"
  };

  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Every option needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    bool ok = true;
    if (flag == "--cache-dir") {
      options.config.cache_dir = value;
    } else if (flag == "--cache-max-mb") {
      try {
        const long long megabytes = std::stoll(value);
        ok = megabytes >= 0;
        if (ok) {
          options.config.cache_max_bytes = static_cast<uint64_t>(megabytes) * 1024 * 1024;
        }
      } catch (const std::exception&) {
        ok = false;
      }
    } else if (flag == "--log-file") {
      options.config.log_file = value;
    } else if (flag == "--log-level") {
      ok = netfs::logging::parse_severity(value, options.config.log_level);
    } else if (flag == "--threads") {
      try {
        const int threads = std::stoi(value);
        ok = threads > 0;
        options.config.io_threads = ok ? static_cast<std::size_t>(threads) : options.config.io_threads;
      } catch (const std::exception&) {
        ok = false;
      }
    } else if (flag == "--idle-timeout") {
      ok = parse_seconds(value, options.config.idle_timeout);
    } else if (flag == "--connect-timeout") {
      ok = parse_seconds(value, options.config.connect_timeout);
    } else if (flag == "--io-timeout") {
      ok = parse_seconds(value, options.config.io_timeout);
    } else if (flag == "--known-hosts") {
      options.config.known_hosts_file = value;
    }

    if (!ok) {
      std::cerr << "Error: Invalid value for " << flag << ": " << value << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  options.valid = true;
  return options;
}

bool run_shell(const netfs::Config& config) {
  try {
    netfs::logging::init_logging(config.log_file, config.log_level, config.log_to_console);

    netfs::credentials::InMemoryCredentialStore credentials;
    netfs::service::FileAccessManager manager(config, credentials);
    netfs::cli::CLI cli(manager, credentials);

    cli.run();
    manager.shutdown();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start netfs: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options.config)) {
    return 1;
  }
  return 0;
}
