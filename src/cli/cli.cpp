#include "cli/cli.hpp"
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace netfs {
namespace cli {

namespace {

constexpr const char* PROMPT = "netfs> ";
constexpr std::size_t CAT_CHUNK = 64 * 1024;

std::string format_size(uint64_t bytes) {
  std::ostringstream out;
  if (bytes >= 1024 * 1024) {
    out << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MB";
  } else if (bytes >= 1024) {
    out << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / 1024.0 << " KB";
  } else {
    out << bytes << " B";
  }
  return out.str();
}

bool print_progress(const TransferProgress& progress) {
  std::cout << "\r  " << format_size(progress.bytes_transferred);
  if (progress.total_bytes > 0) {
    std::cout << " / " << format_size(progress.total_bytes);
  }
  std::cout << " (" << format_size(static_cast<uint64_t>(progress.bytes_per_second)) << "/s)   " << std::flush;
  return true;
}

class ConsoleScanProgress : public scanner::ScanProgressListener {
public:
  void on_progress(std::size_t scanned, const std::string& current_file) override {
    std::cout << "\r  scanned " << scanned << " files (" << current_file << ")   " << std::flush;
  }
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(service::FileAccessManager& manager, credentials::InMemoryCredentialStore& credentials)
  : running_(false)
  , next_credentials_id_(1)
  , manager_(manager)
  , credentials_(credentials) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  std::cout << PROMPT << std::flush;

  while (running_ && std::getline(std::cin, line)) {
    running_ = execute(line);
    if (running_) {
      std::cout << PROMPT << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  Args args = tokenize(line);
  if (args.empty()) {
    return true;
  }

  const std::string command = args.front();
  args.erase(args.begin());
  if (command == "quit" || command == "exit") {
    return false;
  }
  process_command(command, args);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const Args& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "help") {
    handle_help_command();
  }
  else if (command == "login") {
    handle_login_command(args);
  }
  else if (command == "ls") {
    handle_ls_command(args);
  }
  else if (command == "stat") {
    handle_stat_command(args);
  }
  else if (command == "cat") {
    handle_cat_command(args);
  }
  else if (command == "get" || command == "put" || command == "cp" || command == "mv") {
    handle_transfer_command(command, args);
  }
  else if (command == "rm") {
    handle_rm_command(args);
  }
  else if (command == "trash") {
    handle_trash_command(args);
  }
  else if (command == "mkdir") {
    handle_mkdir_command(args);
  }
  else if (command == "rename") {
    handle_rename_command(args);
  }
  else if (command == "test") {
    handle_test_command(args);
  }
  else if (command == "scan") {
    handle_scan_command(args);
  }
  else if (command == "fetch") {
    handle_fetch_command(args);
  }
  else if (command == "cache-stats" || command == "cache-clear") {
    handle_cache_command(command);
  }
  else if (command == "pool") {
    handle_pool_command();
  }
  else {
    std::cout << "Unknown command, type 'help' for the list" << std::endl;
  }
}

void CLI::handle_help_command() {
  std::cout << "Available commands:" << std::endl;
  std::cout << "  help                              Display this help message" << std::endl;
  std::cout << "  login <uri> <user> [password] [key=<file>] [domain=<name>]" << std::endl;
  std::cout << "                                    Register credentials for a server" << std::endl;
  std::cout << "  ls <uri>                          List a directory" << std::endl;
  std::cout << "  stat <uri>                        Show one entry" << std::endl;
  std::cout << "  cat <uri>                         Stream a file to the terminal" << std::endl;
  std::cout << "  get [-f] <uri> <local>            Download a file" << std::endl;
  std::cout << "  put [-f] <local> <uri>            Upload a file" << std::endl;
  std::cout << "  cp [-f] <src> <dst>               Copy between any two locations" << std::endl;
  std::cout << "  mv [-f] <src> <dst>               Move between any two locations" << std::endl;
  std::cout << "  rm <uri>                          Delete a file or directory tree" << std::endl;
  std::cout << "  trash <uri> <root>                Move into <root>/.trash" << std::endl;
  std::cout << "  mkdir <uri>                       Create a directory" << std::endl;
  std::cout << "  rename <uri> <new-name>           Rename within the directory" << std::endl;
  std::cout << "  test <uri>                        Check that a server accepts the login" << std::endl;
  std::cout << "  scan <root> [types=a,b] [flat]    Find media files" << std::endl;
  std::cout << "  fetch <uri>                       Download into the shared cache" << std::endl;
  std::cout << "  cache-stats | cache-clear         Inspect or empty the cache" << std::endl;
  std::cout << "  pool                              Show pooled connections" << std::endl;
  std::cout << "  quit                              Exit the shell" << std::endl;
}

void CLI::handle_login_command(const Args& args) {
  if (args.size() < 2) {
    std::cout << "Usage: login <uri> <user> [password] [key=<file>] [domain=<name>]" << std::endl;
    return;
  }

  auto uri = RemoteUri::parse(args[0]);
  if (!uri.ok()) {
    log_and_display_error("Invalid server address", uri.error());
    return;
  }
  if (!is_remote(uri.value().protocol)) {
    std::cout << "Local paths need no login" << std::endl;
    return;
  }

  Credentials creds;
  creds.id = "cred-" + std::to_string(next_credentials_id_++);
  creds.protocol = uri.value().protocol;
  creds.server = uri.value().host;
  creds.port = uri.value().port;
  creds.share = uri.value().share;
  creds.username = args[1];
  for (std::size_t i = 2; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg.rfind("key=", 0) == 0) {
      creds.private_key_path = arg.substr(4);
    } else if (arg.rfind("domain=", 0) == 0) {
      creds.domain = arg.substr(7);
    } else {
      creds.password = arg;
    }
  }

  credentials_.add(creds);
  std::cout << "Stored credentials " << creds.id << " for " << uri.value().connection_info().endpoint() << std::endl;
}

void CLI::handle_ls_command(const Args& args) {
  if (args.size() != 1) {
    std::cout << "Usage: ls <uri>" << std::endl;
    return;
  }

  auto entries = manager_.list(to_uri(args[0])).get();
  if (!entries.ok()) {
    log_and_display_error("Cannot list " + args[0], entries.error());
    return;
  }
  for (const auto& entry : entries.value()) {
    std::cout << (entry.is_directory ? "d " : "- ") << std::setw(12) << entry.size << "  " << entry.name
              << (entry.is_directory ? "/" : "") << std::endl;
  }
  std::cout << entries.value().size() << " entries" << std::endl;
}

void CLI::handle_stat_command(const Args& args) {
  if (args.size() != 1) {
    std::cout << "Usage: stat <uri>" << std::endl;
    return;
  }

  auto entry = manager_.stat(to_uri(args[0])).get();
  if (!entry.ok()) {
    log_and_display_error("Cannot stat " + args[0], entry.error());
    return;
  }
  std::cout << "  path:     " << entry.value().path << std::endl;
  std::cout << "  type:     " << (entry.value().is_directory ? "directory" : "file") << std::endl;
  std::cout << "  size:     " << entry.value().size << " (" << format_size(entry.value().size) << ")" << std::endl;
  std::cout << "  modified: " << entry.value().last_modified << " ms" << std::endl;
}

void CLI::handle_cat_command(const Args& args) {
  if (args.size() != 1) {
    std::cout << "Usage: cat <uri>" << std::endl;
    return;
  }

  auto reader = manager_.create_reader();
  auto opened = reader->open(to_uri(args[0]));
  if (!opened.ok()) {
    log_and_display_error("Cannot open " + args[0], opened.error());
    return;
  }

  std::vector<char> buffer(CAT_CHUNK);
  uint64_t position = 0;
  for (;;) {
    const int64_t n = reader->read_at(position, buffer.data(), buffer.size());
    if (n == reader::NetworkReader::END_OF_STREAM) {
      break;
    }
    if (n < 0) {
      std::cout << std::endl;
      log_and_display_error("Read failed", reader->last_error().value_or(Error{}));
      break;
    }
    std::cout.write(buffer.data(), static_cast<std::streamsize>(n));
    position += static_cast<uint64_t>(n);
  }
  std::cout << std::endl;
  reader->close();
}

void CLI::handle_transfer_command(const std::string& command, const Args& args) {
  bool overwrite = false;
  Args paths;
  for (const auto& arg : args) {
    if (arg == "-f") {
      overwrite = true;
    } else {
      paths.push_back(arg);
    }
  }
  if (paths.size() != 2) {
    std::cout << "Usage: " << command << " [-f] <source> <destination>" << std::endl;
    return;
  }

  const std::string source = to_uri(paths[0]);
  const std::string destination = to_uri(paths[1]);
  auto future = command == "mv"
    ? manager_.move(source, destination, overwrite, print_progress)
    : manager_.copy(source, destination, overwrite, print_progress);
  auto outcome = future.get();
  std::cout << std::endl;

  if (!outcome.ok()) {
    log_and_display_error(command + " failed", outcome.error());
    return;
  }

  const auto& result = outcome.value();
  if (result.server_side) {
    std::cout << "Renamed on server: " << result.destination.location() << std::endl;
  } else {
    std::cout << "Transferred " << format_size(result.bytes_transferred) << " to "
              << result.destination.location() << std::endl;
  }
  if (result.status == transfer::TransferStatus::PARTIAL_SUCCESS) {
    std::cout << "Copied, but the source could not be deleted and needs manual cleanup: "
              << (result.cleanup_error ? result.cleanup_error->message : source) << std::endl;
  }
}

void CLI::handle_rm_command(const Args& args) {
  if (args.size() != 1) {
    std::cout << "Usage: rm <uri>" << std::endl;
    return;
  }

  auto removed = manager_.remove(to_uri(args[0])).get();
  if (!removed.ok()) {
    log_and_display_error("Cannot delete " + args[0], removed.error());
    return;
  }
  std::cout << "Deleted " << args[0] << std::endl;
}

void CLI::handle_trash_command(const Args& args) {
  if (args.size() != 2) {
    std::cout << "Usage: trash <uri> <root>" << std::endl;
    return;
  }

  auto trashed = manager_.move_to_trash(to_uri(args[0]), to_uri(args[1])).get();
  if (!trashed.ok()) {
    log_and_display_error("Cannot move to trash", trashed.error());
    return;
  }
  std::cout << "Moved to " << trashed.value().location() << std::endl;
}

void CLI::handle_mkdir_command(const Args& args) {
  if (args.size() != 1) {
    std::cout << "Usage: mkdir <uri>" << std::endl;
    return;
  }

  auto created = manager_.mkdir(to_uri(args[0])).get();
  if (!created.ok()) {
    log_and_display_error("Cannot create " + args[0], created.error());
    return;
  }
  std::cout << "Created " << args[0] << std::endl;
}

void CLI::handle_rename_command(const Args& args) {
  if (args.size() != 2) {
    std::cout << "Usage: rename <uri> <new-name>" << std::endl;
    return;
  }

  auto renamed = manager_.rename(to_uri(args[0]), args[1]).get();
  if (!renamed.ok()) {
    log_and_display_error("Cannot rename " + args[0], renamed.error());
    return;
  }
  std::cout << "Renamed to " << renamed.value().location() << std::endl;
}

void CLI::handle_test_command(const Args& args) {
  if (args.size() != 1) {
    std::cout << "Usage: test <uri>" << std::endl;
    return;
  }

  auto tested = manager_.test_connection(to_uri(args[0])).get();
  if (!tested.ok()) {
    log_and_display_error("Connection test failed", tested.error());
    return;
  }
  std::cout << "Connection OK" << std::endl;
}

void CLI::handle_scan_command(const Args& args) {
  if (args.empty()) {
    std::cout << "Usage: scan <root> [types=image,video,...] [flat]" << std::endl;
    return;
  }

  scanner::ScanOptions options;
  for (std::size_t i = 1; i < args.size(); ++i) {
    if (args[i] == "flat") {
      options.recursive = false;
    } else if (args[i].rfind("types=", 0) == 0) {
      std::istringstream list(args[i].substr(6));
      std::string name;
      while (std::getline(list, name, ',')) {
        auto type = scanner::media_type_from_string(name);
        if (!type) {
          std::cout << "Unknown media type: " << name << std::endl;
          return;
        }
        options.types.insert(*type);
      }
    } else {
      std::cout << "Unknown scan option: " << args[i] << std::endl;
      return;
    }
  }

  ConsoleScanProgress progress;
  auto files = manager_.scan(to_uri(args[0]), options, &progress).get();
  std::cout << std::endl;
  if (!files.ok()) {
    log_and_display_error("Scan failed", files.error());
    return;
  }
  for (const auto& file : files.value()) {
    std::cout << std::setw(6) << scanner::media_type_to_string(file.type) << "  " << std::setw(10)
              << format_size(file.entry.size) << "  " << file.uri.path << std::endl;
  }
  std::cout << files.value().size() << " media files" << std::endl;
}

void CLI::handle_fetch_command(const Args& args) {
  if (args.size() != 1) {
    std::cout << "Usage: fetch <uri>" << std::endl;
    return;
  }

  auto cached = manager_.fetch_to_cache(to_uri(args[0])).get();
  if (!cached.ok()) {
    log_and_display_error("Cannot fetch " + args[0], cached.error());
    return;
  }
  std::cout << "Cached at " << cached.value().string() << std::endl;
}

void CLI::handle_cache_command(const std::string& command) {
  auto& cache = manager_.file_cache();
  if (command == "cache-clear") {
    std::cout << "Deleted " << cache.clear_all() << " cached files" << std::endl;
    return;
  }
  const auto stats = cache.stats();
  std::cout << "  directory: " << cache.directory().string() << std::endl;
  std::cout << "  entries:   " << stats.file_count << std::endl;
  std::cout << "  size:      " << format_size(stats.total_bytes);
  if (stats.max_bytes > 0) {
    std::cout << " of " << format_size(stats.max_bytes);
  }
  std::cout << std::endl;
  std::cout << "  ttl:       " << cache.ttl().count() << " s" << std::endl;
}

void CLI::handle_pool_command() {
  std::cout << "Pooled connections: " << manager_.connection_pool().size() << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const Error& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error.to_string();

  std::cout << message << ": ";
  if (error.kind == ErrorKind::CONNECTION_ERROR) {
    std::cout << "connection failed (" << error_reason_to_string(error.reason) << "). " << error.message;
  } else if (error.reason == ErrorReason::NOT_FOUND) {
    std::cout << "not found. " << error.message;
  } else if (error.reason == ErrorReason::DESTINATION_EXISTS) {
    std::cout << "destination exists, use -f to overwrite. " << error.message;
  } else if (error.reason == ErrorReason::MISSING_CREDENTIALS) {
    std::cout << "no credentials, use 'login' first. " << error.message;
  } else if (error.kind == ErrorKind::CANCELLED) {
    std::cout << "cancelled.";
  } else {
    std::cout << error.message;
  }
  if (!error.cause.empty()) {
    std::cout << " [" << error.cause << "]";
  }
  std::cout << std::endl;
}


//==============================================
// INTERNAL HELPERS
//==============================================

std::string CLI::to_uri(const std::string& text) {
  if (text.find("://") != std::string::npos || text.empty() || text.front() == '/') {
    return text;
  }
  std::error_code ec;
  const auto absolute = std::filesystem::absolute(text, ec);
  return ec ? text : absolute.string();
}

CLI::Args CLI::tokenize(const std::string& line) {
  Args tokens;
  std::string current;
  bool quoted = false;
  bool has_token = false;

  for (char c : line) {
    if (c == '"') {
      quoted = !quoted;
      has_token = true;
    } else if (!quoted && std::isspace(static_cast<unsigned char>(c))) {
      if (has_token) {
        tokens.push_back(current);
        current.clear();
        has_token = false;
      }
    } else {
      current += c;
      has_token = true;
    }
  }
  if (has_token) {
    tokens.push_back(current);
  }
  return tokens;
}

} // namespace cli
} // namespace netfs
