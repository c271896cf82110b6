#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "credentials/credential_store.hpp"
#include "service/file_access_manager.hpp"

namespace netfs {
namespace cli {

class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(service::FileAccessManager& manager, credentials::InMemoryCredentialStore& credentials);


  // ---- STARTUP ----
  void run();

  // Runs one input line; false once the shell should exit
  bool execute(const std::string& line);

private:
  using Args = std::vector<std::string>;

  // ---- PARAMETERS ----
  bool running_;
  std::size_t next_credentials_id_;
  // System components
  service::FileAccessManager& manager_;
  credentials::InMemoryCredentialStore& credentials_;


  // ---- COMMAND PROCESSING ----
  void process_command(const std::string& command, const Args& args);
  void handle_help_command();
  void handle_login_command(const Args& args);
  void handle_ls_command(const Args& args);
  void handle_stat_command(const Args& args);
  void handle_cat_command(const Args& args);
  void handle_transfer_command(const std::string& command, const Args& args);
  void handle_rm_command(const Args& args);
  void handle_trash_command(const Args& args);
  void handle_mkdir_command(const Args& args);
  void handle_rename_command(const Args& args);
  void handle_test_command(const Args& args);
  void handle_scan_command(const Args& args);
  void handle_fetch_command(const Args& args);
  void handle_cache_command(const std::string& command);
  void handle_pool_command();
  void log_and_display_error(const std::string& message, const Error& error);


  // ---- INTERNAL HELPERS ----
  // Relative local paths are made absolute
  static std::string to_uri(const std::string& text);
  static Args tokenize(const std::string& line);
};

} // namespace cli
} // namespace netfs
