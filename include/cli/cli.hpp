#ifndef VAULT_CLI_CLI_HPP
#define VAULT_CLI_CLI_HPP

#include <chrono>
#include <iostream>
#include <string>
#include <vector>
#include "client/client.hpp"

namespace vault {
namespace cli {

// Numbered menu shell over an authenticated Client
class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(client::Client& client, std::istream& in = std::cin, std::ostream& out = std::cout,
      std::chrono::milliseconds shutdown_poll = std::chrono::milliseconds(100));


  // ---- STARTUP ----
  // Returns when the user exits, input ends or the connection is lost
  void run();

private:
  // ---- PARAMETERS ----
  bool running_;
  client::Client& client_;
  std::istream& in_;
  std::ostream& out_;
  std::chrono::milliseconds shutdown_poll_;


  // ---- COMMAND PROCESSING ----
  void display_menu();
  bool get_valid_input(const std::string& prompt, const std::vector<std::string>& valid_choices,
                       std::string& choice);
  bool prompt(const std::string& text, std::string& value);
  void process_choice(const std::string& choice);
  void handle_upload_choice();
  void handle_download_choice();
  void handle_preview_choice();
  void handle_delete_choice();
  void handle_list_choice();
  void handle_exit_choice();
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace vault

#endif // VAULT_CLI_CLI_HPP
