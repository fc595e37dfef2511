#include "cli/cli.hpp"
#include "network/protocol_error.hpp"
#include <boost/log/trivial.hpp>
#include <filesystem>

namespace vault {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(client::Client& client, std::istream& in, std::ostream& out, std::chrono::milliseconds shutdown_poll)
  : running_(false)
  , client_(client)
  , in_(in)
  , out_(out)
  , shutdown_poll_(shutdown_poll) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";

  const std::vector<std::string> choices{"1", "2", "3", "4", "5", "6"};

  while (running_) {
    try {
      client_.poll_shutdown(shutdown_poll_);

      display_menu();
      std::string choice;
      if (!get_valid_input("Enter your choice (1-6): ", choices, choice)) {
        // Input closed, leave politely
        handle_exit_choice();
        break;
      }

      // The server may have gone away while the user was typing
      client_.poll_shutdown(shutdown_poll_);
      process_choice(choice);
    } catch (const network::ShutdownInProgress& e) {
      out_ << "\n[SERVER SHUTDOWN] Server is shutting down. Closing connection..." << std::endl;
      BOOST_LOG_TRIVIAL(warning) << "CLI: " << e.what();
      running_ = false;
    } catch (const network::ConnectionClosed& e) {
      log_and_display_error("\nConnection lost", e.what());
      running_ = false;
    } catch (const network::MalformedMessage& e) {
      log_and_display_error("Error: Invalid response from server", e.what());
      running_ = false;
    } catch (const network::TransferAborted& e) {
      log_and_display_error("Transfer failed", e.what());
      running_ = client_.is_connected();
    } catch (const std::exception& e) {
      log_and_display_error("Error", e.what());
      running_ = client_.is_connected();
    }
  }

  client_.close();
  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::display_menu() {
  out_ << "\nAvailable commands:" << std::endl;
  out_ << "1. Upload file" << std::endl;
  out_ << "2. Download file" << std::endl;
  out_ << "3. Preview file" << std::endl;
  out_ << "4. Delete file" << std::endl;
  out_ << "5. List files" << std::endl;
  out_ << "6. Exit" << std::endl;
}

bool CLI::get_valid_input(const std::string& prompt_text, const std::vector<std::string>& valid_choices,
                          std::string& choice) {
  while (prompt(prompt_text, choice)) {
    for (const auto& valid : valid_choices) {
      if (choice == valid) {
        return true;
      }
    }
    out_ << "Invalid input. Please choose from 1, 2, 3, 4, 5, 6" << std::endl;
  }
  return false;
}

bool CLI::prompt(const std::string& text, std::string& value) {
  out_ << text << std::flush;
  if (!std::getline(in_, value)) {
    return false;
  }
  if (!value.empty() && value.back() == '\r') {
    value.pop_back();
  }
  return true;
}

void CLI::process_choice(const std::string& choice) {
  BOOST_LOG_TRIVIAL(debug) << "Processing menu choice: " << choice;

  if (choice == "1") {
    handle_upload_choice();
  } else if (choice == "2") {
    handle_download_choice();
  } else if (choice == "3") {
    handle_preview_choice();
  } else if (choice == "4") {
    handle_delete_choice();
  } else if (choice == "5") {
    handle_list_choice();
  } else if (choice == "6") {
    handle_exit_choice();
  }
}

void CLI::handle_upload_choice() {
  std::string local_path;
  if (!prompt("Enter file path to upload: ", local_path)) {
    return;
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(local_path, ec)) {
    out_ << "File does not exist!" << std::endl;
    return;
  }

  // Only the basename is sent, the server never sees local directories
  std::string remote_name = std::filesystem::path(local_path).filename().string();
  auto response = client_.upload(local_path, remote_name);
  if (response.is_success()) {
    out_ << "File " << local_path << " uploaded successfully" << std::endl;
  } else {
    out_ << "Upload failed: " << response.message << std::endl;
  }
}

void CLI::handle_download_choice() {
  std::string filename;
  if (!prompt("Enter filename to download: ", filename)) {
    return;
  }

  // Saved into the working directory under its basename
  std::filesystem::path local_path = std::filesystem::path(filename).filename();
  if (local_path.empty()) {
    out_ << "Download failed: Invalid filename" << std::endl;
    return;
  }

  auto response = client_.download(filename, local_path);
  if (response.is_success()) {
    out_ << "File " << filename << " downloaded successfully" << std::endl;
  } else {
    out_ << "Download failed: " << response.message << std::endl;
  }
}

void CLI::handle_preview_choice() {
  std::string filename;
  if (!prompt("Enter filename to preview: ", filename)) {
    return;
  }

  auto response = client_.preview(filename);
  if (response.is_success()) {
    out_ << "\nFile preview:" << std::endl;
    out_ << std::string(40, '-') << std::endl;
    out_ << response.preview.value_or("") << std::endl;
    out_ << std::string(40, '-') << std::endl;
  } else {
    out_ << "Error: " << response.message << std::endl;
  }
}

void CLI::handle_delete_choice() {
  std::string filename;
  if (!prompt("Enter filename to delete: ", filename)) {
    return;
  }

  auto response = client_.remove(filename);
  out_ << response.message << std::endl;
}

void CLI::handle_list_choice() {
  auto response = client_.list();
  if (!response.is_success()) {
    out_ << "Error: " << response.message << std::endl;
    return;
  }

  out_ << "\nYour files:" << std::endl;
  for (const auto& file : response.files.value_or(std::vector<std::string>{})) {
    out_ << "- " << file << std::endl;
  }
}

void CLI::handle_exit_choice() {
  client_.exit();
  out_ << "[CLIENT SHUTDOWN] Exiting..." << std::endl;
  running_ = false;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace vault
