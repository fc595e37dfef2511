#include "client/client.hpp"
#include "network/protocol_error.hpp"
#include "protocol/command_codec.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>

namespace vault {
namespace client {

using protocol::Action;
using protocol::Command;
using protocol::CommandCodec;
using protocol::Response;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Client::Client() = default;

Client::~Client() {
  close();
}


//==============================================
// SESSION SETUP
//==============================================

void Client::connect(const std::string& host, uint16_t port) {
  auto connection = network::Connection::connect(io_context_, host, port);
  {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    connection_ = connection;
  }

  connection->send_message(protocol::HELLO_TOKEN);
  std::string reply = connection->read_message();
  if (reply != protocol::ACK_TOKEN) {
    BOOST_LOG_TRIVIAL(error) << "Client: Handshake failed, server replied: " << reply;
    close();
    throw network::HandshakeRejected(reply);
  }

  BOOST_LOG_TRIVIAL(info) << "Client: Handshake complete with " << host << ":" << port;
}

void Client::authenticate(const std::string& username, const std::string& password) {
  require_connection()->send_message(CommandCodec::encode(protocol::Credentials{username, password}));

  Response response = read_response();
  if (!response.is_success()) {
    BOOST_LOG_TRIVIAL(warning) << "Client: Authentication failed: " << response.message;
    close();
    throw network::AuthenticationFailed(response.message);
  }

  BOOST_LOG_TRIVIAL(info) << "Client: Authenticated as '" << username << "'";
}


//==============================================
// COMMANDS
//==============================================

protocol::Response Client::upload(const std::filesystem::path& local_path, const std::string& remote_name) {
  std::ifstream file(local_path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Client: Cannot open local file: " << local_path.string();
    throw network::NotFound(local_path.string());
  }

  // Server must acknowledge before the body is streamed
  Response ready = send_command(Command{Action::UPLOAD, remote_name});
  if (!ready.is_success()) {
    return ready;
  }

  try {
    uint64_t bytes_sent = framer_.send_stream(*require_connection(), file);
    BOOST_LOG_TRIVIAL(info) << "Client: Uploaded " << bytes_sent << " bytes as " << remote_name;
  } catch (const network::TransferAborted& e) {
    BOOST_LOG_TRIVIAL(error) << "Client: Upload aborted: " << e.what();
    return read_response();
  }

  return read_response();
}

protocol::Response Client::download(const std::string& remote_name, const std::filesystem::path& local_path) {
  // Received bytes land in a side file that only replaces local_path once verified
  std::filesystem::path partial_path = local_path;
  partial_path += ".part";

  std::ofstream file(partial_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Client: Cannot create local file: " << partial_path.string();
    return Response::error("Cannot create local file " + local_path.string());
  }

  auto discard_partial = [&]() {
    file.close();
    std::error_code ec;
    std::filesystem::remove(partial_path, ec);
  };

  Response starting;
  try {
    starting = send_command(Command{Action::DOWNLOAD, remote_name});
  } catch (const std::exception&) {
    discard_partial();
    throw;
  }
  if (!starting.is_success()) {
    discard_partial();
    return starting;
  }

  try {
    uint64_t bytes_received = framer_.receive_stream(*require_connection(), file);
    file.close();
    std::filesystem::rename(partial_path, local_path);
    BOOST_LOG_TRIVIAL(info) << "Client: Downloaded " << bytes_received << " bytes to " << local_path.string();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Client: Download of " << remote_name << " failed: " << e.what();
    discard_partial();
    throw;
  }

  return starting;
}

protocol::Response Client::preview(const std::string& remote_name) {
  return send_command(Command{Action::PREVIEW, remote_name});
}

protocol::Response Client::remove(const std::string& remote_name) {
  return send_command(Command{Action::DELETE, remote_name});
}

protocol::Response Client::list() {
  return send_command(Command{Action::LIST, std::nullopt});
}

void Client::exit() {
  if (!is_connected()) {
    return;
  }

  try {
    require_connection()->send_message(CommandCodec::encode(Command{Action::EXIT, std::nullopt}));
    BOOST_LOG_TRIVIAL(info) << "Client: Sent exit";
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Client: Could not send exit: " << e.what();
  }
  close();
}

void Client::interrupt() {
  std::shared_ptr<network::Connection> connection;
  {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    connection = connection_;
  }
  if (!connection) {
    return;
  }

  if (connection->try_send_message(CommandCodec::encode(Command{Action::EXIT, std::nullopt}),
                                   EXIT_NOTICE_TIMEOUT)) {
    BOOST_LOG_TRIVIAL(info) << "Client: Sent exit on interrupt";
  } else {
    BOOST_LOG_TRIVIAL(warning) << "Client: Could not send exit on interrupt";
  }
  close();
}


//==============================================
// SHUTDOWN DETECTION
//==============================================

void Client::poll_shutdown(std::chrono::milliseconds timeout) {
  auto connection = require_connection();
  if (!connection->wait_readable(timeout)) {
    return;
  }

  // Nothing is outstanding between commands, so anything readable is unsolicited
  Response response = CommandCodec::decode_response(connection->read_message());
  if (response.is_shutdown()) {
    BOOST_LOG_TRIVIAL(warning) << "Client: Server is shutting down: " << response.message;
    close();
    throw network::ShutdownInProgress(response.message);
  }
  BOOST_LOG_TRIVIAL(warning) << "Client: Ignoring unsolicited " << response.status << " response: " << response.message;
}


//==============================================
// CONNECTION
//==============================================

bool Client::is_connected() const {
  std::lock_guard<std::mutex> lock(connection_mutex_);
  return connection_ && connection_->is_open();
}

void Client::close() {
  std::shared_ptr<network::Connection> connection;
  {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    connection.swap(connection_);
  }
  if (connection) {
    connection->close();
  }
}

network::Connection& Client::get_connection() {
  return *require_connection();
}


//==============================================
// UTILITY METHODS
//==============================================

protocol::Response Client::send_command(const Command& command) {
  require_connection()->send_message(CommandCodec::encode(command));
  return read_response();
}

protocol::Response Client::read_response() {
  Response response = CommandCodec::decode_response(require_connection()->read_message());
  if (response.is_shutdown()) {
    BOOST_LOG_TRIVIAL(warning) << "Client: Server is shutting down: " << response.message;
    close();
    throw network::ShutdownInProgress(response.message);
  }
  return response;
}

std::shared_ptr<network::Connection> Client::require_connection() const {
  std::lock_guard<std::mutex> lock(connection_mutex_);
  if (!connection_) {
    throw network::ConnectionClosed("not connected");
  }
  return connection_;
}

} // namespace client
} // namespace vault
