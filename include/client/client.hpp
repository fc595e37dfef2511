#ifndef VAULT_CLIENT_CLIENT_HPP
#define VAULT_CLIENT_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <boost/asio.hpp>
#include "network/connection.hpp"
#include "protocol/messages.hpp"
#include "transfer/transfer_framer.hpp"

namespace vault {
namespace client {

struct ClientConfig {
  std::string host = "127.0.0.1";
  uint16_t port = 12345;
  std::string log_file = "vault_client.log";
  std::string log_level = "warning";
};

// Initiating side of the protocol. Every call that reads from the server
// throws network::ShutdownInProgress when it receives a shutdown notice.
class Client {
public:
  static constexpr std::chrono::milliseconds EXIT_NOTICE_TIMEOUT{100};

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Client();
  ~Client();


  // ---- SESSION SETUP ----
  // Connects and performs the handshake, throws HandshakeRejected
  void connect(const std::string& host, uint16_t port);
  // Single attempt, throws AuthenticationFailed
  void authenticate(const std::string& username, const std::string& password);


  // ---- COMMANDS ----
  // Stores local_path under remote_name, returns the final server response
  protocol::Response upload(const std::filesystem::path& local_path, const std::string& remote_name);
  // Writes remote_name to local_path; a partial local file is removed on failure
  protocol::Response download(const std::string& remote_name, const std::filesystem::path& local_path);
  protocol::Response preview(const std::string& remote_name);
  protocol::Response remove(const std::string& remote_name);
  protocol::Response list();
  // Sends exit and closes the connection
  void exit();
  // Safe from another thread: best-effort exit notice that never waits on
  // a transfer in progress, then closes the connection
  void interrupt();


  // ---- SHUTDOWN DETECTION ----
  // Waits up to timeout for an unsolicited notice, throws ShutdownInProgress if one arrived
  void poll_shutdown(std::chrono::milliseconds timeout);


  // ---- CONNECTION ----
  bool is_connected() const;
  void close();
  // Valid until close(); for use on the thread driving the client
  network::Connection& get_connection();

private:
  // ---- PARAMETERS ----
  boost::asio::io_context io_context_;
  // Guards the pointer only; Connection serializes its own I/O
  mutable std::mutex connection_mutex_;
  std::shared_ptr<network::Connection> connection_;
  transfer::TransferFramer framer_;


  // ---- UTILITY METHODS ----
  protocol::Response send_command(const protocol::Command& command);
  // Throws ShutdownInProgress on a shutdown status
  protocol::Response read_response();
  // Throws ConnectionClosed when not connected
  std::shared_ptr<network::Connection> require_connection() const;
};

} // namespace client
} // namespace vault

#endif // VAULT_CLIENT_CLIENT_HPP
