#ifndef VAULT_NETWORK_CONNECTION_HPP
#define VAULT_NETWORK_CONNECTION_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <boost/asio.hpp>
#include "network/frame.hpp"

namespace vault {
namespace network {

// Blocking, frame-oriented wrapper around one TCP stream.
// Reads are expected from a single thread; writes may come from any thread.
class Connection {
public:
  // Delete copy operations to prevent socket duplication
  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Connection(boost::asio::ip::tcp::socket socket);
  ~Connection();

  // Resolves and connects to a remote endpoint, throws on failure
  static std::shared_ptr<Connection> connect(boost::asio::io_context& io_context,
                                             const std::string& host, uint16_t port);


  // ---- FRAME OPERATIONS ----
  void write_frame(const Frame& frame);
  // Blocks until a complete frame is available
  Frame read_frame();

  // Convenience wrappers for MESSAGE frames
  void send_message(const std::string& message);
  std::string read_message();

  // Sends a MESSAGE frame without waiting on a busy writer or a full send buffer.
  // Returns false when the frame could not be fully written within timeout.
  bool try_send_message(const std::string& message, std::chrono::milliseconds timeout);

  // Returns true when a read would not block (data or end of stream pending)
  bool wait_readable(std::chrono::milliseconds timeout);


  // ---- TEARDOWN ----
  // Stops both directions and wakes any blocked reader
  void shutdown();
  // Releases the socket
  void close();


  // ---- GETTERS ----
  bool is_open() const;
  const std::string& remote_address() const { return remote_address_; }

private:
  // ---- PARAMETERS ----
  boost::asio::ip::tcp::socket socket_;
  std::string remote_address_;

  // Lock order: write_mutex_ before lifecycle_mutex_.
  // lifecycle_mutex_ is never held across a blocking read or write.
  std::mutex write_mutex_;
  mutable std::mutex lifecycle_mutex_;
  std::atomic<bool> shut_down_{false};


  // ---- TEARDOWN ----
  // Caller holds lifecycle_mutex_
  void shutdown_locked();


  // ---- STREAM OPERATIONS ----
  // Reads exactly size bytes, throws ConnectionClosed on end of stream or error
  void read_exact(void* data, std::size_t size);
};

} // namespace network
} // namespace vault

#endif // VAULT_NETWORK_CONNECTION_HPP
