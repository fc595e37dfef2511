#include "network/connection.hpp"
#include "network/codec.hpp"
#include "network/protocol_error.hpp"
#include <boost/log/trivial.hpp>
#include <array>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <poll.h>

namespace vault {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Connection::Connection(boost::asio::ip::tcp::socket socket)
  : socket_(std::move(socket)) {
  boost::system::error_code ec;
  auto endpoint = socket_.remote_endpoint(ec);
  if (!ec) {
    remote_address_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
  } else {
    remote_address_ = "<unknown>";
  }
  BOOST_LOG_TRIVIAL(debug) << "Connection: Created for " << remote_address_;
}

Connection::~Connection() {
  close();
  BOOST_LOG_TRIVIAL(debug) << "Connection: Destroyed for " << remote_address_;
}

std::shared_ptr<Connection> Connection::connect(boost::asio::io_context& io_context,
                                                const std::string& host, uint16_t port) {
  BOOST_LOG_TRIVIAL(info) << "Connection: Connecting to " << host << ":" << port;

  // Resolve remote address to endpoints
  boost::asio::ip::tcp::resolver resolver(io_context);
  auto endpoints = resolver.resolve(host, std::to_string(port));

  // Connect to the first available endpoint
  boost::asio::ip::tcp::socket socket(io_context);
  boost::asio::connect(socket, endpoints);

  BOOST_LOG_TRIVIAL(info) << "Connection: Connected to " << host << ":" << port;
  return std::make_shared<Connection>(std::move(socket));
}


//==============================================
// FRAME OPERATIONS
//==============================================

void Connection::write_frame(const Frame& frame) {
  if (frame.payload.size() > FrameCodec::max_payload_size(frame.type)) {
    throw std::length_error("Connection: Frame payload too large");
  }

  FrameHeader header{frame.type, static_cast<uint32_t>(frame.payload.size())};
  auto header_bytes = FrameCodec::encode_header(header);

  std::array<boost::asio::const_buffer, 2> buffers = {
    boost::asio::buffer(header_bytes),
    boost::asio::buffer(frame.payload)
  };

  std::lock_guard<std::mutex> lock(write_mutex_);
  if (shut_down_) {
    throw ConnectionClosed("connection to " + remote_address_ + " is shut down");
  }

  boost::system::error_code ec;
  boost::asio::write(socket_, buffers, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "Connection: Write to " << remote_address_ << " failed: " << ec.message();
    throw ConnectionClosed(ec.message());
  }

  BOOST_LOG_TRIVIAL(trace) << "Connection: Sent " << frame_type_to_string(frame.type)
                           << " frame of " << frame.payload.size() << " bytes to " << remote_address_;
}

Frame Connection::read_frame() {
  FrameCodec::HeaderBytes header_bytes{};
  read_exact(header_bytes.data(), header_bytes.size());
  FrameHeader header = FrameCodec::parse_header(header_bytes);

  Frame frame;
  frame.type = header.type;
  frame.payload.resize(header.payload_size);
  if (header.payload_size > 0) {
    read_exact(&frame.payload[0], header.payload_size);
  }

  BOOST_LOG_TRIVIAL(trace) << "Connection: Received " << frame_type_to_string(frame.type)
                           << " frame of " << frame.payload.size() << " bytes from " << remote_address_;
  return frame;
}

void Connection::send_message(const std::string& message) {
  write_frame(Frame{FrameType::MESSAGE, message});
}

std::string Connection::read_message() {
  Frame frame = read_frame();
  if (frame.type != FrameType::MESSAGE) {
    BOOST_LOG_TRIVIAL(error) << "Connection: Expected MESSAGE frame from " << remote_address_
                             << ", got " << frame_type_to_string(frame.type);
    throw MalformedMessage(std::string("unexpected ") + frame_type_to_string(frame.type) + " frame");
  }
  return std::move(frame.payload);
}

bool Connection::try_send_message(const std::string& message, std::chrono::milliseconds timeout) {
  Frame frame{FrameType::MESSAGE, message};
  if (frame.payload.size() > FrameCodec::max_payload_size(frame.type)) {
    throw std::length_error("Connection: Frame payload too large");
  }

  FrameHeader header{frame.type, static_cast<uint32_t>(frame.payload.size())};
  auto header_bytes = FrameCodec::encode_header(header);
  std::string wire(header_bytes.begin(), header_bytes.end());
  wire += frame.payload;

  // A writer holding the lock may be stuck on a peer that stopped reading
  std::unique_lock<std::mutex> write_lock(write_mutex_, std::try_to_lock);
  if (!write_lock.owns_lock()) {
    BOOST_LOG_TRIVIAL(debug) << "Connection: Writer busy, skipped message to " << remote_address_;
    return false;
  }

  std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);
  if (shut_down_ || !socket_.is_open()) {
    return false;
  }

  auto deadline = std::chrono::steady_clock::now() + timeout;
  std::size_t written = 0;
  while (written < wire.size()) {
    ssize_t sent = ::send(socket_.native_handle(), wire.data() + written, wire.size() - written,
                          MSG_DONTWAIT | MSG_NOSIGNAL);
    if (sent > 0) {
      written += static_cast<std::size_t>(sent);
      continue;
    }
    if (sent < 0 && errno == EINTR) {
      continue;
    }
    if (sent < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
      BOOST_LOG_TRIVIAL(debug) << "Connection: Send to " << remote_address_ << " failed: "
                               << std::strerror(errno);
      return false;
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      break;
    }
    pollfd descriptor{};
    descriptor.fd = socket_.native_handle();
    descriptor.events = POLLOUT;
    if (::poll(&descriptor, 1, static_cast<int>(remaining.count())) <= 0) {
      break;
    }
  }

  if (written < wire.size()) {
    BOOST_LOG_TRIVIAL(debug) << "Connection: Send buffer full, gave up on message to " << remote_address_
                             << " after " << written << " of " << wire.size() << " bytes";
    if (written > 0) {
      // A torn frame leaves the stream unusable
      shutdown_locked();
    }
    return false;
  }
  return true;
}

bool Connection::wait_readable(std::chrono::milliseconds timeout) {
  pollfd descriptor{};
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!socket_.is_open()) {
      return true;
    }
    boost::system::error_code ec;
    if (socket_.available(ec) > 0) {
      return true;
    }
    descriptor.fd = socket_.native_handle();
  }

  descriptor.events = POLLIN;
  int result = ::poll(&descriptor, 1, static_cast<int>(timeout.count()));
  if (result < 0) {
    BOOST_LOG_TRIVIAL(warning) << "Connection: poll failed for " << remote_address_;
    return false;
  }
  return result > 0;
}


//==============================================
// TEARDOWN
//==============================================

void Connection::shutdown() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  shutdown_locked();
}

void Connection::shutdown_locked() {
  if (shut_down_.exchange(true) || !socket_.is_open()) {
    return;
  }

  boost::system::error_code ec;
  socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  if (ec && ec != boost::asio::error::not_connected) {
    BOOST_LOG_TRIVIAL(debug) << "Connection: Socket shutdown error for " << remote_address_ << ": " << ec.message();
  }
  BOOST_LOG_TRIVIAL(debug) << "Connection: Shut down " << remote_address_;
}

void Connection::close() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  shutdown_locked();
  if (socket_.is_open()) {
    boost::system::error_code ec;
    socket_.close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Connection: Socket close error for " << remote_address_ << ": " << ec.message();
    }
  }
}

bool Connection::is_open() const {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  return !shut_down_ && socket_.is_open();
}


//==============================================
// STREAM OPERATIONS
//==============================================

void Connection::read_exact(void* data, std::size_t size) {
  boost::system::error_code ec;
  std::size_t bytes_read = boost::asio::read(socket_, boost::asio::buffer(data, size), ec);
  if (ec || bytes_read != size) {
    BOOST_LOG_TRIVIAL(debug) << "Connection: Read from " << remote_address_ << " ended after "
                             << bytes_read << " of " << size << " bytes: " << ec.message();
    throw ConnectionClosed(ec ? ec.message() : "short read");
  }
}

} // namespace network
} // namespace vault
