#ifndef VAULT_NETWORK_PROTOCOL_ERROR_HPP
#define VAULT_NETWORK_PROTOCOL_ERROR_HPP

#include <stdexcept>
#include <string>

namespace vault {
namespace network {

class ProtocolError : public std::runtime_error {
public:
  explicit ProtocolError(const std::string& message)
    : std::runtime_error(message) {}
};

// Peer did not open with the expected greeting
class HandshakeRejected : public ProtocolError {
public:
  explicit HandshakeRejected(const std::string& message)
    : ProtocolError("Handshake rejected: " + message) {}
};

class AuthenticationFailed : public ProtocolError {
public:
  explicit AuthenticationFailed(const std::string& message)
    : ProtocolError("Authentication failed: " + message) {}
};

// Framing or record structure lost, connection-fatal
class MalformedMessage : public ProtocolError {
public:
  explicit MalformedMessage(const std::string& message)
    : ProtocolError("Malformed message: " + message) {}
};

// Transfer ended before its trailer; receiver must discard the partial sink
class TransferAborted : public ProtocolError {
public:
  explicit TransferAborted(const std::string& message)
    : ProtocolError("Transfer aborted: " + message) {}
};

class PathRejected : public ProtocolError {
public:
  explicit PathRejected(const std::string& message)
    : ProtocolError("Path rejected: " + message) {}
};

class NotFound : public ProtocolError {
public:
  explicit NotFound(const std::string& message)
    : ProtocolError("Not found: " + message) {}
};

class ShutdownInProgress : public ProtocolError {
public:
  explicit ShutdownInProgress(const std::string& message)
    : ProtocolError("Shutdown in progress: " + message) {}
};

// Peer closed the stream on a frame boundary
class ConnectionClosed : public ProtocolError {
public:
  explicit ConnectionClosed(const std::string& message)
    : ProtocolError("Connection closed: " + message) {}
};

} // namespace network
} // namespace vault

#endif // VAULT_NETWORK_PROTOCOL_ERROR_HPP
