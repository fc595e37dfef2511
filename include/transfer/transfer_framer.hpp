#ifndef VAULT_TRANSFER_TRANSFER_FRAMER_HPP
#define VAULT_TRANSFER_TRANSFER_FRAMER_HPP

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include "network/connection.hpp"
#include "crypto/digest.hpp"

namespace vault {
namespace transfer {

/**
 * Streams a file body over a connection as CHUNK frames followed by one
 * END_OF_STREAM trailer carrying the byte count and SHA-256 of the body.
 * The trailer is the only terminator, so body content is never inspected
 * for end markers.
 */
class TransferFramer {
public:
  static constexpr std::size_t DEFAULT_CHUNK_SIZE = 4096;
  static constexpr std::size_t TRAILER_SIZE = sizeof(uint64_t) + crypto::Sha256::DIGEST_SIZE;

  // ---- CONSTRUCTOR ----
  explicit TransferFramer(std::size_t chunk_size = DEFAULT_CHUNK_SIZE);


  // ---- OUTGOING ----
  // Sends the whole source followed by the trailer, returns body bytes sent.
  // Sends ABORT and throws TransferAborted if the source fails mid-read.
  uint64_t send_stream(network::Connection& connection, std::istream& source) const;


  // ---- INCOMING ----
  // Writes the body to sink until the trailer arrives, returns body bytes received.
  // Throws TransferAborted (peer closed, ABORT, trailer mismatch),
  // ShutdownInProgress (shutdown notice mid-stream) or MalformedMessage.
  // The caller discards the sink on any exception.
  uint64_t receive_stream(network::Connection& connection, std::ostream& sink) const;


  // ---- TRAILER ----
  static std::string encode_trailer(uint64_t total_bytes, const crypto::Sha256::Digest& digest);
  static void decode_trailer(const std::string& payload, uint64_t& total_bytes, crypto::Sha256::Digest& digest);

  std::size_t chunk_size() const { return chunk_size_; }

private:
  std::size_t chunk_size_;
};

} // namespace transfer
} // namespace vault

#endif // VAULT_TRANSFER_TRANSFER_FRAMER_HPP
