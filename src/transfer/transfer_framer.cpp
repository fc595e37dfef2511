#include "transfer/transfer_framer.hpp"
#include "network/protocol_error.hpp"
#include "protocol/command_codec.hpp"
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace vault {
namespace transfer {

using network::Frame;
using network::FrameType;

TransferFramer::TransferFramer(std::size_t chunk_size)
  : chunk_size_(chunk_size) {
  if (chunk_size_ == 0 || chunk_size_ > network::MAX_CHUNK_SIZE) {
    throw std::invalid_argument("Transfer framer: Invalid chunk size " + std::to_string(chunk_size_));
  }
}

//==============================================
// OUTGOING
//==============================================

uint64_t TransferFramer::send_stream(network::Connection& connection, std::istream& source) const {
  BOOST_LOG_TRIVIAL(debug) << "Transfer framer: Starting to send stream to " << connection.remote_address();

  crypto::Sha256 hasher;
  std::vector<char> buffer(chunk_size_);
  uint64_t total_bytes_sent = 0;

  // Read and send data in chunks until the source is exhausted
  while (source.good()) {
    source.read(buffer.data(), buffer.size());
    auto bytes_read = static_cast<std::size_t>(source.gcount());
    if (bytes_read == 0) {
      break;
    }

    hasher.update(buffer.data(), bytes_read);
    connection.write_frame(Frame{FrameType::CHUNK, std::string(buffer.data(), bytes_read)});
    total_bytes_sent += bytes_read;

    BOOST_LOG_TRIVIAL(trace) << "Transfer framer: Sent " << bytes_read
                             << " bytes, total sent: " << total_bytes_sent;
  }

  if (source.bad() || (source.fail() && !source.eof())) {
    BOOST_LOG_TRIVIAL(error) << "Transfer framer: Source read failed after " << total_bytes_sent << " bytes";
    connection.write_frame(Frame{FrameType::ABORT, "source read failed"});
    throw network::TransferAborted("source read failed");
  }

  connection.write_frame(Frame{FrameType::END_OF_STREAM, encode_trailer(total_bytes_sent, hasher.finalize())});

  BOOST_LOG_TRIVIAL(debug) << "Transfer framer: Successfully sent " << total_bytes_sent << " bytes";
  return total_bytes_sent;
}


//==============================================
// INCOMING
//==============================================

uint64_t TransferFramer::receive_stream(network::Connection& connection, std::ostream& sink) const {
  BOOST_LOG_TRIVIAL(debug) << "Transfer framer: Starting to receive stream from " << connection.remote_address();

  crypto::Sha256 hasher;
  uint64_t total_bytes_received = 0;

  while (true) {
    Frame frame;
    try {
      frame = connection.read_frame();
    } catch (const network::ConnectionClosed& e) {
      BOOST_LOG_TRIVIAL(warning) << "Transfer framer: Peer closed after " << total_bytes_received
                                 << " bytes: " << e.what();
      throw network::TransferAborted("peer closed the connection mid-stream");
    }

    switch (frame.type) {
      case FrameType::CHUNK:
        hasher.update(frame.payload.data(), frame.payload.size());
        if (!sink.write(frame.payload.data(), frame.payload.size())) {
          BOOST_LOG_TRIVIAL(error) << "Transfer framer: Failed to write " << frame.payload.size() << " bytes to sink";
          throw network::TransferAborted("failed to write received data");
        }
        total_bytes_received += frame.payload.size();
        BOOST_LOG_TRIVIAL(trace) << "Transfer framer: Received " << frame.payload.size()
                                 << " bytes, total received: " << total_bytes_received;
        break;

      case FrameType::END_OF_STREAM: {
        uint64_t expected_bytes = 0;
        crypto::Sha256::Digest expected_digest{};
        decode_trailer(frame.payload, expected_bytes, expected_digest);

        if (expected_bytes != total_bytes_received) {
          BOOST_LOG_TRIVIAL(error) << "Transfer framer: Size mismatch, trailer says " << expected_bytes
                                   << " bytes, received " << total_bytes_received;
          throw network::TransferAborted("size mismatch");
        }
        if (hasher.finalize() != expected_digest) {
          BOOST_LOG_TRIVIAL(error) << "Transfer framer: Digest mismatch after " << total_bytes_received << " bytes";
          throw network::TransferAborted("checksum mismatch");
        }

        sink.flush();
        BOOST_LOG_TRIVIAL(debug) << "Transfer framer: Successfully received " << total_bytes_received << " bytes";
        return total_bytes_received;
      }

      case FrameType::ABORT:
        BOOST_LOG_TRIVIAL(warning) << "Transfer framer: Sender aborted: " << frame.payload;
        throw network::TransferAborted("sender aborted: " + frame.payload);

      case FrameType::MESSAGE: {
        // Only an unsolicited shutdown notice may interrupt a transfer
        auto response = protocol::CommandCodec::decode_response(frame.payload);
        if (response.is_shutdown()) {
          BOOST_LOG_TRIVIAL(warning) << "Transfer framer: Shutdown notice received mid-stream";
          throw network::ShutdownInProgress(response.message);
        }
        throw network::MalformedMessage("unexpected message during transfer");
      }
    }
  }
}


//==============================================
// TRAILER
//==============================================

std::string TransferFramer::encode_trailer(uint64_t total_bytes, const crypto::Sha256::Digest& digest) {
  std::string payload(TRAILER_SIZE, '\0');
  uint64_t network_total = boost::endian::native_to_big(total_bytes);
  std::memcpy(&payload[0], &network_total, sizeof(network_total));
  std::memcpy(&payload[sizeof(network_total)], digest.data(), digest.size());
  return payload;
}

void TransferFramer::decode_trailer(const std::string& payload, uint64_t& total_bytes,
                                    crypto::Sha256::Digest& digest) {
  if (payload.size() != TRAILER_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Transfer framer: Invalid trailer size: " << payload.size();
    throw network::MalformedMessage("invalid end-of-stream trailer");
  }

  uint64_t network_total;
  std::memcpy(&network_total, payload.data(), sizeof(network_total));
  total_bytes = boost::endian::big_to_native(network_total);
  std::memcpy(digest.data(), payload.data() + sizeof(network_total), digest.size());
}

} // namespace transfer
} // namespace vault
