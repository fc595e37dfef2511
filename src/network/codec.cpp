#include "network/codec.hpp"
#include "network/protocol_error.hpp"
#include <boost/log/trivial.hpp>
#include <cstring>
#include <stdexcept>
#include <string>

namespace vault {
namespace network {

const char* frame_type_to_string(FrameType type) {
  switch (type) {
    case FrameType::MESSAGE:       return "MESSAGE";
    case FrameType::CHUNK:         return "CHUNK";
    case FrameType::END_OF_STREAM: return "END_OF_STREAM";
    case FrameType::ABORT:         return "ABORT";
    default:                       return "UNKNOWN";
  }
}

//==============================================
// SERIALIZATION AND DESERIALIZATION
//==============================================

std::size_t FrameCodec::serialize(const Frame& frame, std::ostream& output) {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw std::runtime_error("Codec: Invalid output stream");
  }

  if (frame.payload.size() > max_payload_size(frame.type)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Payload of " << frame.payload.size()
                             << " bytes exceeds limit for " << frame_type_to_string(frame.type);
    throw std::length_error("Codec: Frame payload too large");
  }

  FrameHeader header{frame.type, static_cast<uint32_t>(frame.payload.size())};
  HeaderBytes header_bytes = encode_header(header);

  BOOST_LOG_TRIVIAL(trace) << "Codec: Writing " << frame_type_to_string(frame.type)
                           << " frame with payload size: " << header.payload_size;
  write_bytes(output, header_bytes.data(), header_bytes.size());
  if (!frame.payload.empty()) {
    write_bytes(output, frame.payload.data(), frame.payload.size());
  }

  return header_bytes.size() + frame.payload.size();
}

Frame FrameCodec::deserialize(std::istream& input) {
  HeaderBytes header_bytes{};
  std::size_t header_read = read_bytes(input, header_bytes.data(), header_bytes.size());
  if (header_read == 0) {
    throw ConnectionClosed("end of stream before frame header");
  }
  if (header_read != header_bytes.size()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Truncated frame header, got " << header_read << " bytes";
    throw MalformedMessage("truncated frame header");
  }

  FrameHeader header = parse_header(header_bytes);

  Frame frame;
  frame.type = header.type;
  frame.payload.resize(header.payload_size);
  if (header.payload_size > 0 &&
      read_bytes(input, &frame.payload[0], header.payload_size) != header.payload_size) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Truncated payload, expected " << header.payload_size << " bytes";
    throw MalformedMessage("truncated frame payload");
  }

  BOOST_LOG_TRIVIAL(trace) << "Codec: Read " << frame_type_to_string(frame.type)
                           << " frame with payload size: " << header.payload_size;
  return frame;
}


//==============================================
// HEADER OPERATIONS
//==============================================

FrameCodec::HeaderBytes FrameCodec::encode_header(const FrameHeader& header) {
  HeaderBytes bytes{};
  bytes[0] = static_cast<uint8_t>(header.type);
  uint32_t network_size = to_network_order(header.payload_size);
  std::memcpy(bytes.data() + 1, &network_size, sizeof(network_size));
  return bytes;
}

FrameHeader FrameCodec::parse_header(const HeaderBytes& bytes) {
  FrameHeader header{};

  switch (static_cast<FrameType>(bytes[0])) {
    case FrameType::MESSAGE:
    case FrameType::CHUNK:
    case FrameType::END_OF_STREAM:
    case FrameType::ABORT:
      header.type = static_cast<FrameType>(bytes[0]);
      break;
    default:
      BOOST_LOG_TRIVIAL(error) << "Codec: Unknown frame type: " << static_cast<int>(bytes[0]);
      throw MalformedMessage("unknown frame type " + std::to_string(bytes[0]));
  }

  uint32_t network_size;
  std::memcpy(&network_size, bytes.data() + 1, sizeof(network_size));
  header.payload_size = from_network_order(network_size);

  if (header.payload_size > max_payload_size(header.type)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Frame size " << header.payload_size
                             << " exceeds limit for " << frame_type_to_string(header.type);
    throw MalformedMessage("frame payload too large");
  }

  return header;
}

std::size_t FrameCodec::max_payload_size(FrameType type) {
  switch (type) {
    case FrameType::MESSAGE:       return MAX_MESSAGE_SIZE;
    case FrameType::CHUNK:         return MAX_CHUNK_SIZE;
    case FrameType::END_OF_STREAM: return 256;
    case FrameType::ABORT:         return 1024;
  }
  return 0;
}


//==============================================
// STREAM OPERATIONS
//==============================================

void FrameCodec::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (!output.write(static_cast<const char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write " << size << " bytes to output stream";
    throw std::runtime_error("Codec: Failed to write to output stream");
  }
}

std::size_t FrameCodec::read_bytes(std::istream& input, void* data, std::size_t size) {
  input.read(static_cast<char*>(data), size);
  return static_cast<std::size_t>(input.gcount());
}

} // namespace network
} // namespace vault
