#ifndef VAULT_NETWORK_CODEC_HPP
#define VAULT_NETWORK_CODEC_HPP

#include <array>
#include <cstdint>
#include <iostream>
#include <boost/endian/conversion.hpp>
#include "network/frame.hpp"

namespace vault {
namespace network {

class FrameCodec {
public:
  using HeaderBytes = std::array<uint8_t, FrameHeader::SIZE>;

  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Serializes a frame to an output stream, returns bytes written
  static std::size_t serialize(const Frame& frame, std::ostream& output);
  // Deserializes the next frame from an input stream
  static Frame deserialize(std::istream& input);


  // ---- HEADER OPERATIONS ----
  static HeaderBytes encode_header(const FrameHeader& header);
  // Validates type and size limits, throws MalformedMessage
  static FrameHeader parse_header(const HeaderBytes& bytes);
  // Largest payload accepted for a frame type
  static std::size_t max_payload_size(FrameType type);

private:
  // ---- STREAM OPERATIONS ----
  static void write_bytes(std::ostream& output, const void* data, std::size_t size);
  // Returns number of bytes actually read
  static std::size_t read_bytes(std::istream& input, void* data, std::size_t size);


  // ---- HOST TO NETWORK BYTE ORDER CONVERSION ----
  static uint32_t to_network_order(uint32_t host_value) {
    return boost::endian::native_to_big(host_value);
  }
  static uint32_t from_network_order(uint32_t network_value) {
    return boost::endian::big_to_native(network_value);
  }
};

} // namespace network
} // namespace vault

#endif // VAULT_NETWORK_CODEC_HPP
