#ifndef VAULT_NETWORK_FRAME_HPP
#define VAULT_NETWORK_FRAME_HPP

#include <cstdint>
#include <string>

namespace vault {
namespace network {

// Frame type used to differentiate control records from transfer data
enum class FrameType : uint8_t {
  MESSAGE = 0x01,
  CHUNK = 0x02,
  END_OF_STREAM = 0x03,
  ABORT = 0x04
};

// Fixed-size prefix of every frame on the wire
struct FrameHeader {
  FrameType type;
  uint32_t payload_size;

  static constexpr std::size_t SIZE = sizeof(uint8_t) + sizeof(uint32_t);
};

// Data structure used to represent a frame locally
struct Frame {
  FrameType type = FrameType::MESSAGE;
  std::string payload;
};

// Upper bounds enforced by the decoder
constexpr std::size_t MAX_MESSAGE_SIZE = 1024 * 1024;
constexpr std::size_t MAX_CHUNK_SIZE = 64 * 1024;

const char* frame_type_to_string(FrameType type);

} // namespace network
} // namespace vault

#endif // VAULT_NETWORK_FRAME_HPP
