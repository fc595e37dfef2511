#ifndef VAULT_PROTOCOL_COMMAND_CODEC_HPP
#define VAULT_PROTOCOL_COMMAND_CODEC_HPP

#include <string>
#include "protocol/messages.hpp"

namespace vault {
namespace protocol {

// JSON encoding of the records exchanged after the handshake.
// Decoders ignore unknown fields and throw network::MalformedMessage
// when the text is not a JSON object or a required field has the wrong type.
class CommandCodec {
public:
  // ---- ENCODING ----
  static std::string encode(const Command& command);
  static std::string encode(const Credentials& credentials);
  static std::string encode(const Response& response);


  // ---- DECODING ----
  // Missing or unknown actions decode as Action::UNKNOWN
  static Command decode_command(const std::string& text);
  static Credentials decode_credentials(const std::string& text);
  static Response decode_response(const std::string& text);


  // ---- VALIDATION ----
  // Known action with a non-empty filename where one is required
  static bool validate(const Command& command);
};

} // namespace protocol
} // namespace vault

#endif // VAULT_PROTOCOL_COMMAND_CODEC_HPP
