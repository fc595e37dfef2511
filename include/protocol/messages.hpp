#ifndef VAULT_PROTOCOL_MESSAGES_HPP
#define VAULT_PROTOCOL_MESSAGES_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace vault {
namespace protocol {

// Literal tokens exchanged before authentication
constexpr const char* HELLO_TOKEN = "HELLO";
constexpr const char* ACK_TOKEN = "ACK";
constexpr const char* REJECT_TOKEN = "REJECTED";

enum class Action {
  UPLOAD,
  DOWNLOAD,
  PREVIEW,
  DELETE,
  LIST,
  EXIT,
  UNKNOWN
};

enum class Status {
  SUCCESS,
  ERROR,
  SHUTDOWN
};

// One client request
struct Command {
  Action action = Action::UNKNOWN;
  std::optional<std::string> filename;
};

// Sent once after the handshake
struct Credentials {
  std::string username;
  std::string password;
};

// One server reply; payload fields are action specific
struct Response {
  Status status = Status::ERROR;
  std::string message;
  std::optional<std::vector<std::string>> files;
  std::optional<std::string> preview;
  std::optional<std::string> filename;
  std::optional<uint64_t> size;

  bool is_success() const { return status == Status::SUCCESS; }
  bool is_shutdown() const { return status == Status::SHUTDOWN; }

  static Response success(const std::string& message);
  static Response error(const std::string& message);
  static Response shutdown(const std::string& message);
};

// ---- STRING CONVERSIONS ----
const char* action_to_string(Action action);
// Returns Action::UNKNOWN for unrecognised names
Action action_from_string(const std::string& name);
const char* status_to_string(Status status);

// True for actions that carry a filename
bool requires_filename(Action action);

inline std::ostream& operator<<(std::ostream& os, Action action) {
  return os << action_to_string(action);
}

inline std::ostream& operator<<(std::ostream& os, Status status) {
  return os << status_to_string(status);
}

} // namespace protocol
} // namespace vault

#endif // VAULT_PROTOCOL_MESSAGES_HPP
