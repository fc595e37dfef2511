#include "protocol/command_codec.hpp"
#include "network/protocol_error.hpp"
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>

namespace vault {
namespace protocol {

using json = nlohmann::json;

namespace {

json parse_object(const std::string& text) {
  json document;
  try {
    document = json::parse(text);
  } catch (const json::parse_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Command codec: Invalid JSON: " << e.what();
    throw network::MalformedMessage("invalid JSON record");
  }

  if (!document.is_object()) {
    BOOST_LOG_TRIVIAL(error) << "Command codec: Record is not a JSON object";
    throw network::MalformedMessage("record is not an object");
  }
  return document;
}

std::string required_string(const json& document, const char* field) {
  auto it = document.find(field);
  if (it == document.end() || !it->is_string()) {
    BOOST_LOG_TRIVIAL(error) << "Command codec: Missing or non-string field: " << field;
    throw network::MalformedMessage(std::string("missing string field '") + field + "'");
  }
  return it->get<std::string>();
}

// Invalid UTF-8 in file names or previews is replaced rather than rejected
std::string dump(const json& document) {
  return document.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

//==============================================
// ENCODING
//==============================================

std::string CommandCodec::encode(const Command& command) {
  json document;
  document["action"] = action_to_string(command.action);
  if (command.filename) {
    document["filename"] = *command.filename;
  }
  return dump(document);
}

std::string CommandCodec::encode(const Credentials& credentials) {
  json document;
  document["username"] = credentials.username;
  document["password"] = credentials.password;
  return dump(document);
}

std::string CommandCodec::encode(const Response& response) {
  json document;
  document["status"] = status_to_string(response.status);
  document["message"] = response.message;
  if (response.files) {
    document["files"] = *response.files;
  }
  if (response.preview) {
    document["preview"] = *response.preview;
  }
  if (response.filename) {
    document["filename"] = *response.filename;
  }
  if (response.size) {
    document["size"] = *response.size;
  }
  return dump(document);
}


//==============================================
// DECODING
//==============================================

Command CommandCodec::decode_command(const std::string& text) {
  json document = parse_object(text);

  Command command;
  auto action = document.find("action");
  if (action != document.end() && action->is_string()) {
    command.action = action_from_string(action->get<std::string>());
  }

  auto filename = document.find("filename");
  if (filename != document.end() && filename->is_string()) {
    command.filename = filename->get<std::string>();
  }

  BOOST_LOG_TRIVIAL(debug) << "Command codec: Decoded command " << command.action
                           << (command.filename ? " for " + *command.filename : std::string());
  return command;
}

Credentials CommandCodec::decode_credentials(const std::string& text) {
  json document = parse_object(text);

  Credentials credentials;
  credentials.username = required_string(document, "username");
  credentials.password = required_string(document, "password");
  return credentials;
}

Response CommandCodec::decode_response(const std::string& text) {
  json document = parse_object(text);

  Response response;
  std::string status = required_string(document, "status");
  if (status == "success") {
    response.status = Status::SUCCESS;
  } else if (status == "error") {
    response.status = Status::ERROR;
  } else if (status == "shutdown") {
    response.status = Status::SHUTDOWN;
  } else {
    BOOST_LOG_TRIVIAL(error) << "Command codec: Unknown response status: " << status;
    throw network::MalformedMessage("unknown status '" + status + "'");
  }

  auto message = document.find("message");
  if (message != document.end() && message->is_string()) {
    response.message = message->get<std::string>();
  }

  try {
    if (auto files = document.find("files"); files != document.end()) {
      response.files = files->get<std::vector<std::string>>();
    }
    if (auto preview = document.find("preview"); preview != document.end()) {
      response.preview = preview->get<std::string>();
    }
    if (auto filename = document.find("filename"); filename != document.end()) {
      response.filename = filename->get<std::string>();
    }
    if (auto size = document.find("size"); size != document.end()) {
      response.size = size->get<uint64_t>();
    }
  } catch (const json::type_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Command codec: Response payload has wrong type: " << e.what();
    throw network::MalformedMessage("response payload has wrong type");
  }

  return response;
}


//==============================================
// VALIDATION
//==============================================

bool CommandCodec::validate(const Command& command) {
  if (command.action == Action::UNKNOWN) {
    return false;
  }
  if (requires_filename(command.action)) {
    return command.filename.has_value() && !command.filename->empty();
  }
  return true;
}

} // namespace protocol
} // namespace vault
