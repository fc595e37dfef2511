#include "protocol/messages.hpp"

namespace vault {
namespace protocol {

Response Response::success(const std::string& message) {
  Response response;
  response.status = Status::SUCCESS;
  response.message = message;
  return response;
}

Response Response::error(const std::string& message) {
  Response response;
  response.status = Status::ERROR;
  response.message = message;
  return response;
}

Response Response::shutdown(const std::string& message) {
  Response response;
  response.status = Status::SHUTDOWN;
  response.message = message;
  return response;
}

const char* action_to_string(Action action) {
  switch (action) {
    case Action::UPLOAD:   return "upload";
    case Action::DOWNLOAD: return "download";
    case Action::PREVIEW:  return "preview";
    case Action::DELETE:   return "delete";
    case Action::LIST:     return "list";
    case Action::EXIT:     return "exit";
    case Action::UNKNOWN:  return "unknown";
  }
  return "unknown";
}

Action action_from_string(const std::string& name) {
  if (name == "upload")   return Action::UPLOAD;
  if (name == "download") return Action::DOWNLOAD;
  if (name == "preview")  return Action::PREVIEW;
  if (name == "delete")   return Action::DELETE;
  if (name == "list")     return Action::LIST;
  if (name == "exit")     return Action::EXIT;
  return Action::UNKNOWN;
}

const char* status_to_string(Status status) {
  switch (status) {
    case Status::SUCCESS:  return "success";
    case Status::ERROR:    return "error";
    case Status::SHUTDOWN: return "shutdown";
  }
  return "error";
}

bool requires_filename(Action action) {
  return action == Action::UPLOAD || action == Action::DOWNLOAD ||
         action == Action::PREVIEW || action == Action::DELETE;
}

} // namespace protocol
} // namespace vault
