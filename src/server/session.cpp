#include "server/session.hpp"
#include "network/protocol_error.hpp"
#include "protocol/command_codec.hpp"
#include "utils/text.hpp"
#include <boost/log/trivial.hpp>
#include <thread>

namespace vault {
namespace server {

using protocol::Action;
using protocol::Command;
using protocol::CommandCodec;
using protocol::Response;
using State = SessionState::State;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Session::Session(SessionId id,
                 std::shared_ptr<network::Connection> connection,
                 const auth::CredentialStore& credentials,
                 const storage::UserStore& store,
                 SessionRegistry& registry,
                 std::shared_ptr<const CancellationToken> cancellation,
                 Options options)
  : id_(id)
  , connection_(std::move(connection))
  , credentials_(credentials)
  , store_(store)
  , registry_(registry)
  , cancellation_(std::move(cancellation))
  , options_(options)
  , framer_(options.chunk_size) {
  BOOST_LOG_TRIVIAL(debug) << "Session " << id_ << ": Created for " << connection_->remote_address();
}

Session::~Session() {
  terminate();
}


//==============================================
// EXECUTION
//==============================================

void Session::run() {
  BOOST_LOG_TRIVIAL(info) << "Session " << id_ << ": Started for " << connection_->remote_address();

  try {
    transition(State::HANDSHAKING);
    if (handshake()) {
      transition(State::AUTHENTICATING);
      if (authenticate()) {
        transition(State::READY);
        command_loop();
      }
    }
  }
  catch (const network::ConnectionClosed& e) {
    if (is_cancelled()) {
      BOOST_LOG_TRIVIAL(info) << "Session " << id_ << ": Closed by server shutdown";
    } else {
      BOOST_LOG_TRIVIAL(info) << "Session " << id_ << ": Peer disconnected: " << e.what();
    }
  }
  catch (const network::ProtocolError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Session " << id_ << ": Terminating on protocol error: " << e.what();
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Session " << id_ << ": Terminating on unexpected error: " << e.what();
  }

  terminate();
}


//==============================================
// PROTOCOL PHASES
//==============================================

bool Session::handshake() {
  if (is_cancelled()) {
    return false;
  }

  std::string greeting;
  try {
    greeting = connection_->read_message();
  } catch (const network::MalformedMessage& e) {
    BOOST_LOG_TRIVIAL(warning) << "Session " << id_ << ": Unframed greeting: " << e.what();
    try {
      connection_->send_message(protocol::REJECT_TOKEN);
    } catch (const std::exception& send_error) {
      BOOST_LOG_TRIVIAL(debug) << "Session " << id_ << ": Could not send rejection: " << send_error.what();
    }
    return false;
  }

  if (greeting != protocol::HELLO_TOKEN) {
    BOOST_LOG_TRIVIAL(warning) << "Session " << id_ << ": Invalid handshake from " << connection_->remote_address();
    connection_->send_message(protocol::REJECT_TOKEN);
    return false;
  }

  connection_->send_message(protocol::ACK_TOKEN);
  BOOST_LOG_TRIVIAL(info) << "Session " << id_ << ": Handshake complete with " << connection_->remote_address();
  return true;
}

bool Session::authenticate() {
  if (is_cancelled()) {
    return false;
  }

  protocol::Credentials credentials;
  try {
    credentials = CommandCodec::decode_credentials(connection_->read_message());
  } catch (const network::MalformedMessage& e) {
    BOOST_LOG_TRIVIAL(warning) << "Session " << id_ << ": Invalid credential record: " << e.what();
    try_send_response(Response::error("Authentication failed"));
    return false;
  }

  if (!credentials_.verify(credentials.username, credentials.password)) {
    BOOST_LOG_TRIVIAL(warning) << "Session " << id_ << ": Authentication failed for '" << credentials.username << "'";
    send_response(Response::error("Authentication failed"));
    return false;
  }

  try {
    sandbox_ = store_.ensure_sandbox(credentials.username);
  } catch (const network::PathRejected& e) {
    BOOST_LOG_TRIVIAL(warning) << "Session " << id_ << ": Unusable username '" << credentials.username << "': " << e.what();
    send_response(Response::error("Authentication failed"));
    return false;
  } catch (const storage::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Session " << id_ << ": " << e.what();
    send_response(Response::error("Server storage unavailable"));
    return false;
  }

  username_ = credentials.username;
  send_response(Response::success("Authentication successful"));
  BOOST_LOG_TRIVIAL(info) << "Session " << id_ << ": Authenticated as '" << *username_ << "'";
  return true;
}

void Session::command_loop() {
  while (state_.get_state() == State::READY) {
    if (is_cancelled()) {
      BOOST_LOG_TRIVIAL(info) << "Session " << id_ << ": Cancelled before next command";
      return;
    }

    // Malformed records propagate: stream framing can no longer be trusted
    Command command = CommandCodec::decode_command(connection_->read_message());

    if (!CommandCodec::validate(command)) {
      BOOST_LOG_TRIVIAL(warning) << "Session " << id_ << ": Invalid command " << command.action;
      send_response(Response::error("Invalid command"));
      continue;
    }

    if (command.action == Action::EXIT) {
      BOOST_LOG_TRIVIAL(info) << "Session " << id_ << ": Client requested exit";
      return;
    }

    dispatch(command);
  }
}


//==============================================
// COMMAND HANDLERS
//==============================================

void Session::dispatch(const Command& command) {
  BOOST_LOG_TRIVIAL(debug) << "Session " << id_ << ": Dispatching " << command.action;

  try {
    switch (command.action) {
      case Action::UPLOAD:   handle_upload(*command.filename);   break;
      case Action::DOWNLOAD: handle_download(*command.filename); break;
      case Action::PREVIEW:  handle_preview(*command.filename);  break;
      case Action::DELETE:   handle_delete(*command.filename);   break;
      case Action::LIST:     handle_list();                      break;
      case Action::EXIT:
      case Action::UNKNOWN:
        send_response(Response::error("Invalid command"));
        break;
    }
  }
  catch (const network::PathRejected& e) {
    BOOST_LOG_TRIVIAL(warning) << "Session " << id_ << ": " << e.what();
    send_response(Response::error("Invalid filename"));
  }
  catch (const network::NotFound& e) {
    BOOST_LOG_TRIVIAL(info) << "Session " << id_ << ": " << e.what();
    send_response(Response::error("File not found"));
  }
  catch (const storage::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Session " << id_ << ": " << e.what();
    send_response(Response::error(e.what()));
  }
}

void Session::handle_upload(const std::string& filename) {
  auto target = store_.resolve(sandbox_, filename);
  // The stored copy is only replaced once the whole body has arrived
  auto staging = store_.staging_path(target);
  auto file = store_.open_for_write(staging);

  // The client streams only after this acknowledgment
  Response ready = Response::success("Ready to receive");
  ready.filename = filename;
  send_response(ready);
  transition(State::UPLOADING);

  uint64_t bytes_received = 0;
  try {
    bytes_received = framer_.receive_stream(*connection_, *file);
    file->close();
    if (file->fail()) {
      throw storage::StoreError("Store: Failed to write file: " + filename);
    }
    store_.commit(staging, target);
  }
  catch (const storage::StoreError&) {
    file.reset();
    store_.discard(staging);
    transition(State::READY);
    throw;
  }
  catch (const network::ProtocolError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Session " << id_ << ": Upload of " << filename << " failed: " << e.what();
    file.reset();
    store_.discard(staging);
    try_send_response(Response::error("Upload failed: " + std::string(e.what())));
    throw;
  }

  transition(State::READY);

  Response done = Response::success("File " + filename + " uploaded successfully");
  done.filename = filename;
  done.size = bytes_received;
  send_response(done);
  BOOST_LOG_TRIVIAL(info) << "Session " << id_ << ": Stored " << filename << " (" << bytes_received << " bytes)";
}

void Session::handle_download(const std::string& filename) {
  auto source_path = store_.resolve(sandbox_, filename);
  auto file = store_.open_for_read(source_path);
  auto size = store_.get_file_size(source_path);

  Response starting = Response::success("Starting transfer");
  starting.filename = filename;
  starting.size = size;
  send_response(starting);
  transition(State::DOWNLOADING);

  // Framing is explicit, the pause only helps peers with naive read loops
  if (options_.transfer_start_delay.count() > 0) {
    std::this_thread::sleep_for(options_.transfer_start_delay);
  }

  try {
    uint64_t bytes_sent = framer_.send_stream(*connection_, *file);
    BOOST_LOG_TRIVIAL(info) << "Session " << id_ << ": Sent " << filename << " (" << bytes_sent << " bytes)";
  }
  catch (const network::TransferAborted& e) {
    // ABORT frame already told the peer, the stream is still in sync
    BOOST_LOG_TRIVIAL(error) << "Session " << id_ << ": Download of " << filename << " aborted: " << e.what();
  }

  transition(State::READY);
}

void Session::handle_preview(const std::string& filename) {
  auto path = store_.resolve(sandbox_, filename);
  std::string prefix = store_.read_prefix(path, storage::UserStore::PREVIEW_SIZE);

  Response response = Response::success("Preview of " + filename);
  response.filename = filename;
  response.preview = utils::sanitize_utf8(prefix);
  send_response(response);
}

void Session::handle_delete(const std::string& filename) {
  auto path = store_.resolve(sandbox_, filename);
  store_.remove(path);
  send_response(Response::success("File " + filename + " deleted successfully"));
}

void Session::handle_list() {
  Response response = Response::success("Files listed");
  response.files = store_.list(sandbox_);
  response.message = std::to_string(response.files->size()) + " file(s)";
  send_response(response);
}


//==============================================
// UTILITY METHODS
//==============================================

void Session::send_response(const Response& response) {
  connection_->send_message(CommandCodec::encode(response));
  BOOST_LOG_TRIVIAL(debug) << "Session " << id_ << ": Sent " << response.status << " response: " << response.message;
}

void Session::try_send_response(const Response& response) noexcept {
  try {
    send_response(response);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(debug) << "Session " << id_ << ": Could not send response: " << e.what();
  }
}

bool Session::transition(State new_state) {
  State previous = state_.get_state();
  if (!state_.transition_to(new_state)) {
    BOOST_LOG_TRIVIAL(error) << "Session " << id_ << ": Invalid transition " << previous << " -> " << new_state;
    return false;
  }
  BOOST_LOG_TRIVIAL(trace) << "Session " << id_ << ": " << previous << " -> " << new_state;
  return true;
}

bool Session::is_cancelled() const {
  return cancellation_ && cancellation_->is_cancelled();
}

void Session::terminate() noexcept {
  if (state_.is_terminal()) {
    return;
  }

  transition(State::TERMINATED);
  registry_.remove(id_);
  connection_->close();
  BOOST_LOG_TRIVIAL(info) << "Session " << id_ << ": Terminated"
                          << (username_ ? " (user '" + *username_ + "')" : std::string());
}

} // namespace server
} // namespace vault
