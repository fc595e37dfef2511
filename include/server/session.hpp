#ifndef VAULT_SERVER_SESSION_HPP
#define VAULT_SERVER_SESSION_HPP

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "auth/credential_store.hpp"
#include "network/connection.hpp"
#include "protocol/messages.hpp"
#include "server/cancellation_token.hpp"
#include "server/session_registry.hpp"
#include "server/session_state.hpp"
#include "storage/user_store.hpp"
#include "transfer/transfer_framer.hpp"

namespace vault {
namespace server {

// Drives one connection from handshake to termination on the calling thread
class Session {
public:
  struct Options {
    // Pause between the download start response and the first chunk
    std::chrono::milliseconds transfer_start_delay{10};
    std::size_t chunk_size = transfer::TransferFramer::DEFAULT_CHUNK_SIZE;
  };

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Session(SessionId id,
          std::shared_ptr<network::Connection> connection,
          const auth::CredentialStore& credentials,
          const storage::UserStore& store,
          SessionRegistry& registry,
          std::shared_ptr<const CancellationToken> cancellation,
          Options options);
  ~Session();


  // ---- EXECUTION ----
  // Runs the protocol until the session terminates; never throws
  void run();


  // ---- GETTERS ----
  SessionId id() const { return id_; }
  SessionState::State state() const { return state_.get_state(); }
  const std::optional<std::string>& username() const { return username_; }

private:
  // ---- PARAMETERS ----
  SessionId id_;
  std::shared_ptr<network::Connection> connection_;
  const auth::CredentialStore& credentials_;
  const storage::UserStore& store_;
  SessionRegistry& registry_;
  std::shared_ptr<const CancellationToken> cancellation_;
  Options options_;
  transfer::TransferFramer framer_;

  // Session data
  SessionState state_;
  std::optional<std::string> username_;
  std::filesystem::path sandbox_;


  // ---- PROTOCOL PHASES ----
  bool handshake();
  bool authenticate();
  void command_loop();


  // ---- COMMAND HANDLERS ----
  void dispatch(const protocol::Command& command);
  void handle_upload(const std::string& filename);
  void handle_download(const std::string& filename);
  void handle_preview(const std::string& filename);
  void handle_delete(const std::string& filename);
  void handle_list();


  // ---- UTILITY METHODS ----
  void send_response(const protocol::Response& response);
  // Swallows write failures, used while already tearing down
  void try_send_response(const protocol::Response& response) noexcept;
  bool transition(SessionState::State new_state);
  bool is_cancelled() const;
  void terminate() noexcept;
};

} // namespace server
} // namespace vault

#endif // VAULT_SERVER_SESSION_HPP
