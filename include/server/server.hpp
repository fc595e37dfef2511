#ifndef VAULT_SERVER_SERVER_HPP
#define VAULT_SERVER_SERVER_HPP

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include "auth/credential_store.hpp"
#include "server/cancellation_token.hpp"
#include "server/server_config.hpp"
#include "server/session_registry.hpp"
#include "storage/user_store.hpp"

namespace vault {
namespace server {

// Accepts connections and runs one Session per connection on its own thread
class Server {
public:
  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;


  // -- CONSTRUCTOR AND DESTRUCTOR ----
  Server(const ServerConfig& config, const auth::CredentialStore& credentials);
  ~Server();


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  // Stops accepting, broadcasts the shutdown notice and joins every session
  void shutdown();


  // ---- GETTERS ----
  bool is_running() const { return is_running_; }
  // Bound port, valid after start_listener
  uint16_t port() const { return bound_port_; }
  SessionRegistry& get_registry() { return registry_; }
  const storage::UserStore& get_store() const { return store_; }

private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> finished;
  };

  // ---- PARAMETERS ----
  ServerConfig config_;
  const auth::CredentialStore& credentials_;

  // Server state
  std::atomic<bool> is_running_{false};
  uint16_t bound_port_ = 0;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::unique_ptr<std::thread> io_thread_;

  // System components
  storage::UserStore store_;
  SessionRegistry registry_;
  std::shared_ptr<CancellationToken> cancellation_;

  // Session threads
  std::list<Worker> workers_;
  std::mutex workers_mutex_;
  std::atomic<SessionId> next_session_id_{1};


  // ---- CONNECTION HANDLING ----
  // Main listening loop that handles incoming connections
  void start_accept();
  void handle_connection(boost::asio::ip::tcp::socket socket);
  // Joins session threads that have already finished
  void reap_workers();
};

} // namespace server
} // namespace vault

#endif // VAULT_SERVER_SERVER_HPP
