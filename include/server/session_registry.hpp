#ifndef VAULT_SERVER_SESSION_REGISTRY_HPP
#define VAULT_SERVER_SESSION_REGISTRY_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "network/connection.hpp"

namespace vault {
namespace server {

using SessionId = uint64_t;

// Live sessions of one server, used to push the shutdown notice.
// Holds connections weakly; sessions own their own lifetime.
class SessionRegistry {
public:
  static constexpr std::chrono::milliseconds DEFAULT_GRACE_PERIOD{100};
  // Longest wait on one client's full send buffer before skipping its notice
  static constexpr std::chrono::milliseconds NOTICE_SEND_TIMEOUT{50};

  // Delete copy constructor and assignment operator
  SessionRegistry(const SessionRegistry&) = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;

  SessionRegistry() = default;
  ~SessionRegistry() = default;


  // ---- SESSION MANAGEMENT ----
  // Returns false once a shutdown broadcast has started
  bool add(SessionId id, const std::shared_ptr<network::Connection>& connection);
  void remove(SessionId id);
  bool contains(SessionId id) const;


  // ---- SHUTDOWN ----
  // Notifies every live session, waits the grace period, then force-closes
  // all connections and clears the registry. Only the first call acts.
  // A session whose writer is busy or stalled is closed without the notice.
  // Returns the number of sessions notified.
  std::size_t broadcast_shutdown(std::chrono::milliseconds grace_period = DEFAULT_GRACE_PERIOD,
                                 const std::string& message = "Server is shutting down");
  bool is_shutting_down() const;


  // ---- UTILITY METHODS ----
  std::size_t size() const;

private:
  // ---- PARAMETERS ----
  std::map<SessionId, std::weak_ptr<network::Connection>> sessions_;
  bool shutting_down_ = false;
  mutable std::mutex mutex_;
};

} // namespace server
} // namespace vault

#endif // VAULT_SERVER_SESSION_REGISTRY_HPP
