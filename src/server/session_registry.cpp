#include "server/session_registry.hpp"
#include "protocol/command_codec.hpp"
#include <boost/log/trivial.hpp>
#include <thread>
#include <vector>

namespace vault {
namespace server {

bool SessionRegistry::add(SessionId id, const std::shared_ptr<network::Connection>& connection) {
  if (!connection) {
    BOOST_LOG_TRIVIAL(error) << "Session registry: Attempted to add null connection";
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (shutting_down_) {
    BOOST_LOG_TRIVIAL(warning) << "Session registry: Refusing session " << id << " during shutdown";
    return false;
  }

  sessions_[id] = connection;
  BOOST_LOG_TRIVIAL(info) << "Session registry: Added session " << id << " (" << connection->remote_address()
                          << "), active sessions: " << sessions_.size();
  return true;
}

void SessionRegistry::remove(SessionId id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = sessions_.find(id);
  if (it != sessions_.end()) {
    sessions_.erase(it);
    BOOST_LOG_TRIVIAL(info) << "Session registry: Removed session " << id
                            << ", active sessions: " << sessions_.size();
  } else {
    BOOST_LOG_TRIVIAL(debug) << "Session registry: Session " << id << " already removed";
  }
}

bool SessionRegistry::contains(SessionId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.find(id) != sessions_.end();
}

std::size_t SessionRegistry::broadcast_shutdown(std::chrono::milliseconds grace_period,
                                                const std::string& message) {
  std::vector<std::pair<SessionId, std::shared_ptr<network::Connection>>> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_) {
      BOOST_LOG_TRIVIAL(debug) << "Session registry: Shutdown already broadcast";
      return 0;
    }
    shutting_down_ = true;

    for (const auto& entry : sessions_) {
      if (auto connection = entry.second.lock()) {
        snapshot.emplace_back(entry.first, std::move(connection));
      }
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Session registry: Broadcasting shutdown to " << snapshot.size() << " sessions";

  const std::string notice = protocol::CommandCodec::encode(protocol::Response::shutdown(message));
  std::size_t notified = 0;
  for (const auto& entry : snapshot) {
    if (entry.second->try_send_message(notice, NOTICE_SEND_TIMEOUT)) {
      ++notified;
    } else {
      BOOST_LOG_TRIVIAL(warning) << "Session registry: Could not notify session " << entry.first;
    }
  }

  // Let in-flight writes land before closing
  std::this_thread::sleep_for(grace_period);

  for (const auto& entry : snapshot) {
    entry.second->shutdown();
    BOOST_LOG_TRIVIAL(debug) << "Session registry: Closed session " << entry.first;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.clear();
  }

  BOOST_LOG_TRIVIAL(info) << "Session registry: Shutdown complete, notified " << notified
                          << " of " << snapshot.size() << " sessions";
  return notified;
}

bool SessionRegistry::is_shutting_down() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return shutting_down_;
}

std::size_t SessionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

} // namespace server
} // namespace vault
