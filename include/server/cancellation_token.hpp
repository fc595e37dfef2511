#ifndef VAULT_SERVER_CANCELLATION_TOKEN_HPP
#define VAULT_SERVER_CANCELLATION_TOKEN_HPP

#include <atomic>

namespace vault {
namespace server {

// Shared stop flag checked by sessions before every blocking read
class CancellationToken {
public:
  void cancel() { cancelled_.store(true); }
  bool is_cancelled() const { return cancelled_.load(); }

private:
  std::atomic<bool> cancelled_{false};
};

} // namespace server
} // namespace vault

#endif // VAULT_SERVER_CANCELLATION_TOKEN_HPP
