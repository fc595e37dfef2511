#ifndef VAULT_SERVER_SERVER_CONFIG_HPP
#define VAULT_SERVER_SERVER_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace vault {
namespace server {

struct ServerConfig {
  std::string address = "0.0.0.0";
  uint16_t port = 12345;               // 0 lets the OS choose
  std::string storage_root = "server_storage";
  std::string credentials_file = "id_passwd.txt";
  std::chrono::milliseconds grace_period{100};
  std::chrono::milliseconds transfer_start_delay{10};
  std::string log_file = "vault_server.log";
  std::string log_level = "info";
};

} // namespace server
} // namespace vault

#endif // VAULT_SERVER_SERVER_CONFIG_HPP
