#ifndef VAULT_AUTH_CREDENTIAL_STORE_HPP
#define VAULT_AUTH_CREDENTIAL_STORE_HPP

#include <map>
#include <stdexcept>
#include <string>

namespace vault {
namespace auth {

class CredentialStore {
public:
  virtual ~CredentialStore() = default;

  // Exact match of username and password
  virtual bool verify(const std::string& username, const std::string& password) const = 0;
};

// Credentials loaded from a "username:password" per line text file.
// Blank lines, lines starting with '#' and lines without a separator are skipped.
// Entries are fixed at construction, so verify() is safe from any thread.
class FileCredentialStore : public CredentialStore {
public:
  explicit FileCredentialStore(const std::string& path);

  bool verify(const std::string& username, const std::string& password) const override;

  std::size_t size() const { return credentials_.size(); }

private:
  std::string path_;
  const std::map<std::string, std::string> credentials_;

  static std::map<std::string, std::string> load(const std::string& path);
};

class CredentialError : public std::runtime_error {
public:
  explicit CredentialError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace auth
} // namespace vault

#endif // VAULT_AUTH_CREDENTIAL_STORE_HPP
