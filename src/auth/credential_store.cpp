#include "auth/credential_store.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>

namespace vault {
namespace auth {

namespace {

std::string trim(const std::string& text) {
  std::size_t first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return std::string();
  }
  std::size_t last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

} // namespace

FileCredentialStore::FileCredentialStore(const std::string& path)
  : path_(path)
  , credentials_(load(path)) {
  BOOST_LOG_TRIVIAL(info) << "Credential store: Loaded " << credentials_.size() << " users from " << path_;
}

bool FileCredentialStore::verify(const std::string& username, const std::string& password) const {
  auto it = credentials_.find(username);
  bool valid = it != credentials_.end() && it->second == password;
  BOOST_LOG_TRIVIAL(debug) << "Credential store: Verification for '" << username << "' "
                           << (valid ? "succeeded" : "failed");
  return valid;
}

std::map<std::string, std::string> FileCredentialStore::load(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Credential store: Failed to open " << path;
    throw CredentialError("Credential store: Failed to open " + path);
  }

  std::map<std::string, std::string> credentials;
  std::string line;
  std::size_t line_number = 0;

  while (std::getline(file, line)) {
    ++line_number;
    // Surrounding whitespace (including '\r') is not part of either field
    line = trim(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }

    std::size_t separator = line.find(':');
    if (separator == std::string::npos || separator == 0) {
      BOOST_LOG_TRIVIAL(warning) << "Credential store: Skipping malformed line " << line_number << " in " << path;
      continue;
    }

    std::string username = trim(line.substr(0, separator));
    std::string password = trim(line.substr(separator + 1));
    if (username.empty()) {
      BOOST_LOG_TRIVIAL(warning) << "Credential store: Skipping line " << line_number << " with empty username";
      continue;
    }
    if (!credentials.emplace(username, password).second) {
      BOOST_LOG_TRIVIAL(warning) << "Credential store: Duplicate user '" << username
                                 << "' on line " << line_number << ", keeping first entry";
    }
  }

  return credentials;
}

} // namespace auth
} // namespace vault
