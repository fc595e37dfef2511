#ifndef VAULT_UTILS_TEXT_HPP
#define VAULT_UTILS_TEXT_HPP

#include <string>

namespace vault {
namespace utils {

// Replaces every invalid or truncated UTF-8 sequence with U+FFFD
std::string sanitize_utf8(const std::string& input);

} // namespace utils
} // namespace vault

#endif // VAULT_UTILS_TEXT_HPP
