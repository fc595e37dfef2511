#ifndef VAULT_CRYPTO_ERROR_HPP
#define VAULT_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace vault::crypto {

class DigestError : public std::runtime_error {
public:
    explicit DigestError(const std::string& message)
        : std::runtime_error("Digest error: " + message) {}
};

} // namespace vault::crypto

#endif // VAULT_CRYPTO_ERROR_HPP
