#ifndef VAULT_CRYPTO_DIGEST_HPP
#define VAULT_CRYPTO_DIGEST_HPP

#include <array>
#include <cstdint>
#include <string>
#include <openssl/evp.h>

namespace vault::crypto {

// Incremental SHA-256 over a transfer body
class Sha256 {
public:
    static constexpr std::size_t DIGEST_SIZE = 32;  // 256 bits
    using Digest = std::array<uint8_t, DIGEST_SIZE>;

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    Sha256();
    ~Sha256();

    void update(const void* data, std::size_t size);
    // Produces the digest; the object must not be updated afterwards
    Digest finalize();

    // One-shot helper
    static Digest of(const std::string& data);
    static std::string to_hex(const Digest& digest);

private:
    EVP_MD_CTX* ctx_;
    bool finalized_ = false;
};

} // namespace vault::crypto

#endif // VAULT_CRYPTO_DIGEST_HPP
