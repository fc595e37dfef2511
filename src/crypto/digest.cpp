#include "crypto/digest.hpp"
#include "crypto/crypto_error.hpp"
#include <iomanip>
#include <sstream>

namespace vault::crypto {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw DigestError("Failed to create hash context");
    }

    // Initialize the context with SHA-256 algorithm
    if (!EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr)) {
        EVP_MD_CTX_free(ctx_);
        throw DigestError("Failed to initialize hash context");
    }
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx_);
}

void Sha256::update(const void* data, std::size_t size) {
    if (finalized_) {
        throw DigestError("Update after finalize");
    }
    if (size == 0) {
        return;
    }
    if (!EVP_DigestUpdate(ctx_, data, size)) {
        throw DigestError("Failed to update hash");
    }
}

Sha256::Digest Sha256::finalize() {
    if (finalized_) {
        throw DigestError("Digest already finalized");
    }

    Digest digest{};
    unsigned int digest_len = 0;
    if (!EVP_DigestFinal_ex(ctx_, digest.data(), &digest_len) || digest_len != DIGEST_SIZE) {
        throw DigestError("Failed to finalize hash");
    }
    finalized_ = true;
    return digest;
}

Sha256::Digest Sha256::of(const std::string& data) {
    Sha256 hasher;
    hasher.update(data.data(), data.size());
    return hasher.finalize();
}

std::string Sha256::to_hex(const Digest& digest) {
    std::stringstream ss;
    for (uint8_t byte : digest) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return ss.str();
}

} // namespace vault::crypto
