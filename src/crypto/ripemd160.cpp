#include "arisen/crypto/ripemd160.hpp"

#include <openssl/evp.h>

#include <memory>

namespace arisen::vault::crypto {

namespace {

struct MdContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept {
        EVP_MD_CTX_free(ctx);
    }
};

using MdContext = std::unique_ptr<EVP_MD_CTX, MdContextDeleter>;

}

Result<Ripemd160::Digest, VaultFailure> Ripemd160::Hash(
    std::initializer_list<std::span<const uint8_t>> parts) {

    const EVP_MD* md = EVP_ripemd160();
    if (md == nullptr) {
        return Result<Digest, VaultFailure>::Err(
            VaultFailure::Encode("RIPEMD-160 is not available in this OpenSSL build"));
    }

    MdContext ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Result<Digest, VaultFailure>::Err(
            VaultFailure::Encode("Failed to create digest context"));
    }

    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != OpenSSLConstants::SUCCESS) {
        return Result<Digest, VaultFailure>::Err(
            VaultFailure::Encode("Failed to initialise RIPEMD-160 digest"));
    }

    for (const auto& part : parts) {
        if (part.empty()) {
            continue;
        }
        if (EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != OpenSSLConstants::SUCCESS) {
            return Result<Digest, VaultFailure>::Err(
                VaultFailure::Encode("RIPEMD-160 digest update failed"));
        }
    }

    Digest digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != OpenSSLConstants::SUCCESS ||
        digest_len != digest.size()) {
        return Result<Digest, VaultFailure>::Err(
            VaultFailure::Encode("RIPEMD-160 digest finalisation failed"));
    }

    return Result<Digest, VaultFailure>::Ok(digest);
}

} // namespace arisen::vault::crypto
