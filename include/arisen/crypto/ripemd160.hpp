#pragma once

#include "arisen/core/result.hpp"
#include "arisen/core/failures.hpp"
#include "arisen/core/constants.hpp"

#include <array>
#include <cstdint>
#include <initializer_list>
#include <span>

namespace arisen::vault::crypto {

/**
 * @brief RIPEMD-160 digest through OpenSSL EVP
 *
 * Native key strings carry the first four bytes of a RIPEMD-160 digest
 * as their checksum trailer.
 */
class Ripemd160 {
public:
    using Digest = std::array<uint8_t, Constants::RIPEMD160_DIGEST_SIZE>;

    /**
     * @brief Digest the concatenation of all parts
     *
     * @param parts Buffers hashed in order, without copying them together
     * @return Ok(digest) or Err if OpenSSL does not provide RIPEMD-160
     */
    static Result<Digest, VaultFailure> Hash(std::initializer_list<std::span<const uint8_t>> parts);

private:
    Ripemd160() = delete;
};

} // namespace arisen::vault::crypto
