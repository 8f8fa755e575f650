#pragma once

#include "arisen/core/result.hpp"
#include "arisen/core/failures.hpp"
#include "arisen/enums/elliptic_curve_type.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace arisen::vault::crypto {

/**
 * @brief SEC1 point encoding for the two vault curves (OpenSSL EC)
 *
 * K1 maps to secp256k1 and R1 to prime256v1. Used for secure stores that
 * only report the 65-byte uncompressed point (0x04 || X || Y).
 */
class EcPointCodec {
public:
    /**
     * @brief Reduce an uncompressed point to its 33-byte form
     *
     * @return Ok(compressed) or Err(InvalidInput) if the point is malformed
     */
    static Result<std::vector<uint8_t>, VaultFailure> Compress(
        enums::EllipticCurveType curve,
        std::span<const uint8_t> uncompressed);

private:
    EcPointCodec() = delete;
};

} // namespace arisen::vault::crypto
