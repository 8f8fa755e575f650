#pragma once

#include "arisen/core/constants.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace arisen::vault::enums {

/**
 * @brief Named elliptic curve of a vault key
 *
 * K1 is secp256k1, R1 is NIST P-256 (secp256r1). The version token of a
 * native key string ("PUB_K1_...") names the curve in upper case, the
 * storage tag names it in lower case.
 */
enum class EllipticCurveType : uint8_t {
    K1 = 0,
    R1 = 1
};

constexpr const char* ToString(EllipticCurveType curve) noexcept {
    switch (curve) {
        case EllipticCurveType::K1:
            return "K1";
        case EllipticCurveType::R1:
            return "R1";
        default:
            return "UNKNOWN";
    }
}

constexpr std::string_view ToTagToken(EllipticCurveType curve) noexcept {
    return curve == EllipticCurveType::K1 ? TagTokens::K1 : TagTokens::R1;
}

/**
 * @brief Parse a curve version token, ignoring case ("K1", "r1", ...)
 */
constexpr std::optional<EllipticCurveType> ParseEllipticCurveType(std::string_view token) noexcept {
    if (token.size() != 2) {
        return std::nullopt;
    }
    const char family = token[0];
    const char digit = token[1];
    if (digit != '1') {
        return std::nullopt;
    }
    if (family == 'K' || family == 'k') {
        return EllipticCurveType::K1;
    }
    if (family == 'R' || family == 'r') {
        return EllipticCurveType::R1;
    }
    return std::nullopt;
}

} // namespace arisen::vault::enums
