#pragma once

#include "arisen/core/result.hpp"
#include "arisen/core/failures.hpp"
#include "arisen/configuration/vault_config.hpp"
#include "arisen/enums/elliptic_curve_type.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace arisen::vault::encoding {

/**
 * @brief Components of a parsed native key string
 */
struct DecodedNativeKey {
    std::string prefix;
    enums::EllipticCurveType curve;
    bool is_legacy;
    std::vector<uint8_t> key_bytes;
};

/**
 * @brief Blockchain-native key string format
 *
 * Curve-tagged form, used for every key this library produces:
 *
 *   PUB_<V>_Base58(key || RIPEMD160(key || "<V>")[0..4])
 *   PVT_<V>_Base58(scalar || RIPEMD160(scalar || "<V>")[0..4])
 *
 * where <V> is "K1" or "R1". The legacy public key form is only read:
 *
 *   <legacy prefix>Base58(key || RIPEMD160(key)[0..4])
 *
 * and is always a K1 key.
 */
class NativeKeyEncoding {
public:
    /**
     * @brief Encode a compressed public key
     *
     * @param curve Curve whose version token tags the string
     * @param compressed 33-byte SEC1 compressed point; only its shape is checked
     * @return Ok(native key) or Err(Encode) for a wrong length or lead byte
     */
    static Result<std::string, VaultFailure> EncodePublicKey(
        enums::EllipticCurveType curve,
        std::span<const uint8_t> compressed,
        const configuration::VaultConfig& config = configuration::VaultConfig::Default());

    /**
     * @brief Encode a 32-byte private scalar
     */
    static Result<std::string, VaultFailure> EncodePrivateKey(
        enums::EllipticCurveType curve,
        std::span<const uint8_t> scalar,
        const configuration::VaultConfig& config = configuration::VaultConfig::Default());

    /**
     * @brief Encode a K1 public key in the legacy untagged form
     *
     * @return Err(Encode) when the configuration has no legacy prefix
     */
    static Result<std::string, VaultFailure> EncodeLegacyPublicKey(
        std::span<const uint8_t> compressed,
        const configuration::VaultConfig& config = configuration::VaultConfig::Default());

    /**
     * @brief Recover the curve from a native public key's version token
     *
     * Only the textual components are inspected; the checksum is not
     * verified. Legacy keys report K1.
     */
    static Result<enums::EllipticCurveType, VaultFailure> DecodeVersion(
        std::string_view native_key,
        const configuration::VaultConfig& config = configuration::VaultConfig::Default());

    /**
     * @brief Fully decode a native public key, verifying its checksum
     */
    static Result<DecodedNativeKey, VaultFailure> DecodePublicKey(
        std::string_view native_key,
        const configuration::VaultConfig& config = configuration::VaultConfig::Default());

    /**
     * @brief Fully decode a native private key, verifying its checksum
     */
    static Result<DecodedNativeKey, VaultFailure> DecodePrivateKey(
        std::string_view native_key,
        const configuration::VaultConfig& config = configuration::VaultConfig::Default());

private:
    NativeKeyEncoding() = delete;
};

} // namespace arisen::vault::encoding
