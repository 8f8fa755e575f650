#pragma once
#include "arisen/core/result.hpp"
#include "arisen/core/failures.hpp"
#include "arisen/enums/elliptic_curve_type.hpp"
#include "arisen/models/key_handle.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
namespace arisen::vault::models {

/**
 * @brief Attributes the secure store reports for one stored key
 *
 * Produced by the storage collaborator and consumed by VaultKey::Create.
 * Raw public keys use SEC1 point encoding: 33 bytes compressed
 * (0x02 / 0x03 || X) and 65 bytes uncompressed (0x04 || X || Y).
 */
struct StorageAttributes {
    std::optional<std::string> label;
    std::optional<std::string> tag;
    std::string access_group;
    bool is_hardware_backed = false;
    std::optional<KeyHandle> private_key_handle;
    std::optional<KeyHandle> public_key_handle;
    std::vector<uint8_t> raw_public_key_compressed;
    std::vector<uint8_t> raw_public_key_uncompressed;

    /**
     * @brief Curve of the stored key
     *
     * Secure hardware only holds R1 keys; software keys are K1 when their
     * tag names k1 and R1 otherwise.
     */
    [[nodiscard]] enums::EllipticCurveType ResolveCurve() const;

    /**
     * @brief Fill in the compressed point from a store that only reports the uncompressed one
     *
     * @param curve Curve the point belongs to
     * @return Err(InvalidInput) if the uncompressed point is malformed
     */
    static Result<StorageAttributes, VaultFailure> FromUncompressed(
        StorageAttributes attributes,
        enums::EllipticCurveType curve);
};
}
