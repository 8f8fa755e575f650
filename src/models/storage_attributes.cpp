#include "arisen/models/storage_attributes.hpp"
#include "arisen/models/key_tag.hpp"
#include "arisen/crypto/ec_point_codec.hpp"

namespace arisen::vault::models {

enums::EllipticCurveType StorageAttributes::ResolveCurve() const {
    if (is_hardware_backed) {
        return enums::EllipticCurveType::R1;
    }
    if (tag.has_value() && KeyTag::Parse(*tag).NamesK1()) {
        return enums::EllipticCurveType::K1;
    }
    return enums::EllipticCurveType::R1;
}

Result<StorageAttributes, VaultFailure> StorageAttributes::FromUncompressed(
    StorageAttributes attributes,
    const enums::EllipticCurveType curve) {
    auto compressed = crypto::EcPointCodec::Compress(curve, attributes.raw_public_key_uncompressed);
    if (compressed.IsErr()) {
        return Result<StorageAttributes, VaultFailure>::Err(std::move(compressed).UnwrapErr());
    }
    attributes.raw_public_key_compressed = std::move(compressed).Unwrap();
    return Result<StorageAttributes, VaultFailure>::Ok(std::move(attributes));
}

} // namespace arisen::vault::models
