#include "arisen/serialization/vault_key_record_codec.hpp"
#include "arisen/core/format.hpp"

namespace arisen::vault::serialization {

using enums::BioFactor;
using enums::EllipticCurveType;

namespace {
    proto::vault::EllipticCurve ToProtoCurve(const EllipticCurveType curve) {
        return curve == EllipticCurveType::K1
                   ? proto::vault::ELLIPTIC_CURVE_K1
                   : proto::vault::ELLIPTIC_CURVE_R1;
    }

    EllipticCurveType FromProtoCurve(const proto::vault::EllipticCurve curve) {
        return curve == proto::vault::ELLIPTIC_CURVE_K1 ? EllipticCurveType::K1 : EllipticCurveType::R1;
    }

    proto::vault::BioFactor ToProtoBioFactor(const BioFactor bio_factor) {
        switch (bio_factor) {
            case BioFactor::Fixed:
                return proto::vault::BIO_FACTOR_FIXED;
            case BioFactor::Flex:
                return proto::vault::BIO_FACTOR_FLEX;
            case BioFactor::None:
            default:
                return proto::vault::BIO_FACTOR_NONE;
        }
    }
}

proto::vault::VaultKeyRecord VaultKeyRecordCodec::ToRecord(const models::VaultKey& key) {
    proto::vault::VaultKeyRecord record;
    record.set_native_public_key(key.GetNativePublicKey());
    record.set_curve(ToProtoCurve(key.GetCurve()));
    if (key.GetLabel().has_value()) {
        record.set_label(*key.GetLabel());
    }
    if (key.GetTag().has_value()) {
        record.set_tag(*key.GetTag());
    }
    record.set_access_group(key.GetAccessGroup());
    record.set_bio_factor(ToProtoBioFactor(key.GetBioFactor()));
    record.set_hardware_backed(key.IsHardwareBacked());
    record.set_retired(key.IsRetired());
    *record.mutable_metadata() = key.GetMetadata();
    return record;
}

Result<std::vector<uint8_t>, VaultFailure> VaultKeyRecordCodec::Serialize(const models::VaultKey& key) {
    const auto record = ToRecord(key);
    std::vector<uint8_t> bytes(record.ByteSizeLong());
    if (!record.SerializeToArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(
            VaultFailure::Serialization("Failed to serialize VaultKeyRecord to protobuf"));
    }
    return Result<std::vector<uint8_t>, VaultFailure>::Ok(std::move(bytes));
}

Result<models::VaultKey, VaultFailure> VaultKeyRecordCodec::Restore(
    const std::span<const uint8_t> bytes,
    const configuration::VaultConfig& config) {
    proto::vault::VaultKeyRecord record;
    if (!record.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<models::VaultKey, VaultFailure>::Err(
            VaultFailure::Serialization("Failed to parse VaultKeyRecord from protobuf"));
    }
    return FromRecord(record, config);
}

Result<models::VaultKey, VaultFailure> VaultKeyRecordCodec::FromRecord(
    const proto::vault::VaultKeyRecord& record,
    const configuration::VaultConfig& config) {
    if (record.native_public_key().empty()) {
        return Result<models::VaultKey, VaultFailure>::Err(
            VaultFailure::Serialization("VaultKeyRecord has no native public key"));
    }
    return models::VaultKey::Restored(
               record.native_public_key(), FromProtoCurve(record.curve()), record.metadata(), config)
        .MapErr([](const VaultFailure& failure) {
            return VaultFailure::Serialization(
                compat::format("Failed to restore vault key: {}", failure.message));
        });
}

} // namespace arisen::vault::serialization
