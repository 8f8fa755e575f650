#include "arisen/models/vault_key.hpp"
#include "arisen/models/key_tag.hpp"
#include "arisen/encoding/native_key_encoding.hpp"
#include "arisen/crypto/sodium_interop.hpp"
#include "arisen/debug/key_logger.hpp"
#include "arisen/core/constants.hpp"
#include "arisen/core/format.hpp"

namespace arisen::vault::models {

using encoding::NativeKeyEncoding;
using enums::BioFactor;
using enums::EllipticCurveType;

Result<VaultKey, VaultFailure> VaultKey::Create(
    std::optional<std::string> expected_public_key,
    std::optional<StorageAttributes> storage,
    std::optional<Metadata> metadata,
    const configuration::VaultConfig& config) {

    Metadata owned_metadata = metadata.has_value() ? std::move(*metadata) : Metadata();

    if (!storage.has_value()) {
        if (!expected_public_key.has_value()) {
            return Result<VaultKey, VaultFailure>::Err(
                VaultFailure::MissingIdentity(std::string(ErrorMessages::MISSING_IDENTITY)));
        }
        return CreateRetired(std::move(*expected_public_key), std::move(owned_metadata), std::nullopt, config);
    }

    return CreateLive(std::move(expected_public_key), std::move(*storage), std::move(owned_metadata), config);
}

Result<VaultKey, VaultFailure> VaultKey::FromStorage(
    StorageAttributes storage,
    std::optional<Metadata> metadata) {
    return Create(std::nullopt, std::move(storage), std::move(metadata));
}

Result<VaultKey, VaultFailure> VaultKey::Retired(
    std::string native_public_key,
    std::optional<Metadata> metadata) {
    return Create(std::move(native_public_key), std::nullopt, std::move(metadata));
}

Result<VaultKey, VaultFailure> VaultKey::Restored(
    std::string native_public_key,
    const EllipticCurveType recorded_curve,
    std::optional<Metadata> metadata,
    const configuration::VaultConfig& config) {
    return CreateRetired(
        std::move(native_public_key),
        metadata.has_value() ? std::move(*metadata) : Metadata(),
        recorded_curve,
        config);
}

Result<VaultKey, VaultFailure> VaultKey::CreateRetired(
    std::string native_public_key,
    Metadata metadata,
    const std::optional<EllipticCurveType> recorded_curve,
    const configuration::VaultConfig& config) {

    if (native_public_key.empty()) {
        return Result<VaultKey, VaultFailure>::Err(
            VaultFailure::InvalidInput("Retired key requires a non-empty native public key"));
    }

    VaultKey key;
    auto version_result = NativeKeyEncoding::DecodeVersion(native_public_key, config);
    const bool curve_from_fallback = version_result.IsErr();
    // Unreadable version tokens come from legacy records; keep the record and assume R1
    key.curve_ = std::move(version_result).UnwrapOr(recorded_curve.value_or(EllipticCurveType::R1));
    key.native_public_key_ = std::move(native_public_key);
    key.bio_factor_ = BioFactor::None;
    key.access_group_.clear();
    key.is_hardware_backed_ = false;
    key.is_retired_ = true;
    key.metadata_ = std::move(metadata);
    key.config_ = config;

    debug::LogRetiredKey(key.native_public_key_, enums::ToString(key.curve_), curve_from_fallback);
    return Result<VaultKey, VaultFailure>::Ok(std::move(key));
}

Result<VaultKey, VaultFailure> VaultKey::CreateLive(
    std::optional<std::string> expected_public_key,
    StorageAttributes storage,
    Metadata metadata,
    const configuration::VaultConfig& config) {

    if (auto init_result = crypto::SodiumInterop::Initialize(); init_result.IsErr()) {
        return Result<VaultKey, VaultFailure>::Err(
            VaultFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }

    const KeyTag key_tag = storage.tag.has_value() ? KeyTag::Parse(*storage.tag) : KeyTag();

    const EllipticCurveType curve = storage.ResolveCurve();

    auto encode_result = NativeKeyEncoding::EncodePublicKey(curve, storage.raw_public_key_compressed, config);
    if (encode_result.IsErr()) {
        return Result<VaultKey, VaultFailure>::Err(std::move(encode_result).UnwrapErr());
    }
    std::string native_public_key = std::move(encode_result).Unwrap();

    if (expected_public_key.has_value()) {
        auto equals_result = crypto::SodiumInterop::ConstantTimeEquals(
            std::string_view(*expected_public_key), std::string_view(native_public_key));
        if (equals_result.IsErr()) {
            return Result<VaultKey, VaultFailure>::Err(
                VaultFailure::FromSodiumFailure(equals_result.UnwrapErr()));
        }
        if (!equals_result.Unwrap()) {
            debug::LogPublicKeyMismatch(*expected_public_key, native_public_key);
            return Result<VaultKey, VaultFailure>::Err(
                VaultFailure::KeyMismatch(
                    compat::format("{} (expected {}, derived {})",
                                   ErrorMessages::PUBLIC_KEY_MISMATCH, *expected_public_key, native_public_key)));
        }
    }

    VaultKey key;
    key.native_public_key_ = std::move(native_public_key);
    key.is_hardware_backed_ = storage.is_hardware_backed;
    key.curve_ = curve;
    key.label_ = std::move(storage.label);
    key.tag_ = std::move(storage.tag);
    key.access_group_ = std::move(storage.access_group);
    key.bio_factor_ = key_tag.GetBioFactor();
    key.is_retired_ = false;
    key.private_key_handle_ = std::move(storage.private_key_handle);
    key.public_key_handle_ = std::move(storage.public_key_handle);
    if (!storage.raw_public_key_uncompressed.empty()) {
        key.raw_public_key_uncompressed_ = std::move(storage.raw_public_key_uncompressed);
    }
    key.raw_public_key_compressed_ = std::move(storage.raw_public_key_compressed);
    key.metadata_ = std::move(metadata);
    key.config_ = config;

    debug::LogLiveKeyClassified(
        key.tag_.value_or(std::string()),
        key.is_hardware_backed_,
        enums::ToString(key.curve_),
        enums::ToString(key.bio_factor_),
        *key.raw_public_key_compressed_);
    return Result<VaultKey, VaultFailure>::Ok(std::move(key));
}

std::optional<std::string> VaultKey::DeriveNativePrivateKey(
    interfaces::IPrivateKeyExporter& exporter) const {

    if (is_hardware_backed_) {
        debug::LogExportSkipped("hardware backed key is not exportable");
        return std::nullopt;
    }
    if (!private_key_handle_.has_value()) {
        debug::LogExportSkipped("no private key handle");
        return std::nullopt;
    }

    if (crypto::SodiumInterop::Initialize().IsErr()) {
        debug::LogExportSkipped("libsodium unavailable");
        return std::nullopt;
    }

    auto export_result = exporter.ExportPrivateKey(*private_key_handle_);
    if (export_result.IsErr()) {
        debug::LogExportSkipped(export_result.UnwrapErr().message.c_str());
        return std::nullopt;
    }
    const crypto::SecureMemoryHandle& exported = export_result.Unwrap();
    if (exported.Size() < Constants::PRIVATE_KEY_SCALAR_SIZE) {
        debug::LogExportSkipped("exported private key shorter than a scalar");
        return std::nullopt;
    }

    // X9.63 exports prefix the scalar with the public point; the scalar is the tail
    auto encode_result = exported.WithReadAccess(
        [this](std::span<const uint8_t> bytes) {
            return NativeKeyEncoding::EncodePrivateKey(
                curve_,
                bytes.subspan(bytes.size() - Constants::PRIVATE_KEY_SCALAR_SIZE),
                config_);
        });
    if (encode_result.IsErr()) {
        return std::nullopt;
    }
    auto native_private_key = std::move(encode_result).Unwrap();
    if (native_private_key.IsErr()) {
        return std::nullopt;
    }
    return std::move(native_private_key).Unwrap();
}

} // namespace arisen::vault::models
