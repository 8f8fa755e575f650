#include "arisen/encoding/native_key_encoding.hpp"
#include "arisen/crypto/base58.hpp"
#include "arisen/crypto/ripemd160.hpp"
#include "arisen/crypto/sodium_interop.hpp"
#include "arisen/core/constants.hpp"
#include "arisen/core/format.hpp"

#include <algorithm>
#include <array>

namespace arisen::vault::encoding {

namespace {

using Checksum = std::array<uint8_t, Constants::CHECKSUM_SIZE>;

struct KeyComponents {
    std::string_view prefix;
    std::string_view version;
    std::string_view body;
    bool is_legacy;
};

std::span<const uint8_t> AsBytes(const std::string_view text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

bool StartsWith(const std::string_view text, const std::string_view prefix) {
    return text.size() >= prefix.size() && text.substr(0, prefix.size()) == prefix;
}

// Shape only: curve membership is the secure store's concern
Result<Unit, VaultFailure> CheckCompressedShape(std::span<const uint8_t> compressed) {
    if (compressed.size() != Constants::COMPRESSED_PUBLIC_KEY_SIZE) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::Encode(
                compat::format("Compressed public key must be {} bytes, got {}",
                               Constants::COMPRESSED_PUBLIC_KEY_SIZE, compressed.size())));
    }
    if (compressed[0] != Constants::COMPRESSED_EVEN_Y_PREFIX &&
        compressed[0] != Constants::COMPRESSED_ODD_Y_PREFIX) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::Encode(
                compat::format("Compressed public key has invalid leading byte 0x{:02x}", compressed[0])));
    }
    return Result<Unit, VaultFailure>::Ok(unit);
}

Result<Checksum, VaultFailure> ComputeChecksum(
    std::span<const uint8_t> key_bytes,
    const std::string_view version_suffix) {
    auto digest_result = crypto::Ripemd160::Hash({key_bytes, AsBytes(version_suffix)});
    if (digest_result.IsErr()) {
        return Result<Checksum, VaultFailure>::Err(std::move(digest_result).UnwrapErr());
    }
    const auto& digest = digest_result.Unwrap();
    Checksum checksum{};
    std::copy_n(digest.begin(), checksum.size(), checksum.begin());
    return Result<Checksum, VaultFailure>::Ok(checksum);
}

Result<KeyComponents, VaultFailure> SplitComponents(
    const std::string_view native_key,
    const std::string_view type_prefix,
    const configuration::VaultConfig& config,
    const bool allow_legacy) {

    if (StartsWith(native_key, type_prefix) &&
        native_key.size() > type_prefix.size() &&
        native_key[type_prefix.size()] == NativeKeyConstants::COMPONENT_SEPARATOR) {
        const std::string_view rest = native_key.substr(type_prefix.size() + 1);
        const size_t separator = rest.find(NativeKeyConstants::COMPONENT_SEPARATOR);
        if (separator == std::string_view::npos || separator == 0 || separator + 1 >= rest.size()) {
            return Result<KeyComponents, VaultFailure>::Err(
                VaultFailure::Decode(
                    compat::format("Native key '{}' is missing its version or body component", native_key)));
        }
        return Result<KeyComponents, VaultFailure>::Ok(KeyComponents{
            type_prefix,
            rest.substr(0, separator),
            rest.substr(separator + 1),
            false});
    }

    const std::string_view legacy_prefix = config.LegacyPublicKeyPrefix();
    if (allow_legacy && config.AcceptsLegacyKeys() && !legacy_prefix.empty() &&
        StartsWith(native_key, legacy_prefix) && native_key.size() > legacy_prefix.size()) {
        return Result<KeyComponents, VaultFailure>::Ok(KeyComponents{
            legacy_prefix,
            enums::ToString(enums::EllipticCurveType::K1),
            native_key.substr(legacy_prefix.size()),
            true});
    }

    return Result<KeyComponents, VaultFailure>::Err(
        VaultFailure::Decode(
            compat::format("Native key '{}' does not start with '{}{}'",
                           native_key, type_prefix, NativeKeyConstants::COMPONENT_SEPARATOR)));
}

Result<std::string, VaultFailure> EncodeWithChecksum(
    const std::string_view prefix,
    std::span<const uint8_t> payload,
    const std::string_view checksum_suffix) {

    auto checksum_result = ComputeChecksum(payload, checksum_suffix);
    if (checksum_result.IsErr()) {
        return Result<std::string, VaultFailure>::Err(std::move(checksum_result).UnwrapErr());
    }
    const Checksum& checksum = checksum_result.Unwrap();

    std::vector<uint8_t> buffer;
    buffer.reserve(payload.size() + checksum.size());
    buffer.insert(buffer.end(), payload.begin(), payload.end());
    buffer.insert(buffer.end(), checksum.begin(), checksum.end());

    std::string encoded(prefix);
    encoded += crypto::Base58::Encode(buffer);

    {
        auto __wipe = crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
        (void) __wipe;
    }
    return Result<std::string, VaultFailure>::Ok(std::move(encoded));
}

Result<DecodedNativeKey, VaultFailure> DecodeBody(
    const KeyComponents& components,
    const size_t expected_key_size) {

    auto curve = enums::ParseEllipticCurveType(components.version);
    if (!curve.has_value()) {
        return Result<DecodedNativeKey, VaultFailure>::Err(
            VaultFailure::Decode(
                compat::format("Unknown curve version token '{}'", components.version)));
    }

    auto bytes_result = crypto::Base58::Decode(components.body);
    if (bytes_result.IsErr()) {
        return Result<DecodedNativeKey, VaultFailure>::Err(std::move(bytes_result).UnwrapErr());
    }
    std::vector<uint8_t> bytes = std::move(bytes_result).Unwrap();

    if (bytes.size() != expected_key_size + Constants::CHECKSUM_SIZE) {
        return Result<DecodedNativeKey, VaultFailure>::Err(
            VaultFailure::Decode(
                compat::format("Native key body decodes to {} bytes, expected {}",
                               bytes.size(), expected_key_size + Constants::CHECKSUM_SIZE)));
    }

    const std::span<const uint8_t> key_bytes(bytes.data(), expected_key_size);
    const std::span<const uint8_t> stored_checksum(bytes.data() + expected_key_size, Constants::CHECKSUM_SIZE);

    // Legacy keys hash the key alone; tagged keys append the version token
    const std::string_view checksum_suffix = components.is_legacy ? std::string_view{} : components.version;
    auto checksum_result = ComputeChecksum(key_bytes, checksum_suffix);
    if (checksum_result.IsErr()) {
        return Result<DecodedNativeKey, VaultFailure>::Err(std::move(checksum_result).UnwrapErr());
    }
    const Checksum& expected_checksum = checksum_result.Unwrap();
    if (!std::equal(stored_checksum.begin(), stored_checksum.end(), expected_checksum.begin())) {
        return Result<DecodedNativeKey, VaultFailure>::Err(
            VaultFailure::Decode("Native key checksum mismatch"));
    }

    DecodedNativeKey decoded{
        std::string(components.prefix),
        *curve,
        components.is_legacy,
        std::vector<uint8_t>(key_bytes.begin(), key_bytes.end())};
    {
        auto __wipe = crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(bytes));
        (void) __wipe;
    }
    return Result<DecodedNativeKey, VaultFailure>::Ok(std::move(decoded));
}

}

Result<std::string, VaultFailure> NativeKeyEncoding::EncodePublicKey(
    const enums::EllipticCurveType curve,
    std::span<const uint8_t> compressed,
    const configuration::VaultConfig& config) {

    if (auto shape = CheckCompressedShape(compressed); shape.IsErr()) {
        return Result<std::string, VaultFailure>::Err(std::move(shape).UnwrapErr());
    }

    const std::string_view version = enums::ToString(curve);
    const std::string prefix = compat::format("{}{}{}{}", config.PublicKeyPrefix(),
                                              NativeKeyConstants::COMPONENT_SEPARATOR, version,
                                              NativeKeyConstants::COMPONENT_SEPARATOR);
    return EncodeWithChecksum(prefix, compressed, version);
}

Result<std::string, VaultFailure> NativeKeyEncoding::EncodePrivateKey(
    const enums::EllipticCurveType curve,
    std::span<const uint8_t> scalar,
    const configuration::VaultConfig& config) {

    if (scalar.size() != Constants::PRIVATE_KEY_SCALAR_SIZE) {
        return Result<std::string, VaultFailure>::Err(
            VaultFailure::Encode(
                compat::format("Private key scalar must be {} bytes, got {}",
                               Constants::PRIVATE_KEY_SCALAR_SIZE, scalar.size())));
    }

    const std::string_view version = enums::ToString(curve);
    const std::string prefix = compat::format("{}{}{}{}", config.PrivateKeyPrefix(),
                                              NativeKeyConstants::COMPONENT_SEPARATOR, version,
                                              NativeKeyConstants::COMPONENT_SEPARATOR);
    return EncodeWithChecksum(prefix, scalar, version);
}

Result<std::string, VaultFailure> NativeKeyEncoding::EncodeLegacyPublicKey(
    std::span<const uint8_t> compressed,
    const configuration::VaultConfig& config) {

    if (!config.AcceptsLegacyKeys() || config.LegacyPublicKeyPrefix().empty()) {
        return Result<std::string, VaultFailure>::Err(
            VaultFailure::Encode("Configuration does not define a legacy public key prefix"));
    }
    if (auto shape = CheckCompressedShape(compressed); shape.IsErr()) {
        return Result<std::string, VaultFailure>::Err(std::move(shape).UnwrapErr());
    }
    return EncodeWithChecksum(config.LegacyPublicKeyPrefix(), compressed, {});
}

Result<enums::EllipticCurveType, VaultFailure> NativeKeyEncoding::DecodeVersion(
    const std::string_view native_key,
    const configuration::VaultConfig& config) {

    return SplitComponents(native_key, config.PublicKeyPrefix(), config, true).Bind(
        [](const KeyComponents& components) {
            return Result<enums::EllipticCurveType, VaultFailure>::FromOptional(
                enums::ParseEllipticCurveType(components.version),
                VaultFailure::Decode(
                    compat::format("Unknown curve version token '{}'", components.version)));
        });
}

Result<DecodedNativeKey, VaultFailure> NativeKeyEncoding::DecodePublicKey(
    const std::string_view native_key,
    const configuration::VaultConfig& config) {

    return SplitComponents(native_key, config.PublicKeyPrefix(), config, true).Bind(
        [](const KeyComponents& components) {
            return DecodeBody(components, Constants::COMPRESSED_PUBLIC_KEY_SIZE);
        });
}

Result<DecodedNativeKey, VaultFailure> NativeKeyEncoding::DecodePrivateKey(
    const std::string_view native_key,
    const configuration::VaultConfig& config) {

    return SplitComponents(native_key, config.PrivateKeyPrefix(), config, false).Bind(
        [](const KeyComponents& components) {
            return DecodeBody(components, Constants::PRIVATE_KEY_SCALAR_SIZE);
        });
}

} // namespace arisen::vault::encoding
