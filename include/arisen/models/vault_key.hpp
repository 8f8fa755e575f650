#pragma once
#include "arisen/core/result.hpp"
#include "arisen/core/failures.hpp"
#include "arisen/configuration/vault_config.hpp"
#include "arisen/enums/bio_factor.hpp"
#include "arisen/enums/elliptic_curve_type.hpp"
#include "arisen/interfaces/i_private_key_exporter.hpp"
#include "arisen/models/key_handle.hpp"
#include "arisen/models/storage_attributes.hpp"
#include <google/protobuf/struct.pb.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
namespace arisen::vault::models {

/// Caller-owned annotations; any JSON object
using Metadata = google::protobuf::Struct;

/**
 * @brief Identity and attributes of one blockchain signing key
 *
 * A VaultKey is built either from a live secure-store entry or, for a
 * retired key whose material has been deleted, from its native public key
 * and metadata alone. Everything except the metadata is fixed at
 * construction.
 */
class VaultKey {
public:
    /**
     * @brief Build a vault key
     *
     * With storage present the native public key is derived from the
     * compressed public key and, if expected_public_key is given, must match
     * it exactly. Without storage expected_public_key is required and the
     * result is a retired key.
     *
     * @return Err(MissingIdentity), Err(InvalidInput), Err(Encode) or
     *         Err(KeyMismatch) when no record can be built
     */
    [[nodiscard]] static Result<VaultKey, VaultFailure> Create(
        std::optional<std::string> expected_public_key,
        std::optional<StorageAttributes> storage,
        std::optional<Metadata> metadata,
        const configuration::VaultConfig& config = configuration::VaultConfig::Default());

    [[nodiscard]] static Result<VaultKey, VaultFailure> FromStorage(
        StorageAttributes storage,
        std::optional<Metadata> metadata = std::nullopt);

    [[nodiscard]] static Result<VaultKey, VaultFailure> Retired(
        std::string native_public_key,
        std::optional<Metadata> metadata = std::nullopt);

    /**
     * @brief Rebuild a retired key from a persisted record
     *
     * The version token read under config wins; recorded_curve is used only
     * when the token cannot be read, instead of the R1 default.
     */
    [[nodiscard]] static Result<VaultKey, VaultFailure> Restored(
        std::string native_public_key,
        enums::EllipticCurveType recorded_curve,
        std::optional<Metadata> metadata,
        const configuration::VaultConfig& config = configuration::VaultConfig::Default());

    VaultKey(const VaultKey&) = default;
    VaultKey(VaultKey&&) noexcept = default;
    VaultKey& operator=(const VaultKey&) = default;
    VaultKey& operator=(VaultKey&&) noexcept = default;
    ~VaultKey() = default;

    [[nodiscard]] const std::string& GetNativePublicKey() const noexcept {
        return native_public_key_;
    }
    [[nodiscard]] const std::optional<std::string>& GetLabel() const noexcept {
        return label_;
    }
    [[nodiscard]] const std::optional<std::string>& GetTag() const noexcept {
        return tag_;
    }
    [[nodiscard]] enums::EllipticCurveType GetCurve() const noexcept {
        return curve_;
    }
    [[nodiscard]] const std::string& GetAccessGroup() const noexcept {
        return access_group_;
    }
    [[nodiscard]] bool IsHardwareBacked() const noexcept {
        return is_hardware_backed_;
    }
    [[nodiscard]] enums::BioFactor GetBioFactor() const noexcept {
        return bio_factor_;
    }
    [[nodiscard]] const std::optional<KeyHandle>& GetPrivateKeyHandle() const noexcept {
        return private_key_handle_;
    }
    [[nodiscard]] const std::optional<KeyHandle>& GetPublicKeyHandle() const noexcept {
        return public_key_handle_;
    }
    [[nodiscard]] const std::optional<std::vector<uint8_t>>& GetRawPublicKeyUncompressed() const noexcept {
        return raw_public_key_uncompressed_;
    }
    [[nodiscard]] const std::optional<std::vector<uint8_t>>& GetRawPublicKeyCompressed() const noexcept {
        return raw_public_key_compressed_;
    }
    [[nodiscard]] bool IsRetired() const noexcept {
        return is_retired_;
    }
    [[nodiscard]] const Metadata& GetMetadata() const noexcept {
        return metadata_;
    }
    [[nodiscard]] Metadata& MutableMetadata() noexcept {
        return metadata_;
    }
    void SetMetadata(Metadata metadata) {
        metadata_ = std::move(metadata);
    }

    /**
     * @brief Export the private key and encode it as a native private key
     *
     * Not cached: every call goes to the exporter. Hardware-backed keys and
     * keys without a private handle return nullopt without calling it; an
     * export error or an export shorter than 32 bytes also yields nullopt.
     */
    [[nodiscard]] std::optional<std::string> DeriveNativePrivateKey(
        interfaces::IPrivateKeyExporter& exporter) const;

private:
    VaultKey() = default;

    static Result<VaultKey, VaultFailure> CreateRetired(
        std::string native_public_key,
        Metadata metadata,
        std::optional<enums::EllipticCurveType> recorded_curve,
        const configuration::VaultConfig& config);

    static Result<VaultKey, VaultFailure> CreateLive(
        std::optional<std::string> expected_public_key,
        StorageAttributes storage,
        Metadata metadata,
        const configuration::VaultConfig& config);

    std::string native_public_key_;
    std::optional<std::string> label_;
    std::optional<std::string> tag_;
    enums::EllipticCurveType curve_ = enums::EllipticCurveType::R1;
    std::string access_group_;
    bool is_hardware_backed_ = false;
    enums::BioFactor bio_factor_ = enums::BioFactor::None;
    std::optional<KeyHandle> private_key_handle_;
    std::optional<KeyHandle> public_key_handle_;
    std::optional<std::vector<uint8_t>> raw_public_key_uncompressed_;
    std::optional<std::vector<uint8_t>> raw_public_key_compressed_;
    bool is_retired_ = false;
    Metadata metadata_;
    configuration::VaultConfig config_ = configuration::VaultConfig::Default();
};
}
