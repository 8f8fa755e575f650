#pragma once

#include "arisen/core/constants.hpp"

#include <string_view>

namespace arisen::vault::configuration {

/// Configuration for native key string parsing and formatting
///
/// Native keys are always produced in the curve-tagged form
/// (`PUB_R1_...`, `PVT_K1_...`). Chains forked from the same codebase differ
/// only in the prefix of the legacy K1 public key form (`RSN...` here,
/// `EOS...` upstream), so that prefix is the one configurable part.
///
/// @example
/// ```cpp
/// auto config = VaultConfig::Default();
/// auto eos = VaultConfig::WithLegacyPrefix("EOS");
/// auto strict = VaultConfig::CurveTaggedOnly();
/// ```
class VaultConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// Arisen defaults: `PUB`/`PVT` prefixes, legacy `RSN` keys accepted
    [[nodiscard]] static constexpr VaultConfig Default() noexcept {
        return VaultConfig(NativeKeyConstants::LEGACY_PUBLIC_KEY_PREFIX, true);
    }

    /// Accept legacy keys carrying another chain's prefix
    ///
    /// The prefix is not copied; it must outlive the configuration.
    [[nodiscard]] static constexpr VaultConfig WithLegacyPrefix(const std::string_view prefix) noexcept {
        return VaultConfig(prefix, !prefix.empty());
    }

    /// Only curve-tagged keys are recognised
    [[nodiscard]] static constexpr VaultConfig CurveTaggedOnly() noexcept {
        return VaultConfig(std::string_view{}, false);
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] constexpr std::string_view PublicKeyPrefix() const noexcept {
        return NativeKeyConstants::PUBLIC_KEY_PREFIX;
    }

    [[nodiscard]] constexpr std::string_view PrivateKeyPrefix() const noexcept {
        return NativeKeyConstants::PRIVATE_KEY_PREFIX;
    }

    [[nodiscard]] constexpr std::string_view LegacyPublicKeyPrefix() const noexcept {
        return legacy_prefix_;
    }

    /// Check if legacy (untagged, implicitly K1) public keys are parsed
    [[nodiscard]] constexpr bool AcceptsLegacyKeys() const noexcept {
        return accept_legacy_;
    }

    [[nodiscard]] constexpr bool operator==(const VaultConfig& other) const noexcept {
        return accept_legacy_ == other.accept_legacy_ && legacy_prefix_ == other.legacy_prefix_;
    }

    [[nodiscard]] constexpr bool operator!=(const VaultConfig& other) const noexcept {
        return !(*this == other);
    }

private:
    constexpr VaultConfig(const std::string_view legacy_prefix, const bool accept_legacy) noexcept
        : legacy_prefix_(legacy_prefix)
        , accept_legacy_(accept_legacy) {}

    std::string_view legacy_prefix_;
    bool accept_legacy_;
};

} // namespace arisen::vault::configuration
