#include <catch2/catch_test_macros.hpp>
#include "arisen/configuration/vault_config.hpp"
#include "arisen/enums/bio_factor.hpp"
#include "arisen/enums/elliptic_curve_type.hpp"
#include <string>
using namespace arisen::vault;
using namespace arisen::vault::configuration;
using namespace arisen::vault::enums;
TEST_CASE("VaultConfig - Factories", "[config]") {
    SECTION("Default uses the RSN legacy prefix") {
        constexpr auto config = VaultConfig::Default();
        STATIC_REQUIRE(config.PublicKeyPrefix() == "PUB");
        STATIC_REQUIRE(config.PrivateKeyPrefix() == "PVT");
        REQUIRE(config.LegacyPublicKeyPrefix() == "RSN");
        REQUIRE(config.AcceptsLegacyKeys());
    }
    SECTION("Custom legacy prefix") {
        constexpr auto config = VaultConfig::WithLegacyPrefix("EOS");
        REQUIRE(config.LegacyPublicKeyPrefix() == "EOS");
        REQUIRE(config.AcceptsLegacyKeys());
        REQUIRE(config != VaultConfig::Default());
    }
    SECTION("Empty legacy prefix disables legacy keys") {
        REQUIRE_FALSE(VaultConfig::WithLegacyPrefix("").AcceptsLegacyKeys());
        REQUIRE(VaultConfig::WithLegacyPrefix("") == VaultConfig::CurveTaggedOnly());
    }
}
TEST_CASE("Enums - Curve tokens", "[config][enums]") {
    STATIC_REQUIRE(std::string_view(ToString(EllipticCurveType::K1)) == "K1");
    STATIC_REQUIRE(std::string_view(ToString(EllipticCurveType::R1)) == "R1");
    REQUIRE(ParseEllipticCurveType("k1") == std::optional<EllipticCurveType>(EllipticCurveType::K1));
    REQUIRE(ParseEllipticCurveType("R1") == std::optional<EllipticCurveType>(EllipticCurveType::R1));
    REQUIRE_FALSE(ParseEllipticCurveType("K2").has_value());
    REQUIRE_FALSE(ParseEllipticCurveType("").has_value());
}
TEST_CASE("Enums - Bio factor tokens", "[config][enums]") {
    REQUIRE(std::string(ToString(BioFactor::None)) == "none");
    REQUIRE(std::string(ToString(BioFactor::Fixed)) == "fixed");
    REQUIRE(std::string(ToString(BioFactor::Flex)) == "flex");
}
