#include <catch2/catch_test_macros.hpp>
#include "arisen/models/vault_key.hpp"
#include "arisen/encoding/native_key_encoding.hpp"
#include "arisen/crypto/sodium_interop.hpp"
#include "helpers/mock_private_key_exporter.hpp"
#include "helpers/test_key_factory.hpp"
#include <string>
#include <vector>
using namespace arisen::vault;
using namespace arisen::vault::models;
using arisen::vault::crypto::SodiumInterop;
using arisen::vault::encoding::NativeKeyEncoding;
using arisen::vault::enums::BioFactor;
using arisen::vault::enums::EllipticCurveType;
using arisen::vault::test_helpers::MakeTestKey;
using arisen::vault::test_helpers::MockPrivateKeyExporter;
using arisen::vault::test_helpers::TestKey;
namespace {
    StorageAttributes MakeStorage(const TestKey& key, std::optional<std::string> tag, const bool hardware_backed) {
        StorageAttributes storage;
        storage.label = "wallet key";
        storage.tag = std::move(tag);
        storage.access_group = "group.io.arisen.wallet";
        storage.is_hardware_backed = hardware_backed;
        storage.private_key_handle = KeyHandle("private-ref");
        storage.public_key_handle = KeyHandle("public-ref");
        storage.raw_public_key_compressed = key.compressed;
        storage.raw_public_key_uncompressed = key.uncompressed;
        return storage;
    }

    Metadata NoteMetadata(const std::string& note) {
        Metadata metadata;
        (*metadata.mutable_fields())["note"].set_string_value(note);
        return metadata;
    }

    std::string EncodeR1(const TestKey& key) {
        return NativeKeyEncoding::EncodePublicKey(EllipticCurveType::R1, key.compressed).Unwrap();
    }
}
TEST_CASE("VaultKey - Live software key", "[models][vault_key]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = MakeTestKey(EllipticCurveType::K1, 0x31);
    auto result = VaultKey::FromStorage(MakeStorage(key, "k1 fixed", false));
    REQUIRE(result.IsOk());
    const auto& vault_key = result.Unwrap();

    SECTION("Tag drives curve and biometric class") {
        REQUIRE(vault_key.GetCurve() == EllipticCurveType::K1);
        REQUIRE(vault_key.GetBioFactor() == BioFactor::Fixed);
        REQUIRE_FALSE(vault_key.IsRetired());
        REQUIRE_FALSE(vault_key.IsHardwareBacked());
    }
    SECTION("Native public key is the K1 encoding of the compressed point") {
        REQUIRE(vault_key.GetNativePublicKey() ==
                NativeKeyEncoding::EncodePublicKey(EllipticCurveType::K1, key.compressed).Unwrap());
    }
    SECTION("Storage fields are carried through") {
        REQUIRE(vault_key.GetLabel() == std::optional<std::string>("wallet key"));
        REQUIRE(vault_key.GetTag() == std::optional<std::string>("k1 fixed"));
        REQUIRE(vault_key.GetAccessGroup() == "group.io.arisen.wallet");
        REQUIRE(vault_key.GetPrivateKeyHandle() == std::optional<KeyHandle>(KeyHandle("private-ref")));
        REQUIRE(vault_key.GetPublicKeyHandle() == std::optional<KeyHandle>(KeyHandle("public-ref")));
        REQUIRE(vault_key.GetRawPublicKeyCompressed() == std::optional<std::vector<uint8_t>>(key.compressed));
        REQUIRE(vault_key.GetRawPublicKeyUncompressed() == std::optional<std::vector<uint8_t>>(key.uncompressed));
        REQUIRE(vault_key.GetMetadata().fields_size() == 0);
    }
}
TEST_CASE("VaultKey - Live key defaults", "[models][vault_key]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("No tag means R1 without biometrics") {
        const auto key = MakeTestKey(EllipticCurveType::R1, 0x32);
        auto vault_key = VaultKey::FromStorage(MakeStorage(key, std::nullopt, false)).Unwrap();
        REQUIRE(vault_key.GetCurve() == EllipticCurveType::R1);
        REQUIRE(vault_key.GetBioFactor() == BioFactor::None);
        REQUIRE(vault_key.GetNativePublicKey().rfind("PUB_R1_", 0) == 0);
    }
    SECTION("Flex word in a delimited tag") {
        const auto key = MakeTestKey(EllipticCurveType::R1, 0x33);
        auto vault_key = VaultKey::FromStorage(MakeStorage(key, "flex-key1", false)).Unwrap();
        REQUIRE(vault_key.GetBioFactor() == BioFactor::Flex);
    }
    SECTION("Flex as a substring is ignored") {
        const auto key = MakeTestKey(EllipticCurveType::R1, 0x34);
        auto vault_key = VaultKey::FromStorage(MakeStorage(key, "myflexiblekey", false)).Unwrap();
        REQUIRE(vault_key.GetBioFactor() == BioFactor::None);
    }
    SECTION("Empty uncompressed point is absent") {
        const auto key = MakeTestKey(EllipticCurveType::R1, 0x35);
        auto storage = MakeStorage(key, std::nullopt, false);
        storage.raw_public_key_uncompressed.clear();
        auto vault_key = VaultKey::FromStorage(std::move(storage)).Unwrap();
        REQUIRE_FALSE(vault_key.GetRawPublicKeyUncompressed().has_value());
        REQUIRE(vault_key.GetRawPublicKeyCompressed().has_value());
    }
}
TEST_CASE("VaultKey - Hardware-backed key", "[models][vault_key]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = MakeTestKey(EllipticCurveType::R1, 0x36);
    MockPrivateKeyExporter exporter;
    exporter.SetExport("private-ref", key.x963_export);

    SECTION("Curve is R1 with no tag") {
        auto vault_key = VaultKey::FromStorage(MakeStorage(key, std::nullopt, true)).Unwrap();
        REQUIRE(vault_key.GetCurve() == EllipticCurveType::R1);
        REQUIRE(vault_key.IsHardwareBacked());
        REQUIRE_FALSE(vault_key.DeriveNativePrivateKey(exporter).has_value());
    }
    SECTION("Curve is R1 even when the tag names k1") {
        auto vault_key = VaultKey::FromStorage(MakeStorage(key, "k1 flex", true)).Unwrap();
        REQUIRE(vault_key.GetCurve() == EllipticCurveType::R1);
        REQUIRE(vault_key.GetBioFactor() == BioFactor::Flex);
    }
    SECTION("Exporter is never asked") {
        auto vault_key = VaultKey::FromStorage(MakeStorage(key, std::nullopt, true)).Unwrap();
        REQUIRE_FALSE(vault_key.DeriveNativePrivateKey(exporter).has_value());
        REQUIRE(exporter.CallCount() == 0);
    }
}
TEST_CASE("VaultKey - Untagged software key", "[models][vault_key]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Every untagged K1 point builds an R1 record") {
        for (uint8_t seed = 1; seed < 20; ++seed) {
            const auto key = MakeTestKey(EllipticCurveType::K1, seed);
            auto result = VaultKey::FromStorage(MakeStorage(key, std::nullopt, false));
            REQUIRE(result.IsOk());
            REQUIRE(result.Unwrap().GetCurve() == EllipticCurveType::R1);
            REQUIRE(result.Unwrap().GetNativePublicKey() == EncodeR1(key));
        }
    }
    SECTION("Arbitrary well-formed bytes build a record") {
        StorageAttributes storage;
        storage.raw_public_key_compressed.assign(33, 0x11);
        storage.raw_public_key_compressed[0] = 0x02;
        auto result = VaultKey::FromStorage(std::move(storage));
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().GetNativePublicKey().rfind("PUB_R1_", 0) == 0);
    }
}
TEST_CASE("VaultKey - Expected public key guard", "[models][vault_key]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = MakeTestKey(EllipticCurveType::R1, 0x37);
    const auto other = MakeTestKey(EllipticCurveType::R1, 0x38);

    SECTION("Matching key builds a live record") {
        auto result = VaultKey::Create(EncodeR1(key), MakeStorage(key, std::nullopt, false), std::nullopt);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.Unwrap().IsRetired());
        REQUIRE(result.Unwrap().GetNativePublicKey() == EncodeR1(key));
    }
    SECTION("Different key yields no record") {
        auto result = VaultKey::Create(EncodeR1(other), MakeStorage(key, std::nullopt, false), std::nullopt);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == VaultFailureType::KeyMismatch);
    }
    SECTION("Same body under another curve token yields no record") {
        std::string relabelled = EncodeR1(key);
        relabelled.replace(4, 2, "K1");
        auto result = VaultKey::Create(relabelled, MakeStorage(key, std::nullopt, false), std::nullopt);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == VaultFailureType::KeyMismatch);
    }
}
TEST_CASE("VaultKey - Construction failures", "[models][vault_key]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Neither storage nor public key") {
        auto result = VaultKey::Create(std::nullopt, std::nullopt, NoteMetadata("orphan"));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == VaultFailureType::MissingIdentity);
    }
    SECTION("Empty retired public key") {
        auto result = VaultKey::Retired("");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == VaultFailureType::InvalidInput);
    }
    SECTION("Malformed compressed point") {
        const auto key = MakeTestKey(EllipticCurveType::R1, 0x3a);
        auto storage = MakeStorage(key, std::nullopt, false);
        storage.raw_public_key_compressed.resize(20);
        auto result = VaultKey::FromStorage(std::move(storage));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == VaultFailureType::Encode);
    }
    SECTION("Missing compressed point") {
        const auto key = MakeTestKey(EllipticCurveType::R1, 0x3b);
        auto storage = MakeStorage(key, std::nullopt, false);
        storage.raw_public_key_compressed.clear();
        REQUIRE(VaultKey::FromStorage(std::move(storage)).IsErr());
    }
}
TEST_CASE("VaultKey - Retired key", "[models][vault_key]") {
    const auto key = MakeTestKey(EllipticCurveType::R1, 0x3c);
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto public_key = EncodeR1(key);

    SECTION("R1 key with metadata") {
        auto result = VaultKey::Create(public_key, std::nullopt, NoteMetadata("legacy"));
        REQUIRE(result.IsOk());
        const auto& vault_key = result.Unwrap();
        REQUIRE(vault_key.IsRetired());
        REQUIRE(vault_key.GetCurve() == EllipticCurveType::R1);
        REQUIRE(vault_key.GetNativePublicKey() == public_key);
        REQUIRE(vault_key.GetMetadata().fields().at("note").string_value() == "legacy");
        REQUIRE(vault_key.GetMetadata().fields_size() == 1);
    }
    SECTION("Retired records carry no storage attributes") {
        auto vault_key = VaultKey::Retired(public_key).Unwrap();
        REQUIRE(vault_key.GetAccessGroup().empty());
        REQUIRE(vault_key.GetBioFactor() == BioFactor::None);
        REQUIRE_FALSE(vault_key.IsHardwareBacked());
        REQUIRE_FALSE(vault_key.GetRawPublicKeyCompressed().has_value());
        REQUIRE_FALSE(vault_key.GetRawPublicKeyUncompressed().has_value());
        REQUIRE_FALSE(vault_key.GetPrivateKeyHandle().has_value());
        REQUIRE_FALSE(vault_key.GetPublicKeyHandle().has_value());
        REQUIRE_FALSE(vault_key.GetLabel().has_value());
        REQUIRE_FALSE(vault_key.GetTag().has_value());
    }
    SECTION("K1 version token") {
        const auto k1_key = MakeTestKey(EllipticCurveType::K1, 0x3d);
        const auto k1_public = NativeKeyEncoding::EncodePublicKey(EllipticCurveType::K1, k1_key.compressed).Unwrap();
        REQUIRE(VaultKey::Retired(k1_public).Unwrap().GetCurve() == EllipticCurveType::K1);
    }
    SECTION("Legacy key string is K1") {
        auto vault_key = VaultKey::Retired("RSN6MRyAjQq8ud7hVNYcfnVPJqcVpscN5So8BhtHuGYqET5GDW5CV").Unwrap();
        REQUIRE(vault_key.GetCurve() == EllipticCurveType::K1);
    }
    SECTION("Unreadable version token falls back to R1") {
        auto vault_key = VaultKey::Retired("PUB_ZZ_garbage").Unwrap();
        REQUIRE(vault_key.IsRetired());
        REQUIRE(vault_key.GetCurve() == EllipticCurveType::R1);
        REQUIRE(vault_key.GetNativePublicKey() == "PUB_ZZ_garbage");
    }
    SECTION("Storage wins over the retired path") {
        auto result = VaultKey::Create(public_key, MakeStorage(key, std::nullopt, false), std::nullopt);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.Unwrap().IsRetired());
    }
    SECTION("No private key without material") {
        MockPrivateKeyExporter exporter;
        auto vault_key = VaultKey::Retired(public_key).Unwrap();
        REQUIRE_FALSE(vault_key.DeriveNativePrivateKey(exporter).has_value());
        REQUIRE(exporter.CallCount() == 0);
    }
}
TEST_CASE("VaultKey - Private key derivation", "[models][vault_key][export]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = MakeTestKey(EllipticCurveType::K1, 0x3e);
    MockPrivateKeyExporter exporter;

    SECTION("X9.63 export yields the native private key of the trailing scalar") {
        exporter.SetExport("private-ref", key.x963_export);
        auto vault_key = VaultKey::FromStorage(MakeStorage(key, "k1", false)).Unwrap();
        const auto native_private_key = vault_key.DeriveNativePrivateKey(exporter);
        REQUIRE(native_private_key.has_value());
        REQUIRE(*native_private_key == NativeKeyEncoding::EncodePrivateKey(EllipticCurveType::K1, key.scalar).Unwrap());
        REQUIRE(native_private_key->rfind("PVT_K1_", 0) == 0);
    }
    SECTION("Bare 32-byte scalar") {
        exporter.SetExport("private-ref", key.scalar);
        auto vault_key = VaultKey::FromStorage(MakeStorage(key, "k1", false)).Unwrap();
        REQUIRE(vault_key.DeriveNativePrivateKey(exporter) ==
                NativeKeyEncoding::EncodePrivateKey(EllipticCurveType::K1, key.scalar).Unwrap());
    }
    SECTION("Short export yields no private key but a complete record") {
        const std::vector<uint8_t> short_export(31, 0x3e);
        exporter.SetExport("private-ref", short_export);
        auto vault_key = VaultKey::FromStorage(MakeStorage(key, "k1 fixed", false)).Unwrap();
        REQUIRE_FALSE(vault_key.DeriveNativePrivateKey(exporter).has_value());
        REQUIRE(vault_key.GetCurve() == EllipticCurveType::K1);
        REQUIRE(vault_key.GetBioFactor() == BioFactor::Fixed);
        REQUIRE(vault_key.GetNativePublicKey().rfind("PUB_K1_", 0) == 0);
    }
    SECTION("Export failure yields no private key") {
        exporter.SetFailing(true);
        auto vault_key = VaultKey::FromStorage(MakeStorage(key, "k1", false)).Unwrap();
        REQUIRE_FALSE(vault_key.DeriveNativePrivateKey(exporter).has_value());
        REQUIRE(exporter.CallCount() == 1);
    }
    SECTION("Every call goes back to the exporter") {
        exporter.SetExport("private-ref", key.x963_export);
        auto vault_key = VaultKey::FromStorage(MakeStorage(key, "k1", false)).Unwrap();
        REQUIRE(vault_key.DeriveNativePrivateKey(exporter).has_value());
        REQUIRE(vault_key.DeriveNativePrivateKey(exporter).has_value());
        REQUIRE(exporter.CallCount() == 2);
    }
    SECTION("No private handle") {
        auto storage = MakeStorage(key, "k1", false);
        storage.private_key_handle.reset();
        auto vault_key = VaultKey::FromStorage(std::move(storage)).Unwrap();
        REQUIRE_FALSE(vault_key.DeriveNativePrivateKey(exporter).has_value());
        REQUIRE(exporter.CallCount() == 0);
    }
}
TEST_CASE("VaultKey - Metadata is mutable", "[models][vault_key]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = MakeTestKey(EllipticCurveType::R1, 0x3f);
    auto vault_key = VaultKey::FromStorage(MakeStorage(key, std::nullopt, false), NoteMetadata("first")).Unwrap();
    const auto public_key = vault_key.GetNativePublicKey();

    vault_key.SetMetadata(NoteMetadata("second"));
    REQUIRE(vault_key.GetMetadata().fields().at("note").string_value() == "second");

    (*vault_key.MutableMetadata().mutable_fields())["count"].set_number_value(2);
    REQUIRE(vault_key.GetMetadata().fields_size() == 2);
    REQUIRE(vault_key.GetNativePublicKey() == public_key);
}
