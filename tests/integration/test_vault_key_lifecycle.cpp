#include <catch2/catch_test_macros.hpp>
#include "arisen/models/vault_key.hpp"
#include "arisen/serialization/metadata_json.hpp"
#include "arisen/serialization/vault_key_record_codec.hpp"
#include "arisen/encoding/native_key_encoding.hpp"
#include "arisen/crypto/sodium_interop.hpp"
#include "helpers/mock_private_key_exporter.hpp"
#include "helpers/test_key_factory.hpp"
#include <google/protobuf/util/message_differencer.h>
#include <string>
#include <vector>
using namespace arisen::vault;
using namespace arisen::vault::models;
using namespace arisen::vault::serialization;
using arisen::vault::crypto::SodiumInterop;
using arisen::vault::encoding::NativeKeyEncoding;
using arisen::vault::enums::BioFactor;
using arisen::vault::enums::EllipticCurveType;
using arisen::vault::test_helpers::MakeTestKey;
using arisen::vault::test_helpers::MockPrivateKeyExporter;
using google::protobuf::util::MessageDifferencer;
namespace {
    StorageAttributes SoftwareStorage(const test_helpers::TestKey& key, std::string tag) {
        StorageAttributes storage;
        storage.label = "imported";
        storage.tag = std::move(tag);
        storage.access_group = "group.io.arisen.wallet";
        storage.private_key_handle = KeyHandle("keychain://imported");
        storage.public_key_handle = KeyHandle("keychain://imported.pub");
        storage.raw_public_key_compressed = key.compressed;
        storage.raw_public_key_uncompressed = key.uncompressed;
        return storage;
    }
}
TEST_CASE("Vault key lifecycle - Live key to retired record", "[integration][vault_key]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = MakeTestKey(EllipticCurveType::K1, 0x51);
    MockPrivateKeyExporter exporter;
    exporter.SetExport("keychain://imported", key.x963_export);

    auto metadata = MetadataJson::FromJson(R"({"account":"alice","chains":["arisen"]})").Unwrap();
    auto live = VaultKey::FromStorage(SoftwareStorage(key, "k1 flex"), metadata).Unwrap();
    REQUIRE(live.GetCurve() == EllipticCurveType::K1);
    REQUIRE(live.GetBioFactor() == BioFactor::Flex);

    const auto native_private_key = live.DeriveNativePrivateKey(exporter);
    REQUIRE(native_private_key.has_value());
    const auto decoded_private = NativeKeyEncoding::DecodePrivateKey(*native_private_key).Unwrap();
    REQUIRE(decoded_private.key_bytes == key.scalar);

    SECTION("Record keeps the public description") {
        const auto record = VaultKeyRecordCodec::ToRecord(live);
        REQUIRE(record.native_public_key() == live.GetNativePublicKey());
        REQUIRE(record.curve() == proto::vault::ELLIPTIC_CURVE_K1);
        REQUIRE(record.bio_factor() == proto::vault::BIO_FACTOR_FLEX);
        REQUIRE(record.label() == "imported");
        REQUIRE(record.tag() == "k1 flex");
        REQUIRE(record.access_group() == "group.io.arisen.wallet");
        REQUIRE_FALSE(record.retired());
        REQUIRE(MessageDifferencer::Equals(record.metadata(), metadata));
    }
    SECTION("Restored key is retired with the same identity and metadata") {
        const auto bytes = VaultKeyRecordCodec::Serialize(live).Unwrap();
        auto restored = VaultKeyRecordCodec::Restore(bytes);
        REQUIRE(restored.IsOk());
        const auto& retired = restored.Unwrap();
        REQUIRE(retired.IsRetired());
        REQUIRE(retired.GetNativePublicKey() == live.GetNativePublicKey());
        REQUIRE(retired.GetCurve() == live.GetCurve());
        REQUIRE(MessageDifferencer::Equals(retired.GetMetadata(), live.GetMetadata()));
        REQUIRE(retired.GetAccessGroup().empty());
        REQUIRE(retired.GetBioFactor() == BioFactor::None);
        REQUIRE_FALSE(retired.GetPrivateKeyHandle().has_value());
        REQUIRE_FALSE(retired.DeriveNativePrivateKey(exporter).has_value());
    }
    SECTION("Restoring twice is stable") {
        const auto first = VaultKeyRecordCodec::Restore(VaultKeyRecordCodec::Serialize(live).Unwrap()).Unwrap();
        const auto second = VaultKeyRecordCodec::Restore(VaultKeyRecordCodec::Serialize(first).Unwrap()).Unwrap();
        REQUIRE(second.GetNativePublicKey() == first.GetNativePublicKey());
        REQUIRE(second.GetCurve() == first.GetCurve());
        REQUIRE(VaultKeyRecordCodec::ToRecord(second).retired());
    }
}
TEST_CASE("Vault key lifecycle - Hardware key record", "[integration][vault_key]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = MakeTestKey(EllipticCurveType::R1, 0x52);
    auto storage = SoftwareStorage(key, "fixed");
    storage.is_hardware_backed = true;
    auto live = VaultKey::FromStorage(std::move(storage)).Unwrap();

    const auto record = VaultKeyRecordCodec::ToRecord(live);
    REQUIRE(record.hardware_backed());
    REQUIRE(record.curve() == proto::vault::ELLIPTIC_CURVE_R1);
    REQUIRE(record.bio_factor() == proto::vault::BIO_FACTOR_FIXED);

    auto restored = VaultKeyRecordCodec::FromRecord(record).Unwrap();
    REQUIRE(restored.GetCurve() == EllipticCurveType::R1);
    REQUIRE_FALSE(restored.IsHardwareBacked());
}
TEST_CASE("Vault key lifecycle - Corrupt records", "[integration][vault_key]") {
    SECTION("Garbage bytes") {
        const std::vector<uint8_t> garbage = {0xFF, 0xFF, 0xFF, 0xFF, 0x0F};
        auto restored = VaultKeyRecordCodec::Restore(garbage);
        REQUIRE(restored.IsErr());
        REQUIRE(restored.UnwrapErr().type == VaultFailureType::Serialization);
    }
    SECTION("Record without a public key") {
        proto::vault::VaultKeyRecord record;
        record.set_label("orphan");
        auto restored = VaultKeyRecordCodec::FromRecord(record);
        REQUIRE(restored.IsErr());
        REQUIRE(restored.UnwrapErr().type == VaultFailureType::Serialization);
    }
    SECTION("Unreadable version token keeps the recorded curve") {
        proto::vault::VaultKeyRecord record;
        record.set_native_public_key("PUB_??_corrupt");
        record.set_curve(proto::vault::ELLIPTIC_CURVE_R1);
        REQUIRE(VaultKeyRecordCodec::FromRecord(record).Unwrap().GetCurve() == EllipticCurveType::R1);
        record.set_curve(proto::vault::ELLIPTIC_CURVE_K1);
        REQUIRE(VaultKeyRecordCodec::FromRecord(record).Unwrap().GetCurve() == EllipticCurveType::K1);
    }
    SECTION("Readable version token wins over the recorded curve") {
        const auto key = MakeTestKey(EllipticCurveType::R1, 0x53);
        proto::vault::VaultKeyRecord record;
        record.set_native_public_key(
            NativeKeyEncoding::EncodePublicKey(EllipticCurveType::R1, key.compressed).Unwrap());
        record.set_curve(proto::vault::ELLIPTIC_CURVE_K1);
        REQUIRE(VaultKeyRecordCodec::FromRecord(record).Unwrap().GetCurve() == EllipticCurveType::R1);
    }
}
TEST_CASE("Vault key lifecycle - Legacy prefixed record", "[integration][vault_key][legacy]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    constexpr auto eos = configuration::VaultConfig::WithLegacyPrefix("EOS");
    const std::string legacy_key = "EOS6MRyAjQq8ud7hVNYcfnVPJqcVpscN5So8BhtHuGYqET5GDW5CV";
    Metadata metadata;
    (*metadata.mutable_fields())["account"].set_string_value("eosio");

    auto retired = VaultKey::Create(legacy_key, std::nullopt, metadata, eos).Unwrap();
    REQUIRE(retired.GetCurve() == EllipticCurveType::K1);
    const auto bytes = VaultKeyRecordCodec::Serialize(retired).Unwrap();

    SECTION("Restoring with the default configuration keeps K1") {
        auto restored = VaultKeyRecordCodec::Restore(bytes).Unwrap();
        REQUIRE(restored.GetNativePublicKey() == legacy_key);
        REQUIRE(restored.GetCurve() == EllipticCurveType::K1);
        REQUIRE(MessageDifferencer::Equals(restored.GetMetadata(), metadata));
    }
    SECTION("Restoring with the legacy configuration reads the prefix") {
        auto restored = VaultKeyRecordCodec::Restore(bytes, eos).Unwrap();
        REQUIRE(restored.GetCurve() == EllipticCurveType::K1);
        REQUIRE(restored.IsRetired());
    }
}
