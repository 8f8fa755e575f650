/**
 * @file vault_key_example.cpp
 * @brief Walk a software key through the vault: classify, export, retire
 */

#include "arisen/crypto/sodium_interop.hpp"
#include "arisen/crypto/sodium_secure_memory_handle.hpp"
#include "arisen/models/vault_key.hpp"
#include "arisen/serialization/metadata_json.hpp"
#include "arisen/serialization/vault_key_record_codec.hpp"

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/evp.h>

#include <iostream>
#include <memory>
#include <vector>

using namespace arisen::vault;
using namespace arisen::vault::crypto;
using namespace arisen::vault::models;
using namespace arisen::vault::serialization;

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); }
};

/// Stands in for a platform keychain holding one software key
class InMemoryKeychain : public interfaces::IPrivateKeyExporter {
public:
    explicit InMemoryKeychain(std::vector<uint8_t> x963_export)
        : x963_export_(std::move(x963_export)) {}

    ~InMemoryKeychain() override {
        auto __wipe = SodiumInterop::SecureWipe(std::span(x963_export_));
        (void) __wipe;
    }

    Result<SecureMemoryHandle, VaultFailure> ExportPrivateKey(const KeyHandle& handle) override {
        if (handle.GetReference() != "keychain://example") {
            return Result<SecureMemoryHandle, VaultFailure>::Err(VaultFailure::Export("Unknown key reference"));
        }
        return SecureMemoryHandle::CopyFrom(x963_export_).MapErr(
            [](const SodiumFailure& failure) { return VaultFailure::FromSodiumFailure(failure); });
    }

private:
    std::vector<uint8_t> x963_export_;
};

}

int main() {
    std::cout << "=== Arisen Vault - Vault Key Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Initializing libsodium..." << std::endl;
    if (auto init_result = SodiumInterop::Initialize(); init_result.IsErr()) {
        std::cerr << "Failed to initialize: " << init_result.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Initialized successfully" << std::endl;
    std::cout << std::endl;

    std::cout << "2. Generating a secp256k1 key as a keychain would..." << std::endl;
    const std::unique_ptr<EVP_PKEY, PkeyDeleter> pkey(EVP_EC_gen("secp256k1"));
    if (!pkey) {
        std::cerr << "Failed to generate secp256k1 key" << std::endl;
        return 1;
    }
    std::vector<uint8_t> uncompressed(65);
    size_t uncompressed_length = 0;
    BIGNUM* scalar = nullptr;
    if (EVP_PKEY_get_octet_string_param(pkey.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                        uncompressed.data(), uncompressed.size(), &uncompressed_length) != 1 ||
        uncompressed_length != uncompressed.size() ||
        EVP_PKEY_get_bn_param(pkey.get(), OSSL_PKEY_PARAM_PRIV_KEY, &scalar) != 1) {
        std::cerr << "Failed to read key parameters" << std::endl;
        return 1;
    }
    std::vector<uint8_t> x963_export = uncompressed;
    x963_export.resize(uncompressed.size() + 32);
    const int padded = BN_bn2binpad(scalar, x963_export.data() + uncompressed.size(), 32);
    BN_clear_free(scalar);
    if (padded != 32) {
        std::cerr << "Failed to export private scalar" << std::endl;
        return 1;
    }
    std::cout << "   ✓ Generated key pair" << std::endl;
    std::cout << std::endl;

    std::cout << "3. Building the vault key from storage attributes..." << std::endl;
    StorageAttributes storage;
    storage.label = "example";
    storage.tag = "k1 fixed";
    storage.access_group = "group.io.arisen.example";
    storage.private_key_handle = KeyHandle("keychain://example");
    storage.raw_public_key_uncompressed = uncompressed;
    auto filled = StorageAttributes::FromUncompressed(std::move(storage), enums::EllipticCurveType::K1);
    if (filled.IsErr()) {
        std::cerr << "Failed to compress public key: " << filled.UnwrapErr().message << std::endl;
        return 1;
    }
    auto metadata = MetadataJson::FromJson(R"({"account":"example","created_by":"vault_key_example"})");
    if (metadata.IsErr()) {
        std::cerr << "Failed to parse metadata: " << metadata.UnwrapErr().message << std::endl;
        return 1;
    }
    auto key_result = VaultKey::FromStorage(std::move(filled).Unwrap(), std::move(metadata).Unwrap());
    if (key_result.IsErr()) {
        std::cerr << "Failed to build vault key: " << key_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const VaultKey vault_key = std::move(key_result).Unwrap();
    std::cout << "   Public key: " << vault_key.GetNativePublicKey() << std::endl;
    std::cout << "   Curve:      " << enums::ToString(vault_key.GetCurve()) << std::endl;
    std::cout << "   Biometrics: " << enums::ToString(vault_key.GetBioFactor()) << std::endl;
    std::cout << std::endl;

    std::cout << "4. Exporting the private key..." << std::endl;
    InMemoryKeychain keychain(std::move(x963_export));
    if (const auto private_key = vault_key.DeriveNativePrivateKey(keychain)) {
        std::cout << "   ✓ Exported " << private_key->substr(0, 7) << "... ("
                  << private_key->size() << " characters)" << std::endl;
    } else {
        std::cout << "   Private key is not exportable" << std::endl;
    }
    std::cout << std::endl;

    std::cout << "5. Retiring the key and restoring its record..." << std::endl;
    auto record = VaultKeyRecordCodec::Serialize(vault_key);
    if (record.IsErr()) {
        std::cerr << "Failed to serialize: " << record.UnwrapErr().message << std::endl;
        return 1;
    }
    auto restored = VaultKeyRecordCodec::Restore(record.Unwrap());
    if (restored.IsErr()) {
        std::cerr << "Failed to restore: " << restored.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto& retired = restored.Unwrap();
    auto metadata_json = MetadataJson::ToJson(retired.GetMetadata());
    std::cout << "   Retired:  " << (retired.IsRetired() ? "yes" : "no") << std::endl;
    std::cout << "   Metadata: " << (metadata_json.IsOk() ? metadata_json.Unwrap() : "<unprintable>") << std::endl;
    std::cout << std::endl;

    std::cout << "=== Example completed successfully ===" << std::endl;
    return 0;
}
