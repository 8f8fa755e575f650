#pragma once
#include "arisen/core/result.hpp"
#include "arisen/core/failures.hpp"
#include "arisen/configuration/vault_config.hpp"
#include "arisen/models/vault_key.hpp"
#include "vault/vault_key_record.pb.h"
#include <cstdint>
#include <span>
#include <vector>
namespace arisen::vault::serialization {

/**
 * @brief Protobuf persistence of vault keys
 *
 * Only the public description is written: handles and raw key bytes stay
 * in the secure store. Restoring therefore always yields a retired key,
 * which is how a wallet keeps a key's metadata after its material is gone.
 */
class VaultKeyRecordCodec {
public:
    static proto::vault::VaultKeyRecord ToRecord(const models::VaultKey& key);

    static Result<std::vector<uint8_t>, VaultFailure> Serialize(const models::VaultKey& key);

    /**
     * @brief Parse a serialized record into a retired key
     *
     * config must recognise the key's prefix for the version token to be
     * read; otherwise the curve stored in the record is kept.
     */
    static Result<models::VaultKey, VaultFailure> Restore(
        std::span<const uint8_t> bytes,
        const configuration::VaultConfig& config = configuration::VaultConfig::Default());

    static Result<models::VaultKey, VaultFailure> FromRecord(
        const proto::vault::VaultKeyRecord& record,
        const configuration::VaultConfig& config = configuration::VaultConfig::Default());

private:
    VaultKeyRecordCodec() = delete;
};
}
