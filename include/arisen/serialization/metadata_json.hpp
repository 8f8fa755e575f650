#pragma once
#include "arisen/core/result.hpp"
#include "arisen/core/failures.hpp"
#include "arisen/models/vault_key.hpp"
#include <string>
#include <string_view>
namespace arisen::vault::serialization {

/**
 * @brief JSON text form of vault key metadata
 *
 * Metadata is a JSON object; arrays, scalars and malformed text are
 * rejected with Err(Serialization).
 */
class MetadataJson {
public:
    static Result<std::string, VaultFailure> ToJson(const models::Metadata& metadata);

    static Result<models::Metadata, VaultFailure> FromJson(std::string_view json);

private:
    MetadataJson() = delete;
};
}
