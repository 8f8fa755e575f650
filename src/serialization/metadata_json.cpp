#include "arisen/serialization/metadata_json.hpp"
#include "arisen/core/constants.hpp"
#include "arisen/core/format.hpp"
#include <google/protobuf/util/json_util.h>

namespace arisen::vault::serialization {

Result<std::string, VaultFailure> MetadataJson::ToJson(const models::Metadata& metadata) {
    std::string json;
    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;
    const auto status = google::protobuf::util::MessageToJsonString(metadata, &json, options);
    if (!status.ok()) {
        return Result<std::string, VaultFailure>::Err(
            VaultFailure::Serialization(
                compat::format("Failed to print metadata as JSON: {}", std::string(status.message()))));
    }
    return Result<std::string, VaultFailure>::Ok(std::move(json));
}

Result<models::Metadata, VaultFailure> MetadataJson::FromJson(const std::string_view json) {
    const auto first = json.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos || json[first] != '{') {
        return Result<models::Metadata, VaultFailure>::Err(
            VaultFailure::Serialization(std::string(ErrorMessages::METADATA_NOT_OBJECT)));
    }

    models::Metadata metadata;
    const auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &metadata);
    if (!status.ok()) {
        return Result<models::Metadata, VaultFailure>::Err(
            VaultFailure::Serialization(
                compat::format("Failed to parse metadata JSON: {}", std::string(status.message()))));
    }
    return Result<models::Metadata, VaultFailure>::Ok(std::move(metadata));
}

} // namespace arisen::vault::serialization
