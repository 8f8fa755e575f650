/**
 * @file avk_internal.hpp
 * @brief Internal types and helpers for the AVK C API
 *
 * This header is NOT part of the public API.
 */

#ifndef AVK_INTERNAL_HPP
#define AVK_INTERNAL_HPP

#include "arisen/c_api/avk_api.h"
#include "arisen/core/result.hpp"
#include "arisen/core/failures.hpp"
#include "arisen/interfaces/i_private_key_exporter.hpp"
#include "arisen/models/vault_key.hpp"
#include <memory>
#include <span>
#include <string>
#include <string_view>

/**
 * @brief Opaque handle wrapping a VaultKey
 */
struct AvkKeyHandle {
    std::unique_ptr<arisen::vault::models::VaultKey> key;
};

namespace avk::internal {

using namespace arisen::vault;

AvkErrorCode EnsureInitialized();

void fill_error(AvkError* out_error, AvkErrorCode code, const std::string& message);

/**
 * @brief Map a VaultFailure to its error code and fill the error struct
 * @return The corresponding AvkErrorCode
 */
AvkErrorCode fill_error_from_failure(AvkError* out_error, const VaultFailure& failure);

bool validate_buffer_param(const uint8_t* data, size_t length, AvkError* out_error);

bool validate_output_handle(const void* handle, AvkError* out_error);

bool validate_key_handle(const AvkKeyHandle* handle, AvkError* out_error);

/**
 * @brief Copy bytes into a newly allocated output buffer
 */
bool copy_to_buffer(std::span<const uint8_t> input, AvkBuffer* out_buffer, AvkError* out_error);

/**
 * @brief Copy a string into a newly allocated, NUL-terminated output buffer
 */
bool copy_string_to_buffer(std::string_view input, AvkBuffer* out_buffer, AvkError* out_error);

/**
 * @brief Parse optional metadata JSON; a null pointer means no metadata
 */
Result<std::optional<models::Metadata>, VaultFailure> parse_metadata(const char* metadata_json);

/**
 * @brief Adapts an AvkPrivateKeyExportCallback to IPrivateKeyExporter
 */
class CallbackPrivateKeyExporter final : public interfaces::IPrivateKeyExporter {
public:
    CallbackPrivateKeyExporter(AvkPrivateKeyExportCallback callback, void* user_data);

    Result<crypto::SecureMemoryHandle, VaultFailure> ExportPrivateKey(
        const models::KeyHandle& handle) override;

private:
    AvkPrivateKeyExportCallback callback_;
    void* user_data_;
};

} // namespace avk::internal

#endif // AVK_INTERNAL_HPP
