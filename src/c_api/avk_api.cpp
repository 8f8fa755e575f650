/**
 * @file avk_api.cpp
 * @brief C API over VaultKey for wallet hosts
 */

#include "arisen/c_api/avk_api.h"
#include "avk_internal.hpp"
#include "arisen/crypto/sodium_interop.hpp"
#include "arisen/crypto/sodium_secure_memory_handle.hpp"
#include "arisen/core/constants.hpp"
#include "arisen/core/format.hpp"
#include "arisen/serialization/metadata_json.hpp"
#include "arisen/serialization/vault_key_record_codec.hpp"
#include <array>
#include <atomic>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <new>

using namespace arisen::vault;
using arisen::vault::crypto::SecureMemoryHandle;
using arisen::vault::crypto::SodiumInterop;
using arisen::vault::models::KeyHandle;
using arisen::vault::models::StorageAttributes;
using arisen::vault::models::VaultKey;
using arisen::vault::serialization::MetadataJson;
using arisen::vault::serialization::VaultKeyRecordCodec;

// ============================================================================
// Internal Helper Implementations
// ============================================================================

namespace avk::internal {

AvkErrorCode EnsureInitialized() {
    static std::once_flag init_flag;
    static std::atomic init_success{false};

    std::call_once(init_flag, [] {
        const auto result = SodiumInterop::Initialize();
        init_success.store(result.IsOk(), std::memory_order_release);
    });

    return init_success.load(std::memory_order_acquire)
               ? AVK_SUCCESS
               : AVK_ERROR_SODIUM_FAILURE;
}

void fill_error(AvkError* out_error, const AvkErrorCode code, const std::string& message) {
    if (out_error) {
        out_error->code = code;
#ifdef _WIN32
        out_error->message = _strdup(message.c_str());
#else
        out_error->message = strdup(message.c_str());
#endif
    }
}

AvkErrorCode fill_error_from_failure(AvkError* out_error, const VaultFailure& failure) {
    AvkErrorCode code = AVK_ERROR_GENERIC;

    switch (failure.type) {
        case VaultFailureType::InvalidInput:
            code = AVK_ERROR_INVALID_INPUT;
            break;
        case VaultFailureType::MissingIdentity:
            code = AVK_ERROR_MISSING_IDENTITY;
            break;
        case VaultFailureType::Encode:
            code = AVK_ERROR_ENCODE;
            break;
        case VaultFailureType::Decode:
            code = AVK_ERROR_DECODE;
            break;
        case VaultFailureType::KeyMismatch:
            code = AVK_ERROR_KEY_MISMATCH;
            break;
        case VaultFailureType::Export:
            code = AVK_ERROR_EXPORT;
            break;
        case VaultFailureType::Serialization:
            code = AVK_ERROR_SERIALIZATION;
            break;
        default:
            code = AVK_ERROR_GENERIC;
            break;
    }

    fill_error(out_error, code, failure.message);
    return code;
}

bool validate_buffer_param(const uint8_t* data, const size_t length, AvkError* out_error) {
    if (!data && length > 0) {
        fill_error(out_error, AVK_ERROR_NULL_POINTER, "Buffer data is null but length is non-zero");
        return false;
    }
    return true;
}

bool validate_output_handle(const void* handle, AvkError* out_error) {
    if (!handle) {
        fill_error(out_error, AVK_ERROR_NULL_POINTER, "Output pointer is null");
        return false;
    }
    return true;
}

bool validate_key_handle(const AvkKeyHandle* handle, AvkError* out_error) {
    if (!handle || !handle->key) {
        fill_error(out_error, AVK_ERROR_NULL_POINTER, "Key handle is null or uninitialized");
        return false;
    }
    return true;
}

bool copy_to_buffer(const std::span<const uint8_t> input, AvkBuffer* out_buffer, AvkError* out_error) {
    if (!out_buffer) {
        fill_error(out_error, AVK_ERROR_NULL_POINTER, "Output buffer is null");
        return false;
    }

    auto* data = new(std::nothrow) uint8_t[input.size() + 1];
    if (!data) {
        fill_error(out_error, AVK_ERROR_OUT_OF_MEMORY, "Failed to allocate output buffer");
        return false;
    }
    if (!input.empty()) {
        std::memcpy(data, input.data(), input.size());
    }
    data[input.size()] = 0;
    out_buffer->data = data;
    out_buffer->length = input.size();
    return true;
}

bool copy_string_to_buffer(const std::string_view input, AvkBuffer* out_buffer, AvkError* out_error) {
    return copy_to_buffer(
        std::span(reinterpret_cast<const uint8_t*>(input.data()), input.size()),
        out_buffer,
        out_error);
}

Result<std::optional<models::Metadata>, VaultFailure> parse_metadata(const char* metadata_json) {
    if (!metadata_json) {
        return Result<std::optional<models::Metadata>, VaultFailure>::Ok(std::nullopt);
    }
    auto parsed = MetadataJson::FromJson(metadata_json);
    if (parsed.IsErr()) {
        return Result<std::optional<models::Metadata>, VaultFailure>::Err(std::move(parsed).UnwrapErr());
    }
    return Result<std::optional<models::Metadata>, VaultFailure>::Ok(std::move(parsed).Unwrap());
}

CallbackPrivateKeyExporter::CallbackPrivateKeyExporter(
    const AvkPrivateKeyExportCallback callback,
    void* user_data)
    : callback_(callback)
    , user_data_(user_data) {
}

Result<SecureMemoryHandle, VaultFailure> CallbackPrivateKeyExporter::ExportPrivateKey(
    const KeyHandle& handle) {
    std::array<uint8_t, AVK_MAX_PRIVATE_KEY_EXPORT_SIZE> exported{};
    size_t exported_length = 0;

    const AvkErrorCode code = callback_(
        handle.GetReference().c_str(),
        exported.data(),
        exported.size(),
        &exported_length,
        user_data_);

    if (code != AVK_SUCCESS || exported_length > exported.size()) {
        auto __wipe = SodiumInterop::SecureWipe(std::span(exported));
        (void) __wipe;
        return Result<SecureMemoryHandle, VaultFailure>::Err(
            VaultFailure::Export(
                arisen::compat::format("{}: export callback returned {}",
                                       ErrorMessages::PRIVATE_KEY_NOT_EXPORTABLE,
                                       avk_error_string(code))));
    }

    auto copy_result = SecureMemoryHandle::CopyFrom(std::span(exported.data(), exported_length)); {
        auto __wipe = SodiumInterop::SecureWipe(std::span(exported));
        (void) __wipe;
    }
    if (copy_result.IsErr()) {
        return Result<SecureMemoryHandle, VaultFailure>::Err(
            VaultFailure::FromSodiumFailure(copy_result.UnwrapErr()));
    }
    return Result<SecureMemoryHandle, VaultFailure>::Ok(std::move(copy_result).Unwrap());
}

} // namespace avk::internal

using namespace avk::internal;

namespace {

AvkErrorCode wrap_key(VaultKey key, AvkKeyHandle** out_handle, AvkError* out_error) {
    auto* handle = new(std::nothrow) AvkKeyHandle{
        std::make_unique<VaultKey>(std::move(key))
    };
    if (!handle) {
        fill_error(out_error, AVK_ERROR_OUT_OF_MEMORY, "Failed to allocate key handle");
        return AVK_ERROR_OUT_OF_MEMORY;
    }
    *out_handle = handle;
    return AVK_SUCCESS;
}

std::optional<std::string> optional_string(const char* value) {
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<KeyHandle> optional_handle(const char* reference) {
    if (!reference) {
        return std::nullopt;
    }
    return KeyHandle(reference);
}

}

// ----------------------------------------------------------------------------
// Library
// ----------------------------------------------------------------------------

const char* avk_version(void) {
    return "1.0.0";
}

AvkErrorCode avk_init(void) {
    return EnsureInitialized();
}

// ----------------------------------------------------------------------------
// Key construction
// ----------------------------------------------------------------------------

AvkErrorCode avk_key_create_live(
    const AvkStorageAttributes* storage,
    const char* expected_public_key,
    const char* metadata_json,
    AvkKeyHandle** out_handle,
    AvkError* out_error) {
    if (const auto err = EnsureInitialized(); err != AVK_SUCCESS) {
        fill_error(out_error, err, "Failed to initialize libsodium");
        return err;
    }
    if (!validate_output_handle(out_handle, out_error)) {
        return AVK_ERROR_NULL_POINTER;
    }
    if (!storage) {
        fill_error(out_error, AVK_ERROR_NULL_POINTER, "Storage attributes are null");
        return AVK_ERROR_NULL_POINTER;
    }
    if (!validate_buffer_param(storage->public_key_compressed, storage->public_key_compressed_length, out_error) ||
        !validate_buffer_param(storage->public_key_uncompressed, storage->public_key_uncompressed_length, out_error)) {
        return AVK_ERROR_NULL_POINTER;
    }

    auto metadata = parse_metadata(metadata_json);
    if (metadata.IsErr()) {
        return fill_error_from_failure(out_error, metadata.UnwrapErr());
    }

    StorageAttributes attributes;
    attributes.label = optional_string(storage->label);
    attributes.tag = optional_string(storage->tag);
    attributes.access_group = storage->access_group ? storage->access_group : "";
    attributes.is_hardware_backed = storage->is_hardware_backed;
    attributes.private_key_handle = optional_handle(storage->private_key_reference);
    attributes.public_key_handle = optional_handle(storage->public_key_reference);
    if (storage->public_key_compressed_length > 0) {
        attributes.raw_public_key_compressed.assign(
            storage->public_key_compressed,
            storage->public_key_compressed + storage->public_key_compressed_length);
    }
    if (storage->public_key_uncompressed_length > 0) {
        attributes.raw_public_key_uncompressed.assign(
            storage->public_key_uncompressed,
            storage->public_key_uncompressed + storage->public_key_uncompressed_length);
    }

    if (attributes.raw_public_key_compressed.empty() && !attributes.raw_public_key_uncompressed.empty()) {
        const auto curve = attributes.ResolveCurve();
        auto filled = StorageAttributes::FromUncompressed(std::move(attributes), curve);
        if (filled.IsErr()) {
            return fill_error_from_failure(out_error, filled.UnwrapErr());
        }
        attributes = std::move(filled).Unwrap();
    }

    auto result = VaultKey::Create(
        optional_string(expected_public_key),
        std::move(attributes),
        std::move(metadata).Unwrap());
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    return wrap_key(std::move(result).Unwrap(), out_handle, out_error);
}

AvkErrorCode avk_key_create_retired(
    const char* native_public_key,
    const char* metadata_json,
    AvkKeyHandle** out_handle,
    AvkError* out_error) {
    if (!validate_output_handle(out_handle, out_error)) {
        return AVK_ERROR_NULL_POINTER;
    }

    auto metadata = parse_metadata(metadata_json);
    if (metadata.IsErr()) {
        return fill_error_from_failure(out_error, metadata.UnwrapErr());
    }

    auto result = VaultKey::Create(
        optional_string(native_public_key),
        std::nullopt,
        std::move(metadata).Unwrap());
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    return wrap_key(std::move(result).Unwrap(), out_handle, out_error);
}

// ----------------------------------------------------------------------------
// Accessors
// ----------------------------------------------------------------------------

AvkErrorCode avk_key_get_public_key(
    const AvkKeyHandle* handle,
    AvkBuffer* out_public_key,
    AvkError* out_error) {
    if (!validate_key_handle(handle, out_error)) {
        return AVK_ERROR_NULL_POINTER;
    }
    if (!copy_string_to_buffer(handle->key->GetNativePublicKey(), out_public_key, out_error)) {
        return out_public_key ? AVK_ERROR_OUT_OF_MEMORY : AVK_ERROR_NULL_POINTER;
    }
    return AVK_SUCCESS;
}

AvkErrorCode avk_key_get_curve(
    const AvkKeyHandle* handle,
    AvkCurve* out_curve,
    AvkError* out_error) {
    if (!validate_key_handle(handle, out_error) || !validate_output_handle(out_curve, out_error)) {
        return AVK_ERROR_NULL_POINTER;
    }
    *out_curve = handle->key->GetCurve() == enums::EllipticCurveType::K1 ? AVK_CURVE_K1 : AVK_CURVE_R1;
    return AVK_SUCCESS;
}

AvkErrorCode avk_key_get_bio_factor(
    const AvkKeyHandle* handle,
    AvkBioFactor* out_bio_factor,
    AvkError* out_error) {
    if (!validate_key_handle(handle, out_error) || !validate_output_handle(out_bio_factor, out_error)) {
        return AVK_ERROR_NULL_POINTER;
    }
    switch (handle->key->GetBioFactor()) {
        case enums::BioFactor::Fixed:
            *out_bio_factor = AVK_BIO_FACTOR_FIXED;
            break;
        case enums::BioFactor::Flex:
            *out_bio_factor = AVK_BIO_FACTOR_FLEX;
            break;
        default:
            *out_bio_factor = AVK_BIO_FACTOR_NONE;
            break;
    }
    return AVK_SUCCESS;
}

AvkErrorCode avk_key_is_retired(
    const AvkKeyHandle* handle,
    bool* out_retired,
    AvkError* out_error) {
    if (!validate_key_handle(handle, out_error) || !validate_output_handle(out_retired, out_error)) {
        return AVK_ERROR_NULL_POINTER;
    }
    *out_retired = handle->key->IsRetired();
    return AVK_SUCCESS;
}

AvkErrorCode avk_key_is_hardware_backed(
    const AvkKeyHandle* handle,
    bool* out_hardware_backed,
    AvkError* out_error) {
    if (!validate_key_handle(handle, out_error) || !validate_output_handle(out_hardware_backed, out_error)) {
        return AVK_ERROR_NULL_POINTER;
    }
    *out_hardware_backed = handle->key->IsHardwareBacked();
    return AVK_SUCCESS;
}

// ----------------------------------------------------------------------------
// Metadata
// ----------------------------------------------------------------------------

AvkErrorCode avk_key_get_metadata_json(
    const AvkKeyHandle* handle,
    AvkBuffer* out_json,
    AvkError* out_error) {
    if (!validate_key_handle(handle, out_error)) {
        return AVK_ERROR_NULL_POINTER;
    }
    auto json = MetadataJson::ToJson(handle->key->GetMetadata());
    if (json.IsErr()) {
        return fill_error_from_failure(out_error, json.UnwrapErr());
    }
    if (!copy_string_to_buffer(json.Unwrap(), out_json, out_error)) {
        return out_json ? AVK_ERROR_OUT_OF_MEMORY : AVK_ERROR_NULL_POINTER;
    }
    return AVK_SUCCESS;
}

AvkErrorCode avk_key_set_metadata_json(
    AvkKeyHandle* handle,
    const char* metadata_json,
    AvkError* out_error) {
    if (!validate_key_handle(handle, out_error)) {
        return AVK_ERROR_NULL_POINTER;
    }
    if (!metadata_json) {
        fill_error(out_error, AVK_ERROR_NULL_POINTER, "Metadata JSON is null");
        return AVK_ERROR_NULL_POINTER;
    }
    auto metadata = MetadataJson::FromJson(metadata_json);
    if (metadata.IsErr()) {
        return fill_error_from_failure(out_error, metadata.UnwrapErr());
    }
    handle->key->SetMetadata(std::move(metadata).Unwrap());
    return AVK_SUCCESS;
}

// ----------------------------------------------------------------------------
// Private key
// ----------------------------------------------------------------------------

AvkErrorCode avk_key_derive_private_key(
    const AvkKeyHandle* handle,
    const AvkPrivateKeyExportCallback export_callback,
    void* user_data,
    AvkBuffer* out_private_key,
    AvkError* out_error) {
    if (const auto err = EnsureInitialized(); err != AVK_SUCCESS) {
        fill_error(out_error, err, "Failed to initialize libsodium");
        return err;
    }
    if (!validate_key_handle(handle, out_error) || !validate_output_handle(out_private_key, out_error)) {
        return AVK_ERROR_NULL_POINTER;
    }
    if (!export_callback) {
        fill_error(out_error, AVK_ERROR_NULL_POINTER, "Export callback is null");
        return AVK_ERROR_NULL_POINTER;
    }

    CallbackPrivateKeyExporter exporter(export_callback, user_data);
    auto native_private_key = handle->key->DeriveNativePrivateKey(exporter);
    if (!native_private_key.has_value()) {
        fill_error(out_error, AVK_ERROR_EXPORT, std::string(ErrorMessages::PRIVATE_KEY_NOT_EXPORTABLE));
        return AVK_ERROR_EXPORT;
    }

    const bool copied = copy_string_to_buffer(*native_private_key, out_private_key, out_error); {
        auto __wipe = SodiumInterop::SecureWipe(
            std::span(reinterpret_cast<uint8_t*>(native_private_key->data()), native_private_key->size()));
        (void) __wipe;
    }
    return copied ? AVK_SUCCESS : AVK_ERROR_OUT_OF_MEMORY;
}

// ----------------------------------------------------------------------------
// Persistence
// ----------------------------------------------------------------------------

AvkErrorCode avk_key_serialize(
    const AvkKeyHandle* handle,
    AvkBuffer* out_record,
    AvkError* out_error) {
    if (!validate_key_handle(handle, out_error)) {
        return AVK_ERROR_NULL_POINTER;
    }
    auto bytes = VaultKeyRecordCodec::Serialize(*handle->key);
    if (bytes.IsErr()) {
        return fill_error_from_failure(out_error, bytes.UnwrapErr());
    }
    if (!copy_to_buffer(bytes.Unwrap(), out_record, out_error)) {
        return out_record ? AVK_ERROR_OUT_OF_MEMORY : AVK_ERROR_NULL_POINTER;
    }
    return AVK_SUCCESS;
}

AvkErrorCode avk_key_restore(
    const uint8_t* record,
    const size_t record_length,
    AvkKeyHandle** out_handle,
    AvkError* out_error) {
    if (!validate_output_handle(out_handle, out_error)) {
        return AVK_ERROR_NULL_POINTER;
    }
    if (!validate_buffer_param(record, record_length, out_error)) {
        return AVK_ERROR_NULL_POINTER;
    }
    auto result = VaultKeyRecordCodec::Restore(std::span(record, record_length));
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    return wrap_key(std::move(result).Unwrap(), out_handle, out_error);
}

// ----------------------------------------------------------------------------
// Memory Management
// ----------------------------------------------------------------------------

void avk_key_destroy(AvkKeyHandle* handle) {
    delete handle;
}

void avk_buffer_free(AvkBuffer* buffer) {
    if (buffer && buffer->data) {
        if (SodiumInterop::IsInitialized()) {
            auto __wipe = SodiumInterop::SecureWipe(std::span(buffer->data, buffer->length));
            (void) __wipe;
        }
        delete[] buffer->data;
        buffer->data = nullptr;
        buffer->length = 0;
    }
}

void avk_error_free(AvkError* error) {
    if (error && error->message) {
        free(error->message);
        error->message = nullptr;
    }
}

const char* avk_error_string(const AvkErrorCode code) {
    switch (code) {
        case AVK_SUCCESS: return "Success";
        case AVK_ERROR_GENERIC: return "Generic error";
        case AVK_ERROR_INVALID_INPUT: return "Invalid input";
        case AVK_ERROR_MISSING_IDENTITY: return "Missing key identity";
        case AVK_ERROR_ENCODE: return "Encoding failed";
        case AVK_ERROR_DECODE: return "Decoding failed";
        case AVK_ERROR_KEY_MISMATCH: return "Public key mismatch";
        case AVK_ERROR_EXPORT: return "Private key export failed";
        case AVK_ERROR_SERIALIZATION: return "Serialization failed";
        case AVK_ERROR_NULL_POINTER: return "Null pointer";
        case AVK_ERROR_OUT_OF_MEMORY: return "Out of memory";
        case AVK_ERROR_SODIUM_FAILURE: return "Sodium library failure";
        default: return "Unknown error";
    }
}
