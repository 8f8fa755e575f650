#pragma once

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#define AVK_API_VERSION_MAJOR 1
#define AVK_API_VERSION_MINOR 0
#define AVK_API_VERSION_PATCH 0

#define AVK_MAX_PRIVATE_KEY_EXPORT_SIZE 256

typedef enum {
    AVK_SUCCESS = 0,
    AVK_ERROR_GENERIC = 1,
    AVK_ERROR_INVALID_INPUT = 2,
    AVK_ERROR_MISSING_IDENTITY = 3,
    AVK_ERROR_ENCODE = 4,
    AVK_ERROR_DECODE = 5,
    AVK_ERROR_KEY_MISMATCH = 6,
    AVK_ERROR_EXPORT = 7,
    AVK_ERROR_SERIALIZATION = 8,
    AVK_ERROR_NULL_POINTER = 9,
    AVK_ERROR_OUT_OF_MEMORY = 10,
    AVK_ERROR_SODIUM_FAILURE = 11
} AvkErrorCode;

typedef enum {
    AVK_CURVE_K1 = 0,
    AVK_CURVE_R1 = 1
} AvkCurve;

typedef enum {
    AVK_BIO_FACTOR_NONE = 0,
    AVK_BIO_FACTOR_FIXED = 1,
    AVK_BIO_FACTOR_FLEX = 2
} AvkBioFactor;

typedef struct AvkKeyHandle AvkKeyHandle;

// String outputs are NUL-terminated; length excludes the terminator.
typedef struct AvkBuffer {
    uint8_t* data;
    size_t length;
} AvkBuffer;

typedef struct AvkError {
    AvkErrorCode code;
    char* message;
} AvkError;

// Attributes of a live secure-store entry. Null strings are absent values.
typedef struct AvkStorageAttributes {
    const char* label;
    const char* tag;
    const char* access_group;
    bool is_hardware_backed;
    const char* private_key_reference;
    const char* public_key_reference;
    const uint8_t* public_key_compressed;
    size_t public_key_compressed_length;
    const uint8_t* public_key_uncompressed;
    size_t public_key_uncompressed_length;
} AvkStorageAttributes;

// Writes the exported private key (X9.63 for EC keys) for reference into out,
// which holds capacity bytes. Returns AVK_SUCCESS or AVK_ERROR_EXPORT.
typedef AvkErrorCode (*AvkPrivateKeyExportCallback)(
    const char* private_key_reference,
    uint8_t* out,
    size_t capacity,
    size_t* out_length,
    void* user_data);

const char* avk_version(void);

AvkErrorCode avk_init(void);

AvkErrorCode avk_key_create_live(
    const AvkStorageAttributes* storage,
    const char* expected_public_key,
    const char* metadata_json,
    AvkKeyHandle** out_handle,
    AvkError* out_error);

AvkErrorCode avk_key_create_retired(
    const char* native_public_key,
    const char* metadata_json,
    AvkKeyHandle** out_handle,
    AvkError* out_error);

AvkErrorCode avk_key_get_public_key(
    const AvkKeyHandle* handle,
    AvkBuffer* out_public_key,
    AvkError* out_error);

AvkErrorCode avk_key_get_curve(
    const AvkKeyHandle* handle,
    AvkCurve* out_curve,
    AvkError* out_error);

AvkErrorCode avk_key_get_bio_factor(
    const AvkKeyHandle* handle,
    AvkBioFactor* out_bio_factor,
    AvkError* out_error);

AvkErrorCode avk_key_is_retired(
    const AvkKeyHandle* handle,
    bool* out_retired,
    AvkError* out_error);

AvkErrorCode avk_key_is_hardware_backed(
    const AvkKeyHandle* handle,
    bool* out_hardware_backed,
    AvkError* out_error);

AvkErrorCode avk_key_get_metadata_json(
    const AvkKeyHandle* handle,
    AvkBuffer* out_json,
    AvkError* out_error);

AvkErrorCode avk_key_set_metadata_json(
    AvkKeyHandle* handle,
    const char* metadata_json,
    AvkError* out_error);

// AVK_ERROR_EXPORT when the key has no exportable private key.
AvkErrorCode avk_key_derive_private_key(
    const AvkKeyHandle* handle,
    AvkPrivateKeyExportCallback export_callback,
    void* user_data,
    AvkBuffer* out_private_key,
    AvkError* out_error);

AvkErrorCode avk_key_serialize(
    const AvkKeyHandle* handle,
    AvkBuffer* out_record,
    AvkError* out_error);

AvkErrorCode avk_key_restore(
    const uint8_t* record,
    size_t record_length,
    AvkKeyHandle** out_handle,
    AvkError* out_error);

void avk_key_destroy(AvkKeyHandle* handle);

// Wipes and releases buffer->data; the AvkBuffer itself belongs to the caller.
void avk_buffer_free(AvkBuffer* buffer);

void avk_error_free(AvkError* error);

const char* avk_error_string(AvkErrorCode code);

#ifdef __cplusplus
}
#endif
