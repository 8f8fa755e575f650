#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace arisen::vault {
struct Constants {
    static constexpr size_t COMPRESSED_PUBLIC_KEY_SIZE = 33;
    static constexpr size_t UNCOMPRESSED_PUBLIC_KEY_SIZE = 65;
    static constexpr size_t PRIVATE_KEY_SCALAR_SIZE = 32;
    static constexpr uint8_t COMPRESSED_EVEN_Y_PREFIX = 0x02;
    static constexpr uint8_t COMPRESSED_ODD_Y_PREFIX = 0x03;
    static constexpr uint8_t UNCOMPRESSED_PREFIX = 0x04;
    static constexpr size_t CHECKSUM_SIZE = 4;
    static constexpr size_t RIPEMD160_DIGEST_SIZE = 20;
};
struct NativeKeyConstants {
    static constexpr std::string_view PUBLIC_KEY_PREFIX = "PUB";
    static constexpr std::string_view PRIVATE_KEY_PREFIX = "PVT";
    static constexpr std::string_view LEGACY_PUBLIC_KEY_PREFIX = "RSN";
    static constexpr char COMPONENT_SEPARATOR = '_';
};
struct TagTokens {
    static constexpr std::string_view K1 = "k1";
    static constexpr std::string_view R1 = "r1";
    static constexpr std::string_view FIXED = "fixed";
    static constexpr std::string_view FLEX = "flex";
    static constexpr char WORD_SEPARATOR = ' ';
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr std::string_view CURVE_K1 = "secp256k1";
    static constexpr std::string_view CURVE_R1 = "prime256v1";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view MISSING_IDENTITY = "Neither storage attributes nor a public key were supplied";
    static constexpr std::string_view PUBLIC_KEY_MISMATCH = "Public key derived from storage does not match the expected public key";
    static constexpr std::string_view PRIVATE_KEY_NOT_EXPORTABLE = "Private key is not exportable";
    static constexpr std::string_view METADATA_NOT_OBJECT = "Metadata JSON must be an object";
};
}
