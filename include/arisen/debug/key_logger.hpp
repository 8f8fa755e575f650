#pragma once

/**
 * @file key_logger.hpp
 * @brief Debug logging for vault key construction.
 *
 * Logs public key material and classification decisions to stdout so that
 * native key strings can be compared against other wallet implementations.
 * Private key bytes are never passed to these macros.
 *
 * Enable via CMake: -DARISEN_VAULT_DEBUG_KEYS=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace arisen::vault::debug {

enum class Path {
    Live,
    Retired,
    Export
};

#ifdef ARISEN_VAULT_DEBUG_KEYS

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

inline const char* PathToString(Path path) {
    switch (path) {
        case Path::Live: return "LIVE";
        case Path::Retired: return "RETIRED";
        case Path::Export: return "EXPORT";
        default: return "UNKNOWN";
    }
}

#define AVK_LOG_KEY(path, key_name, data) \
    do { \
        fprintf(stdout, "[AVK-DEBUG] %s %s: %s\n", \
            ::arisen::vault::debug::PathToString(path), \
            key_name, \
            ::arisen::vault::debug::ToHex(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define AVK_LOG_VALUE(path, name, value) \
    do { \
        fprintf(stdout, "[AVK-DEBUG] %s %s: %s\n", \
            ::arisen::vault::debug::PathToString(path), \
            name, \
            std::string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define AVK_LOG_MSG(path, message) \
    do { \
        fprintf(stdout, "[AVK-DEBUG] %s %s\n", \
            ::arisen::vault::debug::PathToString(path), \
            message); \
        fflush(stdout); \
    } while(0)

#define AVK_LOG_SECTION(path, section_name) \
    do { \
        fprintf(stdout, "[AVK-DEBUG] %s ========== %s ==========\n", \
            ::arisen::vault::debug::PathToString(path), \
            section_name); \
        fflush(stdout); \
    } while(0)

#else // !ARISEN_VAULT_DEBUG_KEYS

#define AVK_LOG_KEY(path, key_name, data) ((void)0)
#define AVK_LOG_VALUE(path, name, value) ((void)0)
#define AVK_LOG_MSG(path, message) ((void)0)
#define AVK_LOG_SECTION(path, section_name) ((void)0)

#endif // ARISEN_VAULT_DEBUG_KEYS

inline void LogLiveKeyClassified(
    std::string_view tag,
    bool is_hardware_backed,
    const char* curve,
    const char* bio_factor,
    std::span<const uint8_t> compressed_public_key) {

    AVK_LOG_SECTION(Path::Live, "VAULT KEY FROM STORAGE");
    AVK_LOG_VALUE(Path::Live, "tag", tag);
    AVK_LOG_MSG(Path::Live, is_hardware_backed ? "hardware backed" : "software key");
    AVK_LOG_VALUE(Path::Live, "curve", std::string_view(curve));
    AVK_LOG_VALUE(Path::Live, "bio_factor", std::string_view(bio_factor));
    AVK_LOG_KEY(Path::Live, "compressed_public_key", compressed_public_key);
    (void) tag;
    (void) is_hardware_backed;
    (void) curve;
    (void) bio_factor;
    (void) compressed_public_key;
}

inline void LogRetiredKey(
    std::string_view native_public_key,
    const char* curve,
    bool curve_from_fallback) {

    AVK_LOG_SECTION(Path::Retired, "RETIRED VAULT KEY");
    AVK_LOG_VALUE(Path::Retired, "native_public_key", native_public_key);
    AVK_LOG_VALUE(Path::Retired, "curve", std::string_view(curve));
    if (curve_from_fallback) {
        AVK_LOG_MSG(Path::Retired, "version token unreadable, curve defaulted");
    }
    (void) native_public_key;
    (void) curve;
}

inline void LogPublicKeyMismatch(
    std::string_view expected,
    std::string_view derived) {

    AVK_LOG_SECTION(Path::Live, "PUBLIC KEY MISMATCH");
    AVK_LOG_VALUE(Path::Live, "expected", expected);
    AVK_LOG_VALUE(Path::Live, "derived", derived);
    (void) expected;
    (void) derived;
}

inline void LogExportSkipped(const char* reason) {
    AVK_LOG_MSG(Path::Export, reason);
    (void) reason;
}

} // namespace arisen::vault::debug
