#pragma once

#include "arisen/core/result.hpp"
#include "arisen/core/failures.hpp"
#include "arisen/core/constants.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string_view>

namespace arisen::vault::crypto {

/**
 * @brief Interop layer for libsodium
 *
 * The vault only needs libsodium for handling exported private-key bytes:
 * guarded allocations, wiping and constant-time comparison.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium library
     *
     * Thread-safe and idempotent. Must succeed before secure memory
     * can be allocated.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /// Zero a buffer with sodium_memzero; fails before Initialize
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * @return Ok(true) if equal, Ok(false) if different (including size)
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    /// Constant-time comparison of two strings, used for the expected public key check
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::string_view a,
        std::string_view b);

    /**
     * @brief Allocate guarded memory with sodium_malloc
     *
     * @return Pointer to secure memory, or nullptr when libsodium is not
     *         initialized or the allocation failed
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace arisen::vault::crypto
