#include "arisen/crypto/sodium_interop.hpp"
#include "arisen/core/format.hpp"

#include <sodium.h>

#include <string>

namespace arisen::vault::crypto {

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= SodiumConstants::SUCCESS, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                compat::format("Buffer size {} exceeds maximum {}", buffer.size(), MAX_BUFFER_SIZE)));
    }

    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }

    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }

    if (!IsInitialized()) {
        return Result<bool, SodiumFailure>::Err(
            SodiumFailure::ComparisonFailed(
                compat::format("{}: {}",
                               ErrorMessages::CONSTANT_TIME_COMPARISON_FAILED,
                               ErrorMessages::NOT_INITIALIZED)));
    }

    return Result<bool, SodiumFailure>::Ok(
        sodium_memcmp(a.data(), b.data(), a.size()) == SodiumConstants::SUCCESS);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::string_view a,
    std::string_view b) {
    return ConstantTimeEquals(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(a.data()), a.size()),
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(b.data()), b.size()));
}

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace arisen::vault::crypto
