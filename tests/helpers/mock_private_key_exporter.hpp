#pragma once
#include "arisen/interfaces/i_private_key_exporter.hpp"
#include "arisen/crypto/sodium_secure_memory_handle.hpp"
#include "arisen/core/result.hpp"
#include "arisen/core/failures.hpp"
#include <map>
#include <span>
#include <string>
#include <vector>

namespace arisen::vault::test_helpers {

using vault::Result;
using vault::VaultFailure;
using crypto::SecureMemoryHandle;
using interfaces::IPrivateKeyExporter;
using models::KeyHandle;

/**
 * @brief In-memory secure store: references map to exported key bytes
 */
class MockPrivateKeyExporter : public IPrivateKeyExporter {
public:
    MockPrivateKeyExporter() = default;

    void SetExport(const std::string& reference, const std::span<const uint8_t> exported) {
        exports_[reference] = std::vector<uint8_t>(exported.begin(), exported.end());
    }

    /// Subsequent exports fail as if the user cancelled authentication
    void SetFailing(const bool failing) noexcept {
        failing_ = failing;
    }

    [[nodiscard]] Result<SecureMemoryHandle, VaultFailure> ExportPrivateKey(
        const KeyHandle& handle) override {
        ++call_count_;
        if (failing_) {
            return Result<SecureMemoryHandle, VaultFailure>::Err(
                VaultFailure::Export("Mock exporter: authentication cancelled"));
        }
        const auto it = exports_.find(handle.GetReference());
        if (it == exports_.end()) {
            return Result<SecureMemoryHandle, VaultFailure>::Err(
                VaultFailure::Export("Mock exporter: no key for reference"));
        }
        auto copy_result = SecureMemoryHandle::CopyFrom(it->second);
        if (copy_result.IsErr()) {
            return Result<SecureMemoryHandle, VaultFailure>::Err(
                VaultFailure::FromSodiumFailure(copy_result.UnwrapErr()));
        }
        return Result<SecureMemoryHandle, VaultFailure>::Ok(std::move(copy_result).Unwrap());
    }

    [[nodiscard]] size_t CallCount() const noexcept {
        return call_count_;
    }

    ~MockPrivateKeyExporter() override = default;

private:
    std::map<std::string, std::vector<uint8_t>> exports_;
    bool failing_ = false;
    size_t call_count_ = 0;
};

}
