#pragma once
#include "arisen/core/result.hpp"
#include "arisen/core/failures.hpp"
#include "arisen/crypto/sodium_secure_memory_handle.hpp"
#include "arisen/models/key_handle.hpp"
namespace arisen::vault::interfaces {
using vault::Result;
using vault::VaultFailure;

/**
 * @brief Secure-store capability to export a private key
 *
 * Implementations return the platform's external representation of the
 * private key behind handle; for EC keys this is ANSI X9.63
 * (0x04 || X || Y || D), so the scalar is the trailing 32 bytes. Keys
 * confined to secure hardware are never exportable and yield Err(Export).
 */
class IPrivateKeyExporter {
public:
    virtual ~IPrivateKeyExporter() = default;
    [[nodiscard]] virtual Result<crypto::SecureMemoryHandle, VaultFailure> ExportPrivateKey(
        const models::KeyHandle& handle) = 0;
};
}
