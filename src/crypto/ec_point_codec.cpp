#include "arisen/crypto/ec_point_codec.hpp"
#include "arisen/core/constants.hpp"
#include "arisen/core/format.hpp"

#include <openssl/ec.h>
#include <openssl/obj_mac.h>

#include <memory>

namespace arisen::vault::crypto {

namespace {

struct EcGroupDeleter {
    void operator()(EC_GROUP* group) const noexcept { EC_GROUP_free(group); }
};
struct EcPointDeleter {
    void operator()(EC_POINT* point) const noexcept { EC_POINT_free(point); }
};

using EcGroupPtr = std::unique_ptr<EC_GROUP, EcGroupDeleter>;
using EcPointPtr = std::unique_ptr<EC_POINT, EcPointDeleter>;

int CurveNid(const enums::EllipticCurveType curve) {
    return curve == enums::EllipticCurveType::K1 ? NID_secp256k1 : NID_X9_62_prime256v1;
}

}

Result<std::vector<uint8_t>, VaultFailure> EcPointCodec::Compress(
    const enums::EllipticCurveType curve,
    std::span<const uint8_t> uncompressed) {
    if (uncompressed.size() != Constants::UNCOMPRESSED_PUBLIC_KEY_SIZE ||
        uncompressed[0] != Constants::UNCOMPRESSED_PREFIX) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(
            VaultFailure::InvalidInput(
                compat::format("Uncompressed point must be {} bytes starting with 0x04",
                               Constants::UNCOMPRESSED_PUBLIC_KEY_SIZE)));
    }

    const EcGroupPtr group(EC_GROUP_new_by_curve_name(CurveNid(curve)));
    if (!group) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(
            VaultFailure::Generic(
                compat::format("OpenSSL does not provide curve {}", enums::ToString(curve))));
    }

    const EcPointPtr point(EC_POINT_new(group.get()));
    if (!point) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(
            VaultFailure::Generic("Failed to allocate EC point"));
    }

    // oct2point rejects coordinates that are not on the curve
    if (EC_POINT_oct2point(group.get(), point.get(), uncompressed.data(), uncompressed.size(), nullptr) !=
        OpenSSLConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(
            VaultFailure::InvalidInput(
                compat::format("Uncompressed bytes are not a valid {} point", enums::ToString(curve))));
    }

    std::vector<uint8_t> compressed(Constants::COMPRESSED_PUBLIC_KEY_SIZE);
    const size_t written = EC_POINT_point2oct(
        group.get(), point.get(), POINT_CONVERSION_COMPRESSED, compressed.data(), compressed.size(), nullptr);
    if (written != compressed.size()) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(
            VaultFailure::Generic("Failed to compress EC point"));
    }
    return Result<std::vector<uint8_t>, VaultFailure>::Ok(std::move(compressed));
}

} // namespace arisen::vault::crypto
