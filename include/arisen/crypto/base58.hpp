#pragma once

#include "arisen/core/result.hpp"
#include "arisen/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace arisen::vault::crypto {

/**
 * @brief Base58 codec over the Bitcoin alphabet
 *
 * Leading zero bytes map to leading '1' characters and back.
 */
class Base58 {
public:
    static constexpr std::string_view ALPHABET =
        "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

    [[nodiscard]] static std::string Encode(std::span<const uint8_t> data);

    /**
     * @brief Decode a Base58 string
     *
     * @return Err(Decode) if any character is outside the alphabet
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, VaultFailure> Decode(std::string_view text);

private:
    Base58() = delete;
};

} // namespace arisen::vault::crypto
