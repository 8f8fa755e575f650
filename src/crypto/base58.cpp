#include "arisen/crypto/base58.hpp"
#include "arisen/core/format.hpp"

#include <array>

namespace arisen::vault::crypto {

namespace {

constexpr int BASE = 58;
constexpr int BYTE_BASE = 256;

constexpr std::array<int8_t, 256> MakeDigitTable() {
    std::array<int8_t, 256> table{};
    for (auto& entry : table) {
        entry = -1;
    }
    for (size_t i = 0; i < Base58::ALPHABET.size(); ++i) {
        table[static_cast<uint8_t>(Base58::ALPHABET[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto DIGIT_TABLE = MakeDigitTable();

}

std::string Base58::Encode(std::span<const uint8_t> data) {
    size_t leading_zeros = 0;
    while (leading_zeros < data.size() && data[leading_zeros] == 0) {
        ++leading_zeros;
    }

    // log(256) / log(58) < 1.38
    std::vector<uint8_t> digits(data.size() * 138 / 100 + 1, 0);

    for (size_t i = leading_zeros; i < data.size(); ++i) {
        int carry = data[i];
        for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
            carry += BYTE_BASE * static_cast<int>(*it);
            *it = static_cast<uint8_t>(carry % BASE);
            carry /= BASE;
        }
    }

    auto first = digits.begin();
    while (first != digits.end() && *first == 0) {
        ++first;
    }

    std::string encoded;
    encoded.reserve(leading_zeros + static_cast<size_t>(digits.end() - first));
    encoded.assign(leading_zeros, ALPHABET[0]);
    for (; first != digits.end(); ++first) {
        encoded.push_back(ALPHABET[*first]);
    }
    return encoded;
}

Result<std::vector<uint8_t>, VaultFailure> Base58::Decode(std::string_view text) {
    size_t leading_ones = 0;
    while (leading_ones < text.size() && text[leading_ones] == ALPHABET[0]) {
        ++leading_ones;
    }

    // log(58) / log(256) < 0.74
    std::vector<uint8_t> bytes(text.size() * 733 / 1000 + 1, 0);

    for (size_t i = leading_ones; i < text.size(); ++i) {
        const int digit = DIGIT_TABLE[static_cast<uint8_t>(text[i])];
        if (digit < 0) {
            return Result<std::vector<uint8_t>, VaultFailure>::Err(
                VaultFailure::Decode(
                    compat::format("Invalid Base58 character '{}' at position {}", text[i], i)));
        }

        int carry = digit;
        for (auto it = bytes.rbegin(); it != bytes.rend(); ++it) {
            carry += BASE * static_cast<int>(*it);
            *it = static_cast<uint8_t>(carry % BYTE_BASE);
            carry /= BYTE_BASE;
        }
        if (carry != 0) {
            return Result<std::vector<uint8_t>, VaultFailure>::Err(
                VaultFailure::Decode("Base58 value overflows decode buffer"));
        }
    }

    auto first = bytes.begin();
    while (first != bytes.end() && *first == 0) {
        ++first;
    }

    std::vector<uint8_t> decoded;
    decoded.reserve(leading_ones + static_cast<size_t>(bytes.end() - first));
    decoded.assign(leading_ones, 0x00);
    decoded.insert(decoded.end(), first, bytes.end());
    return Result<std::vector<uint8_t>, VaultFailure>::Ok(std::move(decoded));
}

} // namespace arisen::vault::crypto
