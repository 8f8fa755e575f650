#pragma once
#include "arisen/enums/bio_factor.hpp"
#include "arisen/enums/elliptic_curve_type.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>
namespace arisen::vault::models {

/**
 * @brief Typed view of a storage tag string
 *
 * The secure store keeps a free-form tag next to each key, e.g.
 * "k1 fixed" or "flex-key1". Words are runs of ASCII letters and digits;
 * everything else separates them. The curve word "k1" and the biometric
 * words "fixed" / "flex" are matched as whole words, ignoring case, so
 * "myflexiblekey" carries no biometric class. When both biometric words
 * are present, "fixed" wins.
 */
class KeyTag {
public:
    KeyTag() = default;
    KeyTag(std::optional<enums::EllipticCurveType> curve,
           enums::BioFactor bio_factor,
           std::vector<std::string> extra_words = {});

    [[nodiscard]] static KeyTag Parse(std::string_view tag);

    /// Space-separated form written back to the store
    [[nodiscard]] std::string ToString() const;

    /// Curve named by the tag, if any ("r1" is recorded but R1 is also the default)
    [[nodiscard]] const std::optional<enums::EllipticCurveType>& GetCurve() const noexcept {
        return curve_;
    }
    [[nodiscard]] bool NamesK1() const noexcept {
        return curve_ == enums::EllipticCurveType::K1;
    }
    [[nodiscard]] enums::BioFactor GetBioFactor() const noexcept {
        return bio_factor_;
    }
    [[nodiscard]] const std::vector<std::string>& GetExtraWords() const noexcept {
        return extra_words_;
    }

    [[nodiscard]] static std::vector<std::string> SplitWords(std::string_view tag);

private:
    std::optional<enums::EllipticCurveType> curve_;
    enums::BioFactor bio_factor_ = enums::BioFactor::None;
    std::vector<std::string> extra_words_;
};
}
