#include "arisen/models/key_tag.hpp"
#include "arisen/core/constants.hpp"

#include <algorithm>
#include <cctype>

namespace arisen::vault::models {

namespace {

bool IsWordChar(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

std::string ToLower(std::string_view word) {
    std::string lowered(word);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

}

KeyTag::KeyTag(
    std::optional<enums::EllipticCurveType> curve,
    const enums::BioFactor bio_factor,
    std::vector<std::string> extra_words)
    : curve_(curve)
    , bio_factor_(bio_factor)
    , extra_words_(std::move(extra_words)) {
}

std::vector<std::string> KeyTag::SplitWords(std::string_view tag) {
    std::vector<std::string> words;
    size_t i = 0;
    while (i < tag.size()) {
        while (i < tag.size() && !IsWordChar(tag[i])) {
            ++i;
        }
        const size_t start = i;
        while (i < tag.size() && IsWordChar(tag[i])) {
            ++i;
        }
        if (i > start) {
            words.emplace_back(tag.substr(start, i - start));
        }
    }
    return words;
}

KeyTag KeyTag::Parse(std::string_view tag) {
    std::optional<enums::EllipticCurveType> curve;
    bool has_fixed = false;
    bool has_flex = false;
    std::vector<std::string> extra_words;

    for (auto& word : SplitWords(tag)) {
        const std::string lowered = ToLower(word);
        if (lowered == TagTokens::K1) {
            curve = enums::EllipticCurveType::K1;
        } else if (lowered == TagTokens::R1) {
            if (!curve.has_value()) {
                curve = enums::EllipticCurveType::R1;
            }
        } else if (lowered == TagTokens::FIXED) {
            has_fixed = true;
        } else if (lowered == TagTokens::FLEX) {
            has_flex = true;
        } else {
            extra_words.push_back(std::move(word));
        }
    }

    enums::BioFactor bio_factor = enums::BioFactor::None;
    if (has_fixed) {
        bio_factor = enums::BioFactor::Fixed;
    } else if (has_flex) {
        bio_factor = enums::BioFactor::Flex;
    }

    return KeyTag(curve, bio_factor, std::move(extra_words));
}

std::string KeyTag::ToString() const {
    std::vector<std::string_view> words;
    if (curve_.has_value()) {
        words.push_back(enums::ToTagToken(*curve_));
    }
    if (bio_factor_ == enums::BioFactor::Fixed) {
        words.push_back(TagTokens::FIXED);
    } else if (bio_factor_ == enums::BioFactor::Flex) {
        words.push_back(TagTokens::FLEX);
    }
    for (const auto& extra : extra_words_) {
        words.push_back(extra);
    }

    std::string tag;
    for (const auto word : words) {
        if (!tag.empty()) {
            tag.push_back(TagTokens::WORD_SEPARATOR);
        }
        tag.append(word);
    }
    return tag;
}

} // namespace arisen::vault::models
