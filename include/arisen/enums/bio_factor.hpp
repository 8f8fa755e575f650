#pragma once
#include <cstdint>
#include <string_view>
namespace arisen::vault::enums {
enum class BioFactor : uint8_t {
    None = 0,
    Fixed = 1,
    Flex = 2
};
inline const char* ToString(BioFactor factor) {
    switch (factor) {
        case BioFactor::None:
            return "none";
        case BioFactor::Fixed:
            return "fixed";
        case BioFactor::Flex:
            return "flex";
        default:
            return "UNKNOWN";
    }
}
}
