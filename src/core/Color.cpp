#include "colourlink/core/Color.hpp"

#include <algorithm>

namespace colourlink::core {
namespace {

std::uint64_t maxForDepth(std::uint8_t depthBits) noexcept {
    if (depthBits == 0) {
        depthBits = DEFAULT_DEPTH_BITS;
    }
    depthBits = std::min(depthBits, MAX_DEPTH_BITS);
    return (std::uint64_t{1} << depthBits) - 1;
}

} // namespace

std::uint64_t Color::maxValue() const noexcept {
    return maxForDepth(depthBits);
}

std::uint8_t Color::scaleToEightBit(Channel value, std::uint8_t depthBits) noexcept {
    const std::uint64_t maxValue = maxForDepth(depthBits);
    // Integer form of round(value * 255 / max) for non-negative operands.
    const std::uint64_t scaled = (std::uint64_t{value} * 255u * 2u + maxValue) / (maxValue * 2u);
    return static_cast<std::uint8_t>(std::min<std::uint64_t>(scaled, 255u));
}

Color Color::toEightBit() const noexcept {
    return Color{scaleToEightBit(red, depthBits),
                 scaleToEightBit(green, depthBits),
                 scaleToEightBit(blue, depthBits),
                 DEFAULT_DEPTH_BITS};
}

} // namespace colourlink::core
