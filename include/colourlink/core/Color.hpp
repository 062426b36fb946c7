#pragma once

#include <cstdint>

namespace colourlink::core {

using Channel = std::uint32_t;

constexpr std::uint8_t DEFAULT_DEPTH_BITS = 8;
// 32-bit channels are the widest we store.
constexpr std::uint8_t MAX_DEPTH_BITS = 32;

// An RGB sample as the instrument reports it.
// - red, green, blue : channel values in [0, 2^depthBits - 1]
// - depthBits : shared by all three channels (8, 10, 12 or 16 in practice;
//   0 is treated as 8)

struct Color {
    Channel red = 0;
    Channel green = 0;
    Channel blue = 0;
    std::uint8_t depthBits = DEFAULT_DEPTH_BITS;

    static Color fromComponents(Channel red, Channel green, Channel blue,
                                std::uint8_t depthBits = DEFAULT_DEPTH_BITS) {
        return Color{red, green, blue, depthBits};
    }

    /// Largest channel value representable at this colour's depth.
    std::uint64_t maxValue() const noexcept;

    /// Canonicalise to 8-bit: round(value * 255 / maxValue), clamped to 255.
    Color toEightBit() const noexcept;

    static std::uint8_t scaleToEightBit(Channel value, std::uint8_t depthBits) noexcept;
};

inline bool operator==(const Color& a, const Color& b) {
    return a.red == b.red && a.green == b.green && a.blue == b.blue
        && a.depthBits == b.depthBits;
}

inline bool operator!=(const Color& a, const Color& b) {
    return !(a == b);
}

} // namespace colourlink::core
