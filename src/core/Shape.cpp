#include "colourlink/core/Shape.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace colourlink::core {

float clampUnit(float value, float fallback) noexcept {
    if (std::isnan(value)) {
        return fallback;
    }
    return std::clamp(value, 0.0f, 1.0f);
}

float Rectangle::area() const noexcept {
    return std::fabs(geometry.width) * std::fabs(geometry.height);
}

PixelRect Rectangle::placement(unsigned surfaceWidth, unsigned surfaceHeight) const noexcept {
    PixelRect out;
    if (surfaceWidth == 0 || surfaceHeight == 0) {
        return out;
    }

    const float surfaceW = static_cast<float>(surfaceWidth);
    const float surfaceH = static_cast<float>(surfaceHeight);

    const float widthPx = std::clamp(clampUnit(geometry.width) * surfaceW, 1.0f, surfaceW);
    const float heightPx = std::clamp(clampUnit(geometry.height) * surfaceH, 1.0f, surfaceH);

    const float centreX = geometry.centerX ? clampUnit(*geometry.centerX, 0.5f) * surfaceW
                                           : surfaceW / 2.0f;
    const float centreY = geometry.centerY ? clampUnit(*geometry.centerY, 0.5f) * surfaceH
                                           : surfaceH / 2.0f;

    out.width = std::max(1u, static_cast<unsigned>(std::lround(widthPx)));
    out.height = std::max(1u, static_cast<unsigned>(std::lround(heightPx)));
    out.left = static_cast<int>(std::lround(centreX - widthPx / 2.0f));
    out.top = static_cast<int>(std::lround(centreY - heightPx / 2.0f));
    return out;
}

const Color& shapeColor(const ShapeInstruction& shape) noexcept {
    return std::visit([](const auto& s) -> const Color& { return s.color; }, shape);
}

float shapeArea(const ShapeInstruction& shape) noexcept {
    const float area = std::visit([](const auto& s) { return s.area(); }, shape);
    if (!std::isfinite(area) || area <= 0.0f) {
        return std::numeric_limits<float>::max();
    }
    return area;
}

} // namespace colourlink::core
