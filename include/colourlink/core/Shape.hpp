#pragma once

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include "colourlink/core/Color.hpp"

namespace colourlink::core {

/**
 * @brief Normalised rectangle footprint.
 *
 * Width and height are fractions of the display surface in [0, 1]. When the
 * wire message omits them they default to 1.0 (full extent). The optional
 * centre, also normalised, replaces the default centred placement.
 */
struct Geometry {
    float width = 1.0f;
    float height = 1.0f;
    std::optional<float> centerX{};
    std::optional<float> centerY{};
};

/// Pixel-space placement of a shape on a concrete surface.
struct PixelRect {
    int left = 0;
    int top = 0;
    unsigned width = 0;
    unsigned height = 0;
};

struct Rectangle {
    Color color{};
    Geometry geometry{};

    /// Absolute area in normalised units.
    float area() const noexcept;

    /**
     * @brief Place the rectangle on a surface of the given pixel size.
     *
     * Size is clamped to the surface and never collapses below one pixel.
     * Without a centre the rectangle is centred on the surface.
     */
    PixelRect placement(unsigned surfaceWidth, unsigned surfaceHeight) const noexcept;
};

// Closed set of drawable shapes. New kinds are added as variant alternatives;
// the parser and worker only dispatch through std::visit.
using ShapeInstruction = std::variant<Rectangle>;

/// Colour carried by any shape kind.
const Color& shapeColor(const ShapeInstruction& shape) noexcept;

/// Area used to rank shapes; non-finite or non-positive areas rank last.
float shapeArea(const ShapeInstruction& shape) noexcept;

/// Clamp to [0, 1]; NaN falls back to @p fallback.
float clampUnit(float value, float fallback = 1.0f) noexcept;

} // namespace colourlink::core
