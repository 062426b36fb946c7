#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "colourlink/core/Color.hpp"
#include "colourlink/core/Shape.hpp"

namespace colourlink::core {

/**
 * @brief Everything one inbound message told us.
 *
 * red/green/blue start as the values we asked for and are overwritten only by
 * numeric children of <result>. x, y and yLum are tristimulus readings and
 * stay empty unless the message reported them.
 */
struct MeasurementResult {
    Channel red = 0;
    Channel green = 0;
    Channel blue = 0;
    std::uint8_t depthBits = DEFAULT_DEPTH_BITS;

    std::optional<double> x{};
    std::optional<double> y{};
    std::optional<double> yLum{};

    std::vector<ShapeInstruction> shapes;

    Color scalarColor() const {
        return Color{red, green, blue, depthBits};
    }
};

} // namespace colourlink::core
