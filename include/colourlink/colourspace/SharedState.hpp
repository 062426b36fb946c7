#pragma once

#include <optional>
#include <shared_mutex>
#include <system_error>
#include <vector>

#include "colourlink/core/Color.hpp"
#include "colourlink/core/MeasurementResult.hpp"
#include "colourlink/core/Shape.hpp"

namespace colourlink::colourspace {

/// Which part of a measurement becomes the measured colour.
enum class MeasuredColourSource {
    FirstShape,     // first shape's colour when shapes are present, else scalars
    SmallestShape,  // colour of the smallest-area shape, else scalars
    ScalarOnly      // always the scalar red/green/blue fields
};

/// How a measurement is folded into the shared record.
struct MeasurementPolicy {
    MeasuredColourSource colourSource = MeasuredColourSource::FirstShape;
    bool canonicaliseToEightBit = false;  // store the measured colour at 8-bit depth
};

/// Copy of the shared record handed to consumers.
struct Snapshot {
    bool connected = false;
    std::vector<core::ShapeInstruction> shapes;
    core::Color measuredColor{};
    core::Color requestedColor{};
    std::optional<core::MeasurementResult> lastMeasurement{};
    std::optional<std::error_code> fault{};
};

/**
 * @brief The "what to show / what was measured" record shared by both loops and the display.
 *
 * Readers take a shared lock and may run concurrently with each other;
 * every mutation takes the exclusive lock. Last writer wins.
 */
class SharedState {
public:
    SharedState() = default;

    SharedState(const SharedState&) = delete;
    SharedState& operator=(const SharedState&) = delete;

    Snapshot read() const;

    core::Color requestedColor() const;
    void setRequestedColor(const core::Color& color);

    bool connected() const;
    void setConnected(bool value);

    /// Mark connected and fold @p result into shapes and measured colour.
    void applyMeasurement(const core::MeasurementResult& result,
                          const MeasurementPolicy& policy = {});

    std::optional<std::error_code> fault() const;
    void setFault(const std::error_code& ec);

private:
    mutable std::shared_mutex mutex;
    bool isConnected = false;
    std::vector<core::ShapeInstruction> shapes;
    core::Color currentMeasuredColor{0, 0, 0, core::DEFAULT_DEPTH_BITS};
    core::Color requested{0, 0, 0, core::DEFAULT_DEPTH_BITS};
    std::optional<core::MeasurementResult> latest{};
    std::optional<std::error_code> lastFault{};
};

/// Pick the measured colour for @p result under @p policy.
core::Color selectMeasuredColor(const core::MeasurementResult& result,
                                const MeasurementPolicy& policy);

} // namespace colourlink::colourspace
