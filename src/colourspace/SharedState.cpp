#include "colourlink/colourspace/SharedState.hpp"

#include <algorithm>
#include <mutex>

namespace colourlink::colourspace {

core::Color selectMeasuredColor(const core::MeasurementResult& result,
                                const MeasurementPolicy& policy) {
    core::Color colour = result.scalarColor();
    if (colour.depthBits == 0) {
        colour.depthBits = core::DEFAULT_DEPTH_BITS;
    }

    if (!result.shapes.empty()) {
        switch (policy.colourSource) {
            case MeasuredColourSource::FirstShape:
                colour = core::shapeColor(result.shapes.front());
                break;
            case MeasuredColourSource::SmallestShape: {
                const auto smallest = std::min_element(
                    result.shapes.begin(), result.shapes.end(),
                    [](const auto& a, const auto& b) { return core::shapeArea(a) < core::shapeArea(b); });
                colour = core::shapeColor(*smallest);
                break;
            }
            case MeasuredColourSource::ScalarOnly:
                break;
        }
    }

    return policy.canonicaliseToEightBit ? colour.toEightBit() : colour;
}

Snapshot SharedState::read() const {
    std::shared_lock lock(mutex);
    Snapshot snapshot;
    snapshot.connected = isConnected;
    snapshot.shapes = shapes;
    snapshot.measuredColor = currentMeasuredColor;
    snapshot.requestedColor = requested;
    snapshot.lastMeasurement = latest;
    snapshot.fault = lastFault;
    return snapshot;
}

core::Color SharedState::requestedColor() const {
    std::shared_lock lock(mutex);
    return requested;
}

void SharedState::setRequestedColor(const core::Color& color) {
    std::unique_lock lock(mutex);
    requested = color;
}

bool SharedState::connected() const {
    std::shared_lock lock(mutex);
    return isConnected;
}

void SharedState::setConnected(bool value) {
    std::unique_lock lock(mutex);
    isConnected = value;
}

void SharedState::applyMeasurement(const core::MeasurementResult& result,
                                   const MeasurementPolicy& policy) {
    const core::Color colour = selectMeasuredColor(result, policy);

    std::unique_lock lock(mutex);
    isConnected = true;
    shapes = result.shapes;
    currentMeasuredColor = colour;
    latest = result;
}

std::optional<std::error_code> SharedState::fault() const {
    std::shared_lock lock(mutex);
    return lastFault;
}

void SharedState::setFault(const std::error_code& ec) {
    std::unique_lock lock(mutex);
    lastFault = ec;
    isConnected = false;
}

} // namespace colourlink::colourspace
