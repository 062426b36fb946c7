#include "colourlink/colourspace/MeasurementWorker.hpp"
#include "colourlink/log/Log.hpp"

#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>
#include <variant>

using namespace colourlink;

namespace {

const char* describe(const core::ShapeInstruction& shape) {
    return std::visit([](const core::Rectangle&) { return "rectangle"; }, shape);
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        logError("usage: colourlink_monitor <host[:port]>\n");
        return 2;
    }

    colourspace::WorkerOptions options;
    options.logReceivedXml = std::getenv(colourspace::config::XML_LOG_ENV) != nullptr;

    auto handle = colourspace::spawn(argv[1], options);
    if (!handle) {
        const auto err = handle.error();
        logError("Connect failed: ", err.message(),
                 " (", err.category().name(), ":", err.value(), ")\n");
        return 1;
    }

    // Step the requested colour through a grey ramp so each request differs.
    for (unsigned step = 0;; ++step) {
        const auto level = static_cast<core::Channel>((step * 32u) % 256u);
        handle->setRequestedColor(core::Color::fromComponents(level, level, level));

        std::this_thread::sleep_for(std::chrono::seconds(1));

        const auto snapshot = handle->read();
        if (snapshot.fault) {
            logError("Worker stopped: ", snapshot.fault->message(), "\n");
            return 1;
        }

        logInfo("connected=", snapshot.connected ? "yes" : "no",
                " measured=", snapshot.measuredColor.red, ",",
                snapshot.measuredColor.green, ",", snapshot.measuredColor.blue,
                " (", static_cast<int>(snapshot.measuredColor.depthBits), "-bit)",
                " shapes=", snapshot.shapes.size(), "\n");

        for (const auto& shape : snapshot.shapes) {
            const auto& colour = core::shapeColor(shape);
            logInfo("  ", describe(shape), " ", colour.red, ",", colour.green, ",", colour.blue, "\n");
        }

        if (snapshot.lastMeasurement && snapshot.lastMeasurement->x && snapshot.lastMeasurement->y) {
            logInfo("  x=", *snapshot.lastMeasurement->x, " y=", *snapshot.lastMeasurement->y,
                    snapshot.lastMeasurement->yLum ? " Y=" : "",
                    snapshot.lastMeasurement->yLum ? std::to_string(*snapshot.lastMeasurement->yLum) : "",
                    "\n");
        }
    }
}
