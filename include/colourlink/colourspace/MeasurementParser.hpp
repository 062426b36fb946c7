// MeasurementParser.hpp
// -----------------------------------------------------------------------------
// Turns one inbound ColourSpace payload into a MeasurementResult.
//
// The parser is a depth-tracked state machine over XmlReader events:
//   * depth 1 is the CS_RMC envelope, depth 2 is the command name; a command
//     name may appear only once per message (DuplicateCommand otherwise).
//   * <result> switches on scalar capture for red/green/blue/x/y/Y/bits.
//   * <rectangle> opens a builder fed by <color>/<colour> and <geometry>
//     attributes at any nesting depth; closing it (or running out of input)
//     finalises the shape, and a rectangle that never saw a colour channel is
//     IncompleteShape.
//   * any XML syntax error is MalformedXml.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "colourlink/core/Color.hpp"
#include "colourlink/core/Expected.hpp"
#include "colourlink/core/MeasurementResult.hpp"
#include "colourlink/colourspace/XmlReader.hpp"

namespace colourlink::colourspace {

class MeasurementParser {
public:
    /// @param fallback Colour we asked for; echoed when <result> omits channels.
    explicit MeasurementParser(const core::Color& fallback);

    [[nodiscard]] expected<core::MeasurementResult> parse(std::string_view document);

    /// Distinct command names seen by the last parse(), in document order.
    const std::vector<std::string>& commands() const { return commands_; }

private:
    enum class Element {
        Other,
        Result,
        Rectangle,
        Color,
        Geometry,
        Red,
        Green,
        Blue,
        X,
        Y,
        YLum,
        Bits
    };

    struct RectangleBuilder {
        core::Color color{};
        bool colorSeen = false;  // set once a channel attribute parsed
        std::optional<float> width{};
        std::optional<float> height{};
        std::optional<float> centerX{};
        std::optional<float> centerY{};
        std::size_t depth = 0;   // stack depth of the owning <rectangle>
    };

    static Element classify(std::string_view name);

    void reset();
    expected<void> onOpen(const xml::Event& event, bool selfClosing);
    expected<void> onClose(const std::string& name);
    void onText(std::string_view text);
    expected<void> noteCommand(const std::string& name);
    void applyColor(const xml::Event& event);
    void applyGeometry(const xml::Event& event);
    expected<void> finishRectangle();

    core::Color fallback_;
    core::MeasurementResult result_;
    std::vector<std::string> stack_;
    std::vector<std::string> commands_;
    bool inResult_ = false;
    std::optional<RectangleBuilder> rectangle_;
};

/// One-shot helper for callers that do not need the command list.
[[nodiscard]] expected<core::MeasurementResult>
parseMeasurement(std::string_view document, const core::Color& fallback);

} // namespace colourlink::colourspace
