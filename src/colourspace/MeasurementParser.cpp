#include "colourlink/colourspace/MeasurementParser.hpp"

#include "colourlink/core/Errors.hpp"
#include "colourlink/log/Log.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <limits>

namespace colourlink::colourspace {

using core::Channel;
using core::Color;

namespace {

// Depth of the command element: the first child of the envelope.
constexpr std::size_t COMMAND_DEPTH = 2;

std::string_view stripPlus(std::string_view text) {
    text = xml::trim(text);
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    return text;
}

template <typename T>
std::optional<T> parseUnsigned(std::string_view text) {
    text = stripPlus(text);
    T value{};
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || text.empty()) {
        return std::nullopt;
    }
    return value;
}

// Widest integer first; on overflow retry as 8-bit (which rejects it too,
// leaving the field untouched).
std::optional<Channel> parseChannel(std::string_view text) {
    if (auto wide = parseUnsigned<std::uint64_t>(text)) {
        if (*wide <= std::numeric_limits<Channel>::max()) {
            return static_cast<Channel>(*wide);
        }
    }
    if (auto narrow = parseUnsigned<std::uint8_t>(text)) {
        return Channel{*narrow};
    }
    return std::nullopt;
}

std::optional<double> parseDouble(std::string_view text) {
    const std::string owned(xml::trim(text));
    if (owned.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const double value = std::strtod(owned.c_str(), &end);
    if (end != owned.c_str() + owned.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<float> parseFloat(std::string_view text) {
    if (auto value = parseDouble(text)) {
        return static_cast<float>(*value);
    }
    return std::nullopt;
}

// Bit depths outside 1..32 leave the current depth in place.
std::optional<std::uint8_t> parseDepth(std::string_view text) {
    auto value = parseUnsigned<std::uint8_t>(text);
    if (!value || *value < 1 || *value > core::MAX_DEPTH_BITS) {
        return std::nullopt;
    }
    return value;
}

bool isDepthAttribute(std::string_view name) {
    return name == "bits" || name == "depth" || name == "bitDepth";
}

} // namespace

MeasurementParser::MeasurementParser(const Color& fallback)
: fallback_(fallback) {}

MeasurementParser::Element MeasurementParser::classify(std::string_view name) {
    if (name == "result")                       return Element::Result;
    if (name == "rectangle")                    return Element::Rectangle;
    if (name == "color" || name == "colour")    return Element::Color;
    if (name == "geometry")                     return Element::Geometry;
    if (name == "red")                          return Element::Red;
    if (name == "green")                        return Element::Green;
    if (name == "blue")                         return Element::Blue;
    if (name == "x")                            return Element::X;
    if (name == "y")                            return Element::Y;
    if (name == "Y")                            return Element::YLum;
    if (isDepthAttribute(name))                 return Element::Bits;
    return Element::Other;
}

void MeasurementParser::reset() {
    result_ = core::MeasurementResult{};
    result_.red = fallback_.red;
    result_.green = fallback_.green;
    result_.blue = fallback_.blue;
    result_.depthBits = fallback_.depthBits;
    stack_.clear();
    commands_.clear();
    inResult_ = false;
    rectangle_.reset();
}

expected<core::MeasurementResult> MeasurementParser::parse(std::string_view document) {
    reset();

    xml::XmlReader reader(document);
    while (true) {
        auto event = reader.next();
        if (!event) {
            logError("[ColourSpace] XML parse error at byte ", reader.position(), "\n");
            return unexpected(event.error());
        }

        expected<void> step{};
        switch (event->type) {
            case xml::EventType::StartTag:
                step = onOpen(*event, false);
                break;
            case xml::EventType::EmptyTag:
                step = onOpen(*event, true);
                break;
            case xml::EventType::EndTag:
                step = onClose(event->name);
                break;
            case xml::EventType::Text:
            case xml::EventType::CData:
                onText(event->text);
                break;
            case xml::EventType::Comment:
            case xml::EventType::Declaration:
            case xml::EventType::Doctype:
                break;
            case xml::EventType::End:
                // An unterminated <rectangle> still has to be complete.
                if (rectangle_) {
                    if (auto done = finishRectangle(); !done) {
                        return unexpected(done.error());
                    }
                }
                return std::move(result_);
        }

        if (!step) {
            return unexpected(step.error());
        }
    }
}

expected<void> MeasurementParser::noteCommand(const std::string& name) {
    if (std::find(commands_.begin(), commands_.end(), name) != commands_.end()) {
        logError("[ColourSpace] duplicate command <", name, "> in one message\n");
        return unexpected(make_error_code(Errc::DuplicateCommand));
    }
    commands_.push_back(name);
    logInfo("[ColourSpace] Received command: ", name, "\n");
    return {};
}

expected<void> MeasurementParser::onOpen(const xml::Event& event, bool selfClosing) {
    const std::size_t depth = stack_.size() + 1;
    if (depth == COMMAND_DEPTH) {
        if (auto ok = noteCommand(event.name); !ok) {
            return ok;
        }
    }

    switch (classify(event.name)) {
        case Element::Result:
            inResult_ = !selfClosing;
            break;
        case Element::Rectangle:
            if (rectangle_) {
                // A nested <rectangle> ends the outer one.
                if (auto done = finishRectangle(); !done) {
                    return done;
                }
            }
            rectangle_ = RectangleBuilder{};
            rectangle_->depth = depth;
            if (selfClosing) {
                return finishRectangle();
            }
            break;
        case Element::Color:
            if (rectangle_) applyColor(event);
            break;
        case Element::Geometry:
            if (rectangle_) applyGeometry(event);
            break;
        default:
            break;
    }

    if (!selfClosing) {
        stack_.push_back(event.name);
    }
    return {};
}

expected<void> MeasurementParser::onClose(const std::string& name) {
    const std::size_t depth = stack_.size();
    const Element element = classify(name);

    if (element == Element::Result) {
        inResult_ = false;
    }

    expected<void> outcome{};
    if (element == Element::Rectangle && rectangle_ && rectangle_->depth == depth) {
        outcome = finishRectangle();
    }

    if (!stack_.empty()) {
        stack_.pop_back();
    }
    return outcome;
}

void MeasurementParser::onText(std::string_view text) {
    if (stack_.empty()) {
        return;
    }

    const std::string& current = stack_.back();
    if (stack_.size() >= COMMAND_DEPTH && current != stack_[COMMAND_DEPTH - 1]) {
        logInfo("[ColourSpace]   ", current, " = ", text, "\n");
    }

    if (!inResult_) {
        return;
    }

    // Unparseable values leave the previous value in place.
    switch (classify(current)) {
        case Element::Red:
            if (auto v = parseChannel(text)) result_.red = *v;
            break;
        case Element::Green:
            if (auto v = parseChannel(text)) result_.green = *v;
            break;
        case Element::Blue:
            if (auto v = parseChannel(text)) result_.blue = *v;
            break;
        case Element::X:
            if (auto v = parseDouble(text)) result_.x = *v;
            break;
        case Element::Y:
            if (auto v = parseDouble(text)) result_.y = *v;
            break;
        case Element::YLum:
            if (auto v = parseDouble(text)) result_.yLum = *v;
            break;
        case Element::Bits:
            if (auto v = parseDepth(text)) result_.depthBits = *v;
            break;
        default:
            break;
    }
}

void MeasurementParser::applyColor(const xml::Event& event) {
    auto& rect = *rectangle_;
    for (const auto& attr : event.attributes) {
        if (attr.name == "red") {
            if (auto v = parseChannel(attr.value)) { rect.color.red = *v; rect.colorSeen = true; }
        } else if (attr.name == "green") {
            if (auto v = parseChannel(attr.value)) { rect.color.green = *v; rect.colorSeen = true; }
        } else if (attr.name == "blue") {
            if (auto v = parseChannel(attr.value)) { rect.color.blue = *v; rect.colorSeen = true; }
        } else if (isDepthAttribute(attr.name)) {
            if (auto v = parseDepth(attr.value)) rect.color.depthBits = *v;
        }
    }
}

void MeasurementParser::applyGeometry(const xml::Event& event) {
    auto& rect = *rectangle_;
    for (const auto& attr : event.attributes) {
        const std::string& key = attr.name;
        if (key == "cx") {
            if (auto v = parseFloat(attr.value)) rect.width = *v;
        } else if (key == "cy") {
            if (auto v = parseFloat(attr.value)) rect.height = *v;
        } else if (key == "x") {
            // cx/cy win over x/y whichever order they arrive in.
            if (!rect.width) {
                if (auto v = parseFloat(attr.value)) rect.width = *v;
            }
        } else if (key == "y") {
            if (!rect.height) {
                if (auto v = parseFloat(attr.value)) rect.height = *v;
            }
        } else if (key == "centerX" || key == "centreX") {
            if (auto v = parseFloat(attr.value)) rect.centerX = *v;
        } else if (key == "centerY" || key == "centreY") {
            if (auto v = parseFloat(attr.value)) rect.centerY = *v;
        }
    }
}

expected<void> MeasurementParser::finishRectangle() {
    RectangleBuilder builder = std::move(*rectangle_);
    rectangle_.reset();

    if (!builder.colorSeen) {
        logError("[ColourSpace] Received rectangle command missing required attributes\n");
        return unexpected(make_error_code(Errc::IncompleteShape));
    }

    core::Rectangle rect;
    rect.color = builder.color;
    rect.geometry.width = core::clampUnit(builder.width.value_or(1.0f));
    rect.geometry.height = core::clampUnit(builder.height.value_or(1.0f));
    if (builder.centerX) rect.geometry.centerX = core::clampUnit(*builder.centerX, 0.5f);
    if (builder.centerY) rect.geometry.centerY = core::clampUnit(*builder.centerY, 0.5f);

    result_.shapes.emplace_back(rect);
    return {};
}

expected<core::MeasurementResult>
parseMeasurement(std::string_view document, const Color& fallback) {
    MeasurementParser parser(fallback);
    return parser.parse(document);
}

} // namespace colourlink::colourspace
