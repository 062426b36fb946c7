#include "colourlink/colourspace/ColourSpaceCommand.hpp"

#include <sstream>

namespace colourlink::colourspace {
namespace {
constexpr std::string_view XML_DECLARATION = "<?xml version=\"1.0\" encoding=\"UTF-8\" ?>\n";
constexpr std::string_view ENVELOPE_OPEN = "<CS_RMC version=1>";
constexpr std::string_view ENVELOPE_CLOSE = "</CS_RMC>";
constexpr std::string_view INIT_PROFILE_NAME = "command";
constexpr std::string_view MEASUREMENT_NAME = "measurement";
}

void ColourSpaceCommand::setInitProfileCommand() {
    wrap("<command>init profile</command>");
    name = INIT_PROFILE_NAME;
}

void ColourSpaceCommand::setMeasurementCommand(const core::Color& color) {
    const core::Color eightBit = color.toEightBit();

    std::ostringstream body;
    body << "<measurement>"
         << "<red>" << eightBit.red << "</red>"
         << "<green>" << eightBit.green << "</green>"
         << "<blue>" << eightBit.blue << "</blue>"
         << "</measurement>";
    wrap(body.str());
    name = MEASUREMENT_NAME;
}

void ColourSpaceCommand::reset() {
    buffer.clear();
    name = {};
}

std::string ColourSpaceCommand::initProfile() {
    ColourSpaceCommand command;
    command.setInitProfileCommand();
    return command.payload();
}

std::string ColourSpaceCommand::measurement(const core::Color& color) {
    ColourSpaceCommand command;
    command.setMeasurementCommand(color);
    return command.payload();
}

void ColourSpaceCommand::wrap(std::string_view body) {
    buffer.clear();
    buffer.reserve(XML_DECLARATION.size() + ENVELOPE_OPEN.size() + body.size() + ENVELOPE_CLOSE.size());
    buffer.append(XML_DECLARATION);
    buffer.append(ENVELOPE_OPEN);
    buffer.append(body);
    buffer.append(ENVELOPE_CLOSE);
}

} // namespace colourlink::colourspace
