// ColourSpaceCommand.hpp
// -----------------------------------------------------------------------------
// Builds the two outbound ColourSpace commands. Both share one fixed envelope:
//
//   <?xml version="1.0" encoding="UTF-8" ?>
//   <CS_RMC version=1>...</CS_RMC>
//
// The schema is fixed, so plain template substitution is enough.

#pragma once

#include <string>
#include <string_view>

#include "colourlink/core/Color.hpp"

namespace colourlink::colourspace {

class ColourSpaceCommand {
public:
    /// Handshake sent once per connection before any measurement request.
    void setInitProfileCommand();

    /// Measurement request; channels are sent as 8-bit integers.
    void setMeasurementCommand(const core::Color& color);

    const std::string& payload() const { return buffer; }
    std::string_view commandName() const { return name; }
    bool isReady() const { return !name.empty() && !buffer.empty(); }
    void reset();

    static std::string initProfile();
    static std::string measurement(const core::Color& color);

private:
    void wrap(std::string_view body);

    std::string buffer;
    std::string_view name;
};

} // namespace colourlink::colourspace
