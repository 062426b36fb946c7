#include "colourlink/core/Errors.hpp"

#include <string>

namespace colourlink {
namespace {

class ColourLinkCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "colourlink"; }

    std::string message(int value) const override {
        switch (static_cast<Errc>(value)) {
            case Errc::PayloadTooLarge:     return "payload too large for 4-byte header";
            case Errc::InvalidPayload:      return "payload is not valid UTF-8";
            case Errc::DuplicateCommand:    return "duplicate top-level command in message";
            case Errc::IncompleteShape:     return "rectangle missing colour attributes";
            case Errc::MalformedXml:        return "malformed XML";
            case Errc::NoReachableEndpoint: return "address resolved to no endpoints";
            case Errc::Disconnected:        return "remote signalled end of communication";
            case Errc::FramingLost:         return "stream lost frame alignment";
        }
        return "unknown colourlink error";
    }
};

} // namespace

const std::error_category& colourlinkCategory() noexcept {
    static const ColourLinkCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), colourlinkCategory()};
}

bool isProtocolViolation(const std::error_code& ec) noexcept {
    if (ec.category() != colourlinkCategory()) {
        return false;
    }
    switch (static_cast<Errc>(ec.value())) {
        case Errc::InvalidPayload:
        case Errc::DuplicateCommand:
        case Errc::IncompleteShape:
        case Errc::MalformedXml:
            return true;
        default:
            return false;
    }
}

} // namespace colourlink
