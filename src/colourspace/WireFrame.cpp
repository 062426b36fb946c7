#include "colourlink/colourspace/WireFrame.hpp"

namespace colourlink::colourspace::frame {
namespace {

// Number of continuation bytes announced by a UTF-8 lead byte, or -1.
int continuationCount(unsigned char lead) noexcept {
    if (lead < 0x80u) return 0;
    if (lead >= 0xC2u && lead <= 0xDFu) return 1;
    if (lead >= 0xE0u && lead <= 0xEFu) return 2;
    if (lead >= 0xF0u && lead <= 0xF4u) return 3;
    return -1;
}

} // namespace

expected<void> checkPayloadSize(std::uint64_t size) {
    if (size > config::FRAME_MAX_PAYLOAD) {
        return unexpected(make_error_code(Errc::PayloadTooLarge));
    }
    return {};
}

Header encodeHeader(std::int32_t length) noexcept {
    const auto bits = static_cast<std::uint32_t>(length);
    return Header{static_cast<std::uint8_t>((bits >> 24) & 0xFFu),
                  static_cast<std::uint8_t>((bits >> 16) & 0xFFu),
                  static_cast<std::uint8_t>((bits >> 8) & 0xFFu),
                  static_cast<std::uint8_t>(bits & 0xFFu)};
}

std::int32_t decodeHeader(const Header& header) noexcept {
    const std::uint32_t bits = (static_cast<std::uint32_t>(header[0]) << 24)
                             | (static_cast<std::uint32_t>(header[1]) << 16)
                             | (static_cast<std::uint32_t>(header[2]) << 8)
                             | static_cast<std::uint32_t>(header[3]);
    return static_cast<std::int32_t>(bits);
}

bool isValidUtf8(std::string_view text) noexcept {
    const auto* bytes = reinterpret_cast<const unsigned char*>(text.data());
    const std::size_t size = text.size();

    std::size_t i = 0;
    while (i < size) {
        const unsigned char lead = bytes[i];
        const int extra = continuationCount(lead);
        if (extra < 0 || static_cast<std::size_t>(extra) >= size - i) {
            return false;
        }
        for (int k = 1; k <= extra; ++k) {
            if ((bytes[i + k] & 0xC0u) != 0x80u) {
                return false;
            }
        }
        if (extra >= 2) {
            const unsigned char second = bytes[i + 1];
            // Reject overlongs, UTF-16 surrogates and code points above U+10FFFF.
            if (lead == 0xE0u && second < 0xA0u) return false;
            if (lead == 0xEDu && second > 0x9Fu) return false;
            if (lead == 0xF0u && second < 0x90u) return false;
            if (lead == 0xF4u && second > 0x8Fu) return false;
        }
        i += static_cast<std::size_t>(extra) + 1;
    }
    return true;
}

} // namespace colourlink::colourspace::frame
