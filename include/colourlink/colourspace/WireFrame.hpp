// WireFrame.hpp
// -----------------------------------------------------------------------------
// Length-prefixed framing for the ColourSpace link.
// Each frame is a 4-byte big-endian signed length followed by that many bytes
// of UTF-8 XML. A negative length is the remote's "end of communication"
// signal and carries no payload.
//
// The read/write helpers are templates over any stream exposing
//   std::error_code read_exact(void* buf, std::size_t n);
//   std::error_code write_all(const void* buf, std::size_t n);
// so the same code runs over a socket and over an in-memory loopback.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "colourlink/core/Errors.hpp"
#include "colourlink/core/Expected.hpp"
#include "colourlink/colourspace/ColourSpaceConfig.hpp"

namespace colourlink::colourspace::frame {

using Header = std::array<std::uint8_t, config::FRAME_HEADER_SIZE>;

/// Fails with PayloadTooLarge when @p size does not fit a signed 32-bit length.
[[nodiscard]] expected<void> checkPayloadSize(std::uint64_t size);

[[nodiscard]] Header encodeHeader(std::int32_t length) noexcept;
[[nodiscard]] std::int32_t decodeHeader(const Header& header) noexcept;

[[nodiscard]] bool isValidUtf8(std::string_view text) noexcept;

template <typename Stream>
expected<void> writeFrame(Stream& stream, std::string_view payload) {
    if (auto ok = checkPayloadSize(payload.size()); !ok) {
        return ok;
    }
    const Header header = encodeHeader(static_cast<std::int32_t>(payload.size()));
    if (auto ec = stream.write_all(header.data(), header.size()); ec) {
        return unexpected(ec);
    }
    if (!payload.empty()) {
        if (auto ec = stream.write_all(payload.data(), payload.size()); ec) {
            return unexpected(ec);
        }
    }
    return {};
}

/**
 * @brief Read one frame.
 *
 * Returns std::nullopt for the disconnect signal (negative length; nothing is
 * read past the header), an empty string for a zero length, otherwise the
 * payload. A payload that is not UTF-8 fails with InvalidPayload. A length
 * above @p maxPayload fails with PayloadTooLarge after only the header was
 * consumed, so the stream is no longer aligned on a frame boundary.
 */
template <typename Stream>
expected<std::optional<std::string>> readFrame(Stream& stream,
                                               std::uint64_t maxPayload = config::FRAME_MAX_RECEIVE_PAYLOAD) {
    Header header{};
    if (auto ec = stream.read_exact(header.data(), header.size()); ec) {
        return unexpected(ec);
    }

    const std::int32_t length = decodeHeader(header);
    if (length < 0) {
        return std::optional<std::string>{};
    }
    if (length == 0) {
        return std::optional<std::string>{std::string{}};
    }
    if (static_cast<std::uint64_t>(length) > maxPayload) {
        return unexpected(make_error_code(Errc::PayloadTooLarge));
    }

    std::string payload(static_cast<std::size_t>(length), '\0');
    if (auto ec = stream.read_exact(payload.data(), payload.size()); ec) {
        return unexpected(ec);
    }
    if (!isValidUtf8(payload)) {
        return unexpected(make_error_code(Errc::InvalidPayload));
    }
    return std::optional<std::string>{std::move(payload)};
}

} // namespace colourlink::colourspace::frame
