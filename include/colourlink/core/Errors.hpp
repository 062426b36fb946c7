#pragma once

#include <system_error>

namespace colourlink {

/**
 * @brief Protocol-level failures raised by the framer, parser and connection manager.
 *
 * Socket failures keep their native Asio/system codes; only conditions the
 * ColourSpace protocol itself defines live here.
 */
enum class Errc {
    PayloadTooLarge = 1,   // frame body does not fit a signed 32-bit length
    InvalidPayload,        // frame body is not valid UTF-8
    DuplicateCommand,      // same top-level command twice in one message
    IncompleteShape,       // <rectangle> closed without a colour
    MalformedXml,          // XML syntax error
    NoReachableEndpoint,   // address resolved to zero endpoints
    Disconnected,          // remote sent the negative-length end signal
    FramingLost            // a read failed part way through a frame; the stream was closed
};

const std::error_category& colourlinkCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;

/// True for the errors that mean the remote broke the protocol contract.
/// These are never retried.
bool isProtocolViolation(const std::error_code& ec) noexcept;

} // namespace colourlink

namespace std {
template <>
struct is_error_code_enum<colourlink::Errc> : true_type {};
} // namespace std
