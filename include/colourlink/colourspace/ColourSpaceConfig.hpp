#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace colourlink::colourspace::config {

/**
 * @brief Constants that define ColourSpace link networking and pacing.
 *
 * Runtime overrides live in `WorkerOptions`; these are its defaults.
 */

// Networking ------------------------------------------------------------------
constexpr unsigned short COLOURSPACE_PORT_DEFAULT = 20002;
constexpr std::chrono::milliseconds CONNECT_TIMEOUT{5000};
constexpr std::chrono::milliseconds WRITE_TIMEOUT{5000};

// Framing ---------------------------------------------------------------------
constexpr std::size_t FRAME_HEADER_SIZE = 4;                // big-endian signed length
constexpr std::uint64_t FRAME_MAX_PAYLOAD = 0x7FFFFFFFull;  // i32::MAX
// Inbound frames above this are refused before any payload is allocated.
constexpr std::uint64_t FRAME_MAX_RECEIVE_PAYLOAD = 16ull * 1024 * 1024;

// Worker pacing ---------------------------------------------------------------
constexpr std::chrono::milliseconds RECEIVE_RETRY_BACKOFF{50};
constexpr std::chrono::milliseconds SEND_INTERVAL{1000};

// Diagnostics -----------------------------------------------------------------
constexpr const char* XML_LOG_ENV = "COLOURSPACE_XML_LOG";
constexpr const char* XML_LOG_DEFAULT_PATH = "colourspace_commands.log";

} // namespace colourlink::colourspace::config
