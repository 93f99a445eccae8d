#pragma once

#include "pitwall/protocol/header.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace pitwall {

/// Bytes per hex dump line.
inline constexpr size_t kHexDumpWidth = 16;

/// Hex dump, kHexDumpWidth bytes per line:
/// "  <offset>: xx xx xx ...\n" with the offset in decimal, starting at
/// base_offset, so it lines up with the byte offsets of the wire layout.
[[nodiscard]] std::string format_hex_dump(std::span<const uint8_t> bytes, size_t base_offset = 0);

/// One "name: value" line per header field.
[[nodiscard]] std::string describe_header(const protocol::DatagramHeader &header);

/// Full report for one datagram: size, header fields, and for lap data and
/// car telemetry a dump of the selected car's record slot. The slot is
/// car_index when given, otherwise the header's controlling car.
[[nodiscard]] std::string inspect_datagram(std::span<const uint8_t> bytes,
                                           std::optional<uint8_t> car_index = std::nullopt);

} // namespace pitwall
