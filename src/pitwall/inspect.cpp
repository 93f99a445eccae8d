#include "pitwall/inspect.hpp"
#include "pitwall/protocol/car_telemetry.hpp"
#include "pitwall/protocol/lap_data.hpp"

#include <algorithm>
#include <cinttypes>
#include <cstdio>

namespace pitwall {

namespace {

template <typename... Args> void append(std::string &out, const char *fmt, Args... args) {
    char line[128];
    const int n = std::snprintf(line, sizeof(line), fmt, args...);
    if (n > 0) {
        out.append(line, std::min(static_cast<size_t>(n), sizeof(line) - 1));
    }
}

} // namespace

std::string format_hex_dump(std::span<const uint8_t> bytes, size_t base_offset) {
    std::string out;
    for (size_t i = 0; i < bytes.size(); i += kHexDumpWidth) {
        append(out, "  %4zu:", base_offset + i);
        const size_t end = std::min(i + kHexDumpWidth, bytes.size());
        for (size_t j = i; j < end; ++j) {
            append(out, " %02x", static_cast<unsigned>(bytes[j]));
        }
        out += '\n';
    }
    return out;
}

std::string describe_header(const protocol::DatagramHeader &header) {
    std::string out;
    append(out, "  packet_format:          %u\n", static_cast<unsigned>(header.protocol_format));
    append(out, "  game_year:              %u\n", static_cast<unsigned>(header.game_year));
    append(out, "  game_version:           %u.%u\n",
           static_cast<unsigned>(header.game_version_major),
           static_cast<unsigned>(header.game_version_minor));
    append(out, "  packet_version:         %u\n", static_cast<unsigned>(header.packet_spec_version));
    append(out, "  packet_id:              %u (%s)\n", static_cast<unsigned>(header.packet_id),
           protocol::packet_id_name(header.packet_id));
    append(out, "  session_uid:            %016" PRIx64 "\n", header.session_id);
    append(out, "  session_time:           %.3f s\n", static_cast<double>(header.session_time));
    append(out, "  frame_identifier:       %" PRIu32 "\n", header.frame_id);
    append(out, "  overall_frame:          %" PRIu32 "\n", header.overall_frame_id);
    append(out, "  player_car_index:       %u\n",
           static_cast<unsigned>(header.controlling_car_index));
    append(out, "  secondary_player_index: %u\n",
           static_cast<unsigned>(header.secondary_car_index));
    return out;
}

std::string inspect_datagram(std::span<const uint8_t> bytes, std::optional<uint8_t> car_index) {
    std::string out;
    const auto header = protocol::decode_header(bytes);
    if (!header) {
        append(out, "Datagram of %zu bytes is too short for a header\n", bytes.size());
        out += format_hex_dump(bytes);
        return out;
    }

    append(out, "Datagram of %zu bytes, %s\n", bytes.size(),
           protocol::packet_id_name(header->packet_id));
    out += describe_header(*header);

    if (!header->packet_kind || !protocol::is_decoded_kind(*header->packet_kind)) {
        return out;
    }

    const size_t car = car_index ? *car_index : header->controlling_car_index;
    const size_t stride = *header->packet_kind == protocol::PacketKind::LapData
                              ? protocol::kLapProgressStride
                              : protocol::kCarTelemetryStride;
    if (car >= protocol::kMaxCars) {
        append(out, "Car index %zu has no record slot\n", car);
        return out;
    }

    const size_t offset = protocol::kHeaderSize + car * stride;
    if (offset + stride > bytes.size()) {
        append(out, "Car %zu record at offset %zu is cut short (%zu of %zu bytes)\n", car, offset,
               bytes.size() > offset ? bytes.size() - offset : size_t{0}, stride);
        return out;
    }

    append(out, "Car %zu record at offset %zu (stride %zu):\n", car, offset, stride);
    out += format_hex_dump(bytes.subspan(offset, stride), offset);
    return out;
}

} // namespace pitwall
