#include "pitwall/data/ingest_stats.hpp"
#include "pitwall/protocol/packet_kind.hpp"

#include <cinttypes>
#include <cstdio>

namespace pitwall::data {

namespace {

void append_line(std::string &out, const char *fmt, auto... args) {
    char buffer[256];
    std::snprintf(buffer, sizeof(buffer), fmt, args...);
    out += buffer;
    out += '\n';
}

} // namespace

std::string format_summary(const IngestStats &stats) {
    std::string out;
    append_line(out, "Datagrams received: %" PRIu64, stats.datagrams);

    for (size_t id = 0; id < stats.per_packet_id.size(); ++id) {
        const uint64_t count = stats.per_packet_id[id];
        if (count == 0) {
            continue;
        }
        append_line(out, "  Type %3zu - %-20s: %8" PRIu64, id,
                    protocol::packet_id_name(static_cast<uint8_t>(id)), count);
    }

    append_line(out, "Records: %" PRIu64 " lap, %" PRIu64 " telemetry (%" PRIu64 " replaced)",
                stats.lap_records, stats.telemetry_records, stats.replaced_records);
    append_line(out, "Frames: %" PRIu64 " complete, %" PRIu64 " expired", stats.frames_complete,
                stats.frames_expired);
    append_line(out,
                "Dropped: %" PRIu64 " (short header %" PRIu64 ", format %" PRIu64
                ", short record %" PRIu64 ", car index %" PRIu64 ", out of range %" PRIu64
                ", late %" PRIu64 ")",
                stats.dropped(), stats.header_too_short, stats.format_mismatch,
                stats.record_too_short, stats.invalid_car_index, stats.field_out_of_range,
                stats.late_records);
    append_line(out, "Unknown packet kinds: %" PRIu64, stats.unknown_kind);
    append_line(out, "Session changes: %" PRIu64 ", frame id rewinds: %" PRIu64,
                stats.session_changes, stats.rewinds);
    append_line(out, "Receive timeouts: %" PRIu64, stats.receive_timeouts);
    append_line(out, "Truncated datagrams: %" PRIu64, stats.truncated_datagrams);
    if (stats.replay_truncated) {
        append_line(out, "Replay ended on a truncated record");
    }
    return out;
}

} // namespace pitwall::data
