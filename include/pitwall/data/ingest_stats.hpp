#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace pitwall::data {

/// Counters kept by the ingestion loop. Failures on the hot path are only
/// counted here; nothing is logged per datagram.
struct IngestStats {
    uint64_t datagrams = 0;
    std::array<uint64_t, 256> per_packet_id{}; // indexed by raw header id

    // Drops, by cause
    uint64_t header_too_short = 0;
    uint64_t unknown_kind = 0;
    uint64_t format_mismatch = 0;
    uint64_t record_too_short = 0;
    uint64_t invalid_car_index = 0;
    uint64_t field_out_of_range = 0;
    uint64_t late_records = 0;

    // Accepted records and emitted frames
    uint64_t lap_records = 0;
    uint64_t telemetry_records = 0;
    uint64_t replaced_records = 0;
    uint64_t frames_complete = 0;
    uint64_t frames_expired = 0;

    uint64_t session_changes = 0;
    uint64_t rewinds = 0; // frame id jumped back within a session (flashback)
    uint64_t receive_timeouts = 0;

    // Reported by the datagram source when ingestion ends
    uint64_t truncated_datagrams = 0;
    bool replay_truncated = false;

    [[nodiscard]] uint64_t dropped() const {
        return header_too_short + format_mismatch + record_too_short + invalid_car_index +
               field_out_of_range + late_records;
    }

    [[nodiscard]] uint64_t frames() const { return frames_complete + frames_expired; }
};

/// Multi-line shutdown report: per-kind counts, drops, frames, source health.
[[nodiscard]] std::string format_summary(const IngestStats &stats);

} // namespace pitwall::data
