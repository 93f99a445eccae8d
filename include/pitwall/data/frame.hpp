#pragma once

#include "pitwall/protocol/car_telemetry.hpp"
#include "pitwall/protocol/lap_data.hpp"

#include <cstdint>
#include <optional>
#include <variant>

namespace pitwall::data {

/// How a frame left the aggregator.
enum class FrameStatus {
    Complete, // both records arrived
    Expired,  // retention window passed (or flushed) with a side missing
};

[[nodiscard]] constexpr const char *frame_status_name(FrameStatus status) {
    return status == FrameStatus::Complete ? "complete" : "expired";
}

/// One simulation tick for the tracked car.
/// A side that never arrived stays empty; it is never zero-filled.
struct Frame {
    uint32_t frame_id = 0;
    float session_time = 0.0f;
    std::optional<protocol::LapProgressRecord> lap_progress;
    std::optional<protocol::CarTelemetryRecord> car_telemetry;
    FrameStatus status = FrameStatus::Expired;

    [[nodiscard]] bool is_complete() const {
        return lap_progress.has_value() && car_telemetry.has_value();
    }
};

/// A decoded per-car record of either supported kind.
using FrameRecord = std::variant<protocol::LapProgressRecord, protocol::CarTelemetryRecord>;

} // namespace pitwall::data
