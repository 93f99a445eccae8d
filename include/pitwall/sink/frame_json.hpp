#pragma once

#include "pitwall/data/frame.hpp"

#include <nlohmann/json.hpp>

namespace pitwall::sink {

nlohmann::json lap_progress_to_json(const protocol::LapProgressRecord &lap);
nlohmann::json car_telemetry_to_json(const protocol::CarTelemetryRecord &tel);

/// Encode a frame as
/// {"frame_id": N, "session_time": T, "status": "complete"|"expired",
///  "lap_progress": {...}|null, "car_telemetry": {...}|null}
/// A side that never arrived is null, never a zero-filled object.
nlohmann::json frame_to_json(const data::Frame &frame);

} // namespace pitwall::sink
