#pragma once

#include "pitwall/protocol/decode_result.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

namespace pitwall::protocol {

/// Bytes occupied by one car in a LapData packet.
inline constexpr size_t kLapProgressStride = 57;

/// Raw result_status values as sent by the game.
enum class ResultStatus : uint8_t {
    Invalid = 0,
    Inactive = 1,
    Active = 2,
    Finished = 3,
    DidNotFinish = 4,
    Disqualified = 5,
    NotClassified = 6,
    Retired = 7,
};

/// One car's lap progress. Times carry the sub-minute part in *_ms and the
/// whole minutes separately, exactly as sent; nothing is recombined here.
struct LapProgressRecord {
    uint32_t last_lap_time_ms = 0;
    uint32_t current_lap_time_ms = 0;
    uint32_t sector1_time_ms = 0;
    uint8_t sector1_time_minutes = 0;
    uint32_t sector2_time_ms = 0;
    uint8_t sector2_time_minutes = 0;
    uint32_t delta_to_car_in_front_ms = 0;
    uint8_t delta_to_car_in_front_minutes = 0;
    uint32_t delta_to_race_leader_ms = 0;
    uint8_t delta_to_race_leader_minutes = 0;
    float lap_distance_m = 0.0f; // negative before the line on an out lap
    float total_distance_m = 0.0f;
    float safety_car_delta_s = 0.0f;
    uint8_t car_position = 0;
    uint32_t current_lap_number = 0;
    uint8_t pit_status = 0; // 0 none, 1 pitting, 2 in pit area
    uint8_t pit_stop_count = 0;
    uint8_t sector = 0; // 0-based
    bool current_lap_invalid = false;
    uint8_t penalties_s = 0;
    uint8_t total_warnings = 0;
    uint8_t corner_cutting_warnings = 0;
    uint8_t grid_position = 0;
    uint8_t driver_status = 0;
    uint8_t result_status = 0;
    bool pit_lane_timer_active = false;
    uint16_t pit_lane_time_in_lane_ms = 0;
    uint16_t pit_stop_timer_ms = 0;
    float speed_trap_fastest_kph = 0.0f;
    uint8_t speed_trap_fastest_lap = 0;
    bool finished = false;
};

/// Decode the lap progress record for car_index from a LapData datagram.
/// Errors: InvalidCarIndex when car_index >= kMaxCars, TooShort when the
/// datagram ends before the record does.
[[nodiscard]] DecodeResult<LapProgressRecord> decode_lap_progress(std::span<const uint8_t> bytes,
                                                                  size_t car_index);

} // namespace pitwall::protocol
