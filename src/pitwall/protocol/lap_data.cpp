#include "pitwall/protocol/lap_data.hpp"
#include "pitwall/protocol/header.hpp"
#include "pitwall/protocol/wire.hpp"

namespace pitwall::protocol {

DecodeResult<LapProgressRecord> decode_lap_progress(std::span<const uint8_t> bytes,
                                                    size_t car_index) {
    using Result = DecodeResult<LapProgressRecord>;

    if (car_index >= kMaxCars) {
        return Result::fail(DecodeError::InvalidCarIndex);
    }
    const size_t offset = kHeaderSize + car_index * kLapProgressStride;
    if (bytes.size() < offset + kLapProgressStride) {
        return Result::fail(DecodeError::TooShort);
    }
    const auto rec = bytes.subspan(offset, kLapProgressStride);

    LapProgressRecord lap;
    lap.last_lap_time_ms = wire::read_u32(rec, 0);
    lap.current_lap_time_ms = wire::read_u32(rec, 4);
    lap.sector1_time_ms = wire::read_u16(rec, 8);
    lap.sector1_time_minutes = wire::read_u8(rec, 10);
    lap.sector2_time_ms = wire::read_u16(rec, 11);
    lap.sector2_time_minutes = wire::read_u8(rec, 13);
    lap.delta_to_car_in_front_ms = wire::read_u16(rec, 14);
    lap.delta_to_car_in_front_minutes = wire::read_u8(rec, 16);
    lap.delta_to_race_leader_ms = wire::read_u16(rec, 17);
    lap.delta_to_race_leader_minutes = wire::read_u8(rec, 19);
    lap.lap_distance_m = wire::read_f32(rec, 20);
    lap.total_distance_m = wire::read_f32(rec, 24);
    lap.safety_car_delta_s = wire::read_f32(rec, 28);
    lap.car_position = wire::read_u8(rec, 32);
    lap.current_lap_number = wire::read_u8(rec, 33);
    lap.pit_status = wire::read_u8(rec, 34);
    lap.pit_stop_count = wire::read_u8(rec, 35);
    lap.sector = wire::read_u8(rec, 36);
    lap.current_lap_invalid = wire::read_u8(rec, 37) != 0;
    lap.penalties_s = wire::read_u8(rec, 38);
    lap.total_warnings = wire::read_u8(rec, 39);
    lap.corner_cutting_warnings = wire::read_u8(rec, 40);
    // 41, 42: unserved drive-through / stop-go penalty counts
    lap.grid_position = wire::read_u8(rec, 43);
    lap.driver_status = wire::read_u8(rec, 44);
    lap.result_status = wire::read_u8(rec, 45);
    lap.pit_lane_timer_active = wire::read_u8(rec, 46) != 0;
    lap.pit_lane_time_in_lane_ms = wire::read_u16(rec, 47);
    lap.pit_stop_timer_ms = wire::read_u16(rec, 49);
    // 51: pit stop should serve penalty
    lap.speed_trap_fastest_kph = wire::read_f32(rec, 52);
    lap.speed_trap_fastest_lap = wire::read_u8(rec, 56);
    lap.finished = lap.result_status == static_cast<uint8_t>(ResultStatus::Finished);

    return Result::ok(lap);
}

} // namespace pitwall::protocol
