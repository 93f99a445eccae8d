#include "pitwall/sink/frame_json.hpp"

namespace pitwall::sink {

nlohmann::json lap_progress_to_json(const protocol::LapProgressRecord &lap) {
    nlohmann::json j;
    j["last_lap_time_ms"] = lap.last_lap_time_ms;
    j["current_lap_time_ms"] = lap.current_lap_time_ms;
    j["sector1_time_ms"] = lap.sector1_time_ms;
    j["sector1_time_minutes"] = lap.sector1_time_minutes;
    j["sector2_time_ms"] = lap.sector2_time_ms;
    j["sector2_time_minutes"] = lap.sector2_time_minutes;
    j["delta_to_car_in_front_ms"] = lap.delta_to_car_in_front_ms;
    j["delta_to_car_in_front_minutes"] = lap.delta_to_car_in_front_minutes;
    j["delta_to_race_leader_ms"] = lap.delta_to_race_leader_ms;
    j["delta_to_race_leader_minutes"] = lap.delta_to_race_leader_minutes;
    j["lap_distance_m"] = lap.lap_distance_m;
    j["total_distance_m"] = lap.total_distance_m;
    j["safety_car_delta_s"] = lap.safety_car_delta_s;
    j["car_position"] = lap.car_position;
    j["current_lap_number"] = lap.current_lap_number;
    j["pit_status"] = lap.pit_status;
    j["pit_stop_count"] = lap.pit_stop_count;
    j["sector"] = lap.sector;
    j["current_lap_invalid"] = lap.current_lap_invalid;
    j["penalties_s"] = lap.penalties_s;
    j["total_warnings"] = lap.total_warnings;
    j["corner_cutting_warnings"] = lap.corner_cutting_warnings;
    j["grid_position"] = lap.grid_position;
    j["driver_status"] = lap.driver_status;
    j["result_status"] = lap.result_status;
    j["pit_lane_timer_active"] = lap.pit_lane_timer_active;
    j["pit_lane_time_in_lane_ms"] = lap.pit_lane_time_in_lane_ms;
    j["pit_stop_timer_ms"] = lap.pit_stop_timer_ms;
    j["speed_trap_fastest_kph"] = lap.speed_trap_fastest_kph;
    j["speed_trap_fastest_lap"] = lap.speed_trap_fastest_lap;
    j["finished"] = lap.finished;
    return j;
}

nlohmann::json car_telemetry_to_json(const protocol::CarTelemetryRecord &tel) {
    nlohmann::json j;
    j["speed_kph"] = tel.speed_kph;
    j["throttle"] = tel.throttle;
    j["steering"] = tel.steering;
    j["brake"] = tel.brake;
    j["clutch"] = tel.clutch;
    j["gear"] = tel.gear;
    j["engine_rpm"] = tel.engine_rpm;
    j["drs_open"] = tel.drs_open;
    j["rev_lights_percent"] = tel.rev_lights_percent;
    j["rev_lights_bit_value"] = tel.rev_lights_bit_value;
    // Wheel arrays in rear-left, rear-right, front-left, front-right order
    j["brake_temperatures"] = tel.brake_temperatures;
    j["tyre_surface_temperatures"] = tel.tyre_surface_temperatures;
    j["tyre_inner_temperatures"] = tel.tyre_inner_temperatures;
    j["engine_temperature"] = tel.engine_temperature;
    j["tyre_pressures"] = tel.tyre_pressures;
    j["surface_types"] = tel.surface_types;
    return j;
}

nlohmann::json frame_to_json(const data::Frame &frame) {
    nlohmann::json j;
    j["frame_id"] = frame.frame_id;
    j["session_time"] = frame.session_time;
    j["status"] = data::frame_status_name(frame.status);
    j["lap_progress"] =
        frame.lap_progress ? lap_progress_to_json(*frame.lap_progress) : nlohmann::json(nullptr);
    j["car_telemetry"] = frame.car_telemetry ? car_telemetry_to_json(*frame.car_telemetry)
                                             : nlohmann::json(nullptr);
    return j;
}

} // namespace pitwall::sink
