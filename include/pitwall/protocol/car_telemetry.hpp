#pragma once

#include "pitwall/protocol/decode_result.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace pitwall::protocol {

/// Bytes occupied by one car in a CarTelemetry packet.
inline constexpr size_t kCarTelemetryStride = 60;

/// Index into the per-wheel arrays.
enum Wheel : size_t { RearLeft = 0, RearRight = 1, FrontLeft = 2, FrontRight = 3 };

/// One car's telemetry, values as sent. Integer fields are never range
/// checked (an implausible speed is for the consumer to flag); normalised
/// floats are rejected by the decoder when outside their wire range.
struct CarTelemetryRecord {
    uint16_t speed_kph = 0;
    float throttle = 0.0f; // 0..1
    float steering = 0.0f; // -1 (full left) .. 1 (full right)
    float brake = 0.0f;    // 0..1
    uint8_t clutch = 0;    // 0..100
    int8_t gear = 0;       // -1 reverse, 0 neutral, 1..8
    uint16_t engine_rpm = 0;
    bool drs_open = false;
    uint8_t rev_lights_percent = 0;
    uint16_t rev_lights_bit_value = 0;
    std::array<uint16_t, 4> brake_temperatures{};     // celsius
    std::array<uint8_t, 4> tyre_surface_temperatures{}; // celsius
    std::array<uint8_t, 4> tyre_inner_temperatures{};   // celsius
    uint16_t engine_temperature = 0;                    // celsius
    std::array<float, 4> tyre_pressures{};              // PSI
    std::array<uint8_t, 4> surface_types{};
};

/// Decode the telemetry record for car_index from a CarTelemetry datagram.
/// Errors: InvalidCarIndex, TooShort, FieldOutOfRange (throttle, brake or
/// steering outside its range, or NaN).
[[nodiscard]] DecodeResult<CarTelemetryRecord>
decode_car_telemetry(std::span<const uint8_t> bytes, size_t car_index);

} // namespace pitwall::protocol
