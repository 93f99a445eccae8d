#include "pitwall/protocol/car_telemetry.hpp"
#include "pitwall/protocol/header.hpp"
#include "pitwall/protocol/wire.hpp"

namespace pitwall::protocol {

namespace {

// NaN fails both comparisons and is rejected with the rest.
[[nodiscard]] bool within(float value, float lo, float hi) { return value >= lo && value <= hi; }

} // namespace

DecodeResult<CarTelemetryRecord> decode_car_telemetry(std::span<const uint8_t> bytes,
                                                      size_t car_index) {
    using Result = DecodeResult<CarTelemetryRecord>;

    if (car_index >= kMaxCars) {
        return Result::fail(DecodeError::InvalidCarIndex);
    }
    const size_t offset = kHeaderSize + car_index * kCarTelemetryStride;
    if (bytes.size() < offset + kCarTelemetryStride) {
        return Result::fail(DecodeError::TooShort);
    }
    const auto rec = bytes.subspan(offset, kCarTelemetryStride);

    CarTelemetryRecord tel;
    tel.speed_kph = wire::read_u16(rec, 0);
    tel.throttle = wire::read_f32(rec, 2);
    tel.steering = wire::read_f32(rec, 6);
    tel.brake = wire::read_f32(rec, 10);
    tel.clutch = wire::read_u8(rec, 14);
    tel.gear = wire::read_i8(rec, 15);
    tel.engine_rpm = wire::read_u16(rec, 16);
    tel.drs_open = wire::read_u8(rec, 18) != 0;
    tel.rev_lights_percent = wire::read_u8(rec, 19);
    tel.rev_lights_bit_value = wire::read_u16(rec, 20);
    tel.brake_temperatures = wire::read_array<uint16_t, 4>(rec, 22, 2, wire::read_u16);
    tel.tyre_surface_temperatures = wire::read_array<uint8_t, 4>(rec, 30, 1, wire::read_u8);
    tel.tyre_inner_temperatures = wire::read_array<uint8_t, 4>(rec, 34, 1, wire::read_u8);
    tel.engine_temperature = wire::read_u16(rec, 38);
    tel.tyre_pressures = wire::read_array<float, 4>(rec, 40, 4, wire::read_f32);
    tel.surface_types = wire::read_array<uint8_t, 4>(rec, 56, 1, wire::read_u8);

    if (!within(tel.throttle, 0.0f, 1.0f) || !within(tel.brake, 0.0f, 1.0f) ||
        !within(tel.steering, -1.0f, 1.0f)) {
        return Result::fail(DecodeError::FieldOutOfRange);
    }

    return Result::ok(tel);
}

} // namespace pitwall::protocol
