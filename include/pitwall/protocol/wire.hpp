#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>

namespace pitwall::protocol::wire {

/// Little-endian field readers over a bounds-checked slice.
/// Callers verify the slice length once per header or record; the readers
/// themselves do not re-check each field.

inline uint8_t read_u8(std::span<const uint8_t> bytes, size_t offset) { return bytes[offset]; }

inline int8_t read_i8(std::span<const uint8_t> bytes, size_t offset) {
    return static_cast<int8_t>(bytes[offset]);
}

inline uint16_t read_u16(std::span<const uint8_t> bytes, size_t offset) {
    return static_cast<uint16_t>(bytes[offset] | (bytes[offset + 1] << 8));
}

inline uint32_t read_u32(std::span<const uint8_t> bytes, size_t offset) {
    return static_cast<uint32_t>(bytes[offset]) |
           (static_cast<uint32_t>(bytes[offset + 1]) << 8) |
           (static_cast<uint32_t>(bytes[offset + 2]) << 16) |
           (static_cast<uint32_t>(bytes[offset + 3]) << 24);
}

inline uint64_t read_u64(std::span<const uint8_t> bytes, size_t offset) {
    return static_cast<uint64_t>(read_u32(bytes, offset)) |
           (static_cast<uint64_t>(read_u32(bytes, offset + 4)) << 32);
}

/// IEEE-754 single precision, little-endian on the wire.
inline float read_f32(std::span<const uint8_t> bytes, size_t offset) {
    const uint32_t bits = read_u32(bytes, offset);
    float value = 0.0f;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

template <typename T, size_t N, typename Reader>
std::array<T, N> read_array(std::span<const uint8_t> bytes, size_t offset, size_t stride,
                            Reader reader) {
    std::array<T, N> out{};
    for (size_t i = 0; i < N; ++i) {
        out[i] = static_cast<T>(reader(bytes, offset + i * stride));
    }
    return out;
}

} // namespace pitwall::protocol::wire
