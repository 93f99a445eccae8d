#pragma once

#include "pitwall/protocol/decode_result.hpp"
#include "pitwall/protocol/packet_kind.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace pitwall::protocol {

/// Datagram header: 29 bytes, little-endian.
/// Layout: format(u16) year(u8) major(u8) minor(u8) packet_version(u8)
///         packet_id(u8) session_uid(u64) session_time(f32) frame(u32)
///         overall_frame(u32) player_car(u8) secondary_player_car(u8)
inline constexpr size_t kHeaderSize = 29;

/// Length of every per-car array payload.
inline constexpr size_t kMaxCars = 22;

/// Packet format tag emitted by the game revision this decoder targets.
inline constexpr uint16_t kProtocolFormat = 2025;

/// Well-known UDP port the game sends to.
inline constexpr uint16_t kDefaultPort = 20777;

struct DatagramHeader {
    uint16_t protocol_format = 0;
    uint8_t game_year = 0;
    uint8_t game_version_major = 0;
    uint8_t game_version_minor = 0;
    uint8_t packet_spec_version = 0;
    uint8_t packet_id = 0;
    std::optional<PacketKind> packet_kind; // nullopt for ids this build does not know
    uint64_t session_id = 0;
    float session_time = 0.0f;
    uint32_t frame_id = 0;
    uint32_t overall_frame_id = 0;
    uint8_t controlling_car_index = 0;
    uint8_t secondary_car_index = 0;
};

/// Decode the common header of a datagram.
/// Fails with TooShort when fewer than kHeaderSize bytes are available.
/// Unknown packet ids decode successfully with packet_kind unset.
[[nodiscard]] DecodeResult<DatagramHeader> decode_header(std::span<const uint8_t> bytes);

} // namespace pitwall::protocol
