#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace pitwall::protocol {

/// Packet ids carried in byte 6 of every datagram header.
/// The set is closed; ids outside it are reported as unknown, not as errors,
/// so newer game revisions can add kinds without breaking the listener.
enum class PacketKind : uint8_t {
    Motion = 0,
    Session = 1,
    LapData = 2,
    Event = 3,
    Participants = 4,
    CarSetups = 5,
    CarTelemetry = 6,
    CarStatus = 7,
    FinalClassification = 8,
    LobbyInfo = 9,
    CarDamage = 10,
    SessionHistory = 11,
    TyreSets = 12,
    MotionEx = 13,
    TimeTrial = 14,
    LapPositions = 15,
};

/// Byte offset of the packet id inside the header.
inline constexpr size_t kPacketIdOffset = 6;

/// Map a raw packet id to a known kind.
[[nodiscard]] std::optional<PacketKind> packet_kind_from_id(uint8_t id);

/// Fast path: read only the packet id byte. Total over every input;
/// buffers too short to hold the id and unknown ids both yield nullopt.
[[nodiscard]] std::optional<PacketKind> classify(std::span<const uint8_t> bytes);

/// Human-readable name ("Car Telemetry"), "Unknown" for unmapped ids.
[[nodiscard]] const char *packet_kind_name(PacketKind kind);
[[nodiscard]] const char *packet_id_name(uint8_t id);

/// Kinds that carry a per-car record the decoder understands.
[[nodiscard]] constexpr bool is_decoded_kind(PacketKind kind) {
    return kind == PacketKind::LapData || kind == PacketKind::CarTelemetry;
}

} // namespace pitwall::protocol
