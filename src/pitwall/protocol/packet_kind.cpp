#include "pitwall/protocol/packet_kind.hpp"

namespace pitwall::protocol {

namespace {

constexpr uint8_t kLastKnownId = static_cast<uint8_t>(PacketKind::LapPositions);

} // namespace

std::optional<PacketKind> packet_kind_from_id(uint8_t id) {
    if (id > kLastKnownId) {
        return std::nullopt;
    }
    return static_cast<PacketKind>(id);
}

std::optional<PacketKind> classify(std::span<const uint8_t> bytes) {
    if (bytes.size() <= kPacketIdOffset) {
        return std::nullopt;
    }
    return packet_kind_from_id(bytes[kPacketIdOffset]);
}

const char *packet_kind_name(PacketKind kind) {
    switch (kind) {
    case PacketKind::Motion:
        return "Motion";
    case PacketKind::Session:
        return "Session";
    case PacketKind::LapData:
        return "Lap Data";
    case PacketKind::Event:
        return "Event";
    case PacketKind::Participants:
        return "Participants";
    case PacketKind::CarSetups:
        return "Car Setups";
    case PacketKind::CarTelemetry:
        return "Car Telemetry";
    case PacketKind::CarStatus:
        return "Car Status";
    case PacketKind::FinalClassification:
        return "Final Classification";
    case PacketKind::LobbyInfo:
        return "Lobby Info";
    case PacketKind::CarDamage:
        return "Car Damage";
    case PacketKind::SessionHistory:
        return "Session History";
    case PacketKind::TyreSets:
        return "Tyre Sets";
    case PacketKind::MotionEx:
        return "Motion Ex";
    case PacketKind::TimeTrial:
        return "Time Trial";
    case PacketKind::LapPositions:
        return "Lap Positions";
    }
    return "Unknown";
}

const char *packet_id_name(uint8_t id) {
    const auto kind = packet_kind_from_id(id);
    return kind ? packet_kind_name(*kind) : "Unknown";
}

} // namespace pitwall::protocol
