#include "pitwall/protocol/header.hpp"
#include "pitwall/protocol/wire.hpp"

namespace pitwall::protocol {

DecodeResult<DatagramHeader> decode_header(std::span<const uint8_t> bytes) {
    if (bytes.size() < kHeaderSize) {
        return DecodeResult<DatagramHeader>::fail(DecodeError::TooShort);
    }

    DatagramHeader hdr;
    hdr.protocol_format = wire::read_u16(bytes, 0);
    hdr.game_year = wire::read_u8(bytes, 2);
    hdr.game_version_major = wire::read_u8(bytes, 3);
    hdr.game_version_minor = wire::read_u8(bytes, 4);
    hdr.packet_spec_version = wire::read_u8(bytes, 5);
    hdr.packet_id = wire::read_u8(bytes, kPacketIdOffset);
    hdr.packet_kind = packet_kind_from_id(hdr.packet_id);
    hdr.session_id = wire::read_u64(bytes, 7);
    hdr.session_time = wire::read_f32(bytes, 15);
    hdr.frame_id = wire::read_u32(bytes, 19);
    hdr.overall_frame_id = wire::read_u32(bytes, 23);
    hdr.controlling_car_index = wire::read_u8(bytes, 27);
    hdr.secondary_car_index = wire::read_u8(bytes, 28);

    return DecodeResult<DatagramHeader>::ok(hdr);
}

} // namespace pitwall::protocol
