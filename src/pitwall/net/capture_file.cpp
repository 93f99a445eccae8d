#include "pitwall/net/capture_file.hpp"

#include <algorithm>

namespace pitwall::net {

CaptureWriter::CaptureWriter(const std::string &path)
    : path_(path), out_(path, std::ios::binary | std::ios::trunc) {
    if (!out_) {
        throw TransportError("Cannot open capture file '" + path + "' for writing");
    }
    out_.write(kCaptureMagic.data(), kCaptureMagic.size());
}

void CaptureWriter::write(std::span<const uint8_t> datagram) {
    const auto len = static_cast<uint32_t>(std::min<size_t>(datagram.size(), kMaxCaptureRecord));
    const char prefix[4] = {
        static_cast<char>(len & 0xFF),
        static_cast<char>((len >> 8) & 0xFF),
        static_cast<char>((len >> 16) & 0xFF),
        static_cast<char>((len >> 24) & 0xFF),
    };
    out_.write(prefix, sizeof(prefix));
    out_.write(reinterpret_cast<const char *>(datagram.data()), len);
    if (!out_) {
        throw TransportError("Write to capture file '" + path_ + "' failed");
    }
    ++written_;
}

void CaptureWriter::flush() { out_.flush(); }

CaptureReplaySource::CaptureReplaySource(const std::string &path)
    : path_(path), in_(path, std::ios::binary) {
    if (!in_) {
        throw TransportError("Cannot open capture file '" + path + "'");
    }
    std::array<char, kCaptureMagic.size()> magic{};
    in_.read(magic.data(), magic.size());
    if (in_.gcount() != static_cast<std::streamsize>(magic.size()) || magic != kCaptureMagic) {
        throw TransportError("'" + path + "' is not a capture file");
    }
}

ReceiveStatus CaptureReplaySource::receive(std::vector<uint8_t> &out,
                                           std::chrono::milliseconds /*timeout*/) {
    out.clear();

    unsigned char prefix[4] = {};
    in_.read(reinterpret_cast<char *>(prefix), sizeof(prefix));
    const auto got = in_.gcount();
    if (got == 0) {
        return ReceiveStatus::Closed;
    }
    if (got != static_cast<std::streamsize>(sizeof(prefix))) {
        truncated_tail_ = true;
        return ReceiveStatus::Closed;
    }

    const uint32_t len = static_cast<uint32_t>(prefix[0]) |
                         (static_cast<uint32_t>(prefix[1]) << 8) |
                         (static_cast<uint32_t>(prefix[2]) << 16) |
                         (static_cast<uint32_t>(prefix[3]) << 24);
    if (len > kMaxCaptureRecord) {
        throw TransportError("Corrupt record in capture file '" + path_ + "'");
    }

    out.resize(len);
    in_.read(reinterpret_cast<char *>(out.data()), len);
    if (in_.gcount() != static_cast<std::streamsize>(len)) {
        out.clear();
        truncated_tail_ = true;
        return ReceiveStatus::Closed;
    }

    ++replayed_;
    return ReceiveStatus::Datagram;
}

std::string CaptureReplaySource::describe() const { return "replay " + path_; }

} // namespace pitwall::net
