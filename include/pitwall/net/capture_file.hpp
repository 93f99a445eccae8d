#pragma once

#include "pitwall/net/datagram_source.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <span>
#include <string>

namespace pitwall::net {

/// Raw datagram capture file.
/// Layout: 8-byte magic "PWCAP001", then per datagram a u32 little-endian
/// length followed by that many bytes. No other framing.
inline constexpr std::array<char, 8> kCaptureMagic = {'P', 'W', 'C', 'A', 'P', '0', '0', '1'};

/// Largest record a capture may hold; anything bigger means the file is
/// corrupt rather than a real datagram.
inline constexpr uint32_t kMaxCaptureRecord = 65535;

/// Appends every received datagram, undecoded, so a session can be
/// replayed later (including kinds this build cannot decode yet).
class CaptureWriter {
  public:
    /// Creates or truncates the file. Throws TransportError if it cannot.
    explicit CaptureWriter(const std::string &path);

    void write(std::span<const uint8_t> datagram);
    void flush();

    [[nodiscard]] uint64_t written() const { return written_; }
    [[nodiscard]] const std::string &path() const { return path_; }

  private:
    std::string path_;
    std::ofstream out_;
    uint64_t written_ = 0;
};

/// Replays a capture file as a datagram source. Never times out; reports
/// Closed at end of file. A record cut short at the end of the file also
/// ends the replay (the recorder was killed mid-write).
class CaptureReplaySource : public DatagramSource {
  public:
    /// Throws TransportError if the file is missing or has the wrong magic.
    explicit CaptureReplaySource(const std::string &path);

    ReceiveStatus receive(std::vector<uint8_t> &out, std::chrono::milliseconds timeout) override;
    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] bool truncated_tail() const override { return truncated_tail_; }
    [[nodiscard]] uint64_t replayed() const { return replayed_; }

  private:
    std::string path_;
    std::ifstream in_;
    bool truncated_tail_ = false;
    uint64_t replayed_ = 0;
};

} // namespace pitwall::net
