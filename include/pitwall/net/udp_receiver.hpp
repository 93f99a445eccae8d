#pragma once

#include "pitwall/net/datagram_source.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace pitwall::net {

/// Connectionless UDP socket bound to a local address, receiving from any
/// sender. Oversized datagrams are truncated to max_datagram_bytes and
/// counted; the decoder length-checks everything anyway.
class UdpReceiver : public DatagramSource {
  public:
    static constexpr size_t kDefaultMaxDatagram = 2048;

    /// Opens and binds the socket. Throws TransportError on failure.
    UdpReceiver(const std::string &bind_address, uint16_t port,
                size_t max_datagram_bytes = kDefaultMaxDatagram);
    ~UdpReceiver() override;

    UdpReceiver(const UdpReceiver &) = delete;
    UdpReceiver &operator=(const UdpReceiver &) = delete;

    ReceiveStatus receive(std::vector<uint8_t> &out, std::chrono::milliseconds timeout) override;
    [[nodiscard]] std::string describe() const override;

    /// Port actually bound (differs from the request when it was 0).
    [[nodiscard]] uint16_t port() const { return port_; }
    [[nodiscard]] uint64_t truncated_datagrams() const override { return truncated_; }

  private:
    void set_timeout(std::chrono::milliseconds timeout);

    int fd_ = -1;
    std::string bind_address_;
    uint16_t port_ = 0;
    size_t max_datagram_bytes_;
    std::chrono::milliseconds current_timeout_{-1};
    uint64_t truncated_ = 0;
};

} // namespace pitwall::net
