#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace pitwall::net {

/// Fatal transport failure (bind error, socket closed underneath us,
/// unreadable capture file). Terminates the ingestion loop.
class TransportError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

enum class ReceiveStatus {
    Datagram, // out holds one datagram
    Timeout,  // nothing arrived within the timeout; not an error
    Closed,   // source exhausted (end of a replay)
};

/// Anything the ingestion loop can pull datagrams from.
class DatagramSource {
  public:
    virtual ~DatagramSource() = default;

    /// Block for at most `timeout` waiting for one datagram.
    /// Throws TransportError on unrecoverable failures.
    virtual ReceiveStatus receive(std::vector<uint8_t> &out, std::chrono::milliseconds timeout) = 0;

    /// Short description for log lines ("udp 0.0.0.0:20777").
    [[nodiscard]] virtual std::string describe() const = 0;

    /// Datagrams cut short to fit the receive buffer so far.
    [[nodiscard]] virtual uint64_t truncated_datagrams() const { return 0; }

    /// True once the source ended on an incomplete record.
    [[nodiscard]] virtual bool truncated_tail() const { return false; }
};

} // namespace pitwall::net
