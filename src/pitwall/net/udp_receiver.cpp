#include "pitwall/net/udp_receiver.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace pitwall::net {

namespace {

[[nodiscard]] std::string errno_message(const std::string &what) {
    return what + ": " + std::strerror(errno);
}

} // namespace

UdpReceiver::UdpReceiver(const std::string &bind_address, uint16_t port,
                         size_t max_datagram_bytes)
    : bind_address_(bind_address), port_(port),
      max_datagram_bytes_(std::max<size_t>(max_datagram_bytes, 1)) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, bind_address.c_str(), &addr.sin_addr) != 1) {
        throw TransportError("Invalid bind address '" + bind_address + "'");
    }

    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) {
        throw TransportError(errno_message("socket"));
    }

    int reuse = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    if (::bind(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        const std::string message =
            errno_message("bind " + bind_address + ":" + std::to_string(port));
        ::close(fd_);
        fd_ = -1;
        throw TransportError(message);
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd_, reinterpret_cast<sockaddr *>(&bound), &len) == 0) {
        port_ = ntohs(bound.sin_port);
    }
}

UdpReceiver::~UdpReceiver() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void UdpReceiver::set_timeout(std::chrono::milliseconds timeout) {
    if (timeout == current_timeout_) {
        return;
    }
    // SO_RCVTIMEO of zero means "block forever"; keep the wait bounded.
    const auto ms = std::max<std::chrono::milliseconds::rep>(timeout.count(), 1);
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(ms / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms % 1000) * 1000);
    if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        throw TransportError(errno_message("setsockopt SO_RCVTIMEO"));
    }
    current_timeout_ = timeout;
}

ReceiveStatus UdpReceiver::receive(std::vector<uint8_t> &out, std::chrono::milliseconds timeout) {
    if (fd_ < 0) {
        throw TransportError("UDP socket is closed");
    }
    set_timeout(timeout);

    out.resize(max_datagram_bytes_);
    // MSG_TRUNC makes recv report the full datagram length even when it
    // did not fit, so oversize datagrams can be counted.
    const ssize_t n = ::recv(fd_, out.data(), out.size(), MSG_TRUNC);
    if (n < 0) {
        out.clear();
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return ReceiveStatus::Timeout;
        }
        throw TransportError(errno_message("recv"));
    }

    const auto received = static_cast<size_t>(n);
    if (received > max_datagram_bytes_) {
        ++truncated_;
    }
    out.resize(std::min(received, max_datagram_bytes_));
    return ReceiveStatus::Datagram;
}

std::string UdpReceiver::describe() const {
    return "udp " + bind_address_ + ":" + std::to_string(port_);
}

} // namespace pitwall::net
