#include "bus.hpp"

#include <poll.h>

#include <cerrno>
#include <system_error>

namespace orincan {

SocketBus::SocketBus(const std::string& ifname)
    : socket_(create_socket(io_, ifname)) {
}

std::optional<CanFrame> SocketBus::recv(std::chrono::milliseconds timeout) {
    struct pollfd pfd = {};
    pfd.fd = socket_->native_handle();
    pfd.events = POLLIN;

    int n = ::poll(&pfd, 1, (int)timeout.count());
    if (n < 0) {
        if (errno == EINTR) return std::nullopt;
        throw std::system_error(errno, std::generic_category(), "poll");
    }
    if (n == 0) return std::nullopt;

    canfd_frame buf;
    std::error_code ec;
    size_t bytes = socket_->receive(asio::buffer(&buf, sizeof(buf)), 0, ec);
    if (ec) throw std::system_error(ec, "read");
    return from_wire(buf, bytes);
}

void SocketBus::send(const CanFrame& frame) {
    canfd_frame wire;
    size_t mtu = to_wire(frame, wire);
    socket_->send(asio::buffer(&wire, mtu));
}

} // namespace orincan
