#include "can_socket.hpp"

#include <linux/can.h>
#include <linux/can/raw.h>
#include <net/if.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

namespace orincan {

unsigned int get_ifindex(const std::string& ifname) {
    struct ifreq ifr;
    std::memset(&ifr, 0, sizeof(ifr));
    std::strncpy(ifr.ifr_name, ifname.c_str(), IFNAMSIZ - 1);
    int s = socket(PF_CAN, SOCK_RAW, CAN_RAW);
    if (s < 0) throw std::system_error(errno, std::generic_category(), "socket");
    if (ioctl(s, SIOCGIFINDEX, &ifr) < 0) {
        int err = errno;
        close(s);
        throw std::system_error(err, std::generic_category(), "ioctl SIOCGIFINDEX " + ifname);
    }
    close(s);
    return ifr.ifr_ifindex;
}

std::shared_ptr<Socket> create_socket(asio::io_context& io, const std::string& ifname) {
    auto sock = std::make_shared<Socket>(io, Protocol(PF_CAN, CAN_RAW));

    // Enable CAN FD
    int enable_canfd = 1;
    if (setsockopt(sock->native_handle(), SOL_CAN_RAW, CAN_RAW_FD_FRAMES, &enable_canfd, sizeof(enable_canfd)) < 0) {
        throw std::system_error(errno, std::generic_category(), "setsockopt CAN_RAW_FD_FRAMES");
    }

    // Bind
    struct sockaddr_can addr = {};
    addr.can_family = AF_CAN;
    addr.can_ifindex = get_ifindex(ifname);

    sock->bind(Endpoint(&addr, sizeof(addr)));

    return sock;
}

} // namespace orincan
