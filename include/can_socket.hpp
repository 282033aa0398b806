#pragma once

#include <asio.hpp>

#include <memory>
#include <string>

namespace orincan {

// Use generic raw protocol for CAN
using Protocol = asio::generic::raw_protocol;
using Socket = Protocol::socket;
using Endpoint = Protocol::endpoint;

// Throws std::system_error when the interface does not exist.
unsigned int get_ifindex(const std::string& ifname);

// Raw CAN socket bound to `ifname` with CAN FD frames enabled.
std::shared_ptr<Socket> create_socket(asio::io_context& io, const std::string& ifname);

} // namespace orincan
