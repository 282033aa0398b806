#pragma once

#include "can_socket.hpp"
#include "frame.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace orincan {

class Bus {
public:
    virtual ~Bus() = default;

    // Returns std::nullopt on timeout. Throws std::system_error on read errors.
    virtual std::optional<CanFrame> recv(std::chrono::milliseconds timeout) = 0;
    // Throws std::system_error.
    virtual void send(const CanFrame& frame) = 0;
};

// Bus over a raw SocketCAN socket.
class SocketBus : public Bus {
public:
    explicit SocketBus(const std::string& ifname);

    std::optional<CanFrame> recv(std::chrono::milliseconds timeout) override;
    void send(const CanFrame& frame) override;

private:
    asio::io_context io_;
    std::shared_ptr<Socket> socket_;
};

} // namespace orincan
