#pragma once

#include "bus.hpp"
#include "can_socket.hpp"
#include "frame.hpp"

#include <chrono>
#include <cstddef>
#include <ostream>
#include <string>
#include <system_error>

namespace orincan {

// Transmits one fixed frame every `interval`, warning on failed sends.
class Sender {
public:
    Sender(asio::io_context& io, Bus& bus, const std::string& ifname, const CanFrame& frame,
           std::chrono::duration<double> interval, const std::string& interval_text,
           std::ostream& err);

    // Single transmission; returns the bus error, if any.
    std::error_code send_once();

    void start();
    void stop();

    size_t sent() const { return sent_; }
    size_t failed() const { return failed_; }

private:
    void tick();

    Bus& bus_;
    std::string ifname_;
    CanFrame frame_;
    std::chrono::steady_clock::duration interval_;
    std::string interval_text_;
    std::ostream& err_;
    asio::steady_timer timer_;
    size_t sent_ = 0;
    size_t failed_ = 0;
};

} // namespace orincan
