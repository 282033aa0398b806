#include "sender.hpp"

namespace orincan {

Sender::Sender(asio::io_context& io, Bus& bus, const std::string& ifname, const CanFrame& frame,
               std::chrono::duration<double> interval, const std::string& interval_text,
               std::ostream& err)
    : bus_(bus),
      ifname_(ifname),
      frame_(frame),
      interval_(std::chrono::duration_cast<std::chrono::steady_clock::duration>(interval)),
      interval_text_(interval_text),
      err_(err),
      timer_(io) {
}

std::error_code Sender::send_once() {
    try {
        bus_.send(frame_);
    } catch (const std::system_error& e) {
        ++failed_;
        return e.code();
    }
    ++sent_;
    return {};
}

void Sender::start() {
    tick();
}

void Sender::stop() {
    timer_.cancel();
}

void Sender::tick() {
    // Keep going even if a single send fails.
    if (std::error_code ec = send_once()) {
        err_ << "Warning: send failed on " << ifname_ << " (" << ec.message()
             << "), retrying in " << interval_text_ << "s..." << std::endl;
    }

    timer_.expires_after(interval_);
    timer_.async_wait([this](std::error_code ec) {
        if (ec) return;
        tick();
    });
}

} // namespace orincan
