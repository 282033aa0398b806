#pragma once

#include "can_socket.hpp"
#include "frame.hpp"

#include <cstddef>
#include <memory>
#include <ostream>
#include <string>

namespace orincan {

// Prints every frame received on an interface as a candump line.
// A read error other than cancellation propagates out of io_context::run().
class Dumper {
public:
    Dumper(std::shared_ptr<Socket> socket, const std::string& ifname, std::ostream& out);

    void start();
    void stop();

    size_t frames() const { return frames_; }

private:
    void receive();

    std::string ifname_;
    std::ostream& out_;
    std::shared_ptr<Socket> socket_;
    canfd_frame buffer_;
    size_t frames_ = 0;
};

} // namespace orincan
