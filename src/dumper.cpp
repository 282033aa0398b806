#include "dumper.hpp"

#include <system_error>
#include <utility>

namespace orincan {

Dumper::Dumper(std::shared_ptr<Socket> socket, const std::string& ifname, std::ostream& out)
    : ifname_(ifname), out_(out), socket_(std::move(socket)) {
}

void Dumper::start() {
    receive();
}

void Dumper::stop() {
    if (socket_->is_open()) {
        socket_->close();
    }
}

void Dumper::receive() {
    socket_->async_receive(asio::buffer(&buffer_, sizeof(buffer_)),
        [this](std::error_code ec, std::size_t bytes) {
            if (ec == asio::error::operation_aborted) return;
            if (ec) {
                // Propagates out of io_context::run(), like candump exiting on a read error.
                throw std::system_error(ec, "read " + ifname_);
            }
            if (auto frame = from_wire(buffer_, bytes)) {
                out_ << format_frame(*frame, ifname_) << std::endl;
                ++frames_;
            }
            receive();
        });
}

} // namespace orincan
