#include "board.hpp"
#include "manager.hpp"
#include "options.hpp"

#include <csignal>
#include <iostream>

using namespace orincan;

// Frames from 0x100..0x102 come back on 0x300 with every byte inverted.
static std::optional<std::vector<uint8_t>> invert(const CanFrame& frame) {
    std::vector<uint8_t> out(frame.data);
    for (auto& b : out) b ^= 0xFF;
    return out;
}

// Frames from 0x200/0x201 come back on 0x400 and 0x401 with every byte + 1.
static std::optional<std::vector<uint8_t>> increment(const CanFrame& frame) {
    std::vector<uint8_t> out(frame.data);
    for (auto& b : out) b = (uint8_t)(b + 1);
    return out;
}

int main(int argc, char** argv) {
    Options opts;
    try {
        opts = parse_options(Mode::Relay, std::vector<std::string>(argv + 1, argv + argc));
    } catch (const UsageError& e) {
        std::cerr << e.what() << std::endl;
        std::cout << usage(Mode::Relay, argv[0]);
        return 1;
    } catch (const OptionError& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
    if (opts.help) {
        std::cout << usage(Mode::Relay, argv[0]);
        return 1;
    }

    const std::string iface = opts.iface();
    LinuxBoard board;

    try {
        ensure_root(argc, argv);

        // Installed before bring-up so an early Ctrl-C still tears the link down.
        asio::io_context io;
        asio::signal_set signals(io, SIGINT, SIGTERM);

        bring_up(board, opts, std::cout);

        SocketBus bus(iface);
        Manager manager(bus, std::cout);
        manager.add_task("invert", {0x100, 0x101, 0x102}, invert, {0x300});
        manager.add_task("increment", {0x200, 0x201}, increment, {0x400, 0x401});

        signals.async_wait([&](std::error_code ec, int) {
            if (ec) return;
            std::cout << "Shutdown requested..." << std::endl;
        });

        manager.start();
        std::cout << "CAN manager running on " << iface << ". Press Ctrl-C to stop." << std::endl;
        io.run();
        manager.stop();

        ManagerStats stats = manager.stats();
        std::cout << "Received " << stats.received << ", sent " << stats.sent
                  << ", unrouted " << stats.unrouted << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    bring_down(board, iface, std::cout);
    return 0;
}
