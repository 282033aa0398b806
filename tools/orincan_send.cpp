#include "board.hpp"
#include "options.hpp"
#include "sender.hpp"

#include <csignal>
#include <iostream>

using namespace orincan;

int main(int argc, char** argv) {
    Options opts;
    try {
        opts = parse_options(Mode::Send, std::vector<std::string>(argv + 1, argv + argc));
    } catch (const UsageError& e) {
        std::cerr << e.what() << std::endl;
        std::cout << usage(Mode::Send, argv[0]);
        return 1;
    } catch (const OptionError& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
    if (opts.help) {
        std::cout << usage(Mode::Send, argv[0]);
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
        Sender sender(io, bus, iface, parse_frame(opts.frame),
                      std::chrono::duration<double>(opts.interval), opts.interval_text, std::cerr);

        if (opts.once) {
            std::cout << "Sending CAN frame '" << opts.frame << "' on " << iface << std::endl;
            if (std::error_code ec = sender.send_once()) {
                std::cerr << "Error: send failed on " << iface << ": " << ec.message() << std::endl;
                return 1;
            }
            return 0;
        }

        std::cout << "Setup done. Sending CAN frame '" << opts.frame << "' on " << iface
                  << " every " << opts.interval_text << "s. Press Ctrl-C to stop." << std::endl;

        signals.async_wait([&](std::error_code ec, int) {
            if (ec) return;
            std::cout << "Stopping sends on " << iface << std::endl;
            sender.stop();
            io.stop();
        });

        sender.start();
        io.run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    bring_down(board, iface, std::cout);
    return 0;
}
