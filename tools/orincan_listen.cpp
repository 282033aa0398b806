#include "board.hpp"
#include "dumper.hpp"
#include "options.hpp"

#include <csignal>
#include <iostream>

using namespace orincan;

int main(int argc, char** argv) {
    Options opts;
    try {
        opts = parse_options(Mode::Listen, std::vector<std::string>(argv + 1, argv + argc));
    } catch (const UsageError& e) {
        std::cerr << e.what() << std::endl;
        std::cout << usage(Mode::Listen, argv[0]);
        return 1;
    } catch (const OptionError& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
    if (opts.help) {
        std::cout << usage(Mode::Listen, argv[0]);
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
        Dumper dumper(create_socket(io, iface), iface, std::cout);

        std::cout << "Setup done. Listening for CAN frames on " << iface
                  << ". Press Ctrl-C to stop." << std::endl;

        signals.async_wait([&](std::error_code ec, int) {
            if (ec) return;
            std::cout << "Stopping listen on " << iface << std::endl;
            dumper.stop();
            io.stop();
        });

        dumper.start();
        io.run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    bring_down(board, iface, std::cout);
    return 0;
}
