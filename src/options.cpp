#include "options.hpp"
#include "frame.hpp"

#include <chrono>
#include <limits>
#include <regex>
#include <sstream>

namespace orincan {

Options default_options(Mode mode) {
    Options opts;
    // The listener historically sits on the second controller.
    opts.controller = (mode == Mode::Listen) ? 1 : 0;
    return opts;
}

static bool is_send_flag(const std::string& arg) {
    return arg == "-i" || arg == "--interval" || arg == "-f" || arg == "--frame" ||
           arg == "-n" || arg == "--once";
}

Options parse_options(Mode mode, const std::vector<std::string>& args) {
    Options opts = default_options(mode);

    std::string bitrate = std::to_string(opts.bitrate);
    std::string controller = std::to_string(opts.controller);
    std::string interval = opts.interval_text;
    std::string frame = opts.frame;

    auto value_of = [&](size_t& i) -> std::string {
        if (i + 1 >= args.size()) {
            throw UsageError("Option " + args[i] + " requires a value");
        }
        i += 2;
        return args[i - 1];
    };

    size_t i = 0;
    while (i < args.size()) {
        const std::string& arg = args[i];
        if (arg == "-b" || arg == "--bitrate") {
            bitrate = value_of(i);
        } else if (arg == "-c" || arg == "--controller") {
            controller = value_of(i);
        } else if (arg == "-h" || arg == "--help") {
            opts.help = true;
            return opts;
        } else if (arg == "--") {
            break;
        } else if (mode == Mode::Send && is_send_flag(arg)) {
            if (arg == "-i" || arg == "--interval") {
                interval = value_of(i);
            } else if (arg == "-f" || arg == "--frame") {
                frame = value_of(i);
            } else {
                opts.once = true;
                ++i;
            }
        } else {
            throw UsageError("Unknown option: " + arg);
        }
    }

    if (!std::regex_match(controller, std::regex("^[01]$"))) {
        throw OptionError("--controller must be 0 or 1");
    }
    opts.controller = controller[0] - '0';

    if (!std::regex_match(bitrate, std::regex("^[0-9]+$"))) {
        throw OptionError("--bitrate must be a positive integer");
    }
    try {
        unsigned long long value = std::stoull(bitrate);
        if (value > std::numeric_limits<uint32_t>::max()) {
            throw OptionError("--bitrate must be a positive integer");
        }
        opts.bitrate = (uint32_t)value;
    } catch (const std::out_of_range&) {
        throw OptionError("--bitrate must be a positive integer");
    }

    if (mode == Mode::Send) {
        if (!std::regex_match(interval, std::regex("^[0-9]+([.][0-9]+)?$"))) {
            throw OptionError("--interval must be numeric");
        }
        try {
            opts.interval = std::stod(interval);
        } catch (const std::out_of_range&) {
            throw OptionError("--interval must be numeric");
        }
        // The timer counts in steady_clock ticks.
        const double max_interval =
            std::chrono::duration<double>(std::chrono::steady_clock::duration::max()).count();
        if (opts.interval >= max_interval) {
            throw OptionError("--interval must be numeric");
        }
        opts.interval_text = interval;

        try {
            parse_frame(frame);
        } catch (const FrameError& e) {
            throw OptionError("--frame must be in cansend syntax (<id>#<data>): " +
                              std::string(e.what()));
        }
        opts.frame = frame;
    }

    return opts;
}

std::string usage(Mode mode, const std::string& prog) {
    Options defaults = default_options(mode);
    std::ostringstream ss;
    ss << "Usage: " << prog << " [OPTIONS]\n"
       << "\n"
       << "Options:\n"
       << "  -b, --bitrate N       CAN bitrate in bits/s (default: " << defaults.bitrate << ")\n"
       << "  -c, --controller N    CAN controller index (0 or 1) (default: " << defaults.controller << ")\n";
    if (mode == Mode::Send) {
        ss << "  -i, --interval N      seconds between sends (default: " << defaults.interval_text << ")\n"
           << "  -f, --frame FRAME     frame in cansend syntax (default: " << defaults.frame << ")\n"
           << "  -n, --once            send a single frame and exit\n";
    }
    ss << "  -h, --help            show this help\n";
    return ss.str();
}

} // namespace orincan
