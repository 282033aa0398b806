#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace orincan {

// Malformed command line: unknown option or a flag without its value.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Well-formed command line with an invalid value.
class OptionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class Mode { Listen, Send, Relay };

constexpr uint32_t kDataBitrate = 1000000;

struct Options {
    uint32_t bitrate = 500000;
    uint32_t dbitrate = kDataBitrate;
    int controller = 0;
    double interval = 1.0;
    std::string interval_text = "1"; // as typed, for messages
    std::string frame = "123#abcdabcd";
    bool once = false;
    bool help = false;

    std::string iface() const { return "can" + std::to_string(controller); }
};

Options default_options(Mode mode);

// Throws UsageError or OptionError. `args` excludes the program name.
Options parse_options(Mode mode, const std::vector<std::string>& args);

std::string usage(Mode mode, const std::string& prog);

} // namespace orincan
