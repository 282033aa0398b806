#pragma once

#include "options.hpp"

#include <array>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

namespace orincan {

class LinkError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One 32-bit pin-mux register write.
struct PinMux {
    uint32_t address;
    uint32_t value;
    const char* name;
};

// Throws std::out_of_range for anything but controller 0 or 1.
const std::array<PinMux, 2>& pin_mux(int controller);

extern const std::array<const char*, 3> kKernelModules;

struct LinkConfig {
    std::string ifname;
    uint32_t bitrate = 0;
    uint32_t dbitrate = 0;
    bool berr_reporting = true;
    bool fd = true;
};

LinkConfig link_config(const Options& opts);

// Hardware access needed to bring a controller up.
class Board {
public:
    virtual ~Board() = default;

    // Throws std::system_error.
    virtual void write_register(uint32_t address, uint32_t value) = 0;
    // Returns false when the module could not be loaded.
    virtual bool load_module(const std::string& name) = 0;
    // Throw LinkError.
    virtual void link_up(const LinkConfig& cfg) = 0;
    virtual void link_down(const std::string& ifname) = 0;
};

// /dev/mem, modprobe and rtnetlink.
class LinuxBoard : public Board {
public:
    void write_register(uint32_t address, uint32_t value) override;
    bool load_module(const std::string& name) override;
    void link_up(const LinkConfig& cfg) override;
    void link_down(const std::string& ifname) override;
};

// Pin mux, kernel modules, then the link. Module failures are only warned about.
void bring_up(Board& board, const Options& opts, std::ostream& log);

// Never throws; returns false if the link could not be set down.
bool bring_down(Board& board, const std::string& ifname, std::ostream& log);

// Re-executes the current program under sudo unless already root.
void ensure_root(int argc, char** argv);

} // namespace orincan
