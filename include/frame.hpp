#pragma once

#include <linux/can.h>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace orincan {

class FrameError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CanFrame {
    uint32_t id = 0;
    std::vector<uint8_t> data; // for remote requests: zero bytes of the requested length
    bool ext = false;
    bool rtr = false;
    bool fd = false;
    bool brs = false;
    bool esi = false;

    static CanFrame new_std(uint32_t id, const std::vector<uint8_t>& data);
    static CanFrame new_ext(uint32_t id, const std::vector<uint8_t>& data);
    static CanFrame new_fd(uint32_t id, const std::vector<uint8_t>& data, bool brs = false);
    static CanFrame new_remote(uint32_t id, uint8_t len, bool ext = false);
};

bool operator==(const CanFrame& a, const CanFrame& b);
inline bool operator!=(const CanFrame& a, const CanFrame& b) { return !(a == b); }

uint8_t len_to_dlc(size_t len);
size_t dlc_to_len(uint8_t dlc);

// cansend syntax: 123#11.22.33, 12345678#R4, 123##1AABBCC
CanFrame parse_frame(const std::string& text);
std::string to_string(const CanFrame& frame);

// One candump line, without the trailing newline.
std::string format_frame(const CanFrame& frame, const std::string& ifname);

// Fills `out` and returns the number of bytes to write (CAN_MTU or CANFD_MTU).
size_t to_wire(const CanFrame& frame, canfd_frame& out);
std::optional<CanFrame> from_wire(const canfd_frame& in, size_t bytes);

} // namespace orincan
