#include "frame.hpp"

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace orincan {

// ================= CanFrame Implementation =================

static void check_payload(const std::vector<uint8_t>& data, size_t max_len) {
    if (data.size() > max_len) {
        throw FrameError("payload of " + std::to_string(data.size()) + " bytes exceeds " +
                         std::to_string(max_len));
    }
}

static void check_id(uint32_t id, bool ext) {
    if (ext && id > CAN_EFF_MASK) {
        throw FrameError("extended id out of range");
    }
    if (!ext && id > CAN_SFF_MASK) {
        throw FrameError("standard id out of range");
    }
}

CanFrame CanFrame::new_std(uint32_t id, const std::vector<uint8_t>& data) {
    check_id(id, false);
    check_payload(data, CAN_MAX_DLEN);
    CanFrame f;
    f.id = id;
    f.data = data;
    return f;
}

CanFrame CanFrame::new_ext(uint32_t id, const std::vector<uint8_t>& data) {
    check_id(id, true);
    check_payload(data, CAN_MAX_DLEN);
    CanFrame f;
    f.id = id;
    f.data = data;
    f.ext = true;
    return f;
}

CanFrame CanFrame::new_fd(uint32_t id, const std::vector<uint8_t>& data, bool brs) {
    check_id(id, id > CAN_SFF_MASK);
    check_payload(data, CANFD_MAX_DLEN);
    CanFrame f;
    f.id = id;
    f.data = data;
    f.ext = id > CAN_SFF_MASK;
    f.fd = true;
    f.brs = brs;
    return f;
}

CanFrame CanFrame::new_remote(uint32_t id, uint8_t len, bool ext) {
    check_id(id, ext);
    if (len > CAN_MAX_DLEN) {
        throw FrameError("remote request length must be 0..8");
    }
    CanFrame f;
    f.id = id;
    f.data.assign(len, 0);
    f.ext = ext;
    f.rtr = true;
    return f;
}

bool operator==(const CanFrame& a, const CanFrame& b) {
    return a.id == b.id && a.data == b.data && a.ext == b.ext && a.rtr == b.rtr &&
           a.fd == b.fd && a.brs == b.brs && a.esi == b.esi;
}

uint8_t len_to_dlc(size_t len) {
    if (len <= 8) return (uint8_t)len;
    if (len <= 12) return 9;
    if (len <= 16) return 10;
    if (len <= 20) return 11;
    if (len <= 24) return 12;
    if (len <= 32) return 13;
    if (len <= 48) return 14;
    return 15;
}

size_t dlc_to_len(uint8_t dlc) {
    static const size_t map[] = {0,1,2,3,4,5,6,7,8,12,16,20,24,32,48,64};
    if (dlc < 16) return map[dlc];
    return 64;
}

// ================= cansend syntax =================

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static std::vector<uint8_t> parse_hex_bytes(const std::string& text, size_t max_len) {
    std::vector<uint8_t> out;
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '.') {
            ++i;
            continue;
        }
        if (i + 1 >= text.size()) {
            throw FrameError("odd number of hex digits in payload");
        }
        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) {
            throw FrameError("invalid hex byte '" + text.substr(i, 2) + "'");
        }
        out.push_back((uint8_t)((hi << 4) | lo));
        i += 2;
    }
    check_payload(out, max_len);
    return out;
}

CanFrame parse_frame(const std::string& text) {
    size_t hash = text.find('#');
    if (hash == std::string::npos) {
        throw FrameError("missing '#' in '" + text + "'");
    }

    std::string id_str = text.substr(0, hash);
    if (id_str.size() != 3 && id_str.size() != 8) {
        throw FrameError("id must have 3 (standard) or 8 (extended) hex digits");
    }
    uint32_t id = 0;
    for (char c : id_str) {
        int v = hex_value(c);
        if (v < 0) {
            throw FrameError("invalid id '" + id_str + "'");
        }
        id = (id << 4) | (uint32_t)v;
    }
    bool ext = id_str.size() == 8;
    check_id(id, ext);

    std::string rest = text.substr(hash + 1);

    if (!rest.empty() && rest[0] == '#') {
        if (rest.size() < 2 || hex_value(rest[1]) < 0) {
            throw FrameError("CAN FD frame needs a flags nibble after '##'");
        }
        int flags = hex_value(rest[1]);
        CanFrame f;
        f.id = id;
        f.ext = ext;
        f.fd = true;
        f.brs = (flags & CANFD_BRS) != 0;
        f.esi = (flags & CANFD_ESI) != 0;
        f.data = parse_hex_bytes(rest.substr(2), CANFD_MAX_DLEN);
        return f;
    }

    if (!rest.empty() && (rest[0] == 'R' || rest[0] == 'r')) {
        uint8_t len = 0;
        if (rest.size() == 2 && rest[1] >= '0' && rest[1] <= '8') {
            len = (uint8_t)(rest[1] - '0');
        } else if (rest.size() != 1) {
            throw FrameError("remote request length must be a single digit 0..8");
        }
        return CanFrame::new_remote(id, len, ext);
    }

    CanFrame f;
    f.id = id;
    f.ext = ext;
    f.data = parse_hex_bytes(rest, CAN_MAX_DLEN);
    return f;
}

static void write_id(std::ostream& os, const CanFrame& frame) {
    os << std::hex << std::uppercase << std::setfill('0');
    if (frame.ext) os << std::setw(8) << frame.id;
    else os << std::setw(3) << frame.id;
    os << std::dec;
}

std::string to_string(const CanFrame& frame) {
    std::ostringstream ss;
    write_id(ss, frame);
    ss << '#';
    if (frame.rtr) {
        ss << 'R';
        if (!frame.data.empty()) ss << frame.data.size();
        return ss.str();
    }
    ss << std::hex << std::uppercase;
    if (frame.fd) {
        ss << '#' << ((frame.brs ? CANFD_BRS : 0) | (frame.esi ? CANFD_ESI : 0));
    }
    for (uint8_t b : frame.data) {
        ss << std::setw(2) << std::setfill('0') << (int)b;
    }
    return ss.str();
}

// ================= candump output =================

std::string format_frame(const CanFrame& frame, const std::string& ifname) {
    std::ostringstream ss;
    ss << "  " << ifname << "  ";
    write_id(ss, frame);

    if (frame.fd) {
        ss << "  [" << std::setw(2) << std::setfill('0') << frame.data.size() << "]";
    } else {
        ss << "   [" << frame.data.size() << "]";
    }

    if (frame.rtr) {
        ss << "  remote request";
        return ss.str();
    }

    if (!frame.data.empty()) ss << " ";
    ss << std::hex << std::uppercase;
    for (uint8_t b : frame.data) {
        ss << " " << std::setw(2) << std::setfill('0') << (int)b;
    }
    return ss.str();
}

// ================= Kernel frame conversion =================

size_t to_wire(const CanFrame& frame, canfd_frame& out) {
    std::memset(&out, 0, sizeof(out));
    out.can_id = frame.id;
    if (frame.ext) out.can_id |= CAN_EFF_FLAG;

    if (frame.fd) {
        size_t len = std::min<size_t>(frame.data.size(), CANFD_MAX_DLEN);
        std::copy(frame.data.begin(), frame.data.begin() + len, std::begin(out.data));
        // Round up to the next length a DLC can express; the tail stays zero.
        out.len = (uint8_t)dlc_to_len(len_to_dlc(len));
        if (frame.brs) out.flags |= CANFD_BRS;
        if (frame.esi) out.flags |= CANFD_ESI;
        return CANFD_MTU;
    }

    size_t len = std::min<size_t>(frame.data.size(), CAN_MAX_DLEN);
    out.len = (uint8_t)len;
    if (frame.rtr) {
        out.can_id |= CAN_RTR_FLAG;
    } else {
        std::copy(frame.data.begin(), frame.data.begin() + len, std::begin(out.data));
    }
    return CAN_MTU;
}

std::optional<CanFrame> from_wire(const canfd_frame& in, size_t bytes) {
    if (bytes != CAN_MTU && bytes != CANFD_MTU) {
        return std::nullopt;
    }

    CanFrame f;
    f.ext = (in.can_id & CAN_EFF_FLAG) != 0;
    f.id = in.can_id & (f.ext ? CAN_EFF_MASK : CAN_SFF_MASK);

    if (bytes == CAN_MTU) {
        size_t len = std::min<size_t>(in.len, CAN_MAX_DLEN);
        f.rtr = (in.can_id & CAN_RTR_FLAG) != 0;
        if (f.rtr) f.data.assign(len, 0);
        else f.data.assign(in.data, in.data + len);
        return f;
    }

    size_t len = std::min<size_t>(in.len, CANFD_MAX_DLEN);
    f.fd = true;
    f.brs = (in.flags & CANFD_BRS) != 0;
    f.esi = (in.flags & CANFD_ESI) != 0;
    f.data.assign(in.data, in.data + len);
    return f;
}

} // namespace orincan
