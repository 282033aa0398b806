#include "board.hpp"

#include <net/if.h>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/wait.h>
#include <unistd.h>

#include <netlink/netlink.h>
#include <netlink/route/link.h>
#include <netlink/route/link/can.h>
#include <linux/can/netlink.h>

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <system_error>
#include <vector>

namespace orincan {

// ================= Board tables =================

static const std::array<PinMux, 2> kCan0PinMux = {{
    {0x0c303018, 0xc458, "can0_din"},
    {0x0c303010, 0xc400, "can0_dout"},
}};

static const std::array<PinMux, 2> kCan1PinMux = {{
    {0x0c303008, 0xc458, "can1_din"},
    {0x0c303000, 0xc400, "can1_dout"},
}};

const std::array<const char*, 3> kKernelModules = {"can", "can_raw", "mttcan"};

const std::array<PinMux, 2>& pin_mux(int controller) {
    switch (controller) {
        case 0: return kCan0PinMux;
        case 1: return kCan1PinMux;
    }
    throw std::out_of_range("controller must be 0 or 1, got " + std::to_string(controller));
}

LinkConfig link_config(const Options& opts) {
    LinkConfig cfg;
    cfg.ifname = opts.iface();
    cfg.bitrate = opts.bitrate;
    cfg.dbitrate = opts.dbitrate;
    return cfg;
}

// ================= /dev/mem =================

namespace {

// RAII wrapper for file descriptors
class FileDescriptor {
    int fd_ = -1;
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { if (fd_ >= 0) close(fd_); }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    int get() const { return fd_; }
};

class Mapping {
    void* addr_;
    size_t len_;
public:
    Mapping(int fd, off_t offset, size_t len) : len_(len) {
        addr_ = mmap(nullptr, len, PROT_READ | PROT_WRITE, MAP_SHARED, fd, offset);
        if (addr_ == MAP_FAILED) {
            throw std::system_error(errno, std::generic_category(), "mmap /dev/mem");
        }
    }
    ~Mapping() { munmap(addr_, len_); }
    Mapping(const Mapping&) = delete;
    Mapping& operator=(const Mapping&) = delete;
    char* data() const { return static_cast<char*>(addr_); }
};

void check_error(int result, const std::string& msg) {
    if (result < 0) {
        throw std::system_error(errno, std::generic_category(), msg);
    }
}

} // namespace

void LinuxBoard::write_register(uint32_t address, uint32_t value) {
    FileDescriptor fd(::open("/dev/mem", O_RDWR | O_SYNC));
    check_error(fd.get(), "open /dev/mem");

    const size_t page = (size_t)sysconf(_SC_PAGESIZE);
    const off_t base = (off_t)(address & ~(uint32_t)(page - 1));
    Mapping map(fd.get(), base, page);

    volatile uint32_t* reg = reinterpret_cast<volatile uint32_t*>(map.data() + (address - base));
    *reg = value;
}

// ================= Kernel modules =================

bool LinuxBoard::load_module(const std::string& name) {
    std::string cmd = "modprobe " + name + " > /dev/null 2>&1";
    int status = std::system(cmd.c_str());
    return status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

// ================= rtnetlink =================

namespace {

struct NlSocketDeleter {
    void operator()(nl_sock* s) const { nl_socket_free(s); }
};
struct LinkDeleter {
    void operator()(rtnl_link* l) const { rtnl_link_put(l); }
};
using NlSocket = std::unique_ptr<nl_sock, NlSocketDeleter>;
using Link = std::unique_ptr<rtnl_link, LinkDeleter>;

void check_nl(int err, const std::string& what) {
    if (err < 0) {
        throw LinkError(what + ": " + nl_geterror(err));
    }
}

NlSocket connect_route() {
    NlSocket sock(nl_socket_alloc());
    if (!sock) throw LinkError("nl_socket_alloc failed");
    check_nl(nl_connect(sock.get(), NETLINK_ROUTE), "nl_connect");
    return sock;
}

Link kernel_link(nl_sock* sock, const std::string& ifname) {
    rtnl_link* link = nullptr;
    check_nl(rtnl_link_get_kernel(sock, 0, ifname.c_str(), &link), ifname);
    return Link(link);
}

Link new_change() {
    Link change(rtnl_link_alloc());
    if (!change) throw LinkError("rtnl_link_alloc failed");
    return change;
}

} // namespace

void LinuxBoard::link_up(const LinkConfig& cfg) {
    NlSocket sock = connect_route();
    Link link = kernel_link(sock.get(), cfg.ifname);
    Link change = new_change();

    // Same request as `ip link set <if> up type can bitrate .. dbitrate .. berr-reporting on fd on`
    check_nl(rtnl_link_set_type(change.get(), "can"), "set type can");
    check_nl(rtnl_link_can_set_bitrate(change.get(), cfg.bitrate), "set bitrate");

    uint32_t ctrlmode = 0;
    if (cfg.berr_reporting) ctrlmode |= CAN_CTRLMODE_BERR_REPORTING;
    if (cfg.fd) {
        ctrlmode |= CAN_CTRLMODE_FD;
        struct can_bittiming dbt = {};
        dbt.bitrate = cfg.dbitrate;
        check_nl(rtnl_link_can_set_data_bittiming(change.get(), &dbt), "set dbitrate");
    }
    if (ctrlmode) {
        check_nl(rtnl_link_can_set_ctrlmode(change.get(), ctrlmode), "set ctrlmode");
    }
    rtnl_link_set_flags(change.get(), IFF_UP);

    check_nl(rtnl_link_change(sock.get(), link.get(), change.get(), 0),
             "bring up " + cfg.ifname);
}

void LinuxBoard::link_down(const std::string& ifname) {
    NlSocket sock = connect_route();
    Link link = kernel_link(sock.get(), ifname);
    Link change = new_change();
    rtnl_link_unset_flags(change.get(), IFF_UP);
    check_nl(rtnl_link_change(sock.get(), link.get(), change.get(), 0), "bring down " + ifname);
}

// ================= Sequences =================

void bring_up(Board& board, const Options& opts, std::ostream& log) {
    log << "Configuring CAN" << opts.controller << " pins..." << std::endl;
    for (const PinMux& reg : pin_mux(opts.controller)) {
        board.write_register(reg.address, reg.value);
    }

    log << "Loading kernel modules..." << std::endl;
    for (const char* mod : kKernelModules) {
        if (!board.load_module(mod)) {
            log << "Warning: modprobe " << mod << " failed, continuing" << std::endl;
        }
    }

    LinkConfig cfg = link_config(opts);
    log << "Bringing up " << cfg.ifname << " with bitrate=" << cfg.bitrate
        << ", dbitrate=" << cfg.dbitrate << "..." << std::endl;
    board.link_up(cfg);
}

bool bring_down(Board& board, const std::string& ifname, std::ostream& log) {
    log << "Bringing down " << ifname << "..." << std::endl;
    try {
        board.link_down(ifname);
    } catch (const LinkError& e) {
        log << "Warning: " << e.what() << std::endl;
        return false;
    }
    return true;
}

void ensure_root(int argc, char** argv) {
    if (geteuid() == 0) return;

    std::cout << "Re-executing with sudo..." << std::endl;

    std::vector<char> exe(4096);
    ssize_t n = readlink("/proc/self/exe", exe.data(), exe.size() - 1);
    std::string self = (n > 0) ? std::string(exe.data(), (size_t)n) : std::string(argv[0]);

    std::vector<char*> args;
    args.push_back(const_cast<char*>("sudo"));
    args.push_back(const_cast<char*>(self.c_str()));
    for (int i = 1; i < argc; ++i) args.push_back(argv[i]);
    args.push_back(nullptr);

    execvp("sudo", args.data());
    throw std::system_error(errno, std::generic_category(), "execvp sudo");
}

} // namespace orincan
