#include "board.hpp"

#include <asio.hpp>
#include <gtest/gtest.h>

#include <cerrno>
#include <csignal>
#include <set>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

using namespace orincan;

namespace {

class FakeBoard : public Board {
public:
    std::vector<std::pair<uint32_t, uint32_t>> writes;
    std::vector<std::string> modules;
    std::vector<LinkConfig> ups;
    std::vector<std::string> downs;
    std::vector<std::string> calls;

    std::set<std::string> missing_modules;
    bool fail_link = false;
    bool fail_register = false;
    int raise_on_link_up = 0;

    void write_register(uint32_t address, uint32_t value) override {
        calls.push_back("write");
        if (fail_register) {
            throw std::system_error(EACCES, std::generic_category(), "open /dev/mem");
        }
        writes.emplace_back(address, value);
    }

    bool load_module(const std::string& name) override {
        calls.push_back("modprobe " + name);
        modules.push_back(name);
        return missing_modules.count(name) == 0;
    }

    void link_up(const LinkConfig& cfg) override {
        calls.push_back("up");
        if (raise_on_link_up) std::raise(raise_on_link_up);
        if (fail_link) throw LinkError("bring up " + cfg.ifname + ": Object not found");
        ups.push_back(cfg);
    }

    void link_down(const std::string& ifname) override {
        calls.push_back("down");
        if (fail_link) throw LinkError("bring down " + ifname + ": Object not found");
        downs.push_back(ifname);
    }
};

Options options_for(int controller, uint32_t bitrate = 500000) {
    Options o;
    o.controller = controller;
    o.bitrate = bitrate;
    return o;
}

} // namespace

TEST(PinMux, Controller0Registers) {
    const auto& regs = pin_mux(0);
    EXPECT_EQ(regs[0].address, 0x0c303018u);
    EXPECT_EQ(regs[0].value, 0xc458u);
    EXPECT_EQ(regs[1].address, 0x0c303010u);
    EXPECT_EQ(regs[1].value, 0xc400u);
}

TEST(PinMux, Controller1Registers) {
    const auto& regs = pin_mux(1);
    EXPECT_EQ(regs[0].address, 0x0c303008u);
    EXPECT_EQ(regs[0].value, 0xc458u);
    EXPECT_EQ(regs[1].address, 0x0c303000u);
    EXPECT_EQ(regs[1].value, 0xc400u);
}

TEST(PinMux, RejectsOtherControllers) {
    EXPECT_THROW(pin_mux(2), std::out_of_range);
    EXPECT_THROW(pin_mux(-1), std::out_of_range);
}

TEST(LinkSettings, FromOptions) {
    LinkConfig cfg = link_config(options_for(1, 250000));
    EXPECT_EQ(cfg.ifname, "can1");
    EXPECT_EQ(cfg.bitrate, 250000u);
    EXPECT_EQ(cfg.dbitrate, 1000000u);
    EXPECT_TRUE(cfg.berr_reporting);
    EXPECT_TRUE(cfg.fd);
}

TEST(BringUp, RunsPinMuxModulesThenLink) {
    FakeBoard board;
    std::ostringstream log;
    bring_up(board, options_for(0), log);

    std::vector<std::string> expected = {
        "write", "write", "modprobe can", "modprobe can_raw", "modprobe mttcan", "up"};
    EXPECT_EQ(board.calls, expected);
    ASSERT_EQ(board.writes.size(), 2u);
    EXPECT_EQ(board.writes[0], std::make_pair(0x0c303018u, 0xc458u));
    EXPECT_EQ(board.writes[1], std::make_pair(0x0c303010u, 0xc400u));
    ASSERT_EQ(board.ups.size(), 1u);
    EXPECT_EQ(board.ups[0].ifname, "can0");
    EXPECT_EQ(board.ups[0].bitrate, 500000u);

    EXPECT_NE(log.str().find("Configuring CAN0 pins..."), std::string::npos);
    EXPECT_NE(log.str().find("Bringing up can0 with bitrate=500000, dbitrate=1000000..."),
              std::string::npos);
}

TEST(BringUp, ModuleFailuresAreTolerated) {
    FakeBoard board;
    board.missing_modules = {"can", "mttcan"};
    std::ostringstream log;
    EXPECT_NO_THROW(bring_up(board, options_for(1), log));

    EXPECT_EQ(board.modules.size(), 3u);
    EXPECT_EQ(board.ups.size(), 1u);
    EXPECT_NE(log.str().find("Warning: modprobe mttcan failed"), std::string::npos);
    EXPECT_EQ(log.str().find("Warning: modprobe can_raw"), std::string::npos);
}

TEST(BringUp, LinkFailureIsFatal) {
    FakeBoard board;
    board.fail_link = true;
    std::ostringstream log;
    EXPECT_THROW(bring_up(board, options_for(1), log), LinkError);
}

TEST(BringUp, RegisterFailureStopsBeforeModules) {
    FakeBoard board;
    board.fail_register = true;
    std::ostringstream log;
    EXPECT_THROW(bring_up(board, options_for(0), log), std::system_error);
    EXPECT_TRUE(board.modules.empty());
    EXPECT_TRUE(board.ups.empty());
}

TEST(BringDown, ReportsSuccess) {
    FakeBoard board;
    std::ostringstream log;
    EXPECT_TRUE(bring_down(board, "can1", log));
    EXPECT_EQ(board.downs, std::vector<std::string>{"can1"});
}

TEST(BringDown, SwallowsLinkErrors) {
    FakeBoard board;
    board.fail_link = true;
    std::ostringstream log;
    EXPECT_FALSE(bring_down(board, "can0", log));
    EXPECT_NE(log.str().find("Warning: bring down can0"), std::string::npos);
}

TEST(BringUp, InterruptDuringBringUpStillTearsDown) {
    FakeBoard board;
    board.raise_on_link_up = SIGINT;
    std::ostringstream log;

    asio::io_context io;
    asio::signal_set signals(io, SIGINT, SIGTERM);
    bring_up(board, options_for(0), log);

    int received = 0;
    signals.async_wait([&](std::error_code ec, int signo) {
        if (!ec) received = signo;
    });
    io.run();
    EXPECT_EQ(received, SIGINT);

    EXPECT_TRUE(bring_down(board, "can0", log));
    EXPECT_EQ(board.downs, std::vector<std::string>{"can0"});
}
