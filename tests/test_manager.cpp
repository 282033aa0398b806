#include "fake_bus.hpp"
#include "manager.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <thread>

using namespace orincan;
using namespace std::chrono_literals;

namespace {

std::optional<std::vector<uint8_t>> invert(const CanFrame& frame) {
    std::vector<uint8_t> out(frame.data);
    for (auto& b : out) b ^= 0xFF;
    return out;
}

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds deadline = 2000ms) {
    auto until = std::chrono::steady_clock::now() + deadline;
    while (std::chrono::steady_clock::now() < until) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace

TEST(Queue, PopTimesOutWhenEmpty) {
    Queue<int> q;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(q.pop(20ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST(Queue, FifoOrder) {
    Queue<int> q;
    q.push(1);
    q.push(2);
    EXPECT_EQ(q.size(), 2u);
    EXPECT_EQ(*q.pop(0ms), 1);
    EXPECT_EQ(*q.pop(0ms), 2);
}

TEST(Manager, RoutesFrameToTaskAndSendsResponse) {
    FakeBus bus;
    std::ostringstream log;
    Manager manager(bus, log);
    manager.add_task("invert", {0x100, 0x101, 0x102}, invert, {0x300});
    manager.start();

    bus.inject(CanFrame::new_std(0x101, {0x01, 0x02, 0xF0}));
    auto sent = bus.wait_sent(1);
    manager.stop();

    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].id, 0x300u);
    EXPECT_FALSE(sent[0].ext);
    EXPECT_EQ(sent[0].data, (std::vector<uint8_t>{0xFE, 0xFD, 0x0F}));
    EXPECT_EQ(manager.stats().processed, 1u);
    EXPECT_NE(log.str().find("Sent: ID=0x300, Data=fefd0f"), std::string::npos);
}

TEST(Manager, ResponseGoesToEveryOutputId) {
    FakeBus bus;
    std::ostringstream log;
    Manager manager(bus, log);
    manager.add_task("increment", {0x200, 0x201},
        [](const CanFrame& f) -> std::optional<std::vector<uint8_t>> {
            std::vector<uint8_t> out(f.data);
            for (auto& b : out) b = (uint8_t)(b + 1);
            return out;
        },
        {0x400, 0x401});
    manager.start();

    bus.inject(CanFrame::new_std(0x200, {0xFF, 0x10}));
    auto sent = bus.wait_sent(2);
    manager.stop();

    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0].id, 0x400u);
    EXPECT_EQ(sent[1].id, 0x401u);
    EXPECT_EQ(sent[0].data, (std::vector<uint8_t>{0x00, 0x11}));
    EXPECT_EQ(sent[1].data, sent[0].data);
}

TEST(Manager, UnclaimedFramesAreCountedNotSent) {
    FakeBus bus;
    std::ostringstream log;
    Manager manager(bus, log);
    manager.add_task("invert", {0x100}, invert, {0x300});
    manager.start();

    bus.inject(CanFrame::new_std(0x555, {0x01}));
    EXPECT_TRUE(eventually([&] { return manager.stats().unrouted == 1; }));
    manager.stop();

    EXPECT_TRUE(bus.sent().empty());
    EXPECT_EQ(manager.stats().received, 1u);
}

TEST(Manager, FrameClaimedByTwoTasksReachesBoth) {
    FakeBus bus;
    std::ostringstream log;
    Manager manager(bus, log);
    manager.add_task("a", {0x123}, invert, {0x321});
    manager.add_task("b", {0x123}, invert, {0x322});
    manager.start();

    bus.inject(CanFrame::new_std(0x123, {0x00}));
    auto sent = bus.wait_sent(2);
    manager.stop();

    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(manager.stats().processed, 2u);
}

TEST(Manager, NoResponseWithoutOutputIdsOrPayload) {
    FakeBus bus;
    std::ostringstream log;
    Manager manager(bus, log);
    manager.add_task("sink", {0x100}, invert);
    manager.add_task("silent", {0x200},
        [](const CanFrame&) -> std::optional<std::vector<uint8_t>> { return std::nullopt; },
        {0x300});
    manager.start();

    bus.inject(CanFrame::new_std(0x100, {0x01}));
    bus.inject(CanFrame::new_std(0x200, {0x01}));
    EXPECT_TRUE(eventually([&] { return manager.stats().processed == 2; }));
    manager.stop();

    EXPECT_TRUE(bus.sent().empty());
}

TEST(Manager, ProcessorErrorsDoNotStopTheTask) {
    FakeBus bus;
    std::ostringstream log;
    Manager manager(bus, log);
    manager.add_task("picky", {0x100},
        [](const CanFrame& f) -> std::optional<std::vector<uint8_t>> {
            if (f.data.empty()) throw std::runtime_error("empty payload");
            return f.data;
        },
        {0x300});
    manager.start();

    bus.inject(CanFrame::new_std(0x100, {}));
    bus.inject(CanFrame::new_std(0x100, {0x42}));
    auto sent = bus.wait_sent(1);
    manager.stop();

    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].data, (std::vector<uint8_t>{0x42}));
    EXPECT_EQ(manager.stats().task_errors, 1u);
    EXPECT_NE(log.str().find("[picky] Error processing message: empty payload"), std::string::npos);
}

TEST(Manager, OversizedResponseIsReportedAsTaskError) {
    FakeBus bus;
    std::ostringstream log;
    Manager manager(bus, log);
    manager.add_task("grow", {0x100},
        [](const CanFrame&) -> std::optional<std::vector<uint8_t>> {
            return std::vector<uint8_t>(9, 0xAA);
        },
        {0x300});
    manager.start();

    bus.inject(CanFrame::new_std(0x100, {0x01}));
    EXPECT_TRUE(eventually([&] { return manager.stats().task_errors == 1; }));
    manager.stop();
    EXPECT_TRUE(bus.sent().empty());
}

TEST(Manager, SendFailuresAreLoggedAndWriterContinues) {
    FakeBus bus;
    std::ostringstream log;
    Manager manager(bus, log);
    manager.start();

    bus.fail_sends(true);
    manager.post(CanFrame::new_std(0x123, {0x01}));
    EXPECT_TRUE(eventually([&] { return manager.stats().send_errors == 1; }));

    bus.fail_sends(false);
    manager.post(CanFrame::new_std(0x124, {0x02}));
    auto sent = bus.wait_sent(1);
    manager.stop();

    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].id, 0x124u);
    EXPECT_NE(log.str().find("Error sending message"), std::string::npos);
}

TEST(Manager, StartTwiceThrowsAndStopIsIdempotent) {
    FakeBus bus;
    std::ostringstream log;
    Manager manager(bus, log);
    manager.start();
    EXPECT_TRUE(manager.running());
    EXPECT_THROW(manager.start(), std::logic_error);
    manager.stop();
    EXPECT_FALSE(manager.running());
    EXPECT_NO_THROW(manager.stop());
}

TEST(Manager, RejectsBadTaskRegistration) {
    FakeBus bus;
    std::ostringstream log;
    Manager manager(bus, log);
    manager.add_task("a", {0x100}, invert, {0x300});
    EXPECT_THROW(manager.add_task("a", {0x101}, invert), std::invalid_argument);
    EXPECT_THROW(manager.add_task("b", {0x101}, invert, {0x800}), std::invalid_argument);

    manager.start();
    EXPECT_THROW(manager.add_task("c", {0x102}, invert), std::logic_error);
    manager.stop();
    EXPECT_EQ(manager.task_count(), 1u);
}

TEST(Manager, StopDropsQueuedFrames) {
    FakeBus bus;
    std::ostringstream log;
    Manager manager(bus, log);
    manager.post(CanFrame::new_std(0x123, {0x01}));
    manager.post(CanFrame::new_std(0x124, {0x02}));
    EXPECT_EQ(manager.pending(), 2u);

    manager.stop();
    EXPECT_EQ(manager.pending(), 0u);

    manager.start();
    std::this_thread::sleep_for(200ms);
    manager.stop();
    EXPECT_TRUE(bus.sent().empty());
}
