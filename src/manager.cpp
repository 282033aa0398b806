#include "manager.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace orincan {

static constexpr std::chrono::milliseconds kPollInterval(100);

static std::string describe(const CanFrame& frame) {
    std::ostringstream ss;
    ss << "ID=0x" << std::hex << std::uppercase << frame.id << std::nouppercase << ", Data=";
    for (uint8_t b : frame.data) {
        ss << std::setw(2) << std::setfill('0') << (int)b;
    }
    return ss.str();
}

// ================= Manager Implementation =================

Manager::Manager(Bus& bus, std::ostream& log) : bus_(bus), log_(log) {
}

Manager::~Manager() {
    stop();
}

void Manager::add_task(const std::string& name, const std::vector<uint32_t>& input_ids,
                       Processor processor, const std::vector<uint32_t>& output_ids) {
    if (running_) {
        throw std::logic_error("add_task() called while the manager is running");
    }
    for (const auto& task : tasks_) {
        if (task->name == name) {
            throw std::invalid_argument("duplicate task name '" + name + "'");
        }
    }
    for (uint32_t id : output_ids) {
        if (id > CAN_SFF_MASK) {
            throw std::invalid_argument("output id out of 11-bit range for task '" + name + "'");
        }
    }

    auto task = std::make_unique<Task>();
    task->name = name;
    task->input_ids = input_ids;
    task->output_ids = output_ids;
    task->processor = std::move(processor);
    tasks_.push_back(std::move(task));
}

void Manager::start() {
    if (running_.exchange(true)) {
        throw std::logic_error("manager already running");
    }

    threads_.emplace_back(&Manager::read_loop, this);
    threads_.emplace_back(&Manager::write_loop, this);
    threads_.emplace_back(&Manager::dispatch_loop, this);
    for (auto& task : tasks_) {
        threads_.emplace_back(&Manager::task_loop, this, std::ref(*task));
    }

    log("All threads started successfully (" + std::to_string(threads_.size()) + " threads)");
}

void Manager::stop() {
    if (running_.exchange(false)) {
        log("Stopping CAN manager...");
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
        threads_.clear();
        log("CAN manager stopped");
    }

    incoming_.clear();
    outgoing_.clear();
    for (auto& task : tasks_) {
        task->queue.clear();
    }
}

void Manager::post(const CanFrame& frame) {
    outgoing_.push(frame);
}

ManagerStats Manager::stats() const {
    ManagerStats s;
    s.received = received_;
    s.sent = sent_;
    s.send_errors = send_errors_;
    s.unrouted = unrouted_;
    s.processed = processed_;
    s.task_errors = task_errors_;
    return s;
}

void Manager::log(const std::string& line) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_ << line << std::endl;
}

void Manager::read_loop() {
    log("CAN bus reader thread started");
    while (running_) {
        try {
            if (auto frame = bus_.recv(kPollInterval)) {
                ++received_;
                incoming_.push(std::move(*frame));
            }
        } catch (const std::system_error& e) {
            log(std::string("Error reading from bus: ") + e.what());
            std::this_thread::sleep_for(kPollInterval);
        }
    }
}

void Manager::write_loop() {
    log("CAN bus sender thread started");
    while (running_) {
        auto frame = outgoing_.pop(kPollInterval);
        if (!frame) continue;

        try {
            bus_.send(*frame);
            ++sent_;
            log("Sent: " + describe(*frame));
        } catch (const std::system_error& e) {
            ++send_errors_;
            log(std::string("Error sending message: ") + e.what());
        }
    }
}

void Manager::dispatch_loop() {
    log("Message dispatcher thread started");
    while (running_) {
        auto frame = incoming_.pop(kPollInterval);
        if (!frame) continue;

        bool routed = false;
        for (auto& task : tasks_) {
            const auto& ids = task->input_ids;
            if (std::find(ids.begin(), ids.end(), frame->id) != ids.end()) {
                task->queue.push(*frame);
                routed = true;
            }
        }
        if (!routed) {
            ++unrouted_;
        }
    }
}

void Manager::task_loop(Task& task) {
    std::ostringstream ids;
    for (size_t i = 0; i < task.input_ids.size(); ++i) {
        ids << (i ? ", " : "") << "0x" << std::hex << task.input_ids[i];
    }
    log("Task '" + task.name + "' started - Monitoring IDs: [" + ids.str() + "]");

    while (running_) {
        auto frame = task.queue.pop(kPollInterval);
        if (!frame) continue;

        log("[" + task.name + "] Processing message from " + describe(*frame));
        try {
            auto result = task.processor(*frame);
            ++processed_;
            if (!result) continue;

            for (uint32_t id : task.output_ids) {
                CanFrame response = CanFrame::new_std(id, *result);
                outgoing_.push(response);
                log("[" + task.name + "] Queued response to " + describe(response));
            }
        } catch (const std::exception& e) {
            ++task_errors_;
            log("[" + task.name + "] Error processing message: " + e.what());
        }
    }
}

} // namespace orincan
