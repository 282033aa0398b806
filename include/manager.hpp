#pragma once

#include "bus.hpp"
#include "frame.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace orincan {

template <typename T>
class Queue {
public:
    void push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.push_back(std::move(value));
        }
        cv_.notify_one();
    }

    std::optional<T> pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !items_.empty(); })) {
            return std::nullopt;
        }
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
};

// Returns the response payload, or std::nullopt for no response.
using Processor = std::function<std::optional<std::vector<uint8_t>>(const CanFrame&)>;

struct ManagerStats {
    size_t received = 0;
    size_t sent = 0;
    size_t send_errors = 0;
    size_t unrouted = 0;
    size_t processed = 0;
    size_t task_errors = 0;
};

// Routes received frames by id to processing tasks and sends their responses.
// Threads: bus reader, bus writer, dispatcher, and one worker per task.
class Manager {
public:
    explicit Manager(Bus& bus, std::ostream& log = std::cout);
    ~Manager();

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    // Must be called before start(). Output ids are 11-bit.
    void add_task(const std::string& name, const std::vector<uint32_t>& input_ids,
                  Processor processor, const std::vector<uint32_t>& output_ids = {});

    void start();
    // Joins the threads and drops any frames still queued.
    void stop();

    void post(const CanFrame& frame);
    size_t pending() const { return outgoing_.size(); }

    bool running() const { return running_; }
    size_t task_count() const { return tasks_.size(); }
    ManagerStats stats() const;

private:
    struct Task {
        std::string name;
        std::vector<uint32_t> input_ids;
        std::vector<uint32_t> output_ids;
        Processor processor;
        Queue<CanFrame> queue;
    };

    void read_loop();
    void write_loop();
    void dispatch_loop();
    void task_loop(Task& task);
    void log(const std::string& line);

    Bus& bus_;
    std::ostream& log_;
    std::mutex log_mutex_;

    std::vector<std::unique_ptr<Task>> tasks_;
    Queue<CanFrame> incoming_;
    Queue<CanFrame> outgoing_;

    std::atomic<bool> running_{false};
    std::vector<std::thread> threads_;

    std::atomic<size_t> received_{0};
    std::atomic<size_t> sent_{0};
    std::atomic<size_t> send_errors_{0};
    std::atomic<size_t> unrouted_{0};
    std::atomic<size_t> processed_{0};
    std::atomic<size_t> task_errors_{0};
};

} // namespace orincan
