#include "grpcflow/event_loop.hpp"
#include "grpcflow/errors.hpp"
#include <glog/logging.h>
#include <exception>

namespace grpcflow {

EventLoop::~EventLoop() {
    stop();
}

void EventLoop::start() {
    if (running_) {
        return;
    }
    running_ = true;
    thread_ = std::thread(&EventLoop::run, this);
    VLOG(1) << "Event loop started";
}

void EventLoop::stop() {
    if (in_loop_thread()) {
        LOG(ERROR) << "Event loop cannot be stopped from one of its own tasks";
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    VLOG(1) << "Event loop stopped";
}

bool EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

bool EventLoop::in_loop_thread() const {
    return std::this_thread::get_id() == thread_.get_id();
}

void EventLoop::run() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !running_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                break;   // Stopped and drained
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try {
            task();
        } catch (...) {
            LOG(ERROR) << "Unhandled exception in event loop task: "
                       << describe_exception(std::current_exception());
        }
    }
}

} // namespace grpcflow
