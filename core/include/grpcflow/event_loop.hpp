#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace grpcflow {

/// Single worker thread running posted tasks in FIFO order.
///
/// All call bookkeeping of a server runs here, so adapters and stream
/// writers never see two events of the same call concurrently.
class EventLoop {
public:
    using Task = std::function<void()>;

    EventLoop() = default;
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void start();

    /// Run the tasks already queued, then join the thread. Tasks posted
    /// after stop() are dropped. Refused when called from a task, since the
    /// thread cannot join itself.
    void stop();

    /// Queue a task; returns false when the loop is not running
    bool post(Task task);

    bool in_loop_thread() const;
    bool running() const { return running_; }

private:
    void run();

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
};

} // namespace grpcflow
