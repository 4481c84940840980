#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace ws {

/// The single context on which a session delivers every delegate and
/// completion call.  Tasks posted to one context run one at a time, in
/// posting order.
class NotificationContext {
public:
    using Task = std::function<void()>;

    virtual ~NotificationContext() = default;

    /// Enqueue `task`.  Never runs it inline; callable from any thread.
    virtual void post(Task task) = 0;
};

/// Notification context with its own dedicated thread.
class SerialQueue : public NotificationContext {
public:
    SerialQueue();

    /// Runs every task already posted, then stops the thread.
    ~SerialQueue() override;

    // Non-copyable.
    SerialQueue(const SerialQueue&) = delete;
    SerialQueue& operator=(const SerialQueue&) = delete;

    void post(Task task) override;

    /// Whether the calling thread is this queue's thread.
    bool is_current() const;

private:
    struct State;

    static void loop(const std::shared_ptr<State>& state);

    std::shared_ptr<State> state_;   // shared with the thread so it can outlive us
    std::thread            thread_;
};

/// Notification context pumped by its owner, typically from the
/// application's main thread:
///
///     ws::MainLoop loop;
///     session->transcribe(samples, on_done);
///     loop.run_until([&] { return finished; }, std::chrono::seconds(60));
class MainLoop : public NotificationContext {
public:
    MainLoop() = default;

    // Non-copyable.
    MainLoop(const MainLoop&) = delete;
    MainLoop& operator=(const MainLoop&) = delete;

    void post(Task task) override;

    /// Run at most one task, waiting up to `timeout` for one to arrive.
    /// Returns true if a task ran.
    bool run_once(std::chrono::milliseconds timeout);

    /// Run every task queued at the time of the call.  Returns how many ran.
    std::size_t drain();

    /// Pump tasks until `done()` is true.  Returns false on timeout.
    bool run_until(const std::function<bool()>& done, std::chrono::milliseconds timeout);

    std::size_t pending() const;

private:
    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::deque<Task>        tasks_;
};

} // namespace ws
