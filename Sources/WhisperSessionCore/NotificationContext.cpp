#include "NotificationContext.hpp"

#include "Log.hpp"

#include <exception>
#include <string>

namespace ws {

namespace {

// A throwing delegate must not take the context down with it.
void run_task(NotificationContext::Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        log::error(std::string("notification task threw: ") + e.what());
    }
}

} // namespace

// ---------------------------------------------------------------------------
// SerialQueue
// ---------------------------------------------------------------------------

struct SerialQueue::State {
    std::mutex              mu;
    std::condition_variable cv;
    std::deque<Task>        tasks;
    bool                    stopping = false;
    std::thread::id         thread_id;
};

SerialQueue::SerialQueue() : state_(std::make_shared<State>()) {
    std::shared_ptr<State> state = state_;
    std::lock_guard<std::mutex> lock(state_->mu);
    thread_ = std::thread([state]() { loop(state); });
    state_->thread_id = thread_.get_id();
}

SerialQueue::~SerialQueue() {
    {
        std::lock_guard<std::mutex> lock(state_->mu);
        state_->stopping = true;
    }
    state_->cv.notify_all();

    if (!thread_.joinable()) {
        return;
    }
    // The last owner may drop us from inside one of our own tasks.
    if (thread_.get_id() == std::this_thread::get_id()) {
        thread_.detach();
    } else {
        thread_.join();
    }
}

void SerialQueue::post(Task task) {
    // Once the task is queued it may drop the last owner of this queue, so
    // only the shared state is touched from here on.
    std::shared_ptr<State> state = state_;
    {
        std::lock_guard<std::mutex> lock(state->mu);
        if (state->stopping) {
            log::warn("task posted to a stopped SerialQueue was dropped");
            return;
        }
        state->tasks.push_back(std::move(task));
    }
    state->cv.notify_one();
}

bool SerialQueue::is_current() const {
    std::lock_guard<std::mutex> lock(state_->mu);
    return state_->thread_id == std::this_thread::get_id();
}

void SerialQueue::loop(const std::shared_ptr<State>& state) {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(state->mu);
            state->cv.wait(lock, [&] { return state->stopping || !state->tasks.empty(); });
            if (state->tasks.empty()) {
                return;   // stopping and drained
            }
            task = std::move(state->tasks.front());
            state->tasks.pop_front();
        }
        run_task(task);
    }
}

// ---------------------------------------------------------------------------
// MainLoop
// ---------------------------------------------------------------------------

void MainLoop::post(Task task) {
    // Notified under the lock: the pumping thread may destroy the loop as
    // soon as it can see the task.
    std::lock_guard<std::mutex> lock(mu_);
    tasks_.push_back(std::move(task));
    cv_.notify_one();
}

bool MainLoop::run_once(std::chrono::milliseconds timeout) {
    Task task;
    {
        std::unique_lock<std::mutex> lock(mu_);
        if (!cv_.wait_for(lock, timeout, [this] { return !tasks_.empty(); })) {
            return false;
        }
        task = std::move(tasks_.front());
        tasks_.pop_front();
    }
    run_task(task);
    return true;
}

std::size_t MainLoop::drain() {
    std::deque<Task> batch;
    {
        std::lock_guard<std::mutex> lock(mu_);
        batch.swap(tasks_);
    }
    for (auto& task : batch) {
        run_task(task);
    }
    return batch.size();
}

bool MainLoop::run_until(const std::function<bool()>& done, std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + timeout;

    while (!done()) {
        const auto now = Clock::now();
        if (now >= deadline) {
            return false;
        }
        run_once(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
    }
    return true;
}

std::size_t MainLoop::pending() const {
    std::lock_guard<std::mutex> lock(mu_);
    return tasks_.size();
}

} // namespace ws
