#pragma once

#include "channel.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace holdtalk {

// Runs posted jobs one at a time on its own thread, in posting order.
class Worker {
public:
    using Job = std::function<void()>;

    explicit Worker(std::string name);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    void start();

    // Runs the jobs already queued, then joins
    void stop();

    bool post(Job job);

    // Jobs posted but not yet finished
    size_t pending() const { return pending_.load(); }
    const std::string& name() const { return name_; }

private:
    void run_loop();

    std::string name_;
    Channel<Job> jobs_;
    std::thread thread_;
    std::atomic<size_t> pending_{0};
    bool started_ = false;
};

// Runs fn on a detached thread and waits at most `timeout` for it. Anything fn
// uses must be owned by fn itself (capture shared_ptrs), since a call that
// times out keeps running after this returns. Returns false on timeout, or
// as soon as `cancel` becomes true.
template <typename Result>
bool run_with_timeout(std::function<Result()> fn, std::chrono::milliseconds timeout, Result& out,
                      const std::atomic<bool>* cancel = nullptr) {
    auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
    std::future<Result> future = task->get_future();
    std::thread([task]() { (*task)(); }).detach();

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const auto slice = std::chrono::milliseconds(50);

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;
        if (cancel && cancel->load()) return false;

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (future.wait_for(remaining < slice ? remaining : slice) == std::future_status::ready) {
            break;
        }
    }
    out = future.get();
    return true;
}

} // namespace holdtalk
