#include "worker.hpp"
#include "log.hpp"
#include <exception>
#include <utility>

namespace holdtalk {

Worker::Worker(std::string name)
    : name_(std::move(name)) {
}

Worker::~Worker() {
    stop();
}

void Worker::start() {
    if (started_) return;
    started_ = true;
    thread_ = std::thread([this]() {
        run_loop();
    });
}

void Worker::stop() {
    jobs_.close();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool Worker::post(Job job) {
    pending_.fetch_add(1);
    if (!jobs_.push(std::move(job))) {
        pending_.fetch_sub(1);
        log_warning(name_.c_str()) << "Worker stopped, job dropped";
        return false;
    }
    return true;
}

void Worker::run_loop() {
    Job job;
    while (jobs_.pop(job)) {
        try {
            job();
        } catch (const std::exception& e) {
            log_error(name_.c_str()) << "Job failed: " << e.what();
        }
        job = nullptr;
        pending_.fetch_sub(1);
    }
}

} // namespace holdtalk
