#include "worker.hpp"

#include <sys/eventfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <memory>

namespace bluetray {

ConnectionWorker::ConnectionWorker(ConnectionRegistry& registry)
    : registry_(registry) {
    event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (event_fd_ < 0) {
        std::cerr << "worker: eventfd failed: " << strerror(errno) << std::endl;
    }
}

ConnectionWorker::~ConnectionWorker() {
    stop();
    if (event_fd_ >= 0) {
        ::close(event_fd_);
    }
}

void ConnectionWorker::start() {
    if (running_) return;

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        accepting_ = true;
    }
    running_ = true;
    thread_ = std::thread(&ConnectionWorker::run, this);
}

void ConnectionWorker::stop() {
    if (!running_) return;

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        accepting_ = false;
        queue_cv_.notify_all();
    }

    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
}

void ConnectionWorker::run() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !queue_.empty() || !accepting_; });

            if (queue_.empty()) {
                break;  // stopped and drained
            }
            job = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        job();

        std::lock_guard<std::mutex> lock(queue_mutex_);
        busy_ = false;
        if (queue_.empty()) {
            idle_cv_.notify_all();
        }
    }

    std::lock_guard<std::mutex> lock(queue_mutex_);
    idle_cv_.notify_all();
}

// A dropped job destroys its task unrun; its future reports broken_promise
void ConnectionWorker::post(std::function<void()> job) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!accepting_) {
        std::cerr << "worker: not running, request dropped" << std::endl;
        return;
    }
    queue_.push_back(std::move(job));
    queue_cv_.notify_one();
}

void ConnectionWorker::complete(Completion completion) {
    {
        std::lock_guard<std::mutex> lock(completion_mutex_);
        completions_.push_back(std::move(completion));
    }

    if (event_fd_ >= 0) {
        uint64_t one = 1;
        if (::write(event_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
            std::cerr << "worker: eventfd write failed: " << strerror(errno) << std::endl;
        }
    }
}

std::vector<Completion> ConnectionWorker::take_completions() {
    if (event_fd_ >= 0) {
        uint64_t count = 0;
        // EAGAIN just means nothing was signalled
        if (::read(event_fd_, &count, sizeof(count)) < 0 && errno != EAGAIN) {
            std::cerr << "worker: eventfd read failed: " << strerror(errno) << std::endl;
        }
    }

    std::lock_guard<std::mutex> lock(completion_mutex_);
    std::vector<Completion> result;
    result.swap(completions_);
    return result;
}

void ConnectionWorker::wait_idle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return (queue_.empty() && !busy_) || !running_; });
}

std::future<ConnectResult> ConnectionWorker::submit_connect(const DeviceId& id) {
    auto task = std::make_shared<std::packaged_task<ConnectResult()>>([this, id] {
        ConnectResult result = registry_.connect(id);
        complete({RequestKind::Connect, id, result, 0});
        return result;
    });
    auto future = task->get_future();
    post([task] { (*task)(); });
    return future;
}

std::future<size_t> ConnectionWorker::submit_disconnect_all() {
    auto task = std::make_shared<std::packaged_task<size_t()>>([this] {
        size_t released = registry_.disconnect_all();
        complete({RequestKind::DisconnectAll, {}, {}, released});
        return released;
    });
    auto future = task->get_future();
    post([task] { (*task)(); });
    return future;
}

std::future<std::vector<DeviceDescriptor>> ConnectionWorker::submit_discovery(
    DeviceSource& source, UnnamedDevicePolicy policy) {
    auto task = std::make_shared<std::packaged_task<std::vector<DeviceDescriptor>()>>(
        [&source, policy] { return load_devices(source, policy); });
    auto future = task->get_future();
    post([task] { (*task)(); });
    return future;
}

} // namespace bluetray
