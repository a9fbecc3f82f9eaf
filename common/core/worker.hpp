#pragma once

#include "directory.hpp"
#include "registry.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

namespace bluetray {

enum class RequestKind {
    Connect,
    DisconnectAll,
};

// Result of a finished registry request, handed back to the UI thread
struct Completion {
    RequestKind kind = RequestKind::Connect;
    DeviceId device;             // empty for DisconnectAll
    ConnectResult connect{};     // Connect only
    size_t released = 0;         // DisconnectAll
};

// Single thread that runs blocking registry and discovery calls so the
// thread servicing the tray never waits on Bluetooth I/O.
//
// Every request returns a future. Registry requests also queue a
// Completion and make get_fd() readable, for poll()-driven callers.
// Requests still queued when stop() is called are run before the thread
// exits; requests submitted after stop() are dropped.
class ConnectionWorker {
public:
    explicit ConnectionWorker(ConnectionRegistry& registry);
    ~ConnectionWorker();

    ConnectionWorker(const ConnectionWorker&) = delete;
    ConnectionWorker& operator=(const ConnectionWorker&) = delete;

    void start();
    void stop();
    bool is_running() const { return running_; }

    std::future<ConnectResult> submit_connect(const DeviceId& id);
    std::future<size_t> submit_disconnect_all();
    std::future<std::vector<DeviceDescriptor>> submit_discovery(DeviceSource& source,
                                                                UnnamedDevicePolicy policy);

    // eventfd that becomes readable when completions are pending
    int get_fd() const { return event_fd_; }

    // Drain finished requests in completion order, resets get_fd()
    std::vector<Completion> take_completions();

    // Block until the queue is empty and no request is running
    void wait_idle();

private:
    void run();
    void post(std::function<void()> job);
    void complete(Completion completion);

    ConnectionRegistry& registry_;
    int event_fd_ = -1;

    std::thread thread_;
    std::atomic<bool> running_{false};

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<std::function<void()>> queue_;
    bool busy_ = false;
    bool accepting_ = false;

    std::mutex completion_mutex_;
    std::vector<Completion> completions_;
};

} // namespace bluetray
