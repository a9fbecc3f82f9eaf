// tests/fakes.hpp
#pragma once

#include <core/transport.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <new>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace bluetray {
namespace testing {

class FakeLink : public Link {
public:
    FakeLink(std::atomic<int>* closes, bool open = true)
        : closes_(closes), open_(open) {}
    ~FakeLink() override { close(); }

    bool is_open() const override { return open_; }
    void close() override {
        if (open_) {
            open_ = false;
            ++*closes_;
        }
    }

private:
    std::atomic<int>* closes_;
    bool open_;
};

// Counts open() calls per device; devices marked with fail() refuse
class FakeTransport : public Transport {
public:
    std::unique_ptr<Link> open(const DeviceId& id, ConnectError& error) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++opens_[id];
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (throw_next.exchange(false)) {
            throw std::bad_alloc();
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = failures_.find(id);
        if (it != failures_.end()) {
            error = it->second;
            return nullptr;
        }
        return std::make_unique<FakeLink>(&closes, !return_closed);
    }

    void fail(const DeviceId& id, ConnectError error) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[id] = std::move(error);
    }

    int open_calls(const DeviceId& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = opens_.find(id);
        return it != opens_.end() ? it->second : 0;
    }

    int total_open_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        int total = 0;
        for (const auto& [id, count] : opens_) total += count;
        return total;
    }

    std::atomic<int> closes{0};
    std::chrono::milliseconds delay{0};
    std::atomic<bool> throw_next{false};   // next open() throws std::bad_alloc
    bool return_closed = false;

private:
    mutable std::mutex mutex_;
    std::map<DeviceId, int> opens_;
    std::map<DeviceId, ConnectError> failures_;
};

class FakeDeviceSource : public DeviceSource {
public:
    std::optional<std::vector<PairedDevice>> query_paired(DiscoveryError& error) override {
        ++calls;
        if (failure) {
            error = *failure;
            return std::nullopt;
        }
        return devices;
    }

    std::vector<PairedDevice> devices;
    std::optional<DiscoveryError> failure;
    int calls = 0;
};

inline PairedDevice paired(const char* id, std::optional<std::string> name,
                           DeviceKind kind = DeviceKind::Classic) {
    return {DeviceId(id), std::move(name), kind};
}

} // namespace testing
} // namespace bluetray
