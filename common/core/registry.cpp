#include "registry.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace bluetray {

ConnectionRegistry::ConnectionRegistry(Transport& transport)
    : transport_(transport) {}

ConnectionRegistry::~ConnectionRegistry() {
    disconnect_all();
}

ConnectResult ConnectionRegistry::connect(const DeviceId& id) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        in_flight_cv_.wait(lock, [&] { return !in_flight_.contains(id); });

        if (links_.contains(id)) {
            return {std::nullopt, true};
        }
        in_flight_.insert(id);
    }

    ConnectError err;
    std::unique_ptr<Link> link;
    try {
        link = transport_.open(id, err);
    } catch (const std::exception& e) {
        std::cerr << "registry: connect to " << id.str() << " threw: " << e.what() << std::endl;
        err = {ConnectErrorKind::Transport, e.what()};
    } catch (...) {
        // Drop the reservation so waiters are not stuck, then let it propagate
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_.erase(id);
        in_flight_cv_.notify_all();
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(id);
    in_flight_cv_.notify_all();

    if (!link || !link->is_open()) {
        if (link) {
            // Transport returned a dead link without reporting why
            err = {ConnectErrorKind::Transport, "link closed during connect"};
        }
        return {std::move(err), false};
    }

    links_.emplace(id, std::move(link));
    std::cout << "registry: " << id.str() << " connected (" << links_.size()
              << " active)" << std::endl;
    return {};
}

bool ConnectionRegistry::disconnect(const DeviceId& id) {
    std::unique_ptr<Link> link;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = links_.find(id);
        if (it == links_.end()) {
            return false;
        }
        link = std::move(it->second);
        links_.erase(it);
    }

    // Release outside the lock; a GATT disconnect is a bus round-trip
    link->close();
    std::cout << "registry: " << id.str() << " disconnected" << std::endl;
    return true;
}

size_t ConnectionRegistry::disconnect_all() {
    std::unordered_map<DeviceId, std::unique_ptr<Link>> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released.swap(links_);
    }

    for (auto& [id, link] : released) {
        link->close();
        std::cout << "registry: " << id.str() << " disconnected" << std::endl;
    }
    return released.size();
}

bool ConnectionRegistry::is_connected(const DeviceId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return links_.contains(id);
}

size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return links_.size();
}

std::vector<DeviceId> ConnectionRegistry::connected_ids() const {
    std::vector<DeviceId> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ids.reserve(links_.size());
        for (const auto& [id, link] : links_) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace bluetray
