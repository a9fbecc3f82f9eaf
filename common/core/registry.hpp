#pragma once

#include "transport.hpp"

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace bluetray {

// Owns one Link per connected device. All members are thread-safe.
//
// connect() checks for an existing entry and reserves the id atomically,
// so at most one platform connect per device is in flight. A second caller
// for the same id waits for the first attempt and then re-checks. The
// platform call itself runs without the lock held.
class ConnectionRegistry {
public:
    explicit ConnectionRegistry(Transport& transport);
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    ConnectResult connect(const DeviceId& id);

    // Returns true if a connection was torn down
    bool disconnect(const DeviceId& id);

    // Releases every entry, returns how many were released
    size_t disconnect_all();

    bool is_connected(const DeviceId& id) const;
    size_t size() const;

    // Sorted snapshot of connected ids
    std::vector<DeviceId> connected_ids() const;

private:
    Transport& transport_;

    mutable std::mutex mutex_;
    std::condition_variable in_flight_cv_;
    std::unordered_map<DeviceId, std::unique_ptr<Link>> links_;
    std::unordered_set<DeviceId> in_flight_;
};

} // namespace bluetray
