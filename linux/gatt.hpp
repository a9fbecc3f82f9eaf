#pragma once

#include <types/errors.hpp>

#include <dbus/dbus.h>
#include <cstddef>
#include <optional>
#include <string>

namespace gatt {

// How long to wait for BlueZ to resolve GATT services after Connect
constexpr int SERVICES_RESOLVED_TIMEOUT_MS = 10000;
constexpr int SERVICES_RESOLVED_POLL_MS = 100;

// Progress of BlueZ service discovery after Connect
enum class ResolveState {
    Pending,
    Resolved,
    Dropped,    // link went down before services resolved
    TimedOut,
};

// One poll step from the ServicesResolved and Connected properties
ResolveState resolve_state(std::optional<bool> services_resolved, std::optional<bool> connected);

// Error for a discovery that ended in Dropped or TimedOut
bluetray::ConnectError resolve_error(ResolveState state);

// Low-energy session held through BlueZ. Closing it disconnects the device.
struct Session {
    DBusConnection* conn = nullptr;   // referenced while open
    std::string device_path;
    std::string address;

    bool is_open() const { return conn != nullptr; }
    void close();

    // Move-only
    Session() = default;
    Session(DBusConnection* conn, std::string path, std::string addr);
    Session(Session&& other) noexcept;
    Session& operator=(Session&& other) noexcept;
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
};

// Connect the device, mark it trusted so BlueZ keeps the link across range
// loss, wait for ServicesResolved and list the GATT services to confirm the
// device answers. Returns a closed session with `error` filled in on failure.
Session open(DBusConnection* conn, const std::string& device_path,
             const std::string& address, bluetray::ConnectError& error);

} // namespace gatt
