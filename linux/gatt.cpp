#include "gatt.hpp"
#include "bluez.hpp"

#include <unistd.h>

#include <iostream>

namespace gatt {

Session::Session(DBusConnection* conn, std::string path, std::string addr)
    : conn(conn), device_path(std::move(path)), address(std::move(addr)) {
    if (conn) dbus_connection_ref(conn);
}

Session::Session(Session&& other) noexcept
    : conn(other.conn), device_path(std::move(other.device_path)),
      address(std::move(other.address)) {
    other.conn = nullptr;
}

Session& Session::operator=(Session&& other) noexcept {
    if (this != &other) {
        close();
        conn = other.conn;
        device_path = std::move(other.device_path);
        address = std::move(other.address);
        other.conn = nullptr;
    }
    return *this;
}

Session::~Session() {
    close();
}

void Session::close() {
    if (!conn) return;

    if (bluez::disconnect_device(conn, device_path)) {
        std::cout << "gatt: session to " << address << " closed" << std::endl;
    }
    dbus_connection_unref(conn);
    conn = nullptr;
}

ResolveState resolve_state(std::optional<bool> services_resolved, std::optional<bool> connected) {
    if (services_resolved && *services_resolved) {
        return ResolveState::Resolved;
    }
    if (connected && !*connected) {
        return ResolveState::Dropped;
    }
    return ResolveState::Pending;
}

bluetray::ConnectError resolve_error(ResolveState state) {
    if (state == ResolveState::Dropped) {
        return {bluetray::ConnectErrorKind::Unreachable,
                "device disconnected while resolving services"};
    }
    return {bluetray::ConnectErrorKind::Timeout, "GATT services not resolved"};
}

// Poll ServicesResolved; BlueZ sets it once service discovery finished
static ResolveState wait_services_resolved(DBusConnection* conn, const std::string& device_path) {
    for (int waited = 0; waited < SERVICES_RESOLVED_TIMEOUT_MS;
         waited += SERVICES_RESOLVED_POLL_MS) {
        auto state = resolve_state(
            bluez::get_device_bool(conn, device_path, "ServicesResolved"),
            bluez::get_device_bool(conn, device_path, "Connected"));
        if (state != ResolveState::Pending) {
            return state;
        }
        usleep(SERVICES_RESOLVED_POLL_MS * 1000);
    }
    return ResolveState::TimedOut;
}

// Undo Connect after a failed open
static void abandon(DBusConnection* conn, const std::string& device_path,
                    const std::string& address) {
    if (!bluez::disconnect_device(conn, device_path)) {
        std::cerr << "gatt: " << address << " left connected" << std::endl;
    }
}

Session open(DBusConnection* conn, const std::string& device_path,
             const std::string& address, bluetray::ConnectError& error) {
    std::cout << "gatt: connecting to " << address << "..." << std::endl;

    if (!bluez::connect_device(conn, device_path, error)) {
        return {};
    }

    if (!bluez::trust_device(conn, device_path)) {
        // Session still works, it just won't come back by itself
        std::cerr << "gatt: could not mark " << address << " trusted" << std::endl;
    }

    ResolveState state = wait_services_resolved(conn, device_path);
    if (state != ResolveState::Resolved) {
        error = resolve_error(state);
        abandon(conn, device_path, address);
        return {};
    }

    auto services = bluez::list_gatt_services(conn, device_path);
    if (services.empty()) {
        error = {bluetray::ConnectErrorKind::NoServices, "device exposes no GATT services"};
        abandon(conn, device_path, address);
        return {};
    }

    std::cout << "gatt: " << address << " ready, " << services.size() << " service(s)"
              << std::endl;
    return Session(conn, device_path, address);
}

} // namespace gatt
