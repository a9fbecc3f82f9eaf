#pragma once

#include <types/device.hpp>
#include <types/errors.hpp>

#include <dbus/dbus.h>
#include <optional>
#include <string>
#include <vector>

namespace bluez {

constexpr const char* SERVICE_NAME = "org.bluez";
constexpr const char* ADAPTER_INTERFACE = "org.bluez.Adapter1";
constexpr const char* DEVICE_INTERFACE = "org.bluez.Device1";
constexpr const char* GATT_SERVICE_INTERFACE = "org.bluez.GattService1";

// Method call timeouts (ms)
constexpr int CALL_TIMEOUT_MS = 5000;
constexpr int CONNECT_TIMEOUT_MS = 20000;

// Device info, read from a single GetManagedObjects reply
struct DeviceInfo {
    std::string path;       // D-Bus object path
    std::string address;    // MAC address
    std::optional<std::string> name;
    bool paired = false;
    bool connected = false;
    bool services_resolved = false;
    bluetray::DeviceKind kind = bluetray::DeviceKind::Unknown;
};

// Get adapter path (usually /org/bluez/hci0)
std::optional<std::string> get_adapter_path(DBusConnection* conn);

// All devices BlueZ knows about, in object manager order
// Returns nullopt on failure with `error` filled in
std::optional<std::vector<DeviceInfo>> list_devices(DBusConnection* conn, std::string& error);

// Look up a device object by MAC address
std::optional<DeviceInfo> find_device(DBusConnection* conn, const std::string& mac_address);

// Object paths of GATT services exported under a device
std::vector<std::string> list_gatt_services(DBusConnection* conn, const std::string& device_path);

// Read a boolean property of org.bluez.Device1
std::optional<bool> get_device_bool(DBusConnection* conn, const std::string& device_path,
                                    const char* prop);

// Connect device via BlueZ; fills `error` on failure
bool connect_device(DBusConnection* conn, const std::string& device_path,
                    bluetray::ConnectError& error);

// Disconnect device
bool disconnect_device(DBusConnection* conn, const std::string& device_path);

// Trust device (BlueZ then keeps reconnecting it when it comes back in range)
bool trust_device(DBusConnection* conn, const std::string& device_path);

// Map a D-Bus error name/message from org.bluez to a connect failure kind
bluetray::ConnectErrorKind classify_error(const char* name, const char* message);

} // namespace bluez
