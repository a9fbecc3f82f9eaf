#pragma once

#include <core/dispatcher.hpp>
#include <core/menu.hpp>

#include <dbus/dbus.h>
#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace tray {

// StatusNotifierItem (KDE/freedesktop tray) and com.canonical.dbusmenu
constexpr const char* ITEM_PATH = "/StatusNotifierItem";
constexpr const char* ITEM_INTERFACE = "org.kde.StatusNotifierItem";
constexpr const char* MENU_PATH = "/MenuBar";
constexpr const char* MENU_INTERFACE = "com.canonical.dbusmenu";
constexpr const char* WATCHER_SERVICE = "org.kde.StatusNotifierWatcher";
constexpr const char* WATCHER_PATH = "/StatusNotifierWatcher";
constexpr const char* WATCHER_INTERFACE = "org.kde.StatusNotifierWatcher";

constexpr const char* ICON_NAME = "bluetooth";
constexpr int ICON_SIZE = 16;
constexpr uint32_t DBUSMENU_VERSION = 3;

// Events forwarded into the core
struct Callbacks {
    std::function<void(const bluetray::TrayEvent&)> on_tray_event;
    std::function<void(bluetray::MenuItemId)> on_menu_selected;
};

// One entry of a dbusmenu EventGroup call
struct MenuEvent {
    int32_t id;
    std::string event_id;
};

// Read the a(isvu) argument of EventGroup. Entries whose id is not an int32 or
// whose event id is not a string are skipped. False if there is no array.
bool read_event_group(DBusMessage* msg, std::vector<MenuEvent>& events);

// Tray service state. Owned by the caller; passed to libdbus as user data.
struct Service {
    DBusConnection* conn = nullptr;
    std::string bus_name;               // org.kde.StatusNotifierItem-<pid>-1
    const bluetray::MenuModel* menu = nullptr;
    Callbacks callbacks;
    std::set<bluetray::DeviceId> connected;
    uint32_t revision = 1;              // dbusmenu layout revision
};

// Connect to the session bus, export the item and menu objects, take the
// bus name and register with the watcher. `service->menu` must be set.
bool init(Service* service);

// Update checkmarks and tooltip, emit LayoutUpdated / NewToolTip
void set_connected(Service* service, const std::vector<bluetray::DeviceId>& ids);

// Process pending D-Bus messages (call in event loop)
void process_pending(Service* service);

// Get file descriptor for polling
int get_fd(const Service* service);

// Cleanup
void cleanup(Service* service);

// Tray icon as ARGB32 in network byte order, size x size pixels
std::vector<uint8_t> icon_pixmap(int size);

} // namespace tray
