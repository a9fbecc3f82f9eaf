#pragma once

#include <types/device.hpp>
#include <types/ids.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace bluetray {

constexpr const char* APP_NAME = "Bluetooth Tray";
constexpr const char* APP_VERSION = "0.1.0";
constexpr const char* APP_COPYRIGHT = "Copyright bluetray";

enum class MenuAction {
    None,           // separators
    About,
    Device,
    DisconnectAll,
    Quit,
};

struct MenuEntry {
    MenuItemId id;
    MenuAction action = MenuAction::None;
    std::string label;
    DeviceId device;    // MenuAction::Device only

    bool is_separator() const { return action == MenuAction::None; }
};

// Tray menu layout and the MenuItemId -> DeviceId mapping. Built once from
// the discovery result and read-only afterwards.
//
// Layout: About, separator, one entry per device (platform order),
// separator, Disconnect all, Quit. Ids are assigned from 1 in layout order.
class MenuModel {
public:
    MenuModel() = default;

    static MenuModel build(const std::vector<DeviceDescriptor>& devices);

    const std::vector<MenuEntry>& entries() const { return entries_; }
    size_t device_count() const { return by_device_.size(); }

    const MenuEntry* find(MenuItemId id) const;
    std::optional<DeviceId> device_for(MenuItemId id) const;
    std::optional<MenuItemId> item_for(const DeviceId& device) const;

    // Display name of a device in the menu, or its id if not listed
    std::string label_for(const DeviceId& device) const;

    MenuItemId about_item() const { return about_; }
    MenuItemId disconnect_all_item() const { return disconnect_all_; }
    MenuItemId quit_item() const { return quit_; }

private:
    MenuItemId append(MenuAction action, std::string label, DeviceId device = {});

    std::vector<MenuEntry> entries_;
    std::unordered_map<MenuItemId, size_t> by_id_;
    std::unordered_map<DeviceId, MenuItemId> by_device_;
    MenuItemId about_;
    MenuItemId disconnect_all_;
    MenuItemId quit_;
};

} // namespace bluetray
