#include "menu.hpp"

namespace bluetray {

MenuModel MenuModel::build(const std::vector<DeviceDescriptor>& devices) {
    MenuModel menu;

    menu.about_ = menu.append(MenuAction::About, std::string("About ") + APP_NAME);
    menu.append(MenuAction::None, {});

    for (const auto& dev : devices) {
        // A device listed twice by the platform keeps its first entry
        if (menu.by_device_.contains(dev.id)) continue;
        MenuItemId id = menu.append(MenuAction::Device, dev.name, dev.id);
        menu.by_device_.emplace(dev.id, id);
    }

    menu.append(MenuAction::None, {});
    menu.disconnect_all_ = menu.append(MenuAction::DisconnectAll, "Disconnect all");
    menu.quit_ = menu.append(MenuAction::Quit, "Quit");
    return menu;
}

MenuItemId MenuModel::append(MenuAction action, std::string label, DeviceId device) {
    MenuItemId id(static_cast<int32_t>(entries_.size()) + 1);
    by_id_.emplace(id, entries_.size());
    entries_.push_back({id, action, std::move(label), std::move(device)});
    return id;
}

const MenuEntry* MenuModel::find(MenuItemId id) const {
    auto it = by_id_.find(id);
    return it != by_id_.end() ? &entries_[it->second] : nullptr;
}

std::optional<DeviceId> MenuModel::device_for(MenuItemId id) const {
    const MenuEntry* entry = find(id);
    if (!entry || entry->action != MenuAction::Device) {
        return std::nullopt;
    }
    return entry->device;
}

std::optional<MenuItemId> MenuModel::item_for(const DeviceId& device) const {
    auto it = by_device_.find(device);
    if (it == by_device_.end()) return std::nullopt;
    return it->second;
}

std::string MenuModel::label_for(const DeviceId& device) const {
    if (auto item = item_for(device)) {
        return find(*item)->label;
    }
    return device.str();
}

} // namespace bluetray
