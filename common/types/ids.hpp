#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace bluetray {

// Platform device identifier (BlueZ address, AA:BB:CC:DD:EE:FF)
class DeviceId {
public:
    DeviceId() = default;
    explicit DeviceId(std::string value) : value_(std::move(value)) {}

    const std::string& str() const { return value_; }
    bool empty() const { return value_.empty(); }

    friend bool operator==(const DeviceId&, const DeviceId&) = default;
    friend auto operator<=>(const DeviceId&, const DeviceId&) = default;

private:
    std::string value_;
};

// Id assigned to a tray menu entry by the menu model (dbusmenu int32 id)
class MenuItemId {
public:
    constexpr MenuItemId() = default;
    constexpr explicit MenuItemId(int32_t value) : value_(value) {}

    constexpr int32_t value() const { return value_; }

    friend constexpr bool operator==(MenuItemId, MenuItemId) = default;
    friend constexpr auto operator<=>(MenuItemId, MenuItemId) = default;

private:
    int32_t value_ = 0;
};

// dbusmenu reserves id 0 for the root node
constexpr MenuItemId ROOT_MENU_ITEM{0};

} // namespace bluetray

template <>
struct std::hash<bluetray::DeviceId> {
    size_t operator()(const bluetray::DeviceId& id) const noexcept {
        return std::hash<std::string>{}(id.str());
    }
};

template <>
struct std::hash<bluetray::MenuItemId> {
    size_t operator()(bluetray::MenuItemId id) const noexcept {
        return std::hash<int32_t>{}(id.value());
    }
};
