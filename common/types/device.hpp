#pragma once

#include "ids.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace bluetray {

enum class DeviceKind {
    Unknown,
    Classic,    // BR/EDR, connected over an RFCOMM stream socket
    LowEnergy,  // LE, connected as a GATT session
};

inline std::string_view to_string(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::Unknown: return "unknown";
        case DeviceKind::Classic: return "classic";
        case DeviceKind::LowEnergy: return "le";
    }
    return "unknown";
}

// Raw record reported by the platform for one paired device
struct PairedDevice {
    DeviceId id;
    std::optional<std::string> name;
    DeviceKind kind = DeviceKind::Unknown;
};

// What the menu shows for one device. Never mutated after discovery.
struct DeviceDescriptor {
    DeviceId id;
    std::string name;

    friend bool operator==(const DeviceDescriptor&, const DeviceDescriptor&) = default;
};

} // namespace bluetray
