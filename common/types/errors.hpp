#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace bluetray {

enum class DiscoveryErrorKind {
    NoBus,        // system bus or BlueZ not reachable
    QueryFailed,  // object enumeration failed
    NameMissing,  // a paired device has no display name (fail policy)
};

inline std::string_view to_string(DiscoveryErrorKind kind) {
    switch (kind) {
        case DiscoveryErrorKind::NoBus: return "no_bus";
        case DiscoveryErrorKind::QueryFailed: return "query_failed";
        case DiscoveryErrorKind::NameMissing: return "name_missing";
    }
    return "unknown";
}

struct DiscoveryError {
    DiscoveryErrorKind kind = DiscoveryErrorKind::QueryFailed;
    std::string reason;
};

enum class ConnectErrorKind {
    UnknownDevice,     // id does not resolve to a device object
    Unreachable,       // device did not answer
    NoServices,        // no RFCOMM record / no GATT service
    PermissionDenied,
    Timeout,
    Transport,         // any other socket or bus failure
};

inline std::string_view to_string(ConnectErrorKind kind) {
    switch (kind) {
        case ConnectErrorKind::UnknownDevice: return "unknown_device";
        case ConnectErrorKind::Unreachable: return "unreachable";
        case ConnectErrorKind::NoServices: return "no_services";
        case ConnectErrorKind::PermissionDenied: return "permission_denied";
        case ConnectErrorKind::Timeout: return "timeout";
        case ConnectErrorKind::Transport: return "transport";
    }
    return "unknown";
}

struct ConnectError {
    ConnectErrorKind kind = ConnectErrorKind::Transport;
    std::string reason;
};

// Outcome of ConnectionRegistry::connect
struct ConnectResult {
    std::optional<ConnectError> error;
    bool already_connected = false;

    bool ok() const { return !error.has_value(); }
};

} // namespace bluetray
