#include "backend.hpp"
#include "bluez.hpp"

#include <iostream>

namespace bluez {

Backend::Backend(DBusConnection* conn)
    : conn_(conn) {
    if (conn_) dbus_connection_ref(conn_);
}

Backend::~Backend() {
    if (conn_) dbus_connection_unref(conn_);
}

std::optional<std::vector<bluetray::PairedDevice>> Backend::query_paired(
    bluetray::DiscoveryError& error) {
    if (!conn_) {
        error = {bluetray::DiscoveryErrorKind::NoBus, "not connected to the system bus"};
        return std::nullopt;
    }

    if (!get_adapter_path(conn_)) {
        error = {bluetray::DiscoveryErrorKind::QueryFailed, "no Bluetooth adapter found"};
        return std::nullopt;
    }

    std::string reason;
    auto devices = list_devices(conn_, reason);
    if (!devices) {
        error = {bluetray::DiscoveryErrorKind::QueryFailed, reason};
        return std::nullopt;
    }

    std::vector<bluetray::PairedDevice> result;
    for (auto& dev : *devices) {
        if (!dev.paired) continue;
        result.push_back({bluetray::DeviceId(dev.address), std::move(dev.name), dev.kind});
    }
    return result;
}

std::unique_ptr<bluetray::Link> Backend::open(const bluetray::DeviceId& id,
                                              bluetray::ConnectError& error) {
    if (!conn_) {
        error = {bluetray::ConnectErrorKind::Transport, "not connected to the system bus"};
        return nullptr;
    }

    auto device = find_device(conn_, id.str());
    if (!device) {
        error = {bluetray::ConnectErrorKind::UnknownDevice, "no such device " + id.str()};
        return nullptr;
    }

    std::cout << "bluez: opening " << to_string(device->kind) << " link to "
              << id.str() << std::endl;

    if (device->kind == bluetray::DeviceKind::Classic) {
        rfcomm::Connection conn = rfcomm::connect(device->address, error);
        if (!conn.is_open()) return nullptr;
        return std::make_unique<RfcommLink>(std::move(conn));
    }

    gatt::Session session = gatt::open(conn_, device->path, device->address, error);
    if (!session.is_open()) return nullptr;
    return std::make_unique<GattLink>(std::move(session));
}

} // namespace bluez
