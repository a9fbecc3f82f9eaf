#pragma once

#include "gatt.hpp"
#include "rfcomm.hpp"

#include <core/transport.hpp>

#include <dbus/dbus.h>

namespace bluez {

// RFCOMM stream socket held as a registry link
class RfcommLink : public bluetray::Link {
public:
    explicit RfcommLink(rfcomm::Connection conn) : conn_(std::move(conn)) {}

    bool is_open() const override { return conn_.is_open(); }
    void close() override { conn_.close(); }

private:
    rfcomm::Connection conn_;
};

// BlueZ GATT session held as a registry link
class GattLink : public bluetray::Link {
public:
    explicit GattLink(gatt::Session session) : session_(std::move(session)) {}

    bool is_open() const override { return session_.is_open(); }
    void close() override { session_.close(); }

private:
    gatt::Session session_;
};

// Paired-device queries and the connect sequence over the system bus
class Backend : public bluetray::Transport, public bluetray::DeviceSource {
public:
    // Takes a reference on `conn`
    explicit Backend(DBusConnection* conn);
    ~Backend() override;

    Backend(const Backend&) = delete;
    Backend& operator=(const Backend&) = delete;

    std::optional<std::vector<bluetray::PairedDevice>> query_paired(
        bluetray::DiscoveryError& error) override;

    std::unique_ptr<bluetray::Link> open(const bluetray::DeviceId& id,
                                         bluetray::ConnectError& error) override;

private:
    DBusConnection* conn_;
};

} // namespace bluez
