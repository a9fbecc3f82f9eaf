#include "bluez.hpp"
#include <strings.h>
#include <cstring>
#include <iostream>

namespace bluez {

// Helper to send a method call and wait for the reply.
// Returns the reply (caller unrefs) or nullptr with `err` set.
static DBusMessage* call(DBusConnection* conn, DBusMessage* msg, int timeout_ms, DBusError* err) {
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, timeout_ms, err);
    dbus_message_unref(msg);
    return reply;
}

static DBusMessage* get_managed_objects(DBusConnection* conn, std::string* error) {
    DBusMessage* msg = dbus_message_new_method_call(SERVICE_NAME, "/",
        "org.freedesktop.DBus.ObjectManager", "GetManagedObjects");
    if (!msg) {
        if (error) *error = "out of memory";
        return nullptr;
    }

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = call(conn, msg, CALL_TIMEOUT_MS, &err);

    if (dbus_error_is_set(&err)) {
        std::cerr << "bluez: GetManagedObjects failed: " << err.message << std::endl;
        if (error) *error = err.message;
        dbus_error_free(&err);
        return nullptr;
    }
    return reply;
}

bluetray::ConnectErrorKind classify_error(const char* name, const char* message) {
    using bluetray::ConnectErrorKind;

    if (!name) return ConnectErrorKind::Transport;
    if (strcmp(name, "org.bluez.Error.DoesNotExist") == 0 ||
        strcmp(name, DBUS_ERROR_UNKNOWN_OBJECT) == 0 ||
        strcmp(name, DBUS_ERROR_UNKNOWN_METHOD) == 0) {
        return ConnectErrorKind::UnknownDevice;
    }
    if (strcmp(name, "org.bluez.Error.NotAuthorized") == 0 ||
        strcmp(name, "org.bluez.Error.AuthenticationFailed") == 0 ||
        strcmp(name, DBUS_ERROR_ACCESS_DENIED) == 0) {
        return ConnectErrorKind::PermissionDenied;
    }
    if (strcmp(name, DBUS_ERROR_NO_REPLY) == 0 ||
        strcmp(name, DBUS_ERROR_TIMEOUT) == 0 ||
        strcmp(name, "org.bluez.Error.AuthenticationTimeout") == 0) {
        return ConnectErrorKind::Timeout;
    }
    if (strcmp(name, "org.bluez.Error.NotAvailable") == 0 ||
        strcmp(name, "org.bluez.Error.NotReady") == 0 ||
        strcmp(name, "org.bluez.Error.Failed") == 0) {
        // "Host is down", "Page Timeout", "br-connection-page-timeout" ...
        if (message && (strstr(message, "imeout") || strstr(message, "timed out"))) {
            return ConnectErrorKind::Timeout;
        }
        return ConnectErrorKind::Unreachable;
    }
    return ConnectErrorKind::Transport;
}

// Fill `info` from the a{sv} properties of org.bluez.Device1
static void parse_device_properties(DBusMessageIter* props, DeviceInfo* info) {
    bool has_class = false;
    std::optional<std::string> alias;

    while (dbus_message_iter_get_arg_type(props) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter prop_entry, variant;
        dbus_message_iter_recurse(props, &prop_entry);

        const char* prop_name;
        dbus_message_iter_get_basic(&prop_entry, &prop_name);
        dbus_message_iter_next(&prop_entry);

        if (dbus_message_iter_get_arg_type(&prop_entry) == DBUS_TYPE_VARIANT) {
            dbus_message_iter_recurse(&prop_entry, &variant);
            int type = dbus_message_iter_get_arg_type(&variant);

            if (type == DBUS_TYPE_STRING) {
                const char* val;
                dbus_message_iter_get_basic(&variant, &val);
                if (strcmp(prop_name, "Address") == 0) {
                    info->address = val;
                } else if (strcmp(prop_name, "Name") == 0) {
                    info->name = val;
                } else if (strcmp(prop_name, "Alias") == 0) {
                    alias = val;
                }
            } else if (type == DBUS_TYPE_BOOLEAN) {
                dbus_bool_t val;
                dbus_message_iter_get_basic(&variant, &val);
                if (strcmp(prop_name, "Paired") == 0) {
                    info->paired = val;
                } else if (strcmp(prop_name, "Connected") == 0) {
                    info->connected = val;
                } else if (strcmp(prop_name, "ServicesResolved") == 0) {
                    info->services_resolved = val;
                }
            } else if (type == DBUS_TYPE_UINT32 && strcmp(prop_name, "Class") == 0) {
                has_class = true;
            }
        }
        dbus_message_iter_next(props);
    }

    // A user-set alias wins, but BlueZ also fills Alias from the address
    // when the device never sent a name; that case stays unnamed.
    if (info->name && alias && !alias->empty()) {
        info->name = alias;
    }

    // Only BR/EDR devices carry a Class of Device
    info->kind = has_class ? bluetray::DeviceKind::Classic : bluetray::DeviceKind::LowEnergy;
}

// Walk a GetManagedObjects reply, calling fn(path, iface_name, props_iter)
// for every interface of every object
template <typename Fn>
static void for_each_interface(DBusMessage* reply, Fn&& fn) {
    DBusMessageIter iter, dict;
    if (!dbus_message_iter_init(reply, &iter) ||
        dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) {
        return;
    }

    dbus_message_iter_recurse(&iter, &dict);

    while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter entry, ifaces;
        dbus_message_iter_recurse(&dict, &entry);

        const char* obj_path;
        dbus_message_iter_get_basic(&entry, &obj_path);
        dbus_message_iter_next(&entry);

        if (dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_ARRAY) {
            dbus_message_iter_recurse(&entry, &ifaces);

            while (dbus_message_iter_get_arg_type(&ifaces) == DBUS_TYPE_DICT_ENTRY) {
                DBusMessageIter iface_entry, props;
                dbus_message_iter_recurse(&ifaces, &iface_entry);

                const char* iface_name;
                dbus_message_iter_get_basic(&iface_entry, &iface_name);
                dbus_message_iter_next(&iface_entry);

                if (dbus_message_iter_get_arg_type(&iface_entry) == DBUS_TYPE_ARRAY) {
                    dbus_message_iter_recurse(&iface_entry, &props);
                    fn(obj_path, iface_name, &props);
                }
                dbus_message_iter_next(&ifaces);
            }
        }
        dbus_message_iter_next(&dict);
    }
}

std::optional<std::string> get_adapter_path(DBusConnection* conn) {
    DBusMessage* reply = get_managed_objects(conn, nullptr);
    if (!reply) return std::nullopt;

    std::optional<std::string> result;
    for_each_interface(reply, [&](const char* path, const char* iface, DBusMessageIter*) {
        if (!result && strcmp(iface, ADAPTER_INTERFACE) == 0) {
            result = path;
        }
    });

    dbus_message_unref(reply);
    return result;
}

std::optional<std::vector<DeviceInfo>> list_devices(DBusConnection* conn, std::string& error) {
    DBusMessage* reply = get_managed_objects(conn, &error);
    if (!reply) return std::nullopt;

    std::vector<DeviceInfo> result;
    for_each_interface(reply, [&](const char* path, const char* iface, DBusMessageIter* props) {
        if (strcmp(iface, DEVICE_INTERFACE) != 0) return;

        DeviceInfo info;
        info.path = path;
        parse_device_properties(props, &info);
        if (!info.address.empty()) {
            result.push_back(std::move(info));
        }
    });

    dbus_message_unref(reply);
    return result;
}

std::optional<DeviceInfo> find_device(DBusConnection* conn, const std::string& mac_address) {
    std::string error;
    auto devices = list_devices(conn, error);
    if (!devices) return std::nullopt;

    for (auto& dev : *devices) {
        if (strcasecmp(dev.address.c_str(), mac_address.c_str()) == 0) {
            return std::move(dev);
        }
    }
    return std::nullopt;
}

std::vector<std::string> list_gatt_services(DBusConnection* conn, const std::string& device_path) {
    std::vector<std::string> result;

    DBusMessage* reply = get_managed_objects(conn, nullptr);
    if (!reply) return result;

    std::string prefix = device_path + "/";
    for_each_interface(reply, [&](const char* path, const char* iface, DBusMessageIter*) {
        if (strcmp(iface, GATT_SERVICE_INTERFACE) == 0 &&
            strncmp(path, prefix.c_str(), prefix.size()) == 0) {
            result.emplace_back(path);
        }
    });

    dbus_message_unref(reply);
    return result;
}

std::optional<bool> get_device_bool(DBusConnection* conn, const std::string& device_path,
                                    const char* prop) {
    DBusMessage* msg = dbus_message_new_method_call(SERVICE_NAME, device_path.c_str(),
        "org.freedesktop.DBus.Properties", "Get");
    if (!msg) return std::nullopt;

    const char* iface = DEVICE_INTERFACE;
    dbus_message_append_args(msg, DBUS_TYPE_STRING, &iface,
                             DBUS_TYPE_STRING, &prop, DBUS_TYPE_INVALID);

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = call(conn, msg, CALL_TIMEOUT_MS, &err);

    if (dbus_error_is_set(&err)) {
        dbus_error_free(&err);
        return std::nullopt;
    }

    std::optional<bool> result;
    if (reply) {
        DBusMessageIter iter, variant;
        if (dbus_message_iter_init(reply, &iter) &&
            dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_VARIANT) {
            dbus_message_iter_recurse(&iter, &variant);
            if (dbus_message_iter_get_arg_type(&variant) == DBUS_TYPE_BOOLEAN) {
                dbus_bool_t val;
                dbus_message_iter_get_basic(&variant, &val);
                result = val;
            }
        }
        dbus_message_unref(reply);
    }
    return result;
}

bool connect_device(DBusConnection* conn, const std::string& device_path,
                    bluetray::ConnectError& error) {
    DBusMessage* msg = dbus_message_new_method_call(SERVICE_NAME, device_path.c_str(),
        DEVICE_INTERFACE, "Connect");
    if (!msg) {
        error = {bluetray::ConnectErrorKind::Transport, "out of memory"};
        return false;
    }

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = call(conn, msg, CONNECT_TIMEOUT_MS, &err);

    if (dbus_error_is_set(&err)) {
        // "Already Connected" is OK
        if (strcmp(err.name, "org.bluez.Error.AlreadyConnected") == 0 ||
            strstr(err.message, "Already") || strstr(err.message, "already")) {
            dbus_error_free(&err);
            return true;
        }
        std::cerr << "bluez: Connect failed: " << err.message << std::endl;
        error = {classify_error(err.name, err.message), err.message};
        dbus_error_free(&err);
        return false;
    }

    if (reply) dbus_message_unref(reply);
    return true;
}

bool disconnect_device(DBusConnection* conn, const std::string& device_path) {
    DBusMessage* msg = dbus_message_new_method_call(SERVICE_NAME, device_path.c_str(),
        DEVICE_INTERFACE, "Disconnect");
    if (!msg) return false;

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = call(conn, msg, CALL_TIMEOUT_MS, &err);

    if (dbus_error_is_set(&err)) {
        // Not connected any more is the state we wanted
        if (strcmp(err.name, "org.bluez.Error.NotConnected") == 0) {
            dbus_error_free(&err);
            return true;
        }
        std::cerr << "bluez: Disconnect failed: " << err.message << std::endl;
        dbus_error_free(&err);
        return false;
    }

    if (reply) dbus_message_unref(reply);
    return true;
}

bool trust_device(DBusConnection* conn, const std::string& device_path) {
    // Set Trusted property to true
    DBusMessage* msg = dbus_message_new_method_call(SERVICE_NAME, device_path.c_str(),
        "org.freedesktop.DBus.Properties", "Set");
    if (!msg) return false;

    const char* iface = DEVICE_INTERFACE;
    const char* prop = "Trusted";
    dbus_message_append_args(msg, DBUS_TYPE_STRING, &iface,
                             DBUS_TYPE_STRING, &prop, DBUS_TYPE_INVALID);

    // Append variant(bool true)
    DBusMessageIter iter, variant;
    dbus_message_iter_init_append(msg, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_VARIANT, "b", &variant);
    dbus_bool_t val = TRUE;
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_BOOLEAN, &val);
    dbus_message_iter_close_container(&iter, &variant);

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = call(conn, msg, CALL_TIMEOUT_MS, &err);

    if (dbus_error_is_set(&err)) {
        std::cerr << "bluez: trust_device failed: " << err.message << std::endl;
        dbus_error_free(&err);
        return false;
    }

    if (reply) dbus_message_unref(reply);
    return true;
}

} // namespace bluez
