#include "tray.hpp"

#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <string_view>

namespace tray {

static const char* ITEM_INTROSPECT_XML =
    "<!DOCTYPE node PUBLIC \"-//freedesktop//DTD D-BUS Object Introspection 1.0//EN\"\n"
    "\"http://www.freedesktop.org/standards/dbus/1.0/introspect.dtd\">\n"
    "<node>\n"
    "  <interface name=\"org.kde.StatusNotifierItem\">\n"
    "    <property name=\"Category\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"Id\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"Title\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"Status\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"WindowId\" type=\"i\" access=\"read\"/>\n"
    "    <property name=\"IconName\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"IconPixmap\" type=\"a(iiay)\" access=\"read\"/>\n"
    "    <property name=\"IconThemePath\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"ToolTip\" type=\"(sa(iiay)ss)\" access=\"read\"/>\n"
    "    <property name=\"ItemIsMenu\" type=\"b\" access=\"read\"/>\n"
    "    <property name=\"Menu\" type=\"o\" access=\"read\"/>\n"
    "    <method name=\"Activate\">\n"
    "      <arg name=\"x\" type=\"i\" direction=\"in\"/>\n"
    "      <arg name=\"y\" type=\"i\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"SecondaryActivate\">\n"
    "      <arg name=\"x\" type=\"i\" direction=\"in\"/>\n"
    "      <arg name=\"y\" type=\"i\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"ContextMenu\">\n"
    "      <arg name=\"x\" type=\"i\" direction=\"in\"/>\n"
    "      <arg name=\"y\" type=\"i\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"Scroll\">\n"
    "      <arg name=\"delta\" type=\"i\" direction=\"in\"/>\n"
    "      <arg name=\"orientation\" type=\"s\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <signal name=\"NewTitle\"/>\n"
    "    <signal name=\"NewIcon\"/>\n"
    "    <signal name=\"NewToolTip\"/>\n"
    "    <signal name=\"NewStatus\">\n"
    "      <arg name=\"status\" type=\"s\"/>\n"
    "    </signal>\n"
    "  </interface>\n"
    "  <interface name=\"org.freedesktop.DBus.Properties\">\n"
    "    <method name=\"Get\">\n"
    "      <arg name=\"interface\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"property\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"value\" type=\"v\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"GetAll\">\n"
    "      <arg name=\"interface\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"properties\" type=\"a{sv}\" direction=\"out\"/>\n"
    "    </method>\n"
    "  </interface>\n"
    "  <interface name=\"org.freedesktop.DBus.Introspectable\">\n"
    "    <method name=\"Introspect\">\n"
    "      <arg name=\"xml\" type=\"s\" direction=\"out\"/>\n"
    "    </method>\n"
    "  </interface>\n"
    "</node>\n";

static const char* MENU_INTROSPECT_XML =
    "<!DOCTYPE node PUBLIC \"-//freedesktop//DTD D-BUS Object Introspection 1.0//EN\"\n"
    "\"http://www.freedesktop.org/standards/dbus/1.0/introspect.dtd\">\n"
    "<node>\n"
    "  <interface name=\"com.canonical.dbusmenu\">\n"
    "    <property name=\"Version\" type=\"u\" access=\"read\"/>\n"
    "    <property name=\"TextDirection\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"Status\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"IconThemePath\" type=\"as\" access=\"read\"/>\n"
    "    <method name=\"GetLayout\">\n"
    "      <arg name=\"parentId\" type=\"i\" direction=\"in\"/>\n"
    "      <arg name=\"recursionDepth\" type=\"i\" direction=\"in\"/>\n"
    "      <arg name=\"propertyNames\" type=\"as\" direction=\"in\"/>\n"
    "      <arg name=\"revision\" type=\"u\" direction=\"out\"/>\n"
    "      <arg name=\"layout\" type=\"(ia{sv}av)\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"GetGroupProperties\">\n"
    "      <arg name=\"ids\" type=\"ai\" direction=\"in\"/>\n"
    "      <arg name=\"propertyNames\" type=\"as\" direction=\"in\"/>\n"
    "      <arg name=\"properties\" type=\"a(ia{sv})\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"GetProperty\">\n"
    "      <arg name=\"id\" type=\"i\" direction=\"in\"/>\n"
    "      <arg name=\"name\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"value\" type=\"v\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"Event\">\n"
    "      <arg name=\"id\" type=\"i\" direction=\"in\"/>\n"
    "      <arg name=\"eventId\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"data\" type=\"v\" direction=\"in\"/>\n"
    "      <arg name=\"timestamp\" type=\"u\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"EventGroup\">\n"
    "      <arg name=\"events\" type=\"a(isvu)\" direction=\"in\"/>\n"
    "      <arg name=\"idErrors\" type=\"ai\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"AboutToShow\">\n"
    "      <arg name=\"id\" type=\"i\" direction=\"in\"/>\n"
    "      <arg name=\"needUpdate\" type=\"b\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"AboutToShowGroup\">\n"
    "      <arg name=\"ids\" type=\"ai\" direction=\"in\"/>\n"
    "      <arg name=\"updatesNeeded\" type=\"ai\" direction=\"out\"/>\n"
    "      <arg name=\"idErrors\" type=\"ai\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <signal name=\"LayoutUpdated\">\n"
    "      <arg name=\"revision\" type=\"u\"/>\n"
    "      <arg name=\"parent\" type=\"i\"/>\n"
    "    </signal>\n"
    "  </interface>\n"
    "  <interface name=\"org.freedesktop.DBus.Properties\">\n"
    "    <method name=\"Get\">\n"
    "      <arg name=\"interface\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"property\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"value\" type=\"v\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"GetAll\">\n"
    "      <arg name=\"interface\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"properties\" type=\"a{sv}\" direction=\"out\"/>\n"
    "    </method>\n"
    "  </interface>\n"
    "  <interface name=\"org.freedesktop.DBus.Introspectable\">\n"
    "    <method name=\"Introspect\">\n"
    "      <arg name=\"xml\" type=\"s\" direction=\"out\"/>\n"
    "    </method>\n"
    "  </interface>\n"
    "</node>\n";

static const char* ITEM_PROPERTIES[] = {
    "Category", "Id", "Title", "Status", "WindowId", "IconName", "IconPixmap",
    "IconThemePath", "ToolTip", "ItemIsMenu", "Menu",
};

static const char* MENU_PROPERTIES[] = {
    "Version", "TextDirection", "Status", "IconThemePath",
};

// Helper to append variant with string
static void append_variant_string(DBusMessageIter* iter, const char* value) {
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "s", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_STRING, &value);
    dbus_message_iter_close_container(iter, &variant);
}

// Helper to append variant with bool
static void append_variant_bool(DBusMessageIter* iter, dbus_bool_t value) {
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "b", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_BOOLEAN, &value);
    dbus_message_iter_close_container(iter, &variant);
}

// Helper to append variant with int32
static void append_variant_int32(DBusMessageIter* iter, dbus_int32_t value) {
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "i", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_INT32, &value);
    dbus_message_iter_close_container(iter, &variant);
}

// Helper to append variant with uint32
static void append_variant_uint32(DBusMessageIter* iter, dbus_uint32_t value) {
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "u", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_UINT32, &value);
    dbus_message_iter_close_container(iter, &variant);
}

// Helper to append variant with object path
static void append_variant_object_path(DBusMessageIter* iter, const char* value) {
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "o", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_OBJECT_PATH, &value);
    dbus_message_iter_close_container(iter, &variant);
}

// Helper to append variant with an empty string array
static void append_variant_empty_strings(DBusMessageIter* iter) {
    DBusMessageIter variant, array;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "as", &variant);
    dbus_message_iter_open_container(&variant, DBUS_TYPE_ARRAY, "s", &array);
    dbus_message_iter_close_container(&variant, &array);
    dbus_message_iter_close_container(iter, &variant);
}

// Append one (iiay) pixmap struct
static void append_pixmap(DBusMessageIter* array) {
    static const std::vector<uint8_t> pixels = icon_pixmap(ICON_SIZE);

    DBusMessageIter pixmap, bytes;
    dbus_message_iter_open_container(array, DBUS_TYPE_STRUCT, nullptr, &pixmap);
    dbus_int32_t size = ICON_SIZE;
    dbus_message_iter_append_basic(&pixmap, DBUS_TYPE_INT32, &size);
    dbus_message_iter_append_basic(&pixmap, DBUS_TYPE_INT32, &size);
    dbus_message_iter_open_container(&pixmap, DBUS_TYPE_ARRAY, "y", &bytes);
    const uint8_t* data = pixels.data();
    dbus_message_iter_append_fixed_array(&bytes, DBUS_TYPE_BYTE, &data,
                                         static_cast<int>(pixels.size()));
    dbus_message_iter_close_container(&pixmap, &bytes);
    dbus_message_iter_close_container(array, &pixmap);
}

static std::string tooltip_text(const Service& service) {
    if (service.connected.empty()) {
        return "No devices connected";
    }

    std::string text;
    for (const auto& id : service.connected) {
        if (!text.empty()) text += ", ";
        text += service.menu ? service.menu->label_for(id) : id.str();
    }
    return "Connected: " + text;
}

// Append the variant for one StatusNotifierItem property.
// Returns false for unknown property names.
static bool append_item_property(DBusMessageIter* iter, const Service& service, const char* prop) {
    if (strcmp(prop, "Category") == 0) {
        append_variant_string(iter, "Hardware");
    } else if (strcmp(prop, "Id") == 0) {
        append_variant_string(iter, "bluetray");
    } else if (strcmp(prop, "Title") == 0) {
        append_variant_string(iter, bluetray::APP_NAME);
    } else if (strcmp(prop, "Status") == 0) {
        append_variant_string(iter, "Active");
    } else if (strcmp(prop, "WindowId") == 0) {
        append_variant_int32(iter, 0);
    } else if (strcmp(prop, "IconName") == 0) {
        append_variant_string(iter, ICON_NAME);
    } else if (strcmp(prop, "IconThemePath") == 0) {
        append_variant_string(iter, "");
    } else if (strcmp(prop, "IconPixmap") == 0) {
        DBusMessageIter variant, array;
        dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "a(iiay)", &variant);
        dbus_message_iter_open_container(&variant, DBUS_TYPE_ARRAY, "(iiay)", &array);
        append_pixmap(&array);
        dbus_message_iter_close_container(&variant, &array);
        dbus_message_iter_close_container(iter, &variant);
    } else if (strcmp(prop, "ToolTip") == 0) {
        std::string text = tooltip_text(service);
        const char* icon = "";
        const char* title = bluetray::APP_NAME;
        const char* body = text.c_str();

        DBusMessageIter variant, tip, pixmaps;
        dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "(sa(iiay)ss)", &variant);
        dbus_message_iter_open_container(&variant, DBUS_TYPE_STRUCT, nullptr, &tip);
        dbus_message_iter_append_basic(&tip, DBUS_TYPE_STRING, &icon);
        dbus_message_iter_open_container(&tip, DBUS_TYPE_ARRAY, "(iiay)", &pixmaps);
        dbus_message_iter_close_container(&tip, &pixmaps);
        dbus_message_iter_append_basic(&tip, DBUS_TYPE_STRING, &title);
        dbus_message_iter_append_basic(&tip, DBUS_TYPE_STRING, &body);
        dbus_message_iter_close_container(&variant, &tip);
        dbus_message_iter_close_container(iter, &variant);
    } else if (strcmp(prop, "ItemIsMenu") == 0) {
        append_variant_bool(iter, TRUE);
    } else if (strcmp(prop, "Menu") == 0) {
        append_variant_object_path(iter, MENU_PATH);
    } else {
        return false;
    }
    return true;
}

// Append the variant for one dbusmenu object property
static bool append_menu_property(DBusMessageIter* iter, const char* prop) {
    if (strcmp(prop, "Version") == 0) {
        append_variant_uint32(iter, DBUSMENU_VERSION);
    } else if (strcmp(prop, "TextDirection") == 0) {
        append_variant_string(iter, "ltr");
    } else if (strcmp(prop, "Status") == 0) {
        append_variant_string(iter, "normal");
    } else if (strcmp(prop, "IconThemePath") == 0) {
        append_variant_empty_strings(iter);
    } else {
        return false;
    }
    return true;
}

// Properties of one menu entry, in dbusmenu naming.
// Only non-default values are sent, as the protocol allows.
struct EntryProperty {
    const char* name;
    enum { String, Bool, Int32 } type;
    std::string s;
    bool b = false;
    int32_t i = 0;
};

static std::vector<EntryProperty> entry_properties(const Service& service, int32_t id) {
    std::vector<EntryProperty> props;

    if (id == bluetray::ROOT_MENU_ITEM.value()) {
        props.push_back({"children-display", EntryProperty::String, "submenu"});
        return props;
    }

    const bluetray::MenuEntry* entry = service.menu->find(bluetray::MenuItemId(id));
    if (!entry) return props;

    if (entry->is_separator()) {
        props.push_back({"type", EntryProperty::String, "separator"});
        return props;
    }

    props.push_back({"label", EntryProperty::String, entry->label});
    props.push_back({"enabled", EntryProperty::Bool, {}, true});
    if (entry->action == bluetray::MenuAction::Device) {
        props.push_back({"toggle-type", EntryProperty::String, "checkmark"});
        props.push_back({"toggle-state", EntryProperty::Int32, {}, false,
                         service.connected.contains(entry->device) ? 1 : 0});
    }
    return props;
}

static void append_entry_property(DBusMessageIter* iter, const EntryProperty& prop) {
    switch (prop.type) {
        case EntryProperty::String: append_variant_string(iter, prop.s.c_str()); break;
        case EntryProperty::Bool: append_variant_bool(iter, prop.b); break;
        case EntryProperty::Int32: append_variant_int32(iter, prop.i); break;
    }
}

static bool wanted(const std::vector<std::string>& filter, const char* name) {
    return filter.empty() || std::find(filter.begin(), filter.end(), name) != filter.end();
}

// Append a{sv} of one entry's properties
static void append_entry_properties(DBusMessageIter* iter, const Service& service, int32_t id,
                                    const std::vector<std::string>& filter) {
    DBusMessageIter dict, entry;
    dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, "{sv}", &dict);

    for (const auto& prop : entry_properties(service, id)) {
        if (!wanted(filter, prop.name)) continue;
        dbus_message_iter_open_container(&dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &prop.name);
        append_entry_property(&entry, prop);
        dbus_message_iter_close_container(&dict, &entry);
    }

    dbus_message_iter_close_container(iter, &dict);
}

// Append one (ia{sv}av) layout node. The menu is flat: only the root has
// children.
static void append_layout_node(DBusMessageIter* iter, const Service& service, int32_t id,
                               int32_t depth, const std::vector<std::string>& filter) {
    DBusMessageIter node, children;
    dbus_message_iter_open_container(iter, DBUS_TYPE_STRUCT, nullptr, &node);
    dbus_message_iter_append_basic(&node, DBUS_TYPE_INT32, &id);
    append_entry_properties(&node, service, id, filter);

    dbus_message_iter_open_container(&node, DBUS_TYPE_ARRAY, "v", &children);
    if (id == bluetray::ROOT_MENU_ITEM.value() && depth != 0) {
        for (const auto& entry : service.menu->entries()) {
            DBusMessageIter variant;
            dbus_message_iter_open_container(&children, DBUS_TYPE_VARIANT, "(ia{sv}av)", &variant);
            append_layout_node(&variant, service, entry.id.value(),
                               depth > 0 ? depth - 1 : depth, filter);
            dbus_message_iter_close_container(&children, &variant);
        }
    }
    dbus_message_iter_close_container(&node, &children);

    dbus_message_iter_close_container(iter, &node);
}

static bool menu_has_item(const Service& service, int32_t id) {
    return id == bluetray::ROOT_MENU_ITEM.value() ||
           service.menu->find(bluetray::MenuItemId(id)) != nullptr;
}

// Read an "as" argument into a vector
static std::vector<std::string> read_string_array(DBusMessageIter* iter) {
    std::vector<std::string> result;
    if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY) return result;

    DBusMessageIter array;
    dbus_message_iter_recurse(iter, &array);
    while (dbus_message_iter_get_arg_type(&array) == DBUS_TYPE_STRING) {
        const char* s;
        dbus_message_iter_get_basic(&array, &s);
        result.emplace_back(s);
        dbus_message_iter_next(&array);
    }
    return result;
}

// Read an "ai" argument into a vector
static std::vector<int32_t> read_int_array(DBusMessageIter* iter) {
    std::vector<int32_t> result;
    if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY) return result;

    DBusMessageIter array;
    dbus_message_iter_recurse(iter, &array);
    while (dbus_message_iter_get_arg_type(&array) == DBUS_TYPE_INT32) {
        dbus_int32_t v;
        dbus_message_iter_get_basic(&array, &v);
        result.push_back(v);
        dbus_message_iter_next(&array);
    }
    return result;
}

static void append_int_array(DBusMessageIter* iter, const std::vector<int32_t>& values) {
    DBusMessageIter array;
    dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, "i", &array);
    for (dbus_int32_t v : values) {
        dbus_message_iter_append_basic(&array, DBUS_TYPE_INT32, &v);
    }
    dbus_message_iter_close_container(iter, &array);
}

// Handle org.freedesktop.DBus.Properties Get/GetAll on either object
static DBusMessage* handle_properties(DBusMessage* msg, const Service& service, bool is_menu) {
    const char* member = dbus_message_get_member(msg);
    const char* expected_iface = is_menu ? MENU_INTERFACE : ITEM_INTERFACE;

    if (member && strcmp(member, "Get") == 0) {
        const char* iface;
        const char* prop;
        if (!dbus_message_get_args(msg, nullptr,
                DBUS_TYPE_STRING, &iface,
                DBUS_TYPE_STRING, &prop,
                DBUS_TYPE_INVALID)) {
            return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Invalid arguments");
        }
        if (strcmp(iface, expected_iface) != 0) {
            return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_INTERFACE, "Unknown interface");
        }

        DBusMessage* reply = dbus_message_new_method_return(msg);
        DBusMessageIter iter;
        dbus_message_iter_init_append(reply, &iter);

        bool known = is_menu ? append_menu_property(&iter, prop)
                             : append_item_property(&iter, service, prop);
        if (!known) {
            dbus_message_unref(reply);
            return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_PROPERTY, "Unknown property");
        }
        return reply;
    }

    if (member && strcmp(member, "GetAll") == 0) {
        const char* iface;
        if (!dbus_message_get_args(msg, nullptr,
                DBUS_TYPE_STRING, &iface,
                DBUS_TYPE_INVALID)) {
            return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Invalid arguments");
        }
        if (strcmp(iface, expected_iface) != 0) {
            return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_INTERFACE, "Unknown interface");
        }

        DBusMessage* reply = dbus_message_new_method_return(msg);
        DBusMessageIter iter, dict, entry;
        dbus_message_iter_init_append(reply, &iter);
        dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);

        if (is_menu) {
            for (const char* name : MENU_PROPERTIES) {
                dbus_message_iter_open_container(&dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
                dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &name);
                append_menu_property(&entry, name);
                dbus_message_iter_close_container(&dict, &entry);
            }
        } else {
            for (const char* name : ITEM_PROPERTIES) {
                dbus_message_iter_open_container(&dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
                dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &name);
                append_item_property(&entry, service, name);
                dbus_message_iter_close_container(&dict, &entry);
            }
        }

        dbus_message_iter_close_container(&iter, &dict);
        return reply;
    }

    if (member && strcmp(member, "Set") == 0) {
        return dbus_message_new_error(msg, DBUS_ERROR_PROPERTY_READ_ONLY, "Property is read-only");
    }
    return nullptr;
}

// StatusNotifierItem methods: all of them are plain tray icon events
static DBusMessage* handle_item_method(DBusMessage* msg, Service* service) {
    const char* member = dbus_message_get_member(msg);
    if (!member) return nullptr;

    bluetray::TrayEvent event;

    if (strcmp(member, "Activate") == 0 || strcmp(member, "SecondaryActivate") == 0 ||
        strcmp(member, "ContextMenu") == 0) {
        dbus_int32_t x, y;
        if (!dbus_message_get_args(msg, nullptr,
                DBUS_TYPE_INT32, &x, DBUS_TYPE_INT32, &y, DBUS_TYPE_INVALID)) {
            return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected (ii)");
        }
        event.kind = member;
        event.x = x;
        event.y = y;
    } else if (strcmp(member, "Scroll") == 0) {
        dbus_int32_t delta;
        const char* orientation;
        if (!dbus_message_get_args(msg, nullptr,
                DBUS_TYPE_INT32, &delta, DBUS_TYPE_STRING, &orientation, DBUS_TYPE_INVALID)) {
            return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected (is)");
        }
        event.kind = std::string("Scroll ") + orientation;
        event.x = delta;
    } else {
        return nullptr;
    }

    if (service->callbacks.on_tray_event) service->callbacks.on_tray_event(event);
    return dbus_message_new_method_return(msg);
}

static void deliver_event(Service* service, int32_t id, const char* event_id) {
    // Hosts also send "opened", "closed" and "hovered"
    if (strcmp(event_id, "clicked") != 0) return;
    if (service->callbacks.on_menu_selected) {
        service->callbacks.on_menu_selected(bluetray::MenuItemId(id));
    }
}

bool read_event_group(DBusMessage* msg, std::vector<MenuEvent>& events) {
    DBusMessageIter args;
    if (!dbus_message_iter_init(msg, &args) ||
        dbus_message_iter_get_arg_type(&args) != DBUS_TYPE_ARRAY) {
        return false;
    }

    DBusMessageIter array;
    dbus_message_iter_recurse(&args, &array);
    while (dbus_message_iter_get_arg_type(&array) == DBUS_TYPE_STRUCT) {
        DBusMessageIter event;
        dbus_message_iter_recurse(&array, &event);
        dbus_message_iter_next(&array);

        if (dbus_message_iter_get_arg_type(&event) != DBUS_TYPE_INT32) {
            std::cerr << "tray: EventGroup entry without an item id" << std::endl;
            continue;
        }
        dbus_int32_t id;
        dbus_message_iter_get_basic(&event, &id);
        dbus_message_iter_next(&event);

        if (dbus_message_iter_get_arg_type(&event) != DBUS_TYPE_STRING) {
            std::cerr << "tray: EventGroup entry for " << id << " without an event id"
                      << std::endl;
            continue;
        }
        const char* event_id;
        dbus_message_iter_get_basic(&event, &event_id);
        events.push_back({id, event_id});
    }
    return true;
}

// com.canonical.dbusmenu methods
static DBusMessage* handle_menu_method(DBusMessage* msg, Service* service) {
    const char* member = dbus_message_get_member(msg);
    if (!member) return nullptr;

    DBusMessageIter args;
    bool has_args = dbus_message_iter_init(msg, &args);

    if (strcmp(member, "GetLayout") == 0) {
        if (!has_args || dbus_message_iter_get_arg_type(&args) != DBUS_TYPE_INT32) {
            return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected (iias)");
        }
        dbus_int32_t parent, depth;
        dbus_message_iter_get_basic(&args, &parent);
        dbus_message_iter_next(&args);
        if (dbus_message_iter_get_arg_type(&args) != DBUS_TYPE_INT32) {
            return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected (iias)");
        }
        dbus_message_iter_get_basic(&args, &depth);
        dbus_message_iter_next(&args);
        std::vector<std::string> filter = read_string_array(&args);

        if (!menu_has_item(*service, parent)) {
            return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Unknown menu item");
        }

        DBusMessage* reply = dbus_message_new_method_return(msg);
        DBusMessageIter iter;
        dbus_message_iter_init_append(reply, &iter);
        dbus_uint32_t revision = service->revision;
        dbus_message_iter_append_basic(&iter, DBUS_TYPE_UINT32, &revision);
        append_layout_node(&iter, *service, parent, depth, filter);
        return reply;
    }

    if (strcmp(member, "GetGroupProperties") == 0) {
        std::vector<int32_t> ids = has_args ? read_int_array(&args) : std::vector<int32_t>{};
        if (has_args) dbus_message_iter_next(&args);
        std::vector<std::string> filter = has_args ? read_string_array(&args)
                                                   : std::vector<std::string>{};

        // An empty id list means every item
        if (ids.empty()) {
            for (const auto& entry : service->menu->entries()) {
                ids.push_back(entry.id.value());
            }
        }

        DBusMessage* reply = dbus_message_new_method_return(msg);
        DBusMessageIter iter, array, item;
        dbus_message_iter_init_append(reply, &iter);
        dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "(ia{sv})", &array);
        for (dbus_int32_t id : ids) {
            if (!menu_has_item(*service, id)) continue;
            dbus_message_iter_open_container(&array, DBUS_TYPE_STRUCT, nullptr, &item);
            dbus_message_iter_append_basic(&item, DBUS_TYPE_INT32, &id);
            append_entry_properties(&item, *service, id, filter);
            dbus_message_iter_close_container(&array, &item);
        }
        dbus_message_iter_close_container(&iter, &array);
        return reply;
    }

    if (strcmp(member, "GetProperty") == 0) {
        dbus_int32_t id;
        const char* name;
        if (!dbus_message_get_args(msg, nullptr,
                DBUS_TYPE_INT32, &id, DBUS_TYPE_STRING, &name, DBUS_TYPE_INVALID)) {
            return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected (is)");
        }
        for (const auto& prop : entry_properties(*service, id)) {
            if (strcmp(prop.name, name) != 0) continue;
            DBusMessage* reply = dbus_message_new_method_return(msg);
            DBusMessageIter iter;
            dbus_message_iter_init_append(reply, &iter);
            append_entry_property(&iter, prop);
            return reply;
        }
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Unknown property");
    }

    if (strcmp(member, "Event") == 0) {
        if (!has_args || dbus_message_iter_get_arg_type(&args) != DBUS_TYPE_INT32) {
            return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected (isvu)");
        }
        dbus_int32_t id;
        dbus_message_iter_get_basic(&args, &id);
        dbus_message_iter_next(&args);
        if (dbus_message_iter_get_arg_type(&args) != DBUS_TYPE_STRING) {
            return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected (isvu)");
        }
        const char* event_id;
        dbus_message_iter_get_basic(&args, &event_id);

        // Reply before running the action; Quit tears the connection down
        DBusMessage* reply = dbus_message_new_method_return(msg);
        dbus_connection_send(service->conn, reply, nullptr);
        dbus_message_unref(reply);

        deliver_event(service, id, event_id);
        return nullptr;
    }

    if (strcmp(member, "EventGroup") == 0) {
        std::vector<MenuEvent> received;
        if (!read_event_group(msg, received)) {
            return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected a(isvu)");
        }

        std::vector<MenuEvent> events;
        std::vector<int32_t> errors;
        for (auto& event : received) {
            if (menu_has_item(*service, event.id)) {
                events.push_back(std::move(event));
            } else {
                errors.push_back(event.id);
            }
        }

        DBusMessage* reply = dbus_message_new_method_return(msg);
        DBusMessageIter iter;
        dbus_message_iter_init_append(reply, &iter);
        append_int_array(&iter, errors);
        dbus_connection_send(service->conn, reply, nullptr);
        dbus_message_unref(reply);

        for (const auto& event : events) {
            deliver_event(service, event.id, event.event_id.c_str());
        }
        return nullptr;
    }

    if (strcmp(member, "AboutToShow") == 0) {
        DBusMessage* reply = dbus_message_new_method_return(msg);
        dbus_bool_t need_update = FALSE;
        dbus_message_append_args(reply, DBUS_TYPE_BOOLEAN, &need_update, DBUS_TYPE_INVALID);
        return reply;
    }

    if (strcmp(member, "AboutToShowGroup") == 0) {
        DBusMessage* reply = dbus_message_new_method_return(msg);
        DBusMessageIter iter;
        dbus_message_iter_init_append(reply, &iter);
        append_int_array(&iter, {});
        append_int_array(&iter, {});
        return reply;
    }

    return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_METHOD, "Unknown method");
}

// Message handler for both exported objects
static DBusHandlerResult message_handler(DBusConnection* conn, DBusMessage* msg, void* data) {
    auto* service = static_cast<Service*>(data);

    const char* iface = dbus_message_get_interface(msg);
    const char* member = dbus_message_get_member(msg);
    const char* path = dbus_message_get_path(msg);

    if (!path || dbus_message_get_type(msg) != DBUS_MESSAGE_TYPE_METHOD_CALL) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    bool is_menu = strcmp(path, MENU_PATH) == 0;
    if (!is_menu && strcmp(path, ITEM_PATH) != 0) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    DBusMessage* reply = nullptr;
    bool handled = false;

    // Introspection
    if (iface && strcmp(iface, "org.freedesktop.DBus.Introspectable") == 0 &&
        member && strcmp(member, "Introspect") == 0) {
        const char* xml = is_menu ? MENU_INTROSPECT_XML : ITEM_INTROSPECT_XML;
        reply = dbus_message_new_method_return(msg);
        dbus_message_append_args(reply, DBUS_TYPE_STRING, &xml, DBUS_TYPE_INVALID);
        handled = true;
    }
    // Properties
    else if (iface && strcmp(iface, "org.freedesktop.DBus.Properties") == 0) {
        reply = handle_properties(msg, *service, is_menu);
        handled = reply != nullptr;
    }
    // Interface methods; some hosts leave the interface unset.
    // Event and EventGroup reply themselves and return nullptr.
    else if (is_menu && (!iface || strcmp(iface, MENU_INTERFACE) == 0)) {
        reply = handle_menu_method(msg, service);
        handled = true;
    } else if (!is_menu && (!iface || strcmp(iface, ITEM_INTERFACE) == 0)) {
        reply = handle_item_method(msg, service);
        handled = reply != nullptr;
    }

    if (reply) {
        dbus_connection_send(conn, reply, nullptr);
        dbus_message_unref(reply);
    }
    return handled ? DBUS_HANDLER_RESULT_HANDLED : DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

static bool register_with_watcher(Service* service) {
    DBusMessage* msg = dbus_message_new_method_call(WATCHER_SERVICE, WATCHER_PATH,
        WATCHER_INTERFACE, "RegisterStatusNotifierItem");
    if (!msg) return false;

    const char* name = service->bus_name.c_str();
    dbus_message_append_args(msg, DBUS_TYPE_STRING, &name, DBUS_TYPE_INVALID);

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(service->conn, msg, 2000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        std::cerr << "tray: no StatusNotifierWatcher yet: " << err.message << std::endl;
        dbus_error_free(&err);
        return false;
    }

    if (reply) dbus_message_unref(reply);
    std::cout << "tray: registered " << service->bus_name << std::endl;
    return true;
}

// Re-register when a watcher (panel, desktop shell) appears or restarts
static DBusHandlerResult watcher_filter(DBusConnection* conn, DBusMessage* msg, void* data) {
    (void)conn;
    auto* service = static_cast<Service*>(data);

    if (!dbus_message_is_signal(msg, DBUS_INTERFACE_DBUS, "NameOwnerChanged")) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    const char* name;
    const char* old_owner;
    const char* new_owner;
    if (!dbus_message_get_args(msg, nullptr,
            DBUS_TYPE_STRING, &name,
            DBUS_TYPE_STRING, &old_owner,
            DBUS_TYPE_STRING, &new_owner,
            DBUS_TYPE_INVALID)) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    if (strcmp(name, WATCHER_SERVICE) == 0 && new_owner[0] != '\0') {
        register_with_watcher(service);
    }
    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

static void emit_signal(Service* service, const char* path, const char* iface, const char* name) {
    DBusMessage* signal = dbus_message_new_signal(path, iface, name);
    if (!signal) return;
    dbus_connection_send(service->conn, signal, nullptr);
    dbus_message_unref(signal);
}

static void emit_layout_updated(Service* service) {
    DBusMessage* signal = dbus_message_new_signal(MENU_PATH, MENU_INTERFACE, "LayoutUpdated");
    if (!signal) return;

    dbus_uint32_t revision = service->revision;
    dbus_int32_t parent = bluetray::ROOT_MENU_ITEM.value();
    dbus_message_append_args(signal, DBUS_TYPE_UINT32, &revision,
                             DBUS_TYPE_INT32, &parent, DBUS_TYPE_INVALID);
    dbus_connection_send(service->conn, signal, nullptr);
    dbus_message_unref(signal);
}

bool init(Service* service) {
    if (!service->menu) {
        std::cerr << "tray: no menu model" << std::endl;
        return false;
    }

    DBusError err;
    dbus_error_init(&err);

    service->conn = dbus_bus_get(DBUS_BUS_SESSION, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "tray: session bus error: " << err.message << std::endl;
        dbus_error_free(&err);
        service->conn = nullptr;
        return false;
    }

    // Register object paths
    DBusObjectPathVTable vtable = {};
    vtable.message_function = message_handler;

    if (!dbus_connection_register_object_path(service->conn, ITEM_PATH, &vtable, service) ||
        !dbus_connection_register_object_path(service->conn, MENU_PATH, &vtable, service)) {
        std::cerr << "tray: failed to register object paths" << std::endl;
        return false;
    }

    service->bus_name = "org.kde.StatusNotifierItem-" + std::to_string(getpid()) + "-1";
    int ret = dbus_bus_request_name(service->conn, service->bus_name.c_str(),
                                    DBUS_NAME_FLAG_DO_NOT_QUEUE, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "tray: name error: " << err.message << std::endl;
        dbus_error_free(&err);
        return false;
    }
    if (ret != DBUS_REQUEST_NAME_REPLY_PRIMARY_OWNER) {
        std::cerr << "tray: not primary owner of " << service->bus_name << std::endl;
        return false;
    }

    dbus_bus_add_match(service->conn,
        "type='signal',sender='org.freedesktop.DBus',interface='org.freedesktop.DBus',"
        "member='NameOwnerChanged',arg0='org.kde.StatusNotifierWatcher'",
        &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "tray: failed to add NameOwnerChanged match: " << err.message << std::endl;
        dbus_error_free(&err);
    }
    if (!dbus_connection_add_filter(service->conn, watcher_filter, service, nullptr)) {
        std::cerr << "tray: failed to add watcher filter" << std::endl;
    }

    // Without a watcher the icon is invisible until one starts
    register_with_watcher(service);
    dbus_connection_flush(service->conn);
    return true;
}

void set_connected(Service* service, const std::vector<bluetray::DeviceId>& ids) {
    std::set<bluetray::DeviceId> connected(ids.begin(), ids.end());
    if (connected == service->connected) return;

    service->connected = std::move(connected);
    service->revision++;

    if (!service->conn) return;
    emit_layout_updated(service);
    emit_signal(service, ITEM_PATH, ITEM_INTERFACE, "NewToolTip");
    dbus_connection_flush(service->conn);
}

void process_pending(Service* service) {
    dbus_connection_read_write(service->conn, 0);
    while (dbus_connection_dispatch(service->conn) == DBUS_DISPATCH_DATA_REMAINS) {
        // Keep processing
    }
}

int get_fd(const Service* service) {
    int fd = -1;
    if (!service->conn || !dbus_connection_get_unix_fd(service->conn, &fd)) {
        return -1;
    }
    return fd;
}

void cleanup(Service* service) {
    if (!service->conn) return;

    dbus_connection_remove_filter(service->conn, watcher_filter, service);
    dbus_connection_unregister_object_path(service->conn, ITEM_PATH);
    dbus_connection_unregister_object_path(service->conn, MENU_PATH);

    if (!service->bus_name.empty()) {
        DBusError err;
        dbus_error_init(&err);
        dbus_bus_release_name(service->conn, service->bus_name.c_str(), &err);
        if (dbus_error_is_set(&err)) {
            dbus_error_free(&err);
        }
    }

    dbus_connection_flush(service->conn);
    dbus_connection_unref(service->conn);
    service->conn = nullptr;
}

std::vector<uint8_t> icon_pixmap(int size) {
    // Filled disc in Bluetooth blue on a transparent background
    constexpr uint8_t r = 0x00, g = 0x82, b = 0xfc;

    std::vector<uint8_t> pixels(static_cast<size_t>(size) * size * 4, 0);
    const float c = (size - 1) / 2.0f;
    const float radius2 = (size / 2.0f) * (size / 2.0f);

    for (int y = 0; y < size; ++y) {
        for (int x = 0; x < size; ++x) {
            float dx = x - c, dy = y - c;
            if (dx * dx + dy * dy > radius2) continue;

            uint8_t* p = &pixels[(static_cast<size_t>(y) * size + x) * 4];
            p[0] = 0xff;  // ARGB, network byte order
            p[1] = r;
            p[2] = g;
            p[3] = b;
        }
    }
    return pixels;
}

} // namespace tray
