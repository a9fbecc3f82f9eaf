// tests/test_tray_events.cpp
#include <gtest/gtest.h>

#include "tray.hpp"

#include <dbus/dbus.h>
#include <utility>
#include <vector>

namespace bluetray {
namespace testing {

// Builds EventGroup calls by hand; no bus connection is needed for that
class TrayEventGroupTest : public ::testing::Test {
protected:
    void SetUp() override {
        msg = dbus_message_new_method_call(nullptr, tray::MENU_PATH, tray::MENU_INTERFACE,
                                           "EventGroup");
        ASSERT_NE(msg, nullptr);
        dbus_message_iter_init_append(msg, &args);
    }

    void TearDown() override {
        if (msg) dbus_message_unref(msg);
    }

    // a(isvu) with a zero int32 payload in the variant
    void append_events(const std::vector<std::pair<dbus_int32_t, const char*>>& events) {
        DBusMessageIter array, entry, variant;
        dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "(isvu)", &array);
        for (const auto& [id, event_id] : events) {
            dbus_int32_t item = id;
            dbus_int32_t data = 0;
            dbus_uint32_t timestamp = 0;
            dbus_message_iter_open_container(&array, DBUS_TYPE_STRUCT, nullptr, &entry);
            dbus_message_iter_append_basic(&entry, DBUS_TYPE_INT32, &item);
            dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &event_id);
            dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "i", &variant);
            dbus_message_iter_append_basic(&variant, DBUS_TYPE_INT32, &data);
            dbus_message_iter_close_container(&entry, &variant);
            dbus_message_iter_append_basic(&entry, DBUS_TYPE_UINT32, &timestamp);
            dbus_message_iter_close_container(&array, &entry);
        }
        dbus_message_iter_close_container(&args, &array);
    }

    DBusMessage* msg = nullptr;
    DBusMessageIter args;
};

TEST_F(TrayEventGroupTest, ReadsEveryEntry) {
    append_events({{5, "clicked"}, {7, "hovered"}});

    std::vector<tray::MenuEvent> events;
    ASSERT_TRUE(tray::read_event_group(msg, events));
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].id, 5);
    EXPECT_EQ(events[0].event_id, "clicked");
    EXPECT_EQ(events[1].id, 7);
    EXPECT_EQ(events[1].event_id, "hovered");
}

TEST_F(TrayEventGroupTest, EmptyArrayIsValid) {
    append_events({});

    std::vector<tray::MenuEvent> events;
    EXPECT_TRUE(tray::read_event_group(msg, events));
    EXPECT_TRUE(events.empty());
}

TEST_F(TrayEventGroupTest, SkipsEntriesWithSwappedFields) {
    // a(si): event id first, item id second
    DBusMessageIter array, entry;
    const char* event_id = "clicked";
    dbus_int32_t id = 5;
    dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "(si)", &array);
    dbus_message_iter_open_container(&array, DBUS_TYPE_STRUCT, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &event_id);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_INT32, &id);
    dbus_message_iter_close_container(&array, &entry);
    dbus_message_iter_close_container(&args, &array);

    std::vector<tray::MenuEvent> events;
    EXPECT_TRUE(tray::read_event_group(msg, events));
    EXPECT_TRUE(events.empty());
}

TEST_F(TrayEventGroupTest, SkipsEntriesWithoutEventId) {
    // a(ii): second field is not a string
    DBusMessageIter array, entry;
    dbus_int32_t id = 5;
    dbus_int32_t other = 1;
    dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "(ii)", &array);
    dbus_message_iter_open_container(&array, DBUS_TYPE_STRUCT, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_INT32, &id);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_INT32, &other);
    dbus_message_iter_close_container(&array, &entry);
    dbus_message_iter_close_container(&args, &array);

    std::vector<tray::MenuEvent> events;
    EXPECT_TRUE(tray::read_event_group(msg, events));
    EXPECT_TRUE(events.empty());
}

TEST_F(TrayEventGroupTest, RejectsMissingArray) {
    dbus_int32_t id = 5;
    dbus_message_iter_append_basic(&args, DBUS_TYPE_INT32, &id);

    std::vector<tray::MenuEvent> events;
    EXPECT_FALSE(tray::read_event_group(msg, events));
    EXPECT_TRUE(events.empty());
}

TEST_F(TrayEventGroupTest, RejectsCallWithoutArguments) {
    std::vector<tray::MenuEvent> events;
    EXPECT_FALSE(tray::read_event_group(msg, events));
}

} // namespace testing
} // namespace bluetray
