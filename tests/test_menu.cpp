// tests/test_menu.cpp
#include <gtest/gtest.h>

#include <core/menu.hpp>

namespace bluetray {
namespace testing {

class MenuModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        devices = {
            {DeviceId("A1:00:00:00:00:01"), "Headset"},
            {DeviceId("B2:00:00:00:00:02"), "Keyboard"},
        };
        menu = MenuModel::build(devices);
    }

    std::vector<DeviceDescriptor> devices;
    MenuModel menu;
};

TEST_F(MenuModelTest, Layout) {
    const auto& entries = menu.entries();
    ASSERT_EQ(entries.size(), 7u);

    EXPECT_EQ(entries[0].action, MenuAction::About);
    EXPECT_EQ(entries[0].label, "About Bluetooth Tray");
    EXPECT_TRUE(entries[1].is_separator());
    EXPECT_EQ(entries[2].label, "Headset");
    EXPECT_EQ(entries[3].label, "Keyboard");
    EXPECT_TRUE(entries[4].is_separator());
    EXPECT_EQ(entries[5].action, MenuAction::DisconnectAll);
    EXPECT_EQ(entries[6].action, MenuAction::Quit);
    EXPECT_EQ(entries[6].label, "Quit");
}

TEST_F(MenuModelTest, IdsAreSequentialAndSkipRoot) {
    int32_t expected = 1;
    for (const auto& entry : menu.entries()) {
        EXPECT_EQ(entry.id.value(), expected++);
        EXPECT_NE(entry.id, ROOT_MENU_ITEM);
    }
    EXPECT_EQ(menu.about_item(), MenuItemId(1));
    EXPECT_EQ(menu.quit_item(), menu.entries().back().id);
    EXPECT_EQ(menu.disconnect_all_item(), MenuItemId(6));
}

TEST_F(MenuModelTest, DeviceItemsResolveBackToTheirDevice) {
    EXPECT_EQ(menu.device_count(), devices.size());

    for (const auto& dev : devices) {
        auto item = menu.item_for(dev.id);
        ASSERT_TRUE(item.has_value());
        EXPECT_EQ(menu.device_for(*item), dev.id);
        EXPECT_EQ(menu.find(*item)->label, dev.name);
        EXPECT_EQ(menu.label_for(dev.id), dev.name);
    }
}

TEST_F(MenuModelTest, NonDeviceItemsHaveNoDevice) {
    EXPECT_FALSE(menu.device_for(menu.about_item()).has_value());
    EXPECT_FALSE(menu.device_for(menu.quit_item()).has_value());
    EXPECT_FALSE(menu.device_for(MenuItemId(2)).has_value());
    EXPECT_FALSE(menu.device_for(MenuItemId(42)).has_value());
    EXPECT_EQ(menu.find(MenuItemId(42)), nullptr);
    EXPECT_EQ(menu.find(ROOT_MENU_ITEM), nullptr);
}

TEST_F(MenuModelTest, UnknownDeviceLabelFallsBackToId) {
    DeviceId other("C3:00:00:00:00:03");
    EXPECT_FALSE(menu.item_for(other).has_value());
    EXPECT_EQ(menu.label_for(other), "C3:00:00:00:00:03");
}

TEST_F(MenuModelTest, DuplicateDeviceKeepsFirstEntry) {
    devices.push_back({DeviceId("A1:00:00:00:00:01"), "Headset (again)"});
    MenuModel dup = MenuModel::build(devices);

    EXPECT_EQ(dup.device_count(), 2u);
    EXPECT_EQ(dup.entries().size(), 7u);
    EXPECT_EQ(dup.label_for(DeviceId("A1:00:00:00:00:01")), "Headset");
}

TEST(MenuModelEmptyTest, NoDevicesStillHasFixedEntries) {
    MenuModel menu = MenuModel::build({});

    EXPECT_EQ(menu.device_count(), 0u);
    ASSERT_EQ(menu.entries().size(), 5u);
    EXPECT_NE(menu.find(menu.quit_item()), nullptr);
    EXPECT_NE(menu.find(menu.about_item()), nullptr);
}

} // namespace testing
} // namespace bluetray
