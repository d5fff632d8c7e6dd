#include "devices/binding_table.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace hearth;
using namespace hearth::devices;

namespace {

Device make_device(const std::string &id, const std::string &room) {
    Device device;
    device.id = id;
    device.attributes = {{"room", room}};
    return device;
}

}  // namespace

TEST(BindingTableTest, AddIsIdempotentPerPluginAndSelector) {
    BindingTable table;
    uint64_t first = 0;
    uint64_t second = 0;
    ASSERT_TRUE(table.add("lights", "room=kitchen", first).ok());
    ASSERT_TRUE(table.add("lights", " room=kitchen ", second).ok());
    EXPECT_EQ(first, second);
    EXPECT_EQ(table.count_for("lights"), 1u);

    uint64_t other = 0;
    ASSERT_TRUE(table.add("scenes", "room=kitchen", other).ok());
    EXPECT_NE(other, first);
    EXPECT_EQ(table.list().size(), 2u);
}

TEST(BindingTableTest, RejectsInvalidInput) {
    BindingTable table;
    uint64_t id = 0;
    EXPECT_EQ(table.add("", "room=kitchen", id).code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(table.add("lights", "kitchen", id).code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_TRUE(table.list().empty());
}

TEST(BindingTableTest, MatchingKeepsRegistrationOrder) {
    BindingTable table;
    uint64_t id = 0;
    ASSERT_TRUE(table.add("scenes", "room=k*", id).ok());
    ASSERT_TRUE(table.add("lights", "id=kitchen_lamp", id).ok());
    ASSERT_TRUE(table.add("garden", "room=garden", id).ok());

    auto matches = table.matching(make_device("kitchen_lamp", "kitchen"));
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].plugin_id, "scenes");
    EXPECT_EQ(matches[1].plugin_id, "lights");
}

TEST(BindingTableTest, ReleaseAndRemove) {
    BindingTable table;
    uint64_t kitchen = 0;
    uint64_t hall = 0;
    uint64_t other = 0;
    ASSERT_TRUE(table.add("lights", "room=kitchen", kitchen).ok());
    ASSERT_TRUE(table.add("lights", "room=hall", hall).ok());
    ASSERT_TRUE(table.add("scenes", "room=hall", other).ok());

    EXPECT_EQ(table.remove_selector("lights", "room=hall"), 1u);
    EXPECT_TRUE(table.remove(other));
    EXPECT_FALSE(table.remove(other));

    EXPECT_EQ(table.release_plugin("lights"), 1u);
    EXPECT_EQ(table.release_plugin("lights"), 0u);
    EXPECT_TRUE(table.list().empty());
}
