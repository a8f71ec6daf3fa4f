#include <gtest/gtest.h>
#include "tracking/track_registry.h"

TEST(TrackRegistryTest, TouchCreatesThenUpdatesLastSeen) {
    TrackRegistry registry;
    registry.touch("A", ObjectClass::VEHICLE, 10.0);
    registry.touch("A", ObjectClass::PERSON, 15.0);

    const TrackedObject* obj = registry.find("A");
    ASSERT_NE(obj, nullptr);
    EXPECT_DOUBLE_EQ(obj->first_seen, 10.0);
    EXPECT_DOUBLE_EQ(obj->last_seen, 15.0);
    // 클래스는 생성 시에만 기록
    EXPECT_EQ(obj->object_class, ObjectClass::VEHICLE);
}

TEST(TrackRegistryTest, ZoneEntryIsIdempotent) {
    TrackRegistry registry;
    registry.touch("A", ObjectClass::VEHICLE, 10.0);

    EXPECT_TRUE(registry.enterZone("A", "z1", 10.0));
    EXPECT_FALSE(registry.enterZone("A", "z1", 12.0));

    const TrackedObject* obj = registry.find("A");
    ASSERT_NE(obj, nullptr);
    ASSERT_EQ(obj->zone_entry_times.size(), 1u);
    EXPECT_DOUBLE_EQ(obj->zone_entry_times.at("z1"), 10.0);
}

TEST(TrackRegistryTest, ExitZoneThenReenterRecordsNewTime) {
    TrackRegistry registry;
    registry.touch("A", ObjectClass::PERSON, 1.0);
    registry.enterZone("A", "z1", 1.0);

    EXPECT_TRUE(registry.exitZone("A", "z1"));
    EXPECT_FALSE(registry.exitZone("A", "z1"));

    EXPECT_TRUE(registry.enterZone("A", "z1", 7.0));
    EXPECT_DOUBLE_EQ(registry.find("A")->zone_entry_times.at("z1"), 7.0);
}

TEST(TrackRegistryTest, ZoneOperationsOnUnknownTrackAreNoops) {
    TrackRegistry registry;
    EXPECT_FALSE(registry.enterZone("ghost", "z1", 1.0));
    EXPECT_FALSE(registry.exitZone("ghost", "z1"));
    registry.markLineCrossed("ghost", "l1");
    registry.rearmZone("ghost", "z1", 2.0);
    EXPECT_TRUE(registry.empty());
}

TEST(TrackRegistryTest, LinesCrossedKeepsOrderWithoutDuplicates) {
    TrackRegistry registry;
    registry.touch("A", ObjectClass::VEHICLE, 1.0);
    registry.markLineCrossed("A", "entry");
    registry.markLineCrossed("A", "bay");
    registry.markLineCrossed("A", "entry");

    const auto& lines = registry.find("A")->lines_crossed;
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "entry");
    EXPECT_EQ(lines[1], "bay");
}

TEST(TrackRegistryTest, RearmResetsEntryTime) {
    TrackRegistry registry;
    registry.touch("A", ObjectClass::VEHICLE, 1.0);
    registry.enterZone("A", "z1", 1.0);
    registry.rearmZone("A", "z1", 4.0);
    EXPECT_DOUBLE_EQ(registry.find("A")->zone_entry_times.at("z1"), 4.0);
}

TEST(TrackRegistryTest, ReapRemovesStaleTracksAndReturnsCount) {
    TrackRegistry registry;
    registry.touch("old", ObjectClass::VEHICLE, 0.0);
    registry.touch("fresh", ObjectClass::VEHICLE, 50.0);

    EXPECT_EQ(registry.reap(60.0, 61.0), 1u);
    EXPECT_EQ(registry.find("old"), nullptr);
    EXPECT_NE(registry.find("fresh"), nullptr);
}

TEST(TrackRegistryTest, ReapBoundaryIsExclusive) {
    TrackRegistry registry;
    registry.touch("A", ObjectClass::VEHICLE, 0.0);
    // last_seen == now - max_age 는 유지
    EXPECT_EQ(registry.reap(60.0, 60.0), 0u);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(TrackRegistryTest, ReappearingTrackStartsFresh) {
    TrackRegistry registry;
    registry.touch("A", ObjectClass::VEHICLE, 0.0);
    registry.enterZone("A", "z1", 0.0);
    registry.markLineCrossed("A", "entry");

    registry.reap(60.0, 100.0);
    ASSERT_EQ(registry.find("A"), nullptr);

    registry.touch("A", ObjectClass::VEHICLE, 101.0);
    const TrackedObject* obj = registry.find("A");
    ASSERT_NE(obj, nullptr);
    EXPECT_DOUBLE_EQ(obj->first_seen, 101.0);
    EXPECT_TRUE(obj->zone_entry_times.empty());
    EXPECT_TRUE(obj->lines_crossed.empty());
}
