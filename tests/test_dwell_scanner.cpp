#include <gtest/gtest.h>
#include "analytics/scanner/dwell_scanner.h"
#include "test_helpers.h"

using namespace testutil;

namespace {

DwellScanner::Config scannerConfig() {
    DwellScanner::Config config;
    config.default_dwell_threshold_sec = 2.0;
    config.greet_min_proximity_sec = 1.0;
    return config;
}

size_t countGreets(const std::vector<DomainEvent>& events) {
    size_t count = 0;
    for (const auto& e : events) {
        if (std::holds_alternative<GreetStarted>(e.payload)) {
            count++;
        }
    }
    return count;
}

}  // namespace

TEST(DwellScannerTest, DwellRearmFiresOncePerThresholdInterval) {
    ZoneConfigStore store;
    ASSERT_TRUE(store.replace({squareZone("wait", ZoneType::WAITING_AREA)}, {}));
    DwellScanner scanner(store, identity(), scannerConfig());

    TrackRegistry registry;
    registry.touch("A", ObjectClass::PERSON, 0.0);
    registry.enterZone("A", "wait", 0.0);

    std::vector<double> fired_at;
    for (int t = 1; t <= 5; ++t) {
        for (const auto& event : scanner.checkDwell(registry, t)) {
            fired_at.push_back(event.timestamp);
        }
    }

    ASSERT_EQ(fired_at.size(), 2u);
    EXPECT_DOUBLE_EQ(fired_at[0], 2.0);
    EXPECT_DOUBLE_EQ(fired_at[1], 4.0);
}

TEST(DwellScannerTest, DwellEventCarriesZoneClassAndDuration) {
    ZoneConfigStore store;
    ASSERT_TRUE(store.replace({squareZone("wait", ZoneType::WAITING_AREA)}, {}));
    DwellScanner scanner(store, identity(), scannerConfig());

    TrackRegistry registry;
    registry.touch("A", ObjectClass::PERSON, 10.0);
    registry.enterZone("A", "wait", 10.0);

    auto events = scanner.checkDwell(registry, 13.5);
    ASSERT_EQ(events.size(), 1u);
    const auto* dwell = std::get_if<ZoneDwell>(&events[0].payload);
    ASSERT_NE(dwell, nullptr);
    EXPECT_EQ(dwell->zone_id, "wait");
    EXPECT_EQ(dwell->object_class, ObjectClass::PERSON);
    EXPECT_DOUBLE_EQ(dwell->dwell_seconds, 3.5);
    EXPECT_DOUBLE_EQ(dwell->confidence, EventConfidence::ZONE_DWELL);
    EXPECT_EQ(events[0].camera_id, CAMERA);
    EXPECT_EQ(events[0].site_id, SITE);

    // 재무장 확인
    EXPECT_DOUBLE_EQ(registry.find("A")->zone_entry_times.at("wait"), 13.5);
}

TEST(DwellScannerTest, ZoneSpecificThresholdOverridesDefault) {
    ZoneDef zone = squareZone("wait", ZoneType::WAITING_AREA);
    zone.dwell_threshold_sec = 10.0;
    ZoneConfigStore store;
    ASSERT_TRUE(store.replace({zone}, {}));
    DwellScanner scanner(store, identity(), scannerConfig());

    TrackRegistry registry;
    registry.touch("A", ObjectClass::PERSON, 0.0);
    registry.enterZone("A", "wait", 0.0);

    EXPECT_TRUE(scanner.checkDwell(registry, 5.0).empty());
    EXPECT_EQ(scanner.checkDwell(registry, 10.0).size(), 1u);
}

TEST(DwellScannerTest, UnknownZoneIsSkipped) {
    ZoneConfigStore store;
    DwellScanner scanner(store, identity(), scannerConfig());

    TrackRegistry registry;
    registry.touch("A", ObjectClass::PERSON, 0.0);
    registry.enterZone("A", "removed", 0.0);

    EXPECT_TRUE(scanner.checkDwell(registry, 100.0).empty());
    EXPECT_EQ(scanner.getStatistics().unknown_zone_skips, 1u);
}

TEST(DwellScannerTest, GreetCrossProductOfVehiclesAndPersons) {
    ZoneConfigStore store;
    ASSERT_TRUE(store.replace({squareZone("greet", ZoneType::GREET_ZONE)}, {}));
    DwellScanner scanner(store, identity(), scannerConfig());

    TrackRegistry registry;
    registry.touch("V1", ObjectClass::VEHICLE, 0.0);
    registry.touch("V2", ObjectClass::TRUCK, 0.0);
    registry.touch("P1", ObjectClass::PERSON, 0.0);
    registry.enterZone("V1", "greet", 0.0);
    registry.enterZone("V2", "greet", 0.0);
    registry.enterZone("P1", "greet", 0.0);

    auto events = scanner.checkGreetProximity(registry, 1.5);
    EXPECT_EQ(countGreets(events), 2u);

    // 다음 틱에도 같은 쌍이 다시 발생
    EXPECT_EQ(countGreets(scanner.checkGreetProximity(registry, 2.5)), 2u);
}

TEST(DwellScannerTest, GreetProximityIsMinimumOfBothDwells) {
    ZoneConfigStore store;
    ASSERT_TRUE(store.replace({squareZone("greet", ZoneType::GREET_ZONE)}, {}));
    DwellScanner scanner(store, identity(), scannerConfig());

    TrackRegistry registry;
    registry.touch("V1", ObjectClass::VEHICLE, 0.0);
    registry.touch("P1", ObjectClass::PERSON, 3.0);
    registry.enterZone("V1", "greet", 0.0);
    registry.enterZone("P1", "greet", 3.0);

    // 보행자 체류 0.5초 → 미달
    EXPECT_TRUE(scanner.checkGreetProximity(registry, 3.5).empty());

    auto events = scanner.checkGreetProximity(registry, 5.0);
    ASSERT_EQ(events.size(), 1u);
    const auto* greet = std::get_if<GreetStarted>(&events[0].payload);
    ASSERT_NE(greet, nullptr);
    EXPECT_EQ(greet->vehicle_track_id, "V1");
    EXPECT_EQ(greet->person_track_id, "P1");
    EXPECT_EQ(greet->zone_id, "greet");
    EXPECT_DOUBLE_EQ(greet->proximity_seconds, 2.0);
    EXPECT_DOUBLE_EQ(greet->confidence, EventConfidence::GREET_STARTED);
}

TEST(DwellScannerTest, NonGreetZonesAndOtherCamerasAreIgnoredForGreet) {
    ZoneConfigStore store;
    ASSERT_TRUE(store.replace({squareZone("wait", ZoneType::WAITING_AREA),
                               squareZone("greet-other", ZoneType::GREET_ZONE, "cam-2")}, {}));
    DwellScanner scanner(store, identity(), scannerConfig());

    TrackRegistry registry;
    for (const auto& zone_id : {"wait", "greet-other"}) {
        registry.touch("V1", ObjectClass::VEHICLE, 0.0);
        registry.touch("P1", ObjectClass::PERSON, 0.0);
        registry.enterZone("V1", zone_id, 0.0);
        registry.enterZone("P1", zone_id, 0.0);
    }

    EXPECT_TRUE(scanner.checkGreetProximity(registry, 10.0).empty());
}

TEST(DwellScannerTest, BicycleIsNeitherVehicleNorPersonForGreet) {
    ZoneConfigStore store;
    ASSERT_TRUE(store.replace({squareZone("greet", ZoneType::GREET_ZONE)}, {}));
    DwellScanner scanner(store, identity(), scannerConfig());

    TrackRegistry registry;
    registry.touch("B1", ObjectClass::BICYCLE, 0.0);
    registry.touch("P1", ObjectClass::PERSON, 0.0);
    registry.enterZone("B1", "greet", 0.0);
    registry.enterZone("P1", "greet", 0.0);

    EXPECT_TRUE(scanner.checkGreetProximity(registry, 10.0).empty());
}
