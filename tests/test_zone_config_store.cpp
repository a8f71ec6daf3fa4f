#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include "data/serialization/event_json.h"
#include "roi_module/zone_config_store.h"
#include "test_helpers.h"

using namespace testutil;

namespace {

const char* kZonesJson = R"({
    "zones": [
        {"zone_id": "greet-1", "camera_id": "cam-1", "name": "Greet", "zone_type": "greet_zone",
         "polygon": [[0, 0], [100, 0], [100, 100], [0, 100]]},
        {"zone_id": "wait-1", "camera_id": "cam-2", "zone_type": "waiting_area",
         "polygon": [{"x": 0, "y": 0}, {"x": 50, "y": 0}, {"x": 50, "y": 50}],
         "dwell_threshold_sec": 30}
    ],
    "lines": [
        {"line_id": "entry-1", "camera_id": "cam-1", "line_type": "entry",
         "points": [[0, 50], [200, 50]], "direction": "clockwise"}
    ]
})";

Json::Value parse(const std::string& text) {
    Json::Value root;
    EXPECT_TRUE(parseJsonString(text, root));
    return root;
}

}  // namespace

TEST(ZoneConfigStoreTest, LoadsZonesAndLinesFromJson) {
    ZoneConfigStore store;
    ASSERT_TRUE(store.loadFromJson(parse(kZonesJson)));

    EXPECT_EQ(store.zoneCount(), 2u);
    EXPECT_EQ(store.lineCount(), 1u);

    auto greet = store.findZone("greet-1");
    ASSERT_TRUE(greet.has_value());
    EXPECT_EQ(greet->zone_type, ZoneType::GREET_ZONE);
    EXPECT_EQ(greet->polygon.size(), 4u);
    EXPECT_FALSE(greet->dwell_threshold_sec.has_value());

    auto wait = store.findZone("wait-1");
    ASSERT_TRUE(wait.has_value());
    ASSERT_TRUE(wait->dwell_threshold_sec.has_value());
    EXPECT_DOUBLE_EQ(*wait->dwell_threshold_sec, 30.0);
    EXPECT_DOUBLE_EQ(wait->effectiveDwellThreshold(2.0), 30.0);

    auto line = store.findLine("entry-1");
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(line->line_type, LineType::ENTRY);
    EXPECT_EQ(line->direction, "clockwise");
    EXPECT_DOUBLE_EQ(line->p2.x, 200.0);
}

TEST(ZoneConfigStoreTest, LookupsArePerCamera) {
    ZoneConfigStore store;
    ASSERT_TRUE(store.loadFromJson(parse(kZonesJson)));

    EXPECT_EQ(store.zonesForCamera("cam-1").size(), 1u);
    EXPECT_EQ(store.zonesForCamera("cam-2").size(), 1u);
    EXPECT_EQ(store.linesForCamera("cam-2").size(), 0u);
    EXPECT_EQ(store.greetZones("cam-1").size(), 1u);
    EXPECT_TRUE(store.greetZones("cam-2").empty());
    EXPECT_FALSE(store.findZone("missing").has_value());
}

TEST(ZoneConfigStoreTest, RejectsPolygonWithTooFewPoints) {
    ZoneDef zone = squareZone("z", ZoneType::CUSTOM);
    zone.polygon.resize(2);

    ZoneConfigStore store;
    EXPECT_FALSE(store.replace({zone}, {}));
}

TEST(ZoneConfigStoreTest, RejectsLineWithIdenticalPoints) {
    LineDef line = horizontalLine("l", LineType::ENTRY);
    line.p2 = line.p1;

    ZoneConfigStore store;
    EXPECT_FALSE(store.replace({}, {line}));
}

TEST(ZoneConfigStoreTest, RejectsDuplicateIds) {
    ZoneConfigStore store;
    EXPECT_FALSE(store.replace({squareZone("z", ZoneType::BAY), squareZone("z", ZoneType::LOBBY)}, {}));
    EXPECT_FALSE(store.replace({}, {horizontalLine("l", LineType::ENTRY),
                                    horizontalLine("l", LineType::EXIT)}));
}

TEST(ZoneConfigStoreTest, RejectsNegativeDwellThreshold) {
    ZoneDef zone = squareZone("z", ZoneType::WAITING_AREA);
    zone.dwell_threshold_sec = -1.0;

    ZoneConfigStore store;
    EXPECT_FALSE(store.replace({zone}, {}));
}

TEST(ZoneConfigStoreTest, FailedLoadKeepsPreviousConfiguration) {
    ZoneConfigStore store;
    ASSERT_TRUE(store.loadFromJson(parse(kZonesJson)));
    uint64_t version = store.version();

    const char* bad = R"({"zones": [], "lines": [{"line_id": "x", "camera_id": "cam-1",
                          "line_type": "entry", "points": [[0, 0]]}]})";
    EXPECT_FALSE(store.loadFromJson(parse(bad)));

    EXPECT_EQ(store.version(), version);
    EXPECT_EQ(store.zoneCount(), 2u);
    EXPECT_TRUE(store.findLine("entry-1").has_value());
}

TEST(ZoneConfigStoreTest, RejectsUnknownTypeNames) {
    const char* bad = R"({"zones": [{"zone_id": "z", "camera_id": "c", "zone_type": "moat",
                          "polygon": [[0, 0], [1, 0], [1, 1]]}]})";
    ZoneConfigStore store;
    EXPECT_FALSE(store.loadFromJson(parse(bad)));
}

TEST(ZoneConfigStoreTest, ReplaceBumpsVersion) {
    ZoneConfigStore store;
    uint64_t before = store.version();
    ASSERT_TRUE(store.replace({squareZone("z", ZoneType::BAY)}, {}));
    EXPECT_EQ(store.version(), before + 1);
}

TEST(ZoneConfigStoreTest, LoadFromFile) {
    std::string path = "/tmp/dealer_vision_zones_test.json";
    {
        std::ofstream out(path);
        out << kZonesJson;
    }

    ZoneConfigStore store;
    EXPECT_TRUE(store.loadFromFile(path));
    EXPECT_EQ(store.zoneCount(), 2u);
    std::remove(path.c_str());

    EXPECT_FALSE(store.loadFromFile("/tmp/dealer_vision_no_such_file.json"));
}
