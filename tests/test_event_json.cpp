#include <gtest/gtest.h>
#include "data/serialization/event_json.h"
#include "test_helpers.h"

using namespace testutil;

TEST(EventJsonTest, EventEnvelopeAndPayload) {
    GreetStarted greet;
    greet.vehicle_track_id = "V1";
    greet.person_track_id = "P1";
    greet.zone_id = "greet-1";
    greet.proximity_seconds = 2.5;
    DomainEvent e = event(1700000000.5, greet);

    Json::Value root = eventToJson(e);
    EXPECT_EQ(root["event_id"].asString(), e.event_id);
    EXPECT_EQ(root["event_type"].asString(), "greet_started");
    EXPECT_EQ(root["tenant_id"].asString(), TENANT);
    EXPECT_EQ(root["site_id"].asString(), SITE);
    EXPECT_EQ(root["camera_id"].asString(), CAMERA);
    EXPECT_DOUBLE_EQ(root["timestamp"].asDouble(), 1700000000.5);

    const Json::Value& payload = root["payload"];
    EXPECT_EQ(payload["vehicle_track_id"].asString(), "V1");
    EXPECT_EQ(payload["person_track_id"].asString(), "P1");
    EXPECT_EQ(payload["zone_id"].asString(), "greet-1");
    EXPECT_DOUBLE_EQ(payload["proximity_seconds"].asDouble(), 2.5);
    EXPECT_DOUBLE_EQ(payload["confidence"].asDouble(), EventConfidence::GREET_STARTED);
}

TEST(EventJsonTest, ZoneDwellWritesObjectClassName) {
    ZoneDwell dwell;
    dwell.track_id = "A";
    dwell.zone_id = "wait";
    dwell.object_class = ObjectClass::PERSON;
    dwell.dwell_seconds = 4.0;

    Json::Value root = eventToJson(event(10.0, dwell));
    EXPECT_EQ(root["event_type"].asString(), "zone_dwell");
    EXPECT_EQ(root["payload"]["object_class"].asString(), "person");
}

TEST(EventJsonTest, MetricUsesStringNamesAndDimensionObject) {
    MetricValue metric;
    metric.metric_id = "m-1";
    metric.tenant_id = TENANT;
    metric.site_id = SITE;
    metric.metric_name = MetricName::RACK_TIME;
    metric.window_start = 100.0;
    metric.window_size = WindowSize::ONE_MINUTE;
    metric.value = 300.0;
    metric.unit = MetricUnits::SECONDS;
    metric.dimensions["bay_id"] = "bay-1";
    metric.is_estimated = true;

    Json::Value root = metricToJson(metric);
    EXPECT_EQ(root["metric_name"].asString(), "rack_time");
    EXPECT_EQ(root["window_size"].asString(), "1m");
    EXPECT_EQ(root["unit"].asString(), "seconds");
    EXPECT_TRUE(root["is_estimated"].asBool());
    EXPECT_EQ(root["dimensions"]["bay_id"].asString(), "bay-1");
}

TEST(EventJsonTest, MetricWithoutDimensionsHasEmptyObject) {
    MetricValue metric;
    metric.metric_name = MetricName::DRIVE_THROUGHPUT;
    Json::Value root = metricToJson(metric);
    EXPECT_TRUE(root["dimensions"].isObject());
    EXPECT_EQ(toCompactString(root["dimensions"]), "{}");
}

TEST(EventJsonTest, ParsesPrimitive) {
    Json::Value root;
    ASSERT_TRUE(parseJsonString(R"({"track_id": 42, "kind": "line_crossing", "reference_id": "entry-1",
        "direction": "forward", "confidence": 0.7, "object_class": "car",
        "camera_id": "cam-1", "site_id": "site-s", "tenant_id": "tenant-t",
        "timestamp": 1700000000.25})", root));

    auto primitive = primitiveFromJson(root);
    ASSERT_TRUE(primitive.has_value());
    EXPECT_EQ(primitive->track_id, "42");
    EXPECT_EQ(primitive->kind, PrimitiveKind::LINE_CROSSING);
    EXPECT_EQ(primitive->reference_id, "entry-1");
    EXPECT_EQ(primitive->direction, "forward");
    EXPECT_EQ(primitive->object_class, ObjectClass::VEHICLE);
    EXPECT_DOUBLE_EQ(primitive->confidence, 0.7);
    EXPECT_DOUBLE_EQ(primitive->timestamp, 1700000000.25);
}

TEST(EventJsonTest, RejectsIncompletePrimitive) {
    const char* cases[] = {
        R"({"kind": "zone_entry", "reference_id": "z", "object_class": "person", "camera_id": "c", "timestamp": 1})",
        R"({"track_id": "a", "kind": "teleport", "reference_id": "z", "object_class": "person", "camera_id": "c", "timestamp": 1})",
        R"({"track_id": "a", "kind": "zone_entry", "reference_id": "z", "object_class": "dragon", "camera_id": "c", "timestamp": 1})",
        R"({"track_id": "a", "kind": "zone_entry", "reference_id": "z", "object_class": "person", "camera_id": "c", "timestamp": "soon"})",
        R"({"track_id": "a", "kind": "zone_entry", "object_class": "person", "camera_id": "c", "timestamp": 1})",
        R"([1, 2, 3])",
    };
    for (const char* text : cases) {
        Json::Value root;
        ASSERT_TRUE(parseJsonString(text, root)) << text;
        EXPECT_FALSE(primitiveFromJson(root).has_value()) << text;
    }
}

TEST(EventJsonTest, ParsesDetectionFrameSkippingBadEntries) {
    Json::Value root;
    ASSERT_TRUE(parseJsonString(R"({"camera_id": "cam-1", "timestamp": 12.5, "detections": [
        {"track_id": 7, "object_class": "person", "confidence": 0.8, "bbox": [10, 20, 30, 40]},
        {"track_id": "8", "object_class": "unicorn", "bbox": [0, 0, 1, 1]},
        {"track_id": "9", "object_class": "truck", "bbox": [0, 0, 1]},
        {"object_class": "bus", "bbox": [0, 0, 1, 1]}
    ]})", root));

    auto frame = detectionsFromJson(root);
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->camera_id, "cam-1");
    EXPECT_DOUBLE_EQ(frame->timestamp, 12.5);
    ASSERT_EQ(frame->detections.size(), 1u);

    const auto& det = frame->detections[0];
    EXPECT_EQ(det.track_id, "7");
    EXPECT_EQ(det.object_class, ObjectClass::PERSON);
    EXPECT_DOUBLE_EQ(det.bbox.left, 10.0);
    EXPECT_DOUBLE_EQ(det.bbox.top, 20.0);
    EXPECT_DOUBLE_EQ(det.bbox.width, 30.0);
    EXPECT_DOUBLE_EQ(det.bbox.height, 40.0);
}

TEST(EventJsonTest, RejectsDetectionFrameWithoutHeader) {
    Json::Value root;
    ASSERT_TRUE(parseJsonString(R"({"timestamp": 1, "detections": []})", root));
    EXPECT_FALSE(detectionsFromJson(root).has_value());
}

TEST(EventJsonTest, ParseFailureReportsErrors) {
    Json::Value root;
    std::string errors;
    EXPECT_FALSE(parseJsonString("{not json", root, &errors));
    EXPECT_FALSE(errors.empty());
}
