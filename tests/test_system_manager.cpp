#include <gtest/gtest.h>
#include <mutex>
#include "server/manager/system_manager.h"
#include "test_helpers.h"

using namespace testutil;

namespace {

class RecordingPublisher : public EventPublisher {
public:
    void publish(const DomainEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events.push_back(event);
    }

    size_t countGreets() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& event : events) {
            if (std::holds_alternative<GreetStarted>(event.payload)) {
                count++;
            }
        }
        return count;
    }

    std::vector<DomainEvent> events;

private:
    std::mutex mutex_;
};

}  // namespace

class SystemManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.tenant_id = TENANT;
        config.site_id = SITE;
        config.camera_ids = {CAMERA};
        // 테스트 중 자동 스캔이 돌지 않도록 긴 주기
        config.scan_interval_ms = 600000;
        config.metric_store_enabled = true;
        config.db_path = "";
        config.db_name = ":memory:";
    }

    std::unique_ptr<SystemManager> makeSystem() {
        auto system = std::make_unique<SystemManager>(config);
        EXPECT_TRUE(system->initialize(""));
        EXPECT_TRUE(system->getZoneStore().replace(
            {squareZone("greet-1", ZoneType::GREET_ZONE)},
            {horizontalLine("entry-1", LineType::ENTRY)}));
        return system;
    }

    SystemManager::Config config;
};

TEST_F(SystemManagerTest, InitializeCreatesConfiguredPipelines) {
    auto system = makeSystem();
    EXPECT_EQ(system->getPipelineCount(), 1u);
    EXPECT_NE(system->findPipeline(CAMERA), nullptr);
    ASSERT_NE(system->getMetricStore(), nullptr);
    EXPECT_TRUE(system->getMetricStore()->isHealthy());
    EXPECT_EQ(system->getThroughputReporter(), nullptr);
}

TEST_F(SystemManagerTest, MissingZoneFileFailsInitialize) {
    SystemManager system(config);
    EXPECT_FALSE(system.initialize("/tmp/dealer_vision_missing_zones.json"));
}

TEST_F(SystemManagerTest, ArrivalThenGreetProducesStoredTtg) {
    auto system = makeSystem();
    RecordingPublisher publisher;
    system->addEventPublisher(&publisher);
    system->start();

    ASSERT_TRUE(system->onPrimitive(
        primitive("V1", PrimitiveKind::LINE_CROSSING, "entry-1", ObjectClass::VEHICLE, 1000.0), 1000.0).has_value());
    system->onPrimitive(primitive("V1", PrimitiveKind::ZONE_ENTRY, "greet-1", ObjectClass::VEHICLE, 1010.0), 1010.0);
    system->onPrimitive(primitive("P1", PrimitiveKind::ZONE_ENTRY, "greet-1", ObjectClass::PERSON, 1010.0), 1010.0);

    // 응대 1건 + 체류 2건
    EXPECT_EQ(system->scanTick(1020.0), 3u);

    system->stop();

    EXPECT_EQ(publisher.countGreets(), 1u);
    EXPECT_EQ(publisher.events.size(), 4u);

    auto stored = system->getMetricStore()->queryMetrics(SITE, MetricName::TIME_TO_GREET, 0, 1e10);
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_DOUBLE_EQ(stored[0].value, 20.0);
    EXPECT_EQ(stored[0].tenant_id, TENANT);

    auto stats = system->getStatistics();
    EXPECT_EQ(stats.primitives_received, 3u);
    EXPECT_EQ(stats.events_published, 4u);
    EXPECT_EQ(stats.metrics_generated, 1u);
    EXPECT_EQ(stats.scan_ticks, 1u);
    EXPECT_EQ(stats.metrics.ttg_metrics, 1u);
}

TEST_F(SystemManagerTest, UnknownCameraGetsPipelineLazily) {
    auto system = makeSystem();

    Primitive p = primitive("V1", PrimitiveKind::LINE_CROSSING, "entry-1", ObjectClass::VEHICLE, 1000.0);
    p.camera_id = "cam-new";
    system->onPrimitive(p);

    EXPECT_EQ(system->getPipelineCount(), 2u);
    ASSERT_NE(system->findPipeline("cam-new"), nullptr);
    EXPECT_EQ(system->findPipeline("cam-new")->getIdentity().site_id, SITE);
}

TEST_F(SystemManagerTest, EmptyIdentityFilledFromConfig) {
    auto system = makeSystem();

    Primitive p = primitive("V1", PrimitiveKind::LINE_CROSSING, "entry-1", ObjectClass::VEHICLE, 1000.0);
    p.tenant_id.clear();
    p.site_id.clear();
    auto event = system->onPrimitive(p, 1000.0);

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->tenant_id, TENANT);
    EXPECT_EQ(event->site_id, SITE);
    EXPECT_EQ(system->computeThroughput(SITE, 0, 2000), 1);
}

TEST_F(SystemManagerTest, PrimitiveWithoutCameraIgnored) {
    auto system = makeSystem();

    Primitive p = primitive("V1", PrimitiveKind::LINE_CROSSING, "entry-1", ObjectClass::VEHICLE, 1000.0);
    p.camera_id.clear();
    EXPECT_FALSE(system->onPrimitive(p).has_value());
    EXPECT_EQ(system->getPipelineCount(), 1u);
}

TEST_F(SystemManagerTest, DetectionsIgnoredWhenCrossingDisabled) {
    auto system = makeSystem();

    DetectionFrame frame;
    frame.camera_id = CAMERA;
    frame.timestamp = 1000.0;
    frame.detections = {detection("V1", ObjectClass::VEHICLE, 50, 40)};
    EXPECT_EQ(system->onDetections(frame), 0u);
    EXPECT_EQ(system->getStatistics().frames_received, 1u);
}

TEST_F(SystemManagerTest, DetectionsDriveArrivalCounting) {
    config.crossing_detection_enabled = true;
    auto system = makeSystem();

    DetectionFrame frame;
    frame.camera_id = CAMERA;
    frame.timestamp = 1000.0;
    frame.detections = {detection("V1", ObjectClass::VEHICLE, 50, 40)};
    // 첫 프레임: 존 진입만
    EXPECT_EQ(system->onDetections(frame, 1000.0), 1u);

    frame.timestamp = 1001.0;
    frame.detections = {detection("V1", ObjectClass::VEHICLE, 50, 60)};
    // 두 번째 프레임: entry-1 통과 → 차량 도착
    EXPECT_EQ(system->onDetections(frame, 1001.0), 1u);

    EXPECT_EQ(system->computeThroughput(SITE, 0, 2000), 1);
    auto track = system->findPipeline(CAMERA)->getTrack("V1");
    ASSERT_TRUE(track.has_value());
    EXPECT_EQ(track->zone_entry_times.count("greet-1"), 1u);
}

TEST_F(SystemManagerTest, InvalidFrameRejected) {
    config.crossing_detection_enabled = true;
    auto system = makeSystem();

    DetectionFrame frame;
    frame.camera_id = CAMERA;
    frame.detections = {detection("V1", ObjectClass::VEHICLE, 50, 40)};
    EXPECT_EQ(system->onDetections(frame), 0u);
}

TEST_F(SystemManagerTest, ThroughputReporterCreatedWhenEnabled) {
    config.throughput_report_enabled = true;
    config.throughput_interval_minutes = 5;
    auto system = makeSystem();
    ASSERT_NE(system->getThroughputReporter(), nullptr);
    EXPECT_EQ(system->getThroughputReporter()->getIntervalMinutes(), 5);
}

TEST_F(SystemManagerTest, TtgUnaffectedByCameraClockSkew) {
    auto system = makeSystem();
    RecordingPublisher publisher;
    system->addEventPublisher(&publisher);
    system->start();

    // 카메라 시계가 수신 시계보다 5초 빠름
    const double skew = 5.0;
    system->onPrimitive(
        primitive("V1", PrimitiveKind::LINE_CROSSING, "entry-1", ObjectClass::VEHICLE, 1000.0 + skew), 1000.0);
    system->onPrimitive(
        primitive("V1", PrimitiveKind::ZONE_ENTRY, "greet-1", ObjectClass::VEHICLE, 1001.0 + skew), 1001.0);
    system->onPrimitive(
        primitive("P1", PrimitiveKind::ZONE_ENTRY, "greet-1", ObjectClass::PERSON, 1001.0 + skew), 1001.0);

    system->scanTick(1002.0);
    system->stop();

    EXPECT_EQ(publisher.countGreets(), 1u);
    auto stored = system->getMetricStore()->queryMetrics(SITE, MetricName::TIME_TO_GREET, 0, 1e10);
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_DOUBLE_EQ(stored[0].value, 2.0);
}
