#include <gtest/gtest.h>
#include <mutex>
#include <stdexcept>
#include "data/sink/async_dispatcher.h"
#include "test_helpers.h"

using namespace testutil;

namespace {

class RecordingPublisher : public EventPublisher, public MetricSink {
public:
    void publish(const DomainEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events.push_back(event.event_id);
    }
    void record(const MetricValue& metric) override {
        std::lock_guard<std::mutex> lock(mutex_);
        metrics.push_back(metric.metric_id);
    }
    std::vector<std::string> events;
    std::vector<std::string> metrics;

private:
    std::mutex mutex_;
};

class FailingPublisher : public EventPublisher {
public:
    void publish(const DomainEvent&) override {
        throw std::runtime_error("transport down");
    }
};

MetricValue metric(const std::string& id) {
    MetricValue m;
    m.metric_id = id;
    m.site_id = SITE;
    return m;
}

}  // namespace

TEST(AsyncDispatcherTest, DeliversEverythingInOrderOnStop) {
    RecordingPublisher downstream;
    AsyncDispatcher dispatcher(64);
    dispatcher.addEventPublisher(&downstream);
    dispatcher.addMetricSink(&downstream);
    dispatcher.start();

    std::vector<std::string> expected;
    for (int i = 0; i < 10; ++i) {
        DomainEvent e = event(100.0 + i, VehicleArrival{"T" + std::to_string(i), "entry", "", 0.9});
        expected.push_back(e.event_id);
        dispatcher.publish(e);
    }
    dispatcher.record(metric("m-1"));
    dispatcher.stop();

    EXPECT_EQ(downstream.events, expected);
    ASSERT_EQ(downstream.metrics.size(), 1u);
    EXPECT_EQ(downstream.metrics[0], "m-1");

    auto stats = dispatcher.getStatistics();
    EXPECT_EQ(stats.events_enqueued, 10u);
    EXPECT_EQ(stats.metrics_enqueued, 1u);
    EXPECT_EQ(stats.delivered, 11u);
    EXPECT_EQ(stats.dropped, 0u);
    EXPECT_FALSE(dispatcher.isRunning());
}

TEST(AsyncDispatcherTest, FullQueueDropsOldest) {
    RecordingPublisher downstream;
    AsyncDispatcher dispatcher(3);
    dispatcher.addMetricSink(&downstream);

    // 시작 전 적재: 워커가 없으므로 큐가 그대로 찬다
    for (int i = 0; i < 5; ++i) {
        dispatcher.record(metric("m-" + std::to_string(i)));
    }
    EXPECT_EQ(dispatcher.pendingCount(), 3u);
    EXPECT_EQ(dispatcher.getStatistics().dropped, 2u);

    dispatcher.start();
    dispatcher.stop();

    std::vector<std::string> expected = {"m-2", "m-3", "m-4"};
    EXPECT_EQ(downstream.metrics, expected);
}

TEST(AsyncDispatcherTest, DownstreamExceptionIsCountedAndWorkerContinues) {
    FailingPublisher failing;
    RecordingPublisher downstream;
    AsyncDispatcher dispatcher(16);
    dispatcher.addEventPublisher(&failing);
    dispatcher.addMetricSink(&downstream);
    dispatcher.start();

    dispatcher.publish(event(1.0, VehicleExit{"A", "exit", "", 0.9}));
    dispatcher.record(metric("after-failure"));
    dispatcher.stop();

    auto stats = dispatcher.getStatistics();
    EXPECT_EQ(stats.delivery_errors, 1u);
    ASSERT_EQ(downstream.metrics.size(), 1u);
    EXPECT_EQ(downstream.metrics[0], "after-failure");
}

TEST(AsyncDispatcherTest, StopWithoutStartIsHarmless) {
    AsyncDispatcher dispatcher;
    dispatcher.stop();
    EXPECT_FALSE(dispatcher.isRunning());
}
