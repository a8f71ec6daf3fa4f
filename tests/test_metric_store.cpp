#include <gtest/gtest.h>
#include <cstdio>
#include <unistd.h>
#include "data/sqlite/metric_store.h"
#include "test_helpers.h"

using namespace testutil;

namespace {

MetricValue makeMetric(const std::string& id, MetricName name, double window_start, double value) {
    MetricValue metric;
    metric.metric_id = id;
    metric.tenant_id = TENANT;
    metric.site_id = SITE;
    metric.metric_name = name;
    metric.window_start = window_start;
    metric.window_size = WindowSize::ONE_MINUTE;
    metric.value = value;
    metric.unit = MetricUnits::SECONDS;
    metric.created_at = window_start + 1;
    return metric;
}

}  // namespace

TEST(MetricStoreTest, InMemoryStoreIsHealthyWithSchema) {
    MetricStore store("", ":memory:");
    EXPECT_TRUE(store.isHealthy());
    EXPECT_TRUE(store.tableExists("metric_values"));
    EXPECT_FALSE(store.tableExists("no_such_table"));
}

TEST(MetricStoreTest, InsertAndQueryRoundTrip) {
    MetricStore store("", ":memory:");

    MetricValue rack = makeMetric("r-1", MetricName::RACK_TIME, 1000.0, 300.0);
    rack.dimensions["bay_id"] = "bay-1";
    rack.is_estimated = true;
    ASSERT_EQ(store.insertMetric(rack), 0);

    auto rows = store.queryMetrics(SITE, MetricName::RACK_TIME, 0.0, 2000.0);
    ASSERT_EQ(rows.size(), 1u);
    const MetricValue& row = rows[0];
    EXPECT_EQ(row.metric_id, "r-1");
    EXPECT_EQ(row.tenant_id, TENANT);
    EXPECT_EQ(row.metric_name, MetricName::RACK_TIME);
    EXPECT_DOUBLE_EQ(row.window_start, 1000.0);
    EXPECT_EQ(row.window_size, WindowSize::ONE_MINUTE);
    EXPECT_DOUBLE_EQ(row.value, 300.0);
    EXPECT_EQ(row.unit, MetricUnits::SECONDS);
    EXPECT_TRUE(row.is_estimated);
    EXPECT_DOUBLE_EQ(row.created_at, 1001.0);
    EXPECT_EQ(row.dimensions.at("bay_id"), "bay-1");
}

TEST(MetricStoreTest, QueryFiltersBySiteNameAndInclusiveRange) {
    MetricStore store("", ":memory:");
    store.record(makeMetric("a", MetricName::TIME_TO_GREET, 100.0, 10.0));
    store.record(makeMetric("b", MetricName::TIME_TO_GREET, 200.0, 20.0));
    store.record(makeMetric("c", MetricName::TIME_TO_GREET, 300.0, 30.0));
    store.record(makeMetric("d", MetricName::RACK_TIME, 200.0, 40.0));

    MetricValue other_site = makeMetric("e", MetricName::TIME_TO_GREET, 200.0, 50.0);
    other_site.site_id = "site-other";
    store.record(other_site);

    auto rows = store.queryMetrics(SITE, MetricName::TIME_TO_GREET, 100.0, 200.0);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].metric_id, "a");
    EXPECT_EQ(rows[1].metric_id, "b");
}

TEST(MetricStoreTest, QueryResultsAreOrderedByWindowStart) {
    MetricStore store("", ":memory:");
    store.record(makeMetric("late", MetricName::LOBBY_OCCUPANCY, 500.0, 1.0));
    store.record(makeMetric("early", MetricName::LOBBY_OCCUPANCY, 100.0, 2.0));

    auto rows = store.queryMetrics(SITE, MetricName::LOBBY_OCCUPANCY, 0.0, 1000.0);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].metric_id, "early");
    EXPECT_EQ(rows[1].metric_id, "late");
}

TEST(MetricStoreTest, FileBackedStoreCreatesDirectory) {
    std::string dir = "/tmp/dealer_vision_store_test_" + std::to_string(getpid());
    {
        MetricStore store(dir, "metrics.db");
        ASSERT_TRUE(store.isHealthy());
        EXPECT_EQ(store.insertMetric(makeMetric("f", MetricName::DRIVE_THROUGHPUT, 1.0, 3.0)), 0);
        EXPECT_EQ(store.optimize(), 0);
    }
    {
        MetricStore reopened(dir, "metrics.db");
        auto rows = reopened.queryMetrics(SITE, MetricName::DRIVE_THROUGHPUT, 0.0, 10.0);
        ASSERT_EQ(rows.size(), 1u);
        EXPECT_EQ(rows[0].metric_id, "f");
    }
    std::remove((dir + "/metrics.db").c_str());
    std::remove((dir + "/metrics.db-wal").c_str());
    std::remove((dir + "/metrics.db-shm").c_str());
    rmdir(dir.c_str());
}
