#include "redis_event_publisher.h"
#include "channel_types.h"
#include "../serialization/event_json.h"

RedisEventPublisher::RedisEventPublisher(RedisClient& client)
    : client_(client) {
    logger = getLogger("DV_RedisPublisher_log");
}

void RedisEventPublisher::publish(const DomainEvent& event) {
    std::string data = toCompactString(eventToJson(event));

    int result = client_.sendData(CHANNEL_EVENTS, data);
    if (result != RedisClient::SEND_OK) {
        send_failures_++;
        logger->warn("이벤트 발행 실패 - id: {}, type: {}, code: {}",
                     event.event_id, getEventTypeName(event), result);
        return;
    }
    events_sent_++;
}

void RedisEventPublisher::record(const MetricValue& metric) {
    std::string data = toCompactString(metricToJson(metric));

    int result = client_.sendData(CHANNEL_METRICS, data);
    if (result != RedisClient::SEND_OK) {
        send_failures_++;
        logger->warn("메트릭 발행 실패 - {} (site: {}), code: {}",
                     metricNameToString(metric.metric_name), metric.site_id, result);
        return;
    }
    metrics_sent_++;
}

RedisEventPublisher::Statistics RedisEventPublisher::getStatistics() const {
    Statistics stats;
    stats.events_sent = events_sent_.load();
    stats.metrics_sent = metrics_sent_.load();
    stats.send_failures = send_failures_.load();
    return stats;
}
