/*
 * redis_event_publisher.h
 *
 * 도메인 이벤트 / 메트릭을 Redis 채널로 발행하는 출력 구현체
 * AsyncDispatcher 뒤에 붙여 사용 (Redis 호출은 워커 스레드에서만 발생)
 */

#ifndef REDIS_EVENT_PUBLISHER_H
#define REDIS_EVENT_PUBLISHER_H

#include <atomic>
#include <cstdint>
#include <memory>
#include "redis_client.h"
#include "../sink/sink_interfaces.h"

class RedisEventPublisher : public EventPublisher, public MetricSink {
public:
    struct Statistics {
        uint64_t events_sent = 0;
        uint64_t metrics_sent = 0;
        uint64_t send_failures = 0;
    };

    explicit RedisEventPublisher(RedisClient& client);

    void publish(const DomainEvent& event) override;
    void record(const MetricValue& metric) override;

    Statistics getStatistics() const;

private:
    RedisClient& client_;

    std::atomic<uint64_t> events_sent_{0};
    std::atomic<uint64_t> metrics_sent_{0};
    std::atomic<uint64_t> send_failures_{0};

    std::shared_ptr<spdlog::logger> logger;
};

#endif // REDIS_EVENT_PUBLISHER_H
