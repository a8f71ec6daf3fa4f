/*
 * async_dispatcher.h
 *
 * 비동기 이벤트/메트릭 전달기
 * - 코어 쪽 publish/record 호출은 큐 삽입만 하고 즉시 반환
 * - 워커 스레드 하나가 등록된 하위 발행자/싱크로 순서대로 전달
 * - 하위 구현의 예외는 로그 후 계속 진행
 */

#ifndef ASYNC_DISPATCHER_H
#define ASYNC_DISPATCHER_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <variant>
#include <vector>
#include "dispatch_queue.h"
#include "sink_interfaces.h"

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

class AsyncDispatcher : public EventPublisher, public MetricSink {
public:
    struct Statistics {
        uint64_t events_enqueued = 0;
        uint64_t metrics_enqueued = 0;
        uint64_t delivered = 0;
        uint64_t dropped = 0;           // 큐 포화로 버려진 항목
        uint64_t delivery_errors = 0;   // 하위 구현 예외
    };

    explicit AsyncDispatcher(size_t queue_capacity = 1024);
    ~AsyncDispatcher() override;

    /**
     * @brief 하위 이벤트 발행자 등록 (start 이전에 호출)
     */
    void addEventPublisher(EventPublisher* publisher);

    /**
     * @brief 하위 메트릭 싱크 등록 (start 이전에 호출)
     */
    void addMetricSink(MetricSink* sink);

    void start();

    /**
     * @brief 중지 (큐에 남은 항목은 모두 전달 후 종료)
     */
    void stop();

    void publish(const DomainEvent& event) override;
    void record(const MetricValue& metric) override;

    bool isRunning() const { return running_.load(); }
    size_t pendingCount() const { return queue_.size(); }
    Statistics getStatistics() const;

private:
    using Item = std::variant<DomainEvent, MetricValue>;

    void workerThread();
    void deliver(const Item& item);

    DispatchQueue<Item> queue_;
    std::vector<EventPublisher*> event_publishers_;
    std::vector<MetricSink*> metric_sinks_;

    std::thread worker_thread_;
    std::atomic<bool> running_{false};
    std::mutex lifecycle_mutex_;

    std::atomic<uint64_t> events_enqueued_{0};
    std::atomic<uint64_t> metrics_enqueued_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> delivery_errors_{0};

    std::shared_ptr<spdlog::logger> logger;
};

#endif // ASYNC_DISPATCHER_H
