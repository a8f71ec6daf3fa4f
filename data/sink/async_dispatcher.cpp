/*
 * async_dispatcher.cpp
 *
 * 비동기 이벤트/메트릭 전달 구현
 */

#include "async_dispatcher.h"

AsyncDispatcher::AsyncDispatcher(size_t queue_capacity)
    : queue_(queue_capacity) {
    logger = getLogger("DV_Dispatcher_log");
    logger->info("AsyncDispatcher 생성 - 큐 용량: {}", queue_capacity);
}

AsyncDispatcher::~AsyncDispatcher() {
    stop();
}

void AsyncDispatcher::addEventPublisher(EventPublisher* publisher) {
    if (publisher) {
        event_publishers_.push_back(publisher);
    }
}

void AsyncDispatcher::addMetricSink(MetricSink* sink) {
    if (sink) {
        metric_sinks_.push_back(sink);
    }
}

void AsyncDispatcher::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load()) {
        logger->warn("AsyncDispatcher 이미 실행 중");
        return;
    }

    running_ = true;
    worker_thread_ = std::thread(&AsyncDispatcher::workerThread, this);
    logger->info("AsyncDispatcher 시작 - 발행자: {}개, 메트릭 싱크: {}개",
                 event_publishers_.size(), metric_sinks_.size());
}

void AsyncDispatcher::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_.load()) {
        return;
    }

    logger->info("AsyncDispatcher 중지 시작 - 대기 항목: {}", queue_.size());
    running_ = false;
    queue_.stop();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    logger->info("AsyncDispatcher 중지 완료 - 전달: {}, 버림: {}, 오류: {}",
                 delivered_.load(), dropped_.load(), delivery_errors_.load());
}

void AsyncDispatcher::publish(const DomainEvent& event) {
    events_enqueued_++;
    if (queue_.push(Item(event))) {
        dropped_++;
        logger->warn("전달 큐 포화 - 가장 오래된 항목 버림");
    }
}

void AsyncDispatcher::record(const MetricValue& metric) {
    metrics_enqueued_++;
    if (queue_.push(Item(metric))) {
        dropped_++;
        logger->warn("전달 큐 포화 - 가장 오래된 항목 버림");
    }
}

void AsyncDispatcher::workerThread() {
    logger->info("전달 워커 스레드 시작");

    Item item;
    while (queue_.pop(item)) {
        deliver(item);
    }

    logger->info("전달 워커 스레드 종료");
}

void AsyncDispatcher::deliver(const Item& item) {
    try {
        if (const auto* event = std::get_if<DomainEvent>(&item)) {
            for (auto* publisher : event_publishers_) {
                publisher->publish(*event);
            }
        } else if (const auto* metric = std::get_if<MetricValue>(&item)) {
            for (auto* sink : metric_sinks_) {
                sink->record(*metric);
            }
        }
        delivered_++;
    } catch (const std::exception& e) {
        delivery_errors_++;
        logger->error("하위 전달 실패: {}", e.what());
    }
}

AsyncDispatcher::Statistics AsyncDispatcher::getStatistics() const {
    Statistics stats;
    stats.events_enqueued = events_enqueued_.load();
    stats.metrics_enqueued = metrics_enqueued_.load();
    stats.delivered = delivered_.load();
    stats.dropped = dropped_.load();
    stats.delivery_errors = delivery_errors_.load();
    return stats;
}
