/*
 * throughput_reporter.cpp
 *
 * 인터벌 타이머 스레드: 첫 경계까지 정렬 대기 후 interval 마다 보고
 */

#include "throughput_reporter.h"
#include <chrono>
#include <ctime>
#include "../../common/common_types.h"

ThroughputReporter::ThroughputReporter(MetricsEngine& engine, MetricSink& sink, int interval_minutes)
    : engine_(engine), sink_(sink), interval_minutes_(interval_minutes) {
    logger = getLogger("DV_ThroughputReporter_log");

    if (interval_minutes_ <= 0 || 60 % interval_minutes_ != 0) {
        logger->warn("잘못된 보고 인터벌 {}분 - 15분으로 대체", interval_minutes_);
        interval_minutes_ = 15;
    }
    logger->info("처리량 보고기 생성 - 인터벌: {}분", interval_minutes_);
}

ThroughputReporter::~ThroughputReporter() {
    stop();
}

void ThroughputReporter::start() {
    if (running_.exchange(true)) {
        logger->warn("처리량 보고기가 이미 실행 중");
        return;
    }
    interval_thread_ = std::thread(&ThroughputReporter::intervalTimerThread, this);
    logger->info("처리량 보고기 시작");
}

void ThroughputReporter::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    cv_.notify_all();

    try {
        if (interval_thread_.joinable()) {
            interval_thread_.join();
        }
    } catch (const std::exception& e) {
        logger->error("스레드 종료 중 오류: {}", e.what());
    }
    logger->info("처리량 보고기 중지 - 누적 보고: {}", reports_.load());
}

int ThroughputReporter::calculateNextIntervalTime(int current_time) const {
    std::time_t time_t_current = static_cast<std::time_t>(current_time);
    std::tm tm_current{};
    localtime_r(&time_t_current, &tm_current);

    int current_minute = tm_current.tm_min;
    int current_second = tm_current.tm_sec;

    if (current_minute % interval_minutes_ == 0 && current_second == 0) {
        return current_time;  // 이미 경계
    }

    int minutes_to_next = interval_minutes_ - (current_minute % interval_minutes_);

    int seconds_to_next = (minutes_to_next * 60) - current_second;
    return current_time + seconds_to_next;
}

size_t ThroughputReporter::reportInterval(double window_end) {
    double window_start = window_end - interval_minutes_ * 60.0;
    WindowSize window = windowSizeFromMinutes(interval_minutes_);

    size_t recorded = 0;
    for (const auto& site_id : engine_.knownSites()) {
        // 연속 구간이므로 [start, end): 경계 시각 도착은 다음 구간에서 집계
        auto metric = engine_.throughputMetric(site_id, window_start, window_end, window, false);
        if (!metric) {
            continue;
        }
        sink_.record(*metric);
        recorded++;
        logger->info("처리량 보고 - site: {}, 구간: [{:.0f}, {:.0f}], 차량: {:.0f}",
                     site_id, window_start, window_end, metric->value);
    }

    reports_ += recorded;
    return recorded;
}

void ThroughputReporter::intervalTimerThread() {
    int current_time = static_cast<int>(getCurTimeSec());
    int next_interval = calculateNextIntervalTime(current_time);

    while (running_.load()) {
        int wait_seconds = next_interval - static_cast<int>(getCurTimeSec());
        if (wait_seconds > 0) {
            std::unique_lock<std::mutex> lock(cv_mutex_);
            if (cv_.wait_for(lock, std::chrono::seconds(wait_seconds),
                             [this]() { return !running_.load(); })) {
                logger->info("처리량 보고 스레드 조기 종료");
                return;
            }
        }

        try {
            reportInterval(static_cast<double>(next_interval));
        } catch (const std::exception& e) {
            // 24/7 동작 유지
            logger->error("처리량 보고 중 오류: {}", e.what());
        }

        next_interval += interval_minutes_ * 60;
    }
}
