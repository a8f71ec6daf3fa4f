/*
 * throughput_reporter.h
 *
 * 드라이브 처리량 주기 보고기
 * - 정각 기준 인터벌 경계에 맞춰 동작 (예: 15분 → 00, 15, 30, 45분)
 * - 경계마다 직전 구간의 사이트별 drive_throughput 메트릭을 기록
 */

#ifndef THROUGHPUT_REPORTER_H
#define THROUGHPUT_REPORTER_H

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include "../../analytics/metrics/metrics_engine.h"
#include "../../data/sink/sink_interfaces.h"

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

class ThroughputReporter {
private:
    MetricsEngine& engine_;
    MetricSink& sink_;
    int interval_minutes_;

    std::thread interval_thread_;
    std::atomic<bool> running_{false};
    std::mutex cv_mutex_;
    std::condition_variable cv_;

    std::atomic<uint64_t> reports_{0};

    std::shared_ptr<spdlog::logger> logger = nullptr;

    void intervalTimerThread();

public:
    /**
     * @brief 생성자
     * @param engine 처리량 계산 대상 엔진
     * @param sink 메트릭 기록 대상
     * @param interval_minutes 보고 인터벌 (60의 약수, 아니면 15분)
     */
    ThroughputReporter(MetricsEngine& engine, MetricSink& sink, int interval_minutes);
    ~ThroughputReporter();

    void start();
    void stop();

    /**
     * @brief 다음 인터벌 경계 시각 계산
     * @param current_time 현재 시각 (Unix 초)
     * @return 다음 경계 시각 (Unix 초, 현재가 경계면 현재 시각)
     */
    int calculateNextIntervalTime(int current_time) const;

    /**
     * @brief [window_end - interval, window_end) 구간을 모든 사이트에 대해 보고
     * @return 기록한 메트릭 수
     */
    size_t reportInterval(double window_end);

    int getIntervalMinutes() const { return interval_minutes_; }
    uint64_t getReportCount() const { return reports_.load(); }
    bool isRunning() const { return running_.load(); }
};

#endif // THROUGHPUT_REPORTER_H
