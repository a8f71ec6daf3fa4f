/*
 * system_manager.h
 *
 * 엣지 분석 시스템 통합 관리 클래스
 * - 모듈 초기화 및 생명주기 관리
 * - 카메라별 파이프라인 / 라인·존 판정기 관리 (미등록 카메라는 지연 생성)
 * - 이벤트 → 메트릭 엔진 → 비동기 디스패처 연결
 * - 스캔 스레드 (고정 주기) 및 처리량 보고기 관리
 *
 * 전송 계층(Redis 등)은 외부에서 addEventPublisher / addMetricSink 로 주입
 */

#ifndef SYSTEM_MANAGER_H
#define SYSTEM_MANAGER_H

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "../report/throughput_reporter.h"
#include "../../analytics/metrics/metrics_engine.h"
#include "../../analytics/pipeline/camera_pipeline.h"
#include "../../data/serialization/event_json.h"
#include "../../data/sink/async_dispatcher.h"
#include "../../data/sqlite/metric_store.h"
#include "../../roi_module/crossing_detector.h"
#include "../../roi_module/zone_config_store.h"

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

class ConfigManager;

class SystemManager {
public:
    struct Config {
        std::string tenant_id;
        std::string site_id;
        std::vector<std::string> camera_ids;

        CameraPipeline::Config pipeline;
        MetricsEngine::Config metrics;

        int scan_interval_ms = 1000;
        double detection_max_age_sec = 5.0;
        size_t dispatch_queue_capacity = 1024;

        bool crossing_detection_enabled = false;
        bool throughput_report_enabled = false;
        int throughput_interval_minutes = 15;

        bool metric_store_enabled = false;
        std::string db_path;
        std::string db_name;
    };

    struct Statistics {
        uint64_t primitives_received = 0;
        uint64_t frames_received = 0;
        uint64_t events_published = 0;
        uint64_t metrics_generated = 0;
        uint64_t scan_ticks = 0;
        size_t pipelines = 0;
        size_t active_tracks = 0;
        MetricsEngine::Statistics metrics;
        AsyncDispatcher::Statistics dispatcher;
    };

    /**
     * @brief ConfigManager 캐시 값으로 Config 구성
     */
    static Config configFromManager(const ConfigManager& config);

    explicit SystemManager(const Config& config);
    ~SystemManager();

    /**
     * @brief 시스템 초기화 (라인/존 설정 로드, 메트릭 저장소 생성, 카메라 파이프라인 생성)
     * @param zone_config_path zones.json 경로 (빈 문자열이면 로드하지 않음)
     * @return 성공 시 true
     */
    bool initialize(const std::string& zone_config_path);

    /**
     * @brief 하위 출력 등록 (start 이전에 호출)
     */
    void addEventPublisher(EventPublisher* publisher);
    void addMetricSink(MetricSink* sink);

    /**
     * @brief 디스패처, 스캔 스레드, 처리량 보고기 시작
     */
    void start();

    /**
     * @brief 역순 중지 (대기 중인 이벤트/메트릭은 모두 전달 후 종료)
     */
    void stop();

    /**
     * @brief 프리미티브 입력 처리 (수신 시각 = 현재 시각)
     * @return 생성된 도메인 이벤트 (없으면 nullopt)
     */
    std::optional<DomainEvent> onPrimitive(const Primitive& primitive);

    /**
     * @brief 프리미티브 입력 처리
     * @param now 수신 시각 (scanTick 과 같은 시계)
     */
    std::optional<DomainEvent> onPrimitive(const Primitive& primitive, double now);

    /**
     * @brief 추적 박스 프레임 입력 처리 (라인/존 판정 활성 시에만)
     * @return 프레임에서 생성된 프리미티브 수
     */
    size_t onDetections(const DetectionFrame& frame);
    size_t onDetections(const DetectionFrame& frame, double now);

    /**
     * @brief 한 번의 스캔 틱 수행 (모든 카메라)
     * @param now 현재 시각 (Unix 초)
     * @return 생성된 이벤트 수
     */
    size_t scanTick(double now);

    /**
     * @brief 구간 처리량 조회
     */
    int computeThroughput(const std::string& site_id, double start_time, double end_time) const;

    ZoneConfigStore& getZoneStore() { return zone_store_; }
    MetricsEngine& getMetricsEngine() { return *metrics_engine_; }
    MetricStore* getMetricStore() { return metric_store_.get(); }
    ThroughputReporter* getThroughputReporter() { return throughput_reporter_.get(); }

    size_t getPipelineCount() const;
    CameraPipeline* findPipeline(const std::string& camera_id) const;
    bool isRunning() const { return running_.load(); }
    Statistics getStatistics() const;

private:
    Config config_;

    ZoneConfigStore zone_store_;
    std::unique_ptr<AsyncDispatcher> dispatcher_;
    std::unique_ptr<MetricsEngine> metrics_engine_;
    std::unique_ptr<MetricStore> metric_store_;
    std::unique_ptr<ThroughputReporter> throughput_reporter_;

    std::map<std::string, std::unique_ptr<CameraPipeline>> pipelines_;
    std::map<std::string, std::unique_ptr<CrossingDetector>> detectors_;
    mutable std::mutex pipelines_mutex_;

    // 스캔 스레드
    std::thread scan_thread_;
    std::atomic<bool> running_{false};
    std::mutex cv_mutex_;
    std::condition_variable cv_;

    std::atomic<uint64_t> primitives_received_{0};
    std::atomic<uint64_t> frames_received_{0};
    std::atomic<uint64_t> events_published_{0};
    std::atomic<uint64_t> metrics_generated_{0};
    std::atomic<uint64_t> scan_ticks_{0};

    std::shared_ptr<spdlog::logger> logger = nullptr;

    CameraPipeline& getOrCreatePipeline(const CameraIdentity& identity);
    CrossingDetector& getOrCreateDetector(const CameraIdentity& identity);
    CameraIdentity resolveIdentity(const std::string& tenant_id, const std::string& site_id,
                                   const std::string& camera_id) const;
    void handleEvent(const DomainEvent& event);
    void scanThread();
};

#endif // SYSTEM_MANAGER_H
