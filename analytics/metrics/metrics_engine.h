/*
 * metrics_engine.h
 *
 * 메트릭 상관 엔진
 * - 사이트 단위로 도메인 이벤트를 시간축에서 상관시켜 메트릭 생성
 *   * TTG: 차량 도착 → 응대 시작 (가장 가까운 선행 도착 기준)
 *   * Rack time: 베이 진입 → 베이 진출 (마지막 진입 기준, 추정값)
 *   * Lobby occupancy: 로비 출입 카운터 (0 미만 불가)
 *   * Drive throughput: 구간 내 도착 차량의 고유 트랙 수 (요청 시 계산)
 * - 사이트별 뮤텍스로 버퍼 보호, 버퍼 정리는 쓰기 시점에 수행
 * - 잘못된 이벤트는 경고 후 건너뜀 (엔진은 멈추지 않음)
 */

#ifndef METRICS_ENGINE_H
#define METRICS_ENGINE_H

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../../common/domain_event.h"
#include "../../common/metric_types.h"
#include "../../data/sink/sink_interfaces.h"

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

class MetricsEngine {
public:
    struct Config {
        double ttg_match_window_sec = 300.0;        // 도착-응대 최대 매칭 윈도우
        double arrival_retention_sec = 3600.0;      // 도착 버퍼 보관 기간
        size_t arrival_buffer_capacity = 10000;     // 사이트당 도착 버퍼 최대 크기
        double bay_entry_retention_sec = 86400.0;   // 미종결 베이 진입 보관 기간
    };

    struct Statistics {
        uint64_t events_processed = 0;
        uint64_t malformed_events = 0;
        uint64_t unmatched_greets = 0;
        uint64_t unmatched_bay_exits = 0;
        uint64_t ttg_metrics = 0;
        uint64_t rack_time_metrics = 0;
        uint64_t lobby_metrics = 0;
    };

    /**
     * @brief 생성자
     * @param config 엔진 설정
     * @param sink 메트릭 기록 대상 (nullptr 이면 반환값으로만 전달)
     */
    explicit MetricsEngine(const Config& config, MetricSink* sink = nullptr);

    /**
     * @brief 도메인 이벤트 처리
     * @param event 분류기/스캐너가 생성한 이벤트
     * @return 이 이벤트로 생성된 메트릭 (sink 에도 기록됨)
     */
    std::vector<MetricValue> processEvent(const DomainEvent& event);

    /**
     * @brief 구간 내 도착 차량 수 (고유 track_id 기준)
     * @param site_id 사이트 ID (상태가 없으면 0)
     * @param start_time 구간 시작 (Unix 초, 포함)
     * @param end_time 구간 끝 (Unix 초)
     * @param end_inclusive false 면 [start, end) 로 계산 (연속 구간 보고용)
     */
    int computeThroughput(const std::string& site_id, double start_time, double end_time,
                          bool end_inclusive = true) const;

    /**
     * @brief 처리량을 drive_throughput 메트릭 값으로 생성
     * @return 사이트 상태가 없으면 nullopt
     */
    std::optional<MetricValue> throughputMetric(const std::string& site_id, double start_time,
                                                double end_time, WindowSize window_size,
                                                bool end_inclusive = true) const;

    int getLobbyOccupancy(const std::string& site_id) const;
    size_t getArrivalBufferSize(const std::string& site_id) const;
    size_t getOpenBayEntryCount(const std::string& site_id) const;

    /**
     * @brief 상태가 있는 사이트 ID 목록
     */
    std::vector<std::string> knownSites() const;

    Statistics getStatistics() const;

private:
    struct ArrivalRecord {
        std::string track_id;
        std::string event_id;
        std::string camera_id;
    };

    struct BayEntryRecord {
        double timestamp = 0;
        std::string bay_id;
        std::string event_id;
    };

    // 사이트별 상관 버퍼
    struct SiteState {
        std::mutex mutex;
        std::string tenant_id;
        std::multimap<double, ArrivalRecord> arrivals;          // 도착 시각 인덱스
        std::map<std::string, BayEntryRecord> open_bay_entries; // track_id -> 진입
        int lobby_occupancy = 0;
    };

    // 페이로드별 처리 방문자 (정의는 cpp)
    struct EventRouter;

    bool validateEvent(const DomainEvent& event) const;
    SiteState& getOrCreateSiteState(const std::string& site_id);
    SiteState* findSiteState(const std::string& site_id) const;

    void onVehicleArrival(SiteState& state, const DomainEvent& event, const VehicleArrival& payload);
    std::optional<MetricValue> onGreetStarted(SiteState& state, const DomainEvent& event,
                                              const GreetStarted& payload);
    void onBayEntry(SiteState& state, const DomainEvent& event, const BayEntry& payload);
    std::optional<MetricValue> onBayExit(SiteState& state, const DomainEvent& event,
                                         const BayExit& payload);
    MetricValue onLobbyChange(SiteState& state, const DomainEvent& event,
                              const std::string& door_id, bool entering);

    MetricValue makeMetric(const DomainEvent& event, MetricName name, double value,
                           const std::string& unit) const;

    Config config_;
    MetricSink* sink_ = nullptr;

    mutable std::mutex sites_mutex_;
    std::map<std::string, std::unique_ptr<SiteState>> sites_;

    std::atomic<uint64_t> events_processed_{0};
    std::atomic<uint64_t> malformed_events_{0};
    std::atomic<uint64_t> unmatched_greets_{0};
    std::atomic<uint64_t> unmatched_bay_exits_{0};
    std::atomic<uint64_t> ttg_metrics_{0};
    std::atomic<uint64_t> rack_time_metrics_{0};
    std::atomic<uint64_t> lobby_metrics_{0};

    std::shared_ptr<spdlog::logger> logger;
};

#endif // METRICS_ENGINE_H
