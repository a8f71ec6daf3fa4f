/*
 * dwell_scanner.h
 *
 * 주기적 체류/응대 근접 스캐너
 * - 프리미티브 도착과 무관하게 고정 주기(기본 1초)로 레지스트리 검사
 * - 체류: 임계값 도달 시 ZoneDwell 발생 후 진입 시각을 now 로 재설정
 * - 응대 근접: greet_zone 내 (차량, 보행자) 모든 쌍에 대해 GreetStarted 발생
 */

#ifndef DWELL_SCANNER_H
#define DWELL_SCANNER_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>
#include "../../common/domain_event.h"
#include "../../roi_module/zone_config_store.h"
#include "../../tracking/track_registry.h"

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

class DwellScanner {
public:
    struct Config {
        double default_dwell_threshold_sec = 2.0;   // 존별 임계값이 없을 때
        double greet_min_proximity_sec = 1.0;       // 응대 판정 최소 동시 체류
    };

    struct Statistics {
        uint64_t dwell_events = 0;
        uint64_t greet_events = 0;
        uint64_t unknown_zone_skips = 0;    // 설정에서 사라진 존
    };

    DwellScanner(const ZoneConfigStore& zone_store, const CameraIdentity& identity,
                 const Config& config);

    /**
     * @brief 체류 검사
     *
     * 임계값 이상 체류한 (트랙, 존) 마다 ZoneDwell 을 만들고 진입 시각을 재설정.
     * 임계 구간 하나당 최대 한 번만 발생
     * @param registry 카메라 레지스트리 (진입 시각 갱신됨)
     * @param now 현재 시각
     */
    std::vector<DomainEvent> checkDwell(TrackRegistry& registry, double now);

    /**
     * @brief 응대 근접 검사
     *
     * greet_zone 마다 상주 차량 × 상주 보행자 전체 조합을 검사.
     * proximity = min(차량 체류, 보행자 체류) >= 최소값이면 쌍마다 이벤트 발생
     */
    std::vector<DomainEvent> checkGreetProximity(const TrackRegistry& registry, double now);

    Statistics getStatistics() const;

private:
    const ZoneConfigStore& zone_store_;
    CameraIdentity identity_;
    Config config_;

    std::atomic<uint64_t> dwell_events_{0};
    std::atomic<uint64_t> greet_events_{0};
    std::atomic<uint64_t> unknown_zone_skips_{0};

    std::shared_ptr<spdlog::logger> logger;
};

#endif // DWELL_SCANNER_H
