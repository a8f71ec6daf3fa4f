/*
 * crossing_detector.h
 *
 * 추적 박스 → 프리미티브 변환기 (카메라 단위)
 * - 트랙 앵커(박스 하단 중심)의 이전/현재 위치로 라인 통과 판정
 * - 다각형 포함 여부 변화로 존 진입/이탈 판정
 * - max_age 동안 보이지 않은 트랙 이력은 정리 (이탈 프리미티브는 만들지 않음)
 */

#ifndef CROSSING_DETECTOR_H
#define CROSSING_DETECTOR_H

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "zone_config_store.h"
#include "../common/domain_event.h"
#include "../common/object_data.h"
#include "../common/primitive.h"

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

class CrossingDetector {
public:
    CrossingDetector(const CameraIdentity& identity, const ZoneConfigStore& zone_store,
                     double track_max_age_sec = 5.0);

    /**
     * @brief 프레임 처리
     * @param detections 현재 프레임의 추적 결과
     * @param timestamp 프레임 시각 (프리미티브 시각)
     * @param now 수신 시각 (이력 보관 기준, purgeStale 과 같은 시계)
     * @return 생성된 프리미티브 (라인 통과 → 존 진입/이탈 순)
     */
    std::vector<Primitive> processFrame(const std::vector<TrackedDetection>& detections,
                                        double timestamp, double now);

    /**
     * @brief 오래된 트랙 이력 정리
     * @param now 수신 시계 기준 현재 시각
     * @return 정리된 트랙 수
     */
    size_t purgeStale(double now);

    size_t getTrackedCount() const;

private:
    struct TrackHistory {
        ObjPoint last_anchor{0, 0};
        double last_seen = 0;
        std::set<std::string> inside_zones;
    };

    /**
     * @brief 라인 통과 방향 판정
     * @return "forward" 또는 "backward"
     */
    std::string crossingDirection(const LineDef& line, ObjPoint to) const;

    Primitive makePrimitive(const TrackedDetection& det, PrimitiveKind kind,
                            const std::string& reference_id, const std::string& direction,
                            double timestamp) const;

    CameraIdentity identity_;
    const ZoneConfigStore& zone_store_;
    double track_max_age_sec_;

    mutable std::mutex history_mutex_;
    std::map<std::string, TrackHistory> history_;

    std::shared_ptr<spdlog::logger> logger;
};

#endif // CROSSING_DETECTOR_H
