/**
 * @file zone_types.h
 * @brief 존/라인 정적 설정 구조체
 */

#ifndef ZONE_TYPES_H
#define ZONE_TYPES_H

#include <optional>
#include <string>
#include <vector>
#include "../common/common_types.h"
#include "../common/object_data.h"

/**
 * @brief 존 정의 (다각형, 꼭짓점 3개 이상, 순서 유의)
 */
struct ZoneDef {
    std::string zone_id;
    std::string camera_id;
    std::string name;
    ZoneType zone_type = ZoneType::CUSTOM;
    std::vector<ObjPoint> polygon;
    std::optional<double> dwell_threshold_sec;     // 없으면 기본값 사용

    double effectiveDwellThreshold(double default_threshold) const {
        return dwell_threshold_sec ? *dwell_threshold_sec : default_threshold;
    }
};

/**
 * @brief 라인 정의 (정확히 두 점)
 *
 * direction: 정방향 라벨. "clockwise" 이면 p1→p2 기준 시계방향 쪽으로
 * 넘어가는 통과를 forward 로 판정 (기본은 반시계방향 쪽)
 */
struct LineDef {
    std::string line_id;
    std::string camera_id;
    std::string name;
    LineType line_type = LineType::CUSTOM;
    ObjPoint p1{0, 0};
    ObjPoint p2{0, 0};
    std::string direction;
};

#endif // ZONE_TYPES_H
