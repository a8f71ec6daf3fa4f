/**
 * @file object_data.h
 * @brief 객체 추적 데이터 구조체
 *
 * 카메라별로 관측 중인 트랙과 프레임 단위 검출 결과를 저장하는 구조체 정의
 */

#ifndef OBJECT_DATA_H
#define OBJECT_DATA_H

#include <map>
#include <string>
#include <vector>
#include "common_types.h"

/**
 * @brief 2D 좌표 구조체
 */
struct ObjPoint {
    double x;
    double y;
};

/**
 * @brief 바운딩 박스 구조체
 * 매 프레임마다 생성되고 사라지는 임시 데이터
 */
struct box {
    double top = -1;
    double height = -1;
    double left = -1;
    double width = -1;
};

/**
 * @brief 바운딩 박스 하단 중심점 (지면 접점)
 */
inline ObjPoint getBottomCenter(const box& b) {
    return {b.left + b.width / 2.0, b.top + b.height};
}

/**
 * @brief 추적 중인 객체 (카메라, track_id 당 하나)
 *
 * === 수명 ===
 * - 처음 참조하는 프리미티브에서 생성
 * - last_seen 이후 max_age 초 동안 갱신이 없으면 reaper가 제거
 *
 * === 불변 조건 ===
 * - zone_entry_times 에 존재하는 zone_id = 현재 해당 존 내부에 있음
 * - 한 존은 최대 한 번만 기록 (존 이탈 프리미티브나 reap 으로만 제거)
 */
struct TrackedObject {
    std::string track_id;
    ObjectClass object_class = ObjectClass::VEHICLE;
    double first_seen = -1;                         // 최초 관측 시각
    double last_seen = -1;                          // 마지막 관측 시각
    std::map<std::string, double> zone_entry_times; // zone_id -> 진입 시각
    std::vector<std::string> lines_crossed;         // 통과한 라인 (순서 유지, 중복 없음)
};

/**
 * @brief 트래커가 넘겨주는 프레임 단위 검출 결과
 */
struct TrackedDetection {
    std::string track_id;
    ObjectClass object_class = ObjectClass::VEHICLE;
    double confidence = 0.0;
    box bbox;
};

#endif // OBJECT_DATA_H
