/**
 * @file primitive.h
 * @brief 인식 파이프라인이 생성하는 원시 기하 이벤트
 */

#ifndef PRIMITIVE_H
#define PRIMITIVE_H

#include <string>
#include "common_types.h"

enum class PrimitiveKind {
    LINE_CROSSING = 0,
    ZONE_ENTRY = 1,
    ZONE_EXIT = 2
};

/**
 * @brief 라인 통과 / 존 진입 / 존 이탈 프리미티브
 *
 * reference_id 는 kind 에 따라 line_id 또는 zone_id
 */
struct Primitive {
    std::string track_id;
    PrimitiveKind kind = PrimitiveKind::LINE_CROSSING;
    std::string reference_id;
    std::string direction;          // 라인 통과 시에만 의미 있음 (빈 문자열 허용)
    double confidence = 0.0;
    ObjectClass object_class = ObjectClass::VEHICLE;
    std::string camera_id;
    std::string site_id;
    std::string tenant_id;
    double timestamp = -1;          // Unix 초
};

inline std::string primitiveKindToString(PrimitiveKind kind) {
    switch (kind) {
        case PrimitiveKind::LINE_CROSSING: return "line_crossing";
        case PrimitiveKind::ZONE_ENTRY:    return "zone_entry";
        case PrimitiveKind::ZONE_EXIT:     return "zone_exit";
    }
    return "line_crossing";
}

inline bool parsePrimitiveKind(const std::string& name, PrimitiveKind& out) {
    if (name == "line_crossing") { out = PrimitiveKind::LINE_CROSSING; return true; }
    if (name == "zone_entry") { out = PrimitiveKind::ZONE_ENTRY; return true; }
    if (name == "zone_exit") { out = PrimitiveKind::ZONE_EXIT; return true; }
    return false;
}

#endif // PRIMITIVE_H
