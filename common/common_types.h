/**
 * @file common_types.h
 * @brief 전역 상수, 열거형, 타입 정의
 *
 * 엣지 분석 애플리케이션 전체에서 사용되는 시스템 전역 상수,
 * 객체/존/라인 열거형과 문자열 매핑을 포함
 */

#ifndef COMMON_TYPES_H
#define COMMON_TYPES_H

#include <chrono>
#include <string>

// 시스템 기본값
const std::string DEFAULT_CONFIG_PATH = "config/config.json";
const std::string DEFAULT_ZONE_CONFIG_PATH = "config/zones.json";

// 라인 통과 방향 라벨
const std::string DIRECTION_FORWARD = "forward";
const std::string DIRECTION_BACKWARD = "backward";

// 객체 클래스 (상위 트래커가 부여)
enum class ObjectClass {
    PERSON = 0,
    VEHICLE = 1,
    BICYCLE = 2,
    MOTORCYCLE = 3,
    TRUCK = 4,
    BUS = 5
};

// 존 의미 타입
enum class ZoneType {
    GREET_ZONE = 0,     // 고객 응대 구역
    BAY = 1,            // 정비 베이
    LOBBY = 2,          // 로비
    WAITING_AREA = 3,   // 대기 구역
    PERIMETER = 4,      // 외곽
    PARKING = 5,        // 주차장
    CUSTOM = 6
};

// 라인 의미 타입
enum class LineType {
    ENTRY = 0,          // 진입 (차량 도착)
    EXIT = 1,           // 진출 (차량 출발)
    BAY_ENTRY = 2,      // 베이 진입
    BAY_EXIT = 3,       // 베이 진출
    DOOR = 4,           // 출입문 (로비)
    PERIMETER = 5,
    CUSTOM = 6
};

// 헬퍼 함수
/**
 * @brief 차량 계열 클래스인지 확인 (응대 근접 판정용)
 */
inline bool isVehicleClass(ObjectClass object_class) {
    return object_class == ObjectClass::VEHICLE ||
           object_class == ObjectClass::TRUCK ||
           object_class == ObjectClass::BUS ||
           object_class == ObjectClass::MOTORCYCLE;
}

/**
 * @brief 보행자 클래스인지 확인
 */
inline bool isPedestrianClass(ObjectClass object_class) {
    return object_class == ObjectClass::PERSON;
}

inline std::string objectClassToString(ObjectClass object_class) {
    switch (object_class) {
        case ObjectClass::PERSON:     return "person";
        case ObjectClass::VEHICLE:    return "vehicle";
        case ObjectClass::BICYCLE:    return "bicycle";
        case ObjectClass::MOTORCYCLE: return "motorcycle";
        case ObjectClass::TRUCK:      return "truck";
        case ObjectClass::BUS:        return "bus";
    }
    return "unknown";
}

/**
 * @brief 라벨 문자열을 객체 클래스로 변환
 * @param label 라벨 ("person", "vehicle", "car" 등)
 * @param out 변환 결과
 * @return 알 수 없는 라벨이면 false
 */
inline bool parseObjectClass(const std::string& label, ObjectClass& out) {
    if (label == "person") { out = ObjectClass::PERSON; return true; }
    if (label == "vehicle" || label == "car") { out = ObjectClass::VEHICLE; return true; }
    if (label == "bicycle") { out = ObjectClass::BICYCLE; return true; }
    if (label == "motorcycle" || label == "motorbike") { out = ObjectClass::MOTORCYCLE; return true; }
    if (label == "truck") { out = ObjectClass::TRUCK; return true; }
    if (label == "bus") { out = ObjectClass::BUS; return true; }
    return false;
}

inline std::string zoneTypeToString(ZoneType type) {
    switch (type) {
        case ZoneType::GREET_ZONE:   return "greet_zone";
        case ZoneType::BAY:          return "bay";
        case ZoneType::LOBBY:        return "lobby";
        case ZoneType::WAITING_AREA: return "waiting_area";
        case ZoneType::PERIMETER:    return "perimeter";
        case ZoneType::PARKING:      return "parking";
        case ZoneType::CUSTOM:       return "custom";
    }
    return "custom";
}

inline bool parseZoneType(const std::string& name, ZoneType& out) {
    if (name == "greet_zone") { out = ZoneType::GREET_ZONE; return true; }
    if (name == "bay") { out = ZoneType::BAY; return true; }
    if (name == "lobby") { out = ZoneType::LOBBY; return true; }
    if (name == "waiting_area") { out = ZoneType::WAITING_AREA; return true; }
    if (name == "perimeter") { out = ZoneType::PERIMETER; return true; }
    if (name == "parking") { out = ZoneType::PARKING; return true; }
    if (name == "custom") { out = ZoneType::CUSTOM; return true; }
    return false;
}

inline std::string lineTypeToString(LineType type) {
    switch (type) {
        case LineType::ENTRY:     return "entry";
        case LineType::EXIT:      return "exit";
        case LineType::BAY_ENTRY: return "bay_entry";
        case LineType::BAY_EXIT:  return "bay_exit";
        case LineType::DOOR:      return "door";
        case LineType::PERIMETER: return "perimeter";
        case LineType::CUSTOM:    return "custom";
    }
    return "custom";
}

inline bool parseLineType(const std::string& name, LineType& out) {
    if (name == "entry") { out = LineType::ENTRY; return true; }
    if (name == "exit") { out = LineType::EXIT; return true; }
    if (name == "bay_entry") { out = LineType::BAY_ENTRY; return true; }
    if (name == "bay_exit") { out = LineType::BAY_EXIT; return true; }
    if (name == "door") { out = LineType::DOOR; return true; }
    if (name == "perimeter") { out = LineType::PERIMETER; return true; }
    if (name == "custom") { out = LineType::CUSTOM; return true; }
    return false;
}

/**
 * @brief 현재 Unix 타임스탬프 반환 (초 단위, 소수점 포함)
 */
inline double getCurTimeSec() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

#endif // COMMON_TYPES_H
