/**
 * @file domain_event.h
 * @brief 도메인 이벤트 타입 정의
 *
 * 분류기와 스캐너가 생성하고 메트릭 엔진이 소비하는 비즈니스 이벤트.
 * 이벤트별 페이로드는 std::variant 로 표현하며 std::visit 으로 처리
 * (새 이벤트 타입 추가 시 모든 방문자에서 컴파일 오류로 누락이 드러남)
 */

#ifndef DOMAIN_EVENT_H
#define DOMAIN_EVENT_H

#include <cstdint>
#include <cstdio>
#include <random>
#include <string>
#include <variant>
#include "common_types.h"

// 스캐너 이벤트 신뢰도
namespace EventConfidence {
    const double ZONE_DWELL = 0.9;
    const double GREET_STARTED = 0.85;
}

struct VehicleArrival {
    std::string track_id;
    std::string line_id;
    std::string direction;
    double confidence = 0.0;
};

struct VehicleExit {
    std::string track_id;
    std::string line_id;
    std::string direction;
    double confidence = 0.0;
};

struct GreetStarted {
    std::string vehicle_track_id;
    std::string person_track_id;
    std::string zone_id;
    double proximity_seconds = 0.0;     // min(차량 체류, 보행자 체류)
    double confidence = EventConfidence::GREET_STARTED;
};

struct BayEntry {
    std::string track_id;
    std::string bay_id;                 // bay_entry 라인 ID
    double confidence = 0.0;
};

struct BayExit {
    std::string track_id;
    std::string bay_id;
    double confidence = 0.0;
};

struct LobbyEnter {
    std::string track_id;
    std::string door_id;
    double confidence = 0.0;
};

struct LobbyExit {
    std::string track_id;
    std::string door_id;
    double confidence = 0.0;
};

struct ZoneDwell {
    std::string track_id;
    std::string zone_id;
    ObjectClass object_class = ObjectClass::VEHICLE;
    double dwell_seconds = 0.0;
    double confidence = EventConfidence::ZONE_DWELL;
};

struct LineCrossing {
    std::string track_id;
    std::string line_id;
    std::string direction;
    ObjectClass object_class = ObjectClass::VEHICLE;
    double confidence = 0.0;
};

using EventPayload = std::variant<VehicleArrival, VehicleExit, GreetStarted,
                                  BayEntry, BayExit, LobbyEnter, LobbyExit,
                                  ZoneDwell, LineCrossing>;

/**
 * @brief 도메인 이벤트 (생성 후 변경 불가)
 */
struct DomainEvent {
    std::string event_id;
    std::string tenant_id;
    std::string site_id;
    std::string camera_id;
    double timestamp = -1;      // Unix 초
    EventPayload payload;
};

/**
 * @brief 이벤트 발생 카메라 식별자 (테넌트/사이트/카메라)
 */
struct CameraIdentity {
    std::string tenant_id;
    std::string site_id;
    std::string camera_id;
};

/**
 * @brief 페이로드별 이벤트 타입 문자열
 */
struct EventTypeName {
    std::string operator()(const VehicleArrival&) const { return "vehicle_arrival"; }
    std::string operator()(const VehicleExit&) const { return "vehicle_exit"; }
    std::string operator()(const GreetStarted&) const { return "greet_started"; }
    std::string operator()(const BayEntry&) const { return "bay_entry"; }
    std::string operator()(const BayExit&) const { return "bay_exit"; }
    std::string operator()(const LobbyEnter&) const { return "lobby_enter"; }
    std::string operator()(const LobbyExit&) const { return "lobby_exit"; }
    std::string operator()(const ZoneDwell&) const { return "zone_dwell"; }
    std::string operator()(const LineCrossing&) const { return "line_crossing"; }
};

inline std::string getEventTypeName(const DomainEvent& event) {
    return std::visit(EventTypeName{}, event.payload);
}

/**
 * @brief 랜덤 UUID(v4) 형식 이벤트 ID 생성
 */
inline std::string generateEventId() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    uint64_t hi = engine();
    uint64_t lo = engine();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;   // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;   // variant 10xx

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

/**
 * @brief 이벤트 헤더를 채운 DomainEvent 생성
 */
inline DomainEvent makeDomainEvent(const std::string& tenant_id, const std::string& site_id,
                                   const std::string& camera_id, double timestamp,
                                   EventPayload payload) {
    DomainEvent event;
    event.event_id = generateEventId();
    event.tenant_id = tenant_id;
    event.site_id = site_id;
    event.camera_id = camera_id;
    event.timestamp = timestamp;
    event.payload = std::move(payload);
    return event;
}

#endif // DOMAIN_EVENT_H
