/*
 * event_classifier.cpp
 *
 * 라인 의미 타입 기반 이벤트 분류 구현
 */

#include "event_classifier.h"

EventClassifier::EventClassifier(const ZoneConfigStore& zone_store)
    : zone_store_(zone_store) {
    logger = getLogger("DV_Classifier_log");
}

std::optional<DomainEvent> EventClassifier::classify(const Primitive& primitive, TrackRegistry& registry,
                                                     double now) {
    primitives_processed_++;

    // 모든 프리미티브는 트랙을 갱신 (카메라 시계 대신 수신 시각 사용)
    registry.touch(primitive.track_id, primitive.object_class, now);

    switch (primitive.kind) {
        case PrimitiveKind::LINE_CROSSING:
            return classifyLineCrossing(primitive, registry, now);
        case PrimitiveKind::ZONE_ENTRY:
            handleZoneEntry(primitive, registry, now);
            return std::nullopt;
        case PrimitiveKind::ZONE_EXIT:
            handleZoneExit(primitive, registry);
            return std::nullopt;
    }
    return std::nullopt;
}

std::optional<DomainEvent> EventClassifier::classifyLineCrossing(const Primitive& primitive,
                                                                 TrackRegistry& registry, double now) {
    auto line = zone_store_.findLine(primitive.reference_id);
    if (!line) {
        config_misses_++;
        logger->debug("알 수 없는 라인 - line: {}, track: {}, camera: {}",
                      primitive.reference_id, primitive.track_id, primitive.camera_id);
        return std::nullopt;
    }
    if (line->camera_id != primitive.camera_id) {
        config_misses_++;
        logger->debug("다른 카메라의 라인 참조 - line: {} (camera: {}), 프리미티브 camera: {}",
                      line->line_id, line->camera_id, primitive.camera_id);
        return std::nullopt;
    }

    registry.markLineCrossed(primitive.track_id, line->line_id);

    DomainEvent event = makeDomainEvent(primitive.tenant_id, primitive.site_id,
                                        primitive.camera_id, now,
                                        dispatchLinePayload(*line, primitive));
    events_emitted_++;

    logger->debug("이벤트 생성 - type: {}, track: {}, line: {} ({})",
                  getEventTypeName(event), primitive.track_id, line->line_id,
                  lineTypeToString(line->line_type));
    return event;
}

EventPayload EventClassifier::dispatchLinePayload(const LineDef& line, const Primitive& primitive) const {
    switch (line.line_type) {
        case LineType::ENTRY:
            return VehicleArrival{primitive.track_id, line.line_id,
                                  primitive.direction, primitive.confidence};
        case LineType::EXIT:
            return VehicleExit{primitive.track_id, line.line_id,
                               primitive.direction, primitive.confidence};
        case LineType::BAY_ENTRY:
            return BayEntry{primitive.track_id, line.line_id, primitive.confidence};
        case LineType::BAY_EXIT:
            return BayExit{primitive.track_id, line.line_id, primitive.confidence};
        case LineType::DOOR:
            if (isPedestrianClass(primitive.object_class)) {
                if (primitive.direction == DIRECTION_FORWARD) {
                    return LobbyEnter{primitive.track_id, line.line_id, primitive.confidence};
                }
                return LobbyExit{primitive.track_id, line.line_id, primitive.confidence};
            }
            break;
        case LineType::PERIMETER:
        case LineType::CUSTOM:
            break;
    }

    // 그 외 조합 (보행자가 아닌 객체의 출입문 통과 포함)
    return LineCrossing{primitive.track_id, line.line_id, primitive.direction,
                        primitive.object_class, primitive.confidence};
}

void EventClassifier::handleZoneEntry(const Primitive& primitive, TrackRegistry& registry, double now) {
    auto zone = zone_store_.findZone(primitive.reference_id);
    if (!zone) {
        config_misses_++;
        logger->debug("알 수 없는 존 진입 - zone: {}, track: {}",
                      primitive.reference_id, primitive.track_id);
        return;
    }
    if (zone->camera_id != primitive.camera_id) {
        config_misses_++;
        logger->debug("다른 카메라의 존 참조 - zone: {} (camera: {}), 프리미티브 camera: {}",
                      zone->zone_id, zone->camera_id, primitive.camera_id);
        return;
    }
    if (registry.enterZone(primitive.track_id, primitive.reference_id, now)) {
        logger->trace("존 진입 - track: {}, zone: {}", primitive.track_id, primitive.reference_id);
    }
}

void EventClassifier::handleZoneExit(const Primitive& primitive, TrackRegistry& registry) {
    if (!zone_store_.findZone(primitive.reference_id)) {
        config_misses_++;
        logger->debug("알 수 없는 존 이탈 - zone: {}, track: {}",
                      primitive.reference_id, primitive.track_id);
    }
    // 재로드로 사라진 존이라도 체류 기록은 정리
    if (registry.exitZone(primitive.track_id, primitive.reference_id)) {
        logger->trace("존 이탈 - track: {}, zone: {}", primitive.track_id, primitive.reference_id);
    }
}

EventClassifier::Statistics EventClassifier::getStatistics() const {
    Statistics stats;
    stats.primitives_processed = primitives_processed_.load();
    stats.events_emitted = events_emitted_.load();
    stats.config_misses = config_misses_.load();
    return stats;
}
