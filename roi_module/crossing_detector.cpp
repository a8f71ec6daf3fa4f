/*
 * crossing_detector.cpp
 *
 * 라인 통과 / 존 진입·이탈 기하 판정 구현
 */

#include "crossing_detector.h"
#include "roi_utils.h"

CrossingDetector::CrossingDetector(const CameraIdentity& identity, const ZoneConfigStore& zone_store,
                                   double track_max_age_sec)
    : identity_(identity), zone_store_(zone_store), track_max_age_sec_(track_max_age_sec) {
    logger = getLogger("DV_CrossingDetector_log");
    logger->info("CrossingDetector 생성 - camera: {}, 트랙 보관: {}초",
                 identity_.camera_id, track_max_age_sec_);
}

std::vector<Primitive> CrossingDetector::processFrame(const std::vector<TrackedDetection>& detections,
                                                      double timestamp, double now) {
    std::vector<Primitive> primitives;

    // 프레임마다 최신 설정 사용 (재로드 반영)
    std::vector<LineDef> lines = zone_store_.linesForCamera(identity_.camera_id);
    std::vector<ZoneDef> zones = zone_store_.zonesForCamera(identity_.camera_id);

    std::lock_guard<std::mutex> lock(history_mutex_);

    for (const auto& det : detections) {
        ObjPoint anchor = getBottomCenter(det.bbox);

        auto it = history_.find(det.track_id);
        bool has_previous = (it != history_.end());
        if (!has_previous) {
            it = history_.emplace(det.track_id, TrackHistory()).first;
        }
        TrackHistory& hist = it->second;

        // 라인 통과: 이전 앵커 → 현재 앵커 선분과 라인 선분 교차
        if (has_previous) {
            for (const auto& line : lines) {
                if (!intersect(hist.last_anchor, anchor, line.p1, line.p2)) {
                    continue;
                }
                // 라인 위에서 멈춘 경우 등 진행 방향이 없는 접촉은 제외
                if (orientation(line.p1, line.p2, anchor) == ORIENTATION_COLLINEAR) {
                    continue;
                }
                std::string direction = crossingDirection(line, anchor);
                primitives.push_back(makePrimitive(det, PrimitiveKind::LINE_CROSSING,
                                                   line.line_id, direction, timestamp));
                logger->debug("라인 통과 - track: {}, line: {}, direction: {}",
                              det.track_id, line.line_id, direction);
            }
        }

        // 존 포함 여부 변화
        for (const auto& zone : zones) {
            bool inside = insidePolygon(anchor, zone.polygon);
            bool was_inside = hist.inside_zones.count(zone.zone_id) > 0;
            if (inside && !was_inside) {
                hist.inside_zones.insert(zone.zone_id);
                primitives.push_back(makePrimitive(det, PrimitiveKind::ZONE_ENTRY,
                                                   zone.zone_id, "", timestamp));
            } else if (!inside && was_inside) {
                hist.inside_zones.erase(zone.zone_id);
                primitives.push_back(makePrimitive(det, PrimitiveKind::ZONE_EXIT,
                                                   zone.zone_id, "", timestamp));
            }
        }

        hist.last_anchor = anchor;
        hist.last_seen = now;
    }

    return primitives;
}

std::string CrossingDetector::crossingDirection(const LineDef& line, ObjPoint to) const {
    // 도착 지점이 p1→p2 기준 반시계 방향 쪽이면 forward
    bool counterclockwise = orientation(line.p1, line.p2, to) == ORIENTATION_COUNTERCLOCKWISE;
    bool forward = (line.direction == "clockwise") ? !counterclockwise : counterclockwise;
    return forward ? DIRECTION_FORWARD : DIRECTION_BACKWARD;
}

Primitive CrossingDetector::makePrimitive(const TrackedDetection& det, PrimitiveKind kind,
                                          const std::string& reference_id, const std::string& direction,
                                          double timestamp) const {
    Primitive primitive;
    primitive.track_id = det.track_id;
    primitive.kind = kind;
    primitive.reference_id = reference_id;
    primitive.direction = direction;
    primitive.confidence = det.confidence;
    primitive.object_class = det.object_class;
    primitive.camera_id = identity_.camera_id;
    primitive.site_id = identity_.site_id;
    primitive.tenant_id = identity_.tenant_id;
    primitive.timestamp = timestamp;
    return primitive;
}

size_t CrossingDetector::purgeStale(double now) {
    std::lock_guard<std::mutex> lock(history_mutex_);
    double cutoff = now - track_max_age_sec_;
    size_t removed = 0;
    for (auto it = history_.begin(); it != history_.end();) {
        if (it->second.last_seen < cutoff) {
            it = history_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        logger->debug("트랙 이력 정리 - camera: {}, 제거: {}", identity_.camera_id, removed);
    }
    return removed;
}

size_t CrossingDetector::getTrackedCount() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return history_.size();
}
