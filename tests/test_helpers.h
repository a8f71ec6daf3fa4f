/*
 * test_helpers.h
 *
 * 테스트 공용 생성 함수
 */

#ifndef TEST_HELPERS_H
#define TEST_HELPERS_H

#include <string>
#include <vector>
#include "common/domain_event.h"
#include "common/primitive.h"
#include "roi_module/zone_types.h"

namespace testutil {

const std::string TENANT = "tenant-t";
const std::string SITE = "site-s";
const std::string CAMERA = "cam-1";

inline CameraIdentity identity(const std::string& camera_id = CAMERA) {
    return CameraIdentity{TENANT, SITE, camera_id};
}

inline ZoneDef squareZone(const std::string& zone_id, ZoneType type,
                          const std::string& camera_id = CAMERA) {
    ZoneDef zone;
    zone.zone_id = zone_id;
    zone.camera_id = camera_id;
    zone.name = zone_id;
    zone.zone_type = type;
    zone.polygon = {{0, 0}, {100, 0}, {100, 100}, {0, 100}};
    return zone;
}

inline LineDef horizontalLine(const std::string& line_id, LineType type, double y = 50,
                              const std::string& camera_id = CAMERA) {
    LineDef line;
    line.line_id = line_id;
    line.camera_id = camera_id;
    line.name = line_id;
    line.line_type = type;
    line.p1 = {0, y};
    line.p2 = {200, y};
    return line;
}

inline Primitive primitive(const std::string& track_id, PrimitiveKind kind,
                           const std::string& reference_id, ObjectClass object_class,
                           double timestamp, const std::string& direction = DIRECTION_FORWARD) {
    Primitive p;
    p.track_id = track_id;
    p.kind = kind;
    p.reference_id = reference_id;
    p.direction = direction;
    p.confidence = 0.8;
    p.object_class = object_class;
    p.camera_id = CAMERA;
    p.site_id = SITE;
    p.tenant_id = TENANT;
    p.timestamp = timestamp;
    return p;
}

inline DomainEvent event(double timestamp, EventPayload payload,
                         const std::string& site_id = SITE) {
    return makeDomainEvent(TENANT, site_id, CAMERA, timestamp, std::move(payload));
}

inline TrackedDetection detection(const std::string& track_id, ObjectClass object_class,
                                  double anchor_x, double anchor_y) {
    // 하단 중심이 (anchor_x, anchor_y) 가 되는 10x20 박스
    TrackedDetection det;
    det.track_id = track_id;
    det.object_class = object_class;
    det.confidence = 0.9;
    det.bbox.left = anchor_x - 5;
    det.bbox.width = 10;
    det.bbox.top = anchor_y - 20;
    det.bbox.height = 20;
    return det;
}

}  // namespace testutil

#endif // TEST_HELPERS_H
