/*
 * event_json.h
 *
 * 도메인 이벤트 / 메트릭 / 프리미티브 JSON 변환 (jsoncpp)
 */

#ifndef EVENT_JSON_H
#define EVENT_JSON_H

#include <optional>
#include <string>
#include <vector>
#include <json/json.h>
#include "../../common/domain_event.h"
#include "../../common/metric_types.h"
#include "../../common/object_data.h"
#include "../../common/primitive.h"

// 직렬화 JSON 키
namespace EventJsonKeys {
    const std::string EVENT_ID = "event_id";
    const std::string EVENT_TYPE = "event_type";
    const std::string TENANT_ID = "tenant_id";
    const std::string SITE_ID = "site_id";
    const std::string CAMERA_ID = "camera_id";
    const std::string TIMESTAMP = "timestamp";
    const std::string PAYLOAD = "payload";

    const std::string TRACK_ID = "track_id";
    const std::string KIND = "kind";
    const std::string REFERENCE_ID = "reference_id";
    const std::string DIRECTION = "direction";
    const std::string CONFIDENCE = "confidence";
    const std::string OBJECT_CLASS = "object_class";
    const std::string DETECTIONS = "detections";
    const std::string BBOX = "bbox";
}

/**
 * @brief 도메인 이벤트 → JSON
 */
Json::Value eventToJson(const DomainEvent& event);

/**
 * @brief 메트릭 값 → JSON
 */
Json::Value metricToJson(const MetricValue& metric);

/**
 * @brief JSON → 프리미티브
 * @return 필수 필드 누락/형식 오류 시 nullopt
 */
std::optional<Primitive> primitiveFromJson(const Json::Value& root);

/**
 * @brief 검출 프레임 메시지
 */
struct DetectionFrame {
    std::string tenant_id;
    std::string site_id;
    std::string camera_id;
    double timestamp = -1;
    std::vector<TrackedDetection> detections;
};

/**
 * @brief JSON → 검출 프레임
 *
 * 알 수 없는 클래스 등 개별 검출 오류는 해당 검출만 제외
 * @return 헤더 필드 누락 시 nullopt
 */
std::optional<DetectionFrame> detectionsFromJson(const Json::Value& root);

/**
 * @brief 문자열 파싱
 * @return 파싱 실패 시 false
 */
bool parseJsonString(const std::string& text, Json::Value& root, std::string* errors = nullptr);

/**
 * @brief JSON → 한 줄 문자열
 */
std::string toCompactString(const Json::Value& root);

#endif // EVENT_JSON_H
