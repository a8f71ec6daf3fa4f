/*
 * event_json.cpp
 *
 * JSON 변환 구현
 */

#include "event_json.h"
#include <memory>

namespace {

// 이벤트 페이로드 → JSON
struct PayloadWriter {
    Json::Value operator()(const VehicleArrival& p) const {
        Json::Value v;
        v["track_id"] = p.track_id;
        v["line_id"] = p.line_id;
        v["direction"] = p.direction;
        v["confidence"] = p.confidence;
        return v;
    }
    Json::Value operator()(const VehicleExit& p) const {
        Json::Value v;
        v["track_id"] = p.track_id;
        v["line_id"] = p.line_id;
        v["direction"] = p.direction;
        v["confidence"] = p.confidence;
        return v;
    }
    Json::Value operator()(const GreetStarted& p) const {
        Json::Value v;
        v["vehicle_track_id"] = p.vehicle_track_id;
        v["person_track_id"] = p.person_track_id;
        v["zone_id"] = p.zone_id;
        v["proximity_seconds"] = p.proximity_seconds;
        v["confidence"] = p.confidence;
        return v;
    }
    Json::Value operator()(const BayEntry& p) const {
        Json::Value v;
        v["track_id"] = p.track_id;
        v["bay_id"] = p.bay_id;
        v["confidence"] = p.confidence;
        return v;
    }
    Json::Value operator()(const BayExit& p) const {
        Json::Value v;
        v["track_id"] = p.track_id;
        v["bay_id"] = p.bay_id;
        v["confidence"] = p.confidence;
        return v;
    }
    Json::Value operator()(const LobbyEnter& p) const {
        Json::Value v;
        v["track_id"] = p.track_id;
        v["door_id"] = p.door_id;
        v["confidence"] = p.confidence;
        return v;
    }
    Json::Value operator()(const LobbyExit& p) const {
        Json::Value v;
        v["track_id"] = p.track_id;
        v["door_id"] = p.door_id;
        v["confidence"] = p.confidence;
        return v;
    }
    Json::Value operator()(const ZoneDwell& p) const {
        Json::Value v;
        v["track_id"] = p.track_id;
        v["zone_id"] = p.zone_id;
        v["object_class"] = objectClassToString(p.object_class);
        v["dwell_seconds"] = p.dwell_seconds;
        v["confidence"] = p.confidence;
        return v;
    }
    Json::Value operator()(const LineCrossing& p) const {
        Json::Value v;
        v["track_id"] = p.track_id;
        v["line_id"] = p.line_id;
        v["direction"] = p.direction;
        v["object_class"] = objectClassToString(p.object_class);
        v["confidence"] = p.confidence;
        return v;
    }
};

std::string getStringField(const Json::Value& root, const std::string& key) {
    const Json::Value& v = root[key];
    return v.isString() ? v.asString() : std::string();
}

}  // namespace

Json::Value eventToJson(const DomainEvent& event) {
    Json::Value root;
    root[EventJsonKeys::EVENT_ID] = event.event_id;
    root[EventJsonKeys::EVENT_TYPE] = getEventTypeName(event);
    root[EventJsonKeys::TENANT_ID] = event.tenant_id;
    root[EventJsonKeys::SITE_ID] = event.site_id;
    root[EventJsonKeys::CAMERA_ID] = event.camera_id;
    root[EventJsonKeys::TIMESTAMP] = event.timestamp;
    root[EventJsonKeys::PAYLOAD] = std::visit(PayloadWriter{}, event.payload);
    return root;
}

Json::Value metricToJson(const MetricValue& metric) {
    Json::Value root;
    root["metric_id"] = metric.metric_id;
    root["tenant_id"] = metric.tenant_id;
    root["site_id"] = metric.site_id;
    root["metric_name"] = metricNameToString(metric.metric_name);
    root["window_start"] = metric.window_start;
    root["window_size"] = windowSizeToString(metric.window_size);
    root["value"] = metric.value;
    root["unit"] = metric.unit;
    root["is_estimated"] = metric.is_estimated;
    root["created_at"] = metric.created_at;

    Json::Value dimensions(Json::objectValue);
    for (const auto& [key, value] : metric.dimensions) {
        dimensions[key] = value;
    }
    root["dimensions"] = dimensions;
    return root;
}

std::optional<Primitive> primitiveFromJson(const Json::Value& root) {
    if (!root.isObject()) {
        return std::nullopt;
    }

    Primitive primitive;
    primitive.track_id = getStringField(root, EventJsonKeys::TRACK_ID);
    primitive.reference_id = getStringField(root, EventJsonKeys::REFERENCE_ID);
    primitive.direction = getStringField(root, EventJsonKeys::DIRECTION);
    primitive.camera_id = getStringField(root, EventJsonKeys::CAMERA_ID);
    primitive.site_id = getStringField(root, EventJsonKeys::SITE_ID);
    primitive.tenant_id = getStringField(root, EventJsonKeys::TENANT_ID);

    // 정수 track_id 도 허용 (트래커 출력 그대로)
    const Json::Value& track = root[EventJsonKeys::TRACK_ID];
    if (primitive.track_id.empty() && track.isIntegral()) {
        primitive.track_id = std::to_string(track.asLargestInt());
    }

    if (primitive.track_id.empty() || primitive.reference_id.empty() || primitive.camera_id.empty()) {
        return std::nullopt;
    }

    if (!parsePrimitiveKind(getStringField(root, EventJsonKeys::KIND), primitive.kind)) {
        return std::nullopt;
    }
    if (!parseObjectClass(getStringField(root, EventJsonKeys::OBJECT_CLASS), primitive.object_class)) {
        return std::nullopt;
    }

    const Json::Value& timestamp = root[EventJsonKeys::TIMESTAMP];
    if (!timestamp.isNumeric()) {
        return std::nullopt;
    }
    primitive.timestamp = timestamp.asDouble();

    const Json::Value& confidence = root[EventJsonKeys::CONFIDENCE];
    primitive.confidence = confidence.isNumeric() ? confidence.asDouble() : 0.0;

    return primitive;
}

std::optional<DetectionFrame> detectionsFromJson(const Json::Value& root) {
    if (!root.isObject()) {
        return std::nullopt;
    }

    DetectionFrame frame;
    frame.camera_id = getStringField(root, EventJsonKeys::CAMERA_ID);
    frame.site_id = getStringField(root, EventJsonKeys::SITE_ID);
    frame.tenant_id = getStringField(root, EventJsonKeys::TENANT_ID);

    const Json::Value& timestamp = root[EventJsonKeys::TIMESTAMP];
    const Json::Value& detections = root[EventJsonKeys::DETECTIONS];
    if (frame.camera_id.empty() || !timestamp.isNumeric() || !detections.isArray()) {
        return std::nullopt;
    }
    frame.timestamp = timestamp.asDouble();

    for (const auto& node : detections) {
        if (!node.isObject()) {
            continue;
        }

        TrackedDetection det;
        const Json::Value& track = node[EventJsonKeys::TRACK_ID];
        if (track.isString()) {
            det.track_id = track.asString();
        } else if (track.isIntegral()) {
            det.track_id = std::to_string(track.asLargestInt());
        }
        if (det.track_id.empty()) {
            continue;
        }
        if (!parseObjectClass(getStringField(node, EventJsonKeys::OBJECT_CLASS), det.object_class)) {
            continue;
        }

        // bbox: [left, top, width, height]
        const Json::Value& bbox = node[EventJsonKeys::BBOX];
        if (!bbox.isArray() || bbox.size() != 4 ||
            !bbox[0].isNumeric() || !bbox[1].isNumeric() ||
            !bbox[2].isNumeric() || !bbox[3].isNumeric()) {
            continue;
        }
        det.bbox.left = bbox[0].asDouble();
        det.bbox.top = bbox[1].asDouble();
        det.bbox.width = bbox[2].asDouble();
        det.bbox.height = bbox[3].asDouble();

        const Json::Value& confidence = node[EventJsonKeys::CONFIDENCE];
        det.confidence = confidence.isNumeric() ? confidence.asDouble() : 0.0;

        frame.detections.push_back(det);
    }
    return frame;
}

bool parseJsonString(const std::string& text, Json::Value& root, std::string* errors) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string parse_errors;
    bool ok = reader->parse(text.data(), text.data() + text.size(), &root, &parse_errors);
    if (!ok && errors) {
        *errors = parse_errors;
    }
    return ok;
}

std::string toCompactString(const Json::Value& root) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}
