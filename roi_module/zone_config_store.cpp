/*
 * zone_config_store.cpp
 *
 * 존/라인 설정 로드, 검증, 조회 구현
 */

#include "zone_config_store.h"
#include <fstream>

ZoneConfigStore::ZoneConfigStore() {
    logger = getLogger("DV_ZoneConfig_log");
}

bool ZoneConfigStore::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        logger->error("존 설정 파일을 열 수 없음: {}", path);
        return false;
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &root, &errors)) {
        logger->error("존 설정 JSON 파싱 실패: {}", errors);
        return false;
    }

    logger->info("존 설정 파일 로드: {}", path);
    return loadFromJson(root);
}

bool ZoneConfigStore::loadFromJson(const Json::Value& root) {
    if (!root.isObject()) {
        logger->error("존 설정 루트가 객체가 아님");
        return false;
    }

    std::vector<ZoneDef> zones;
    std::vector<LineDef> lines;

    const Json::Value& zone_nodes = root["zones"];
    if (!zone_nodes.isNull() && !zone_nodes.isArray()) {
        logger->error("zones 항목이 배열이 아님");
        return false;
    }
    for (const auto& node : zone_nodes) {
        ZoneDef zone;
        if (!parseZone(node, zone)) {
            return false;
        }
        zones.push_back(std::move(zone));
    }

    const Json::Value& line_nodes = root["lines"];
    if (!line_nodes.isNull() && !line_nodes.isArray()) {
        logger->error("lines 항목이 배열이 아님");
        return false;
    }
    for (const auto& node : line_nodes) {
        LineDef line;
        if (!parseLine(node, line)) {
            return false;
        }
        lines.push_back(std::move(line));
    }

    return replace(zones, lines);
}

bool ZoneConfigStore::replace(const std::vector<ZoneDef>& zones, const std::vector<LineDef>& lines) {
    std::map<std::string, ZoneDef> new_zones;
    std::map<std::string, LineDef> new_lines;

    for (const auto& zone : zones) {
        if (!validateZone(zone)) {
            logger->error("존 설정 거부 - 잘못된 존: '{}'", zone.zone_id);
            return false;
        }
        if (!new_zones.emplace(zone.zone_id, zone).second) {
            logger->error("존 설정 거부 - 중복 zone_id: {}", zone.zone_id);
            return false;
        }
    }

    for (const auto& line : lines) {
        if (!validateLine(line)) {
            logger->error("존 설정 거부 - 잘못된 라인: '{}'", line.line_id);
            return false;
        }
        if (!new_lines.emplace(line.line_id, line).second) {
            logger->error("존 설정 거부 - 중복 line_id: {}", line.line_id);
            return false;
        }
    }

    std::lock_guard<std::mutex> lock(config_mutex_);
    zones_ = std::move(new_zones);
    lines_ = std::move(new_lines);
    version_++;

    logger->info("존/라인 설정 적용 - 존: {}개, 라인: {}개 (version {})",
                 zones_.size(), lines_.size(), version_);
    return true;
}

bool ZoneConfigStore::parsePoint(const Json::Value& node, ObjPoint& point) const {
    // [x, y] 또는 {"x": .., "y": ..} 형식 허용
    if (node.isArray() && node.size() == 2 && node[0].isNumeric() && node[1].isNumeric()) {
        point = {node[0].asDouble(), node[1].asDouble()};
        return true;
    }
    if (node.isObject() && node["x"].isNumeric() && node["y"].isNumeric()) {
        point = {node["x"].asDouble(), node["y"].asDouble()};
        return true;
    }
    return false;
}

bool ZoneConfigStore::parseZone(const Json::Value& node, ZoneDef& zone) const {
    if (!node.isObject()) {
        logger->error("존 항목이 객체가 아님");
        return false;
    }

    zone.zone_id = node.get("zone_id", "").asString();
    zone.camera_id = node.get("camera_id", "").asString();
    zone.name = node.get("name", "").asString();

    std::string type_name = node.get("zone_type", "custom").asString();
    if (!parseZoneType(type_name, zone.zone_type)) {
        logger->error("알 수 없는 zone_type '{}' (zone: {})", type_name, zone.zone_id);
        return false;
    }

    const Json::Value& polygon = node["polygon"];
    if (!polygon.isArray()) {
        logger->error("polygon 이 배열이 아님 (zone: {})", zone.zone_id);
        return false;
    }
    for (const auto& point_node : polygon) {
        ObjPoint point;
        if (!parsePoint(point_node, point)) {
            logger->error("잘못된 좌표 (zone: {})", zone.zone_id);
            return false;
        }
        zone.polygon.push_back(point);
    }

    const Json::Value& threshold = node["dwell_threshold_sec"];
    if (!threshold.isNull()) {
        if (!threshold.isNumeric()) {
            logger->error("dwell_threshold_sec 가 숫자가 아님 (zone: {})", zone.zone_id);
            return false;
        }
        zone.dwell_threshold_sec = threshold.asDouble();
    }
    return true;
}

bool ZoneConfigStore::parseLine(const Json::Value& node, LineDef& line) const {
    if (!node.isObject()) {
        logger->error("라인 항목이 객체가 아님");
        return false;
    }

    line.line_id = node.get("line_id", "").asString();
    line.camera_id = node.get("camera_id", "").asString();
    line.name = node.get("name", "").asString();
    line.direction = node.get("direction", "").asString();

    std::string type_name = node.get("line_type", "custom").asString();
    if (!parseLineType(type_name, line.line_type)) {
        logger->error("알 수 없는 line_type '{}' (line: {})", type_name, line.line_id);
        return false;
    }

    const Json::Value& points = node["points"];
    if (!points.isArray() || points.size() != 2) {
        logger->error("라인은 정확히 두 점이 필요함 (line: {})", line.line_id);
        return false;
    }
    if (!parsePoint(points[0], line.p1) || !parsePoint(points[1], line.p2)) {
        logger->error("잘못된 좌표 (line: {})", line.line_id);
        return false;
    }
    return true;
}

bool ZoneConfigStore::validateZone(const ZoneDef& zone) const {
    if (zone.zone_id.empty() || zone.camera_id.empty()) {
        logger->error("zone_id 또는 camera_id 누락");
        return false;
    }
    if (zone.polygon.size() < 3) {
        logger->error("존 다각형 꼭짓점 부족: {}개 (zone: {})", zone.polygon.size(), zone.zone_id);
        return false;
    }
    if (zone.dwell_threshold_sec && *zone.dwell_threshold_sec < 0) {
        logger->error("음수 dwell_threshold_sec (zone: {})", zone.zone_id);
        return false;
    }
    return true;
}

bool ZoneConfigStore::validateLine(const LineDef& line) const {
    if (line.line_id.empty() || line.camera_id.empty()) {
        logger->error("line_id 또는 camera_id 누락");
        return false;
    }
    if (line.p1.x == line.p2.x && line.p1.y == line.p2.y) {
        logger->error("라인의 두 점이 동일함 (line: {})", line.line_id);
        return false;
    }
    return true;
}

std::optional<ZoneDef> ZoneConfigStore::findZone(const std::string& zone_id) const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    auto it = zones_.find(zone_id);
    if (it == zones_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<LineDef> ZoneConfigStore::findLine(const std::string& line_id) const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    auto it = lines_.find(line_id);
    if (it == lines_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ZoneDef> ZoneConfigStore::zonesForCamera(const std::string& camera_id) const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    std::vector<ZoneDef> result;
    for (const auto& [zone_id, zone] : zones_) {
        if (zone.camera_id == camera_id) {
            result.push_back(zone);
        }
    }
    return result;
}

std::vector<LineDef> ZoneConfigStore::linesForCamera(const std::string& camera_id) const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    std::vector<LineDef> result;
    for (const auto& [line_id, line] : lines_) {
        if (line.camera_id == camera_id) {
            result.push_back(line);
        }
    }
    return result;
}

std::vector<ZoneDef> ZoneConfigStore::greetZones(const std::string& camera_id) const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    std::vector<ZoneDef> result;
    for (const auto& [zone_id, zone] : zones_) {
        if (zone.camera_id == camera_id && zone.zone_type == ZoneType::GREET_ZONE) {
            result.push_back(zone);
        }
    }
    return result;
}

size_t ZoneConfigStore::zoneCount() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return zones_.size();
}

size_t ZoneConfigStore::lineCount() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return lines_.size();
}

uint64_t ZoneConfigStore::version() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return version_;
}
