/*
 * zone_config_store.h
 *
 * 사이트의 존/라인 정적 설정 저장소
 * - zones.json 로드 및 검증 (하나라도 잘못되면 전체 거부, 기존 설정 유지)
 * - 카메라별/ID별 조회 (복사본 반환, 재로드와 동시 접근 안전)
 */

#ifndef ZONE_CONFIG_STORE_H
#define ZONE_CONFIG_STORE_H

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>
#include "zone_types.h"

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

class ZoneConfigStore {
public:
    ZoneConfigStore();

    /**
     * @brief zones.json 파일 로드
     * @param path 파일 경로
     * @return 성공 시 true (실패 시 기존 설정 유지)
     */
    bool loadFromFile(const std::string& path);

    /**
     * @brief JSON 객체 로드 ({"zones": [...], "lines": [...]})
     * @return 성공 시 true (실패 시 기존 설정 유지)
     */
    bool loadFromJson(const Json::Value& root);

    /**
     * @brief 프로그램에서 구성한 설정으로 교체
     * @return 검증 실패 시 false
     */
    bool replace(const std::vector<ZoneDef>& zones, const std::vector<LineDef>& lines);

    std::optional<ZoneDef> findZone(const std::string& zone_id) const;
    std::optional<LineDef> findLine(const std::string& line_id) const;

    std::vector<ZoneDef> zonesForCamera(const std::string& camera_id) const;
    std::vector<LineDef> linesForCamera(const std::string& camera_id) const;

    /**
     * @brief 카메라의 greet_zone 타입 존 목록
     */
    std::vector<ZoneDef> greetZones(const std::string& camera_id) const;

    size_t zoneCount() const;
    size_t lineCount() const;

    /**
     * @brief 설정 버전 (교체될 때마다 증가)
     */
    uint64_t version() const;

private:
    bool parseZone(const Json::Value& node, ZoneDef& zone) const;
    bool parseLine(const Json::Value& node, LineDef& line) const;
    bool parsePoint(const Json::Value& node, ObjPoint& point) const;
    bool validateZone(const ZoneDef& zone) const;
    bool validateLine(const LineDef& line) const;

    mutable std::mutex config_mutex_;
    std::map<std::string, ZoneDef> zones_;
    std::map<std::string, LineDef> lines_;
    uint64_t version_ = 0;

    std::shared_ptr<spdlog::logger> logger;
};

#endif // ZONE_CONFIG_STORE_H
