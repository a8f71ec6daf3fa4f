/*
 * config_manager.h
 *
 * 싱글톤 패턴의 설정 관리자 헤더
 * config.json 파일을 읽어서 파싱하고 관리
 *
 * 코어 분석 모듈은 이 싱글톤을 직접 읽지 않음:
 * SystemManager 가 캐시된 값으로 모듈별 Config 구조체를 만들어 전달
 */

#ifndef CONFIG_MANAGER_H
#define CONFIG_MANAGER_H

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <json/json.h>

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

// 싱글톤 매크로
#define CONFIG ConfigManager::getInstance()

/**
 * @brief 설정 관리자 싱글톤 클래스
 *
 * config.json 파일을 읽고 파싱하여 전역적으로 설정에 접근
 */
class ConfigManager {
public:
    // 카메라 정보
    struct CameraInfo {
        std::string camera_id;
        std::string name;
    };

private:
    static std::unique_ptr<ConfigManager> instance;
    static std::mutex instance_mutex;

    Json::Value config_root;
    std::string config_path_;
    std::shared_ptr<spdlog::logger> logger = nullptr;

    // 설정값 캐시 (초기화 시 한 번만 계산)
    struct CachedFlags {
        // System
        std::string log_level = "info";

        // Site
        std::string tenant_id;
        std::string site_id;
        std::vector<CameraInfo> cameras;

        // Analytics
        double default_dwell_threshold_sec = 2.0;
        double greet_min_proximity_sec = 1.0;
        int scan_interval_ms = 1000;
        double track_max_age_sec = 60.0;
        double detection_max_age_sec = 5.0;
        double ttg_match_window_sec = 300.0;
        double arrival_retention_sec = 3600.0;
        int arrival_buffer_capacity = 10000;
        double bay_entry_retention_sec = 86400.0;

        // Processing modules
        bool crossing_detection_enabled = false;
        bool metric_store_enabled = false;
        bool redis_uplink_enabled = false;
        bool throughput_report_enabled = false;
        int throughput_interval_minutes = 15;
        int dispatch_queue_capacity = 1024;

        // Redis
        std::string redis_host = "127.0.0.1";
        int redis_port = 6379;

        // Paths
        std::string base_path;
        std::string db_filename;
        std::string log_path;
        std::string zone_config_path;
    } cached_flags;

    // private 생성자 (싱글톤)
    ConfigManager() = default;

    bool loadConfig(const std::string& path);
    bool validate() const;
    void cacheAllFlags();           // 모든 플래그 캐싱
    void logAllSettings() const;    // 모든 설정값 로그 출력
    const Json::Value* getJsonValue(const std::string& key) const;

public:
    // 싱글톤 인스턴스 접근
    static ConfigManager& getInstance();

    // 초기화 (단일 config 파일만 사용)
    bool initialize(const std::string& config_path = "config/config.json");

    // Path 관련
    std::string getBasePath() const { return cached_flags.base_path; }
    std::string getSQLitePath() const;
    std::string getDBFileName() const { return cached_flags.db_filename; }
    std::string getLogPath() const;
    std::string getZoneConfigPath() const;
    std::string getFullPath(const std::string& relative_path) const;

    // System 설정 (캐시된 값 반환)
    std::string getLogLevel() const { return cached_flags.log_level; }

    // Site 설정
    std::string getTenantId() const { return cached_flags.tenant_id; }
    std::string getSiteId() const { return cached_flags.site_id; }
    const std::vector<CameraInfo>& getCameras() const { return cached_flags.cameras; }

    // Analytics 설정
    double getDefaultDwellThresholdSec() const { return cached_flags.default_dwell_threshold_sec; }
    double getGreetMinProximitySec() const { return cached_flags.greet_min_proximity_sec; }
    int getScanIntervalMs() const { return cached_flags.scan_interval_ms; }
    double getTrackMaxAgeSec() const { return cached_flags.track_max_age_sec; }
    double getDetectionMaxAgeSec() const { return cached_flags.detection_max_age_sec; }
    double getTtgMatchWindowSec() const { return cached_flags.ttg_match_window_sec; }
    double getArrivalRetentionSec() const { return cached_flags.arrival_retention_sec; }
    int getArrivalBufferCapacity() const { return cached_flags.arrival_buffer_capacity; }
    double getBayEntryRetentionSec() const { return cached_flags.bay_entry_retention_sec; }

    // Processing modules 설정 (캐시된 값 반환)
    bool isCrossingDetectionEnabled() const { return cached_flags.crossing_detection_enabled; }
    bool isMetricStoreEnabled() const { return cached_flags.metric_store_enabled; }
    bool isRedisUplinkEnabled() const { return cached_flags.redis_uplink_enabled; }
    bool isThroughputReportEnabled() const { return cached_flags.throughput_report_enabled; }
    int getThroughputIntervalMinutes() const { return cached_flags.throughput_interval_minutes; }
    int getDispatchQueueCapacity() const { return cached_flags.dispatch_queue_capacity; }

    // Redis 설정 (캐시된 값 반환)
    std::string getRedisHost() const { return cached_flags.redis_host; }
    int getRedisPort() const { return cached_flags.redis_port; }
    std::string getRedisChannel(const std::string& channel_key) const;

    // 기능 플래그
    bool isModuleEnabled(const std::string& module) const;

    // Helper methods
    std::string getString(const std::string& key, const std::string& default_value = "") const;
    int getInt(const std::string& key, int default_value = 0) const;
    double getDouble(const std::string& key, double default_value = 0.0) const;
    bool getBool(const std::string& key, bool default_value = false) const;
};

#endif // CONFIG_MANAGER_H
