/*
 * config_manager.cpp
 *
 * 싱글톤 패턴의 설정 관리자 구현
 * config.json 파일을 읽어서 파싱하고 관리
 */

#include "config_manager.h"
#include <fstream>
#include <sstream>

// 싱글톤 인스턴스 정의
std::unique_ptr<ConfigManager> ConfigManager::instance = nullptr;
std::mutex ConfigManager::instance_mutex;

ConfigManager& ConfigManager::getInstance() {
    std::lock_guard<std::mutex> lock(instance_mutex);
    if (!instance) {
        instance = std::unique_ptr<ConfigManager>(new ConfigManager());
    }
    return *instance;
}

bool ConfigManager::initialize(const std::string& config_path) {
    logger = getLogger("DV_ConfigManager_log");
    logger->info("ConfigManager 초기화 시작: {}", config_path);

    config_path_ = config_path;
    config_root = Json::Value();
    cached_flags = CachedFlags();

    if (!loadConfig(config_path)) {
        logger->error("설정 파일 로드 실패");
        return false;
    }

    // 모든 플래그를 캐싱
    cacheAllFlags();

    // 로거 경로/레벨 반영
    setLoggerConfig(getLogPath(), cached_flags.log_level);

    // 모든 설정 로깅
    logAllSettings();

    if (!validate()) {
        logger->error("설정 검증 실패");
        return false;
    }

    logger->info("ConfigManager 초기화 완료");
    return true;
}

void ConfigManager::logAllSettings() const {
    logger->info("========== CONFIG.JSON 설정값 전체 출력 시작 ==========");

    logger->info("[System 설정]");
    logger->info("  - log_level: {}", cached_flags.log_level);

    logger->info("[Site 설정]");
    logger->info("  - tenant_id: {}", cached_flags.tenant_id);
    logger->info("  - site_id: {}", cached_flags.site_id);
    logger->info("  - cameras: {}개", cached_flags.cameras.size());
    for (const auto& camera : cached_flags.cameras) {
        logger->debug("    * {} ({})", camera.camera_id, camera.name);
    }

    logger->info("[Analytics 설정]");
    logger->info("  - default_dwell_threshold_sec: {}", cached_flags.default_dwell_threshold_sec);
    logger->info("  - greet_min_proximity_sec: {}", cached_flags.greet_min_proximity_sec);
    logger->info("  - scan_interval_ms: {}", cached_flags.scan_interval_ms);
    logger->info("  - track_max_age_sec: {}", cached_flags.track_max_age_sec);
    logger->info("  - ttg_match_window_sec: {}", cached_flags.ttg_match_window_sec);
    logger->info("  - arrival_retention_sec: {}", cached_flags.arrival_retention_sec);
    logger->debug("  - arrival_buffer_capacity: {}", cached_flags.arrival_buffer_capacity);
    logger->debug("  - bay_entry_retention_sec: {}", cached_flags.bay_entry_retention_sec);
    logger->debug("  - detection_max_age_sec: {}", cached_flags.detection_max_age_sec);

    logger->info("[처리 모듈]");
    logger->info("  - crossing_detection: {}", cached_flags.crossing_detection_enabled);
    logger->info("  - metric_store: {}", cached_flags.metric_store_enabled);
    logger->info("  - redis_uplink: {}", cached_flags.redis_uplink_enabled);
    logger->info("  - throughput_report: {}", cached_flags.throughput_report_enabled);
    if (cached_flags.throughput_report_enabled) {
        logger->info("    * 다음 정각 기준으로 {}분 간격 처리량 보고", cached_flags.throughput_interval_minutes);
    }

    logger->info("[경로 설정]");
    logger->info("  - base_path: {}", cached_flags.base_path);
    logger->info("  - db_filename: {}", cached_flags.db_filename);
    logger->info("  - log_path: {}", getLogPath());
    logger->info("  - zone_config: {}", getZoneConfigPath());

    logger->info("[Redis 설정]");
    logger->info("  - host: {}", cached_flags.redis_host);
    logger->info("  - port: {}", cached_flags.redis_port);
    logger->info("  - primitives: {}", getRedisChannel("primitives"));
    logger->info("  - detections: {}", getRedisChannel("detections"));
    logger->info("  - events: {}", getRedisChannel("events"));
    logger->info("  - metrics: {}", getRedisChannel("metrics"));

    logger->info("========== CONFIG.JSON 설정값 전체 출력 완료 ==========");
}

bool ConfigManager::loadConfig(const std::string& path) {
    std::ifstream config_file(path);
    if (!config_file.is_open()) {
        logger->error("설정 파일을 열 수 없음: {}", path);
        return false;
    }

    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, config_file, &config_root, &errors)) {
        logger->error("JSON 파싱 실패: {}", errors);
        return false;
    }

    logger->info("설정 파일 로드 성공");
    return true;
}

void ConfigManager::cacheAllFlags() {
    // System 설정
    cached_flags.log_level = getString("system.log_level", "info");

    // Site 설정
    cached_flags.tenant_id = getString("site.tenant_id", "");
    cached_flags.site_id = getString("site.site_id", "");
    const Json::Value* cameras = getJsonValue("site.cameras");
    if (cameras && cameras->isArray()) {
        for (const auto& camera : *cameras) {
            CameraInfo info;
            info.camera_id = camera.get("camera_id", "").asString();
            info.name = camera.get("name", "").asString();
            if (info.camera_id.empty()) {
                logger->warn("camera_id 가 없는 카메라 항목 무시");
                continue;
            }
            cached_flags.cameras.push_back(info);
        }
    }

    // Analytics 설정
    cached_flags.default_dwell_threshold_sec = getDouble("analytics.default_dwell_threshold_sec", 2.0);
    cached_flags.greet_min_proximity_sec = getDouble("analytics.greet_min_proximity_sec", 1.0);
    cached_flags.scan_interval_ms = getInt("analytics.scan_interval_ms", 1000);
    cached_flags.track_max_age_sec = getDouble("analytics.track_max_age_sec", 60.0);
    cached_flags.detection_max_age_sec = getDouble("analytics.detection_max_age_sec", 5.0);
    cached_flags.ttg_match_window_sec = getDouble("analytics.ttg_match_window_sec", 300.0);
    cached_flags.arrival_retention_sec = getDouble("analytics.arrival_retention_sec", 3600.0);
    cached_flags.arrival_buffer_capacity = getInt("analytics.arrival_buffer_capacity", 10000);
    cached_flags.bay_entry_retention_sec = getDouble("analytics.bay_entry_retention_sec", 86400.0);

    // Processing modules
    cached_flags.crossing_detection_enabled = getBool("processing_modules.crossing_detection", false);
    cached_flags.metric_store_enabled = getBool("processing_modules.metric_store", false);
    cached_flags.redis_uplink_enabled = getBool("processing_modules.redis_uplink", false);
    cached_flags.throughput_report_enabled = getBool("processing_modules.throughput_report.enabled", false);
    cached_flags.dispatch_queue_capacity = getInt("processing_modules.dispatch_queue_capacity", 1024);

    // interval_minutes 검증 (60의 약수만 허용)
    int raw_interval = getInt("processing_modules.throughput_report.interval_minutes", 15);
    if (raw_interval <= 0 || raw_interval > 60 || (60 % raw_interval != 0)) {
        logger->warn("잘못된 interval_minutes 값: {}분 (60의 약수가 아님)", raw_interval);
        logger->warn("기본값 15분으로 설정. 허용값: 1, 2, 3, 4, 5, 6, 10, 12, 15, 20, 30, 60");
        cached_flags.throughput_interval_minutes = 15;
    } else {
        cached_flags.throughput_interval_minutes = raw_interval;
    }

    if (cached_flags.dispatch_queue_capacity <= 0) {
        logger->warn("잘못된 dispatch_queue_capacity: {} - 기본값 1024 사용",
                     cached_flags.dispatch_queue_capacity);
        cached_flags.dispatch_queue_capacity = 1024;
    }

    // Redis 설정
    cached_flags.redis_host = getString("redis.host", "127.0.0.1");
    cached_flags.redis_port = getInt("redis.port", 6379);

    // Path 설정
    cached_flags.base_path = getString("paths.base_path", "./");
    cached_flags.db_filename = getString("paths.sqlite_db.filename", "metrics.db");
    cached_flags.log_path = getString("paths.logs", "logs");
    cached_flags.zone_config_path = getString("paths.zones", "config/zones.json");
}

std::string ConfigManager::getSQLitePath() const {
    std::string db_dir = getString("paths.sub_paths.db", "");

    if (db_dir.empty()) {
        return cached_flags.base_path;  // db 하위 경로가 없으면 base_path 그대로 사용
    }
    return getFullPath(db_dir);
}

std::string ConfigManager::getLogPath() const {
    return getFullPath(cached_flags.log_path);
}

std::string ConfigManager::getZoneConfigPath() const {
    return getFullPath(cached_flags.zone_config_path);
}

std::string ConfigManager::getFullPath(const std::string& relative_path) const {
    if (relative_path.empty() || relative_path[0] == '/') {
        return relative_path;  // 이미 절대 경로
    }

    std::string base_path = cached_flags.base_path;
    if (base_path.empty()) {
        return relative_path;
    }
    if (base_path.back() != '/') {
        base_path += "/";
    }
    return base_path + relative_path;
}

// 기능 플래그
bool ConfigManager::isModuleEnabled(const std::string& module) const {
    return getBool("processing_modules." + module, false);
}

// Redis 채널 설정
std::string ConfigManager::getRedisChannel(const std::string& channel_key) const {
    return getString("redis.channels." + channel_key, "");
}

// Helper 메서드들
std::string ConfigManager::getString(const std::string& key, const std::string& default_value) const {
    const Json::Value* value = getJsonValue(key);
    if (value && value->isString()) {
        return value->asString();
    }
    return default_value;
}

int ConfigManager::getInt(const std::string& key, int default_value) const {
    const Json::Value* value = getJsonValue(key);
    if (value && value->isInt()) {
        return value->asInt();
    }
    return default_value;
}

double ConfigManager::getDouble(const std::string& key, double default_value) const {
    const Json::Value* value = getJsonValue(key);
    if (value && value->isNumeric()) {
        return value->asDouble();
    }
    return default_value;
}

bool ConfigManager::getBool(const std::string& key, bool default_value) const {
    const Json::Value* value = getJsonValue(key);
    if (value && value->isBool()) {
        return value->asBool();
    }
    return default_value;
}

const Json::Value* ConfigManager::getJsonValue(const std::string& key) const {
    std::vector<std::string> parts;
    std::stringstream ss(key);
    std::string part;

    while (std::getline(ss, part, '.')) {
        parts.push_back(part);
    }

    const Json::Value* current = &config_root;

    for (const auto& p : parts) {
        if (!current->isObject() || !current->isMember(p)) {
            return nullptr;
        }
        current = &(*current)[p];
    }

    return current;
}

bool ConfigManager::validate() const {
    // 필수 설정 확인
    if (cached_flags.tenant_id.empty()) {
        logger->error("site.tenant_id 가 없음");
        return false;
    }

    if (cached_flags.site_id.empty()) {
        logger->error("site.site_id 가 없음");
        return false;
    }

    if (cached_flags.scan_interval_ms <= 0) {
        logger->error("잘못된 scan_interval_ms: {}", cached_flags.scan_interval_ms);
        return false;
    }

    if (cached_flags.track_max_age_sec <= 0 || cached_flags.ttg_match_window_sec <= 0 ||
        cached_flags.arrival_retention_sec <= 0 || cached_flags.bay_entry_retention_sec <= 0) {
        logger->error("시간 기반 설정값은 양수여야 함");
        return false;
    }

    if (cached_flags.arrival_buffer_capacity <= 0) {
        logger->error("잘못된 arrival_buffer_capacity: {}", cached_flags.arrival_buffer_capacity);
        return false;
    }

    if (cached_flags.default_dwell_threshold_sec < 0 || cached_flags.greet_min_proximity_sec < 0) {
        logger->error("체류/근접 임계값은 음수일 수 없음");
        return false;
    }

    // 설정 충돌 경고
    if (cached_flags.arrival_retention_sec < cached_flags.ttg_match_window_sec) {
        logger->warn("arrival_retention_sec({}) < ttg_match_window_sec({}) - 매칭 윈도우가 잘림",
                     cached_flags.arrival_retention_sec, cached_flags.ttg_match_window_sec);
    }

    if (cached_flags.redis_uplink_enabled && getRedisChannel("events").empty()) {
        logger->warn("redis_uplink 활성화되었으나 redis.channels.events 가 비어 있음");
    }

    if (cached_flags.cameras.empty()) {
        logger->warn("설정된 카메라 없음 - 프리미티브 수신 시 카메라 파이프라인 자동 생성");
    }

    return true;
}
