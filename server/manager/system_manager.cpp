/*
 * system_manager.cpp
 *
 * 엣지 분석 시스템 통합 관리 클래스 구현
 * - 입력(프리미티브/검출 프레임) → 카메라 파이프라인 → 이벤트
 * - 이벤트 → 디스패처(발행) + 메트릭 엔진 → 디스패처(기록)
 */

#include "system_manager.h"
#include <chrono>
#include "../../common/common_types.h"
#include "../../utils/config_manager.h"

SystemManager::Config SystemManager::configFromManager(const ConfigManager& config) {
    Config cfg;
    cfg.tenant_id = config.getTenantId();
    cfg.site_id = config.getSiteId();
    for (const auto& camera : config.getCameras()) {
        cfg.camera_ids.push_back(camera.camera_id);
    }

    cfg.pipeline.scanner.default_dwell_threshold_sec = config.getDefaultDwellThresholdSec();
    cfg.pipeline.scanner.greet_min_proximity_sec = config.getGreetMinProximitySec();
    cfg.pipeline.track_max_age_sec = config.getTrackMaxAgeSec();

    cfg.metrics.ttg_match_window_sec = config.getTtgMatchWindowSec();
    cfg.metrics.arrival_retention_sec = config.getArrivalRetentionSec();
    cfg.metrics.arrival_buffer_capacity = static_cast<size_t>(config.getArrivalBufferCapacity());
    cfg.metrics.bay_entry_retention_sec = config.getBayEntryRetentionSec();

    cfg.scan_interval_ms = config.getScanIntervalMs();
    cfg.detection_max_age_sec = config.getDetectionMaxAgeSec();
    cfg.dispatch_queue_capacity = static_cast<size_t>(config.getDispatchQueueCapacity());

    cfg.crossing_detection_enabled = config.isCrossingDetectionEnabled();
    cfg.throughput_report_enabled = config.isThroughputReportEnabled();
    cfg.throughput_interval_minutes = config.getThroughputIntervalMinutes();

    cfg.metric_store_enabled = config.isMetricStoreEnabled();
    cfg.db_path = config.getSQLitePath();
    cfg.db_name = config.getDBFileName();
    return cfg;
}

SystemManager::SystemManager(const Config& config)
    : config_(config) {
    logger = getLogger("DV_SystemManager_log");

    dispatcher_ = std::make_unique<AsyncDispatcher>(config_.dispatch_queue_capacity);
    metrics_engine_ = std::make_unique<MetricsEngine>(config_.metrics, dispatcher_.get());

    logger->info("SystemManager 생성 - tenant: {}, site: {}", config_.tenant_id, config_.site_id);
}

SystemManager::~SystemManager() {
    stop();
}

bool SystemManager::initialize(const std::string& zone_config_path) {
    logger->info("시스템 매니저 초기화 시작");

    // ====== 1단계: 라인/존 설정 ======
    if (!zone_config_path.empty()) {
        if (!zone_store_.loadFromFile(zone_config_path)) {
            logger->error("라인/존 설정 로드 실패: {}", zone_config_path);
            return false;
        }
        logger->info("라인/존 설정 로드 완료 - 존: {}, 라인: {}",
                     zone_store_.zoneCount(), zone_store_.lineCount());
    } else {
        logger->warn("라인/존 설정 경로 없음 - 빈 설정으로 시작");
    }

    // ====== 2단계: 메트릭 저장소 ======
    if (config_.metric_store_enabled) {
        metric_store_ = std::make_unique<MetricStore>(config_.db_path, config_.db_name);
        if (!metric_store_->isHealthy()) {
            logger->error("SQLite 메트릭 저장소 초기화 실패");
            metric_store_.reset();
            return false;
        }
        dispatcher_->addMetricSink(metric_store_.get());
        logger->info("SQLite 메트릭 저장소 초기화 성공");
    } else {
        logger->info("메트릭 저장소 비활성 (config.json에서 false로 설정됨)");
    }

    // ====== 3단계: 등록 카메라 파이프라인 ======
    for (const auto& camera_id : config_.camera_ids) {
        getOrCreatePipeline(resolveIdentity("", "", camera_id));
        if (config_.crossing_detection_enabled) {
            getOrCreateDetector(resolveIdentity("", "", camera_id));
        }
    }

    // ====== 4단계: 처리량 보고기 ======
    if (config_.throughput_report_enabled) {
        throughput_reporter_ = std::make_unique<ThroughputReporter>(
            *metrics_engine_, *dispatcher_, config_.throughput_interval_minutes);
    } else {
        logger->info("처리량 보고기 비활성 (config.json에서 false로 설정됨)");
    }

    logger->info("=== 활성 모듈 요약 ===");
    logger->info("  - 카메라 파이프라인: {}", getPipelineCount());
    logger->info("  - 라인/존 판정: {}", config_.crossing_detection_enabled ? "활성" : "비활성");
    logger->info("  - 메트릭 저장소: {}", metric_store_ ? "활성" : "비활성");
    logger->info("  - 처리량 보고: {}", throughput_reporter_ ? "활성" : "비활성");
    logger->info("시스템 매니저 초기화 완료");
    return true;
}

void SystemManager::addEventPublisher(EventPublisher* publisher) {
    dispatcher_->addEventPublisher(publisher);
}

void SystemManager::addMetricSink(MetricSink* sink) {
    dispatcher_->addMetricSink(sink);
}

void SystemManager::start() {
    if (running_.exchange(true)) {
        logger->warn("시스템 매니저가 이미 실행 중");
        return;
    }
    logger->info("시스템 매니저 시작");

    dispatcher_->start();
    scan_thread_ = std::thread(&SystemManager::scanThread, this);
    logger->info("스캔 스레드 시작 - 주기: {}ms", config_.scan_interval_ms);

    if (throughput_reporter_) {
        throughput_reporter_->start();
    }
    logger->info("모든 모듈 시작 완료");
}

void SystemManager::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    logger->info("시스템 매니저 중지 시작");
    auto total_start = std::chrono::steady_clock::now();

    if (throughput_reporter_) {
        throughput_reporter_->stop();
    }

    cv_.notify_all();
    if (scan_thread_.joinable()) {
        scan_thread_.join();
    }
    logger->info("스캔 스레드 중지 완료");

    // 큐에 남은 이벤트/메트릭 전달 후 종료
    dispatcher_->stop();

    auto stats = getStatistics();
    logger->info("최종 통계 - 프리미티브: {}, 프레임: {}, 이벤트: {}, 메트릭: {}, 스캔: {}",
                 stats.primitives_received, stats.frames_received, stats.events_published,
                 stats.metrics_generated, stats.scan_ticks);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>
                   (std::chrono::steady_clock::now() - total_start);
    logger->info("시스템 매니저 중지 완료: {}ms", elapsed.count());
}

CameraIdentity SystemManager::resolveIdentity(const std::string& tenant_id,
                                              const std::string& site_id,
                                              const std::string& camera_id) const {
    CameraIdentity identity;
    identity.tenant_id = tenant_id.empty() ? config_.tenant_id : tenant_id;
    identity.site_id = site_id.empty() ? config_.site_id : site_id;
    identity.camera_id = camera_id;
    return identity;
}

CameraPipeline& SystemManager::getOrCreatePipeline(const CameraIdentity& identity) {
    std::lock_guard<std::mutex> lock(pipelines_mutex_);

    auto it = pipelines_.find(identity.camera_id);
    if (it != pipelines_.end()) {
        return *it->second;
    }

    auto pipeline = std::make_unique<CameraPipeline>(identity, zone_store_, config_.pipeline);
    auto& ref = *pipeline;
    pipelines_.emplace(identity.camera_id, std::move(pipeline));
    logger->info("카메라 파이프라인 생성 - camera: {} (site: {})", identity.camera_id, identity.site_id);
    return ref;
}

CrossingDetector& SystemManager::getOrCreateDetector(const CameraIdentity& identity) {
    std::lock_guard<std::mutex> lock(pipelines_mutex_);

    auto it = detectors_.find(identity.camera_id);
    if (it != detectors_.end()) {
        return *it->second;
    }

    auto detector = std::make_unique<CrossingDetector>(identity, zone_store_,
                                                       config_.detection_max_age_sec);
    auto& ref = *detector;
    detectors_.emplace(identity.camera_id, std::move(detector));
    logger->info("라인/존 판정기 생성 - camera: {}", identity.camera_id);
    return ref;
}

void SystemManager::handleEvent(const DomainEvent& event) {
    dispatcher_->publish(event);
    events_published_++;

    auto metrics = metrics_engine_->processEvent(event);
    metrics_generated_ += metrics.size();
}

std::optional<DomainEvent> SystemManager::onPrimitive(const Primitive& primitive) {
    return onPrimitive(primitive, getCurTimeSec());
}

std::optional<DomainEvent> SystemManager::onPrimitive(const Primitive& primitive, double now) {
    primitives_received_++;

    if (primitive.camera_id.empty()) {
        logger->warn("camera_id 없는 프리미티브 무시 - track: {}", primitive.track_id);
        return std::nullopt;
    }

    auto identity = resolveIdentity(primitive.tenant_id, primitive.site_id, primitive.camera_id);
    auto& pipeline = getOrCreatePipeline(identity);

    // 테넌트/사이트가 비어 있으면 설정값으로 채움
    Primitive resolved = primitive;
    resolved.tenant_id = identity.tenant_id;
    resolved.site_id = identity.site_id;

    auto event = pipeline.onPrimitive(resolved, now);
    if (event) {
        handleEvent(*event);
    }
    return event;
}

size_t SystemManager::onDetections(const DetectionFrame& frame) {
    return onDetections(frame, getCurTimeSec());
}

size_t SystemManager::onDetections(const DetectionFrame& frame, double now) {
    frames_received_++;

    if (!config_.crossing_detection_enabled) {
        logger->debug("라인/존 판정 비활성 - 검출 프레임 무시 (camera: {})", frame.camera_id);
        return 0;
    }
    if (frame.camera_id.empty() || frame.timestamp <= 0) {
        logger->warn("잘못된 검출 프레임 무시 - camera: '{}', ts: {}", frame.camera_id, frame.timestamp);
        return 0;
    }

    auto identity = resolveIdentity(frame.tenant_id, frame.site_id, frame.camera_id);
    auto& detector = getOrCreateDetector(identity);

    auto primitives = detector.processFrame(frame.detections, frame.timestamp, now);
    for (const auto& primitive : primitives) {
        onPrimitive(primitive, now);
    }
    return primitives.size();
}

size_t SystemManager::scanTick(double now) {
    std::vector<CameraPipeline*> pipelines;
    std::vector<CrossingDetector*> detectors;
    {
        std::lock_guard<std::mutex> lock(pipelines_mutex_);
        for (auto& [camera_id, pipeline] : pipelines_) {
            pipelines.push_back(pipeline.get());
        }
        for (auto& [camera_id, detector] : detectors_) {
            detectors.push_back(detector.get());
        }
    }

    size_t emitted = 0;
    for (auto* pipeline : pipelines) {
        auto events = pipeline->onScanTick(now);
        for (const auto& event : events) {
            handleEvent(event);
        }
        emitted += events.size();
    }

    for (auto* detector : detectors) {
        detector->purgeStale(now);
    }

    scan_ticks_++;
    return emitted;
}

void SystemManager::scanThread() {
    const auto interval = std::chrono::milliseconds(config_.scan_interval_ms);

    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(cv_mutex_);
            if (cv_.wait_for(lock, interval, [this]() { return !running_.load(); })) {
                break;
            }
        }

        try {
            size_t emitted = scanTick(getCurTimeSec());
            if (emitted > 0) {
                logger->debug("스캔 틱 이벤트 {}건", emitted);
            }
        } catch (const std::exception& e) {
            // 스캔 루프 유지
            logger->error("스캔 틱 처리 중 오류: {}", e.what());
        }
    }
    logger->info("스캔 스레드 종료");
}

int SystemManager::computeThroughput(const std::string& site_id, double start_time,
                                     double end_time) const {
    return metrics_engine_->computeThroughput(site_id, start_time, end_time);
}

size_t SystemManager::getPipelineCount() const {
    std::lock_guard<std::mutex> lock(pipelines_mutex_);
    return pipelines_.size();
}

CameraPipeline* SystemManager::findPipeline(const std::string& camera_id) const {
    std::lock_guard<std::mutex> lock(pipelines_mutex_);
    auto it = pipelines_.find(camera_id);
    return it != pipelines_.end() ? it->second.get() : nullptr;
}

SystemManager::Statistics SystemManager::getStatistics() const {
    Statistics stats;
    stats.primitives_received = primitives_received_.load();
    stats.frames_received = frames_received_.load();
    stats.events_published = events_published_.load();
    stats.metrics_generated = metrics_generated_.load();
    stats.scan_ticks = scan_ticks_.load();
    {
        std::lock_guard<std::mutex> lock(pipelines_mutex_);
        stats.pipelines = pipelines_.size();
        for (const auto& [camera_id, pipeline] : pipelines_) {
            stats.active_tracks += pipeline->getTrackCount();
        }
    }
    stats.metrics = metrics_engine_->getStatistics();
    stats.dispatcher = dispatcher_->getStatistics();
    return stats;
}
