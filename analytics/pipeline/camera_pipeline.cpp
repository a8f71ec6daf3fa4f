/*
 * camera_pipeline.cpp
 *
 * 카메라 단위 프리미티브/스캔 처리 구현
 */

#include "camera_pipeline.h"
#include <iterator>

CameraPipeline::CameraPipeline(const CameraIdentity& identity, const ZoneConfigStore& zone_store,
                               const Config& config)
    : identity_(identity),
      config_(config),
      classifier_(zone_store),
      scanner_(zone_store, identity, config.scanner) {
    logger = getLogger("DV_CameraPipeline_log");
    logger->info("CameraPipeline 생성 - camera: {}, site: {}, track_max_age: {}초",
                 identity_.camera_id, identity_.site_id, config_.track_max_age_sec);
}

bool CameraPipeline::validatePrimitive(const Primitive& primitive) const {
    if (primitive.track_id.empty()) {
        logger->warn("track_id 없는 프리미티브 폐기 - camera: {}", primitive.camera_id);
        return false;
    }
    if (primitive.camera_id.empty()) {
        logger->warn("camera_id 없는 프리미티브 폐기 - track: {}", primitive.track_id);
        return false;
    }
    if (primitive.timestamp <= 0) {
        logger->warn("timestamp 없는 프리미티브 폐기 - track: {}", primitive.track_id);
        return false;
    }
    return true;
}

std::optional<DomainEvent> CameraPipeline::onPrimitive(const Primitive& primitive, double now) {
    primitives_received_++;

    if (!validatePrimitive(primitive)) {
        malformed_primitives_++;
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    return classifier_.classify(primitive, registry_, now);
}

std::vector<DomainEvent> CameraPipeline::onScanTick(double now) {
    std::lock_guard<std::mutex> lock(state_mutex_);

    std::vector<DomainEvent> events = scanner_.checkGreetProximity(registry_, now);
    std::vector<DomainEvent> dwell_events = scanner_.checkDwell(registry_, now);
    events.insert(events.end(),
                  std::make_move_iterator(dwell_events.begin()),
                  std::make_move_iterator(dwell_events.end()));

    size_t reaped = registry_.reap(config_.track_max_age_sec, now);
    if (reaped > 0) {
        tracks_reaped_ += reaped;
        logger->debug("오래된 트랙 제거 - camera: {}, 제거: {}, 남은 트랙: {}",
                      identity_.camera_id, reaped, registry_.size());
    }

    return events;
}

size_t CameraPipeline::getTrackCount() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return registry_.size();
}

std::optional<TrackedObject> CameraPipeline::getTrack(const std::string& track_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    const TrackedObject* obj = registry_.find(track_id);
    if (!obj) {
        return std::nullopt;
    }
    return *obj;
}

CameraPipeline::Statistics CameraPipeline::getStatistics() const {
    Statistics stats;
    stats.primitives_received = primitives_received_.load();
    stats.malformed_primitives = malformed_primitives_.load();
    stats.tracks_reaped = tracks_reaped_.load();
    stats.active_tracks = getTrackCount();
    stats.classifier = classifier_.getStatistics();
    stats.scanner = scanner_.getStatistics();
    return stats;
}
