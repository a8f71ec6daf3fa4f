/*
 * dwell_scanner.cpp
 *
 * 체류/응대 근접 주기 검사 구현
 */

#include "dwell_scanner.h"
#include <algorithm>
#include <utility>

DwellScanner::DwellScanner(const ZoneConfigStore& zone_store, const CameraIdentity& identity,
                           const Config& config)
    : zone_store_(zone_store), identity_(identity), config_(config) {
    logger = getLogger("DV_DwellScanner_log");
    logger->info("DwellScanner 생성 - camera: {}, 기본 체류 임계값: {}초, 응대 최소 근접: {}초",
                 identity_.camera_id, config_.default_dwell_threshold_sec,
                 config_.greet_min_proximity_sec);
}

std::vector<DomainEvent> DwellScanner::checkDwell(TrackRegistry& registry, double now) {
    std::vector<DomainEvent> events;
    std::vector<std::pair<std::string, std::string>> rearm;

    for (const auto& [track_id, obj] : registry.tracks()) {
        for (const auto& [zone_id, entry_time] : obj.zone_entry_times) {
            auto zone = zone_store_.findZone(zone_id);
            if (!zone) {
                unknown_zone_skips_++;
                continue;
            }

            double dwell_seconds = now - entry_time;
            double threshold = zone->effectiveDwellThreshold(config_.default_dwell_threshold_sec);
            if (dwell_seconds < threshold) {
                continue;
            }

            ZoneDwell payload;
            payload.track_id = track_id;
            payload.zone_id = zone_id;
            payload.object_class = obj.object_class;
            payload.dwell_seconds = dwell_seconds;
            events.push_back(makeDomainEvent(identity_.tenant_id, identity_.site_id,
                                             identity_.camera_id, now, payload));
            rearm.emplace_back(track_id, zone_id);

            logger->debug("체류 이벤트 - track: {}, zone: {}, dwell: {:.1f}초",
                          track_id, zone_id, dwell_seconds);
        }
    }

    // 재무장: 다음 임계 구간까지 재발생 방지
    for (const auto& [track_id, zone_id] : rearm) {
        registry.rearmZone(track_id, zone_id, now);
    }

    dwell_events_ += events.size();
    return events;
}

std::vector<DomainEvent> DwellScanner::checkGreetProximity(const TrackRegistry& registry, double now) {
    std::vector<DomainEvent> events;

    for (const auto& zone : zone_store_.greetZones(identity_.camera_id)) {
        std::vector<std::pair<std::string, double>> vehicles;
        std::vector<std::pair<std::string, double>> persons;

        for (const auto& [track_id, obj] : registry.tracks()) {
            auto it = obj.zone_entry_times.find(zone.zone_id);
            if (it == obj.zone_entry_times.end()) {
                continue;
            }
            double dwell = now - it->second;
            if (isVehicleClass(obj.object_class)) {
                vehicles.emplace_back(track_id, dwell);
            } else if (isPedestrianClass(obj.object_class)) {
                persons.emplace_back(track_id, dwell);
            }
        }

        // 배타적 매칭 없이 전체 조합
        for (const auto& [vehicle_id, vehicle_dwell] : vehicles) {
            for (const auto& [person_id, person_dwell] : persons) {
                double proximity = std::min(vehicle_dwell, person_dwell);
                if (proximity < config_.greet_min_proximity_sec) {
                    continue;
                }

                GreetStarted payload;
                payload.vehicle_track_id = vehicle_id;
                payload.person_track_id = person_id;
                payload.zone_id = zone.zone_id;
                payload.proximity_seconds = proximity;
                events.push_back(makeDomainEvent(identity_.tenant_id, identity_.site_id,
                                                 identity_.camera_id, now, payload));

                logger->debug("응대 이벤트 - vehicle: {}, person: {}, zone: {}, proximity: {:.1f}초",
                              vehicle_id, person_id, zone.zone_id, proximity);
            }
        }
    }

    greet_events_ += events.size();
    return events;
}

DwellScanner::Statistics DwellScanner::getStatistics() const {
    Statistics stats;
    stats.dwell_events = dwell_events_.load();
    stats.greet_events = greet_events_.load();
    stats.unknown_zone_skips = unknown_zone_skips_.load();
    return stats;
}
