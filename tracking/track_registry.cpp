#include "track_registry.h"
#include <algorithm>

void TrackRegistry::touch(const std::string& track_id, ObjectClass object_class, double now) {
    auto it = tracks_.find(track_id);
    if (it == tracks_.end()) {
        TrackedObject obj;
        obj.track_id = track_id;
        obj.object_class = object_class;
        obj.first_seen = now;
        obj.last_seen = now;
        tracks_.emplace(track_id, std::move(obj));
        return;
    }
    it->second.last_seen = now;
}

bool TrackRegistry::enterZone(const std::string& track_id, const std::string& zone_id, double now) {
    auto it = tracks_.find(track_id);
    if (it == tracks_.end()) {
        return false;
    }
    // emplace 는 기존 키가 있으면 진입 시각을 바꾸지 않음
    return it->second.zone_entry_times.emplace(zone_id, now).second;
}

bool TrackRegistry::exitZone(const std::string& track_id, const std::string& zone_id) {
    auto it = tracks_.find(track_id);
    if (it == tracks_.end()) {
        return false;
    }
    return it->second.zone_entry_times.erase(zone_id) > 0;
}

void TrackRegistry::markLineCrossed(const std::string& track_id, const std::string& line_id) {
    auto it = tracks_.find(track_id);
    if (it == tracks_.end()) {
        return;
    }
    auto& lines = it->second.lines_crossed;
    if (std::find(lines.begin(), lines.end(), line_id) == lines.end()) {
        lines.push_back(line_id);
    }
}

void TrackRegistry::rearmZone(const std::string& track_id, const std::string& zone_id, double now) {
    auto it = tracks_.find(track_id);
    if (it == tracks_.end()) {
        return;
    }
    auto zone_it = it->second.zone_entry_times.find(zone_id);
    if (zone_it != it->second.zone_entry_times.end()) {
        zone_it->second = now;
    }
}

size_t TrackRegistry::reap(double max_age_sec, double now) {
    double cutoff = now - max_age_sec;
    size_t removed = 0;
    for (auto it = tracks_.begin(); it != tracks_.end();) {
        if (it->second.last_seen < cutoff) {
            it = tracks_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

const TrackedObject* TrackRegistry::find(const std::string& track_id) const {
    auto it = tracks_.find(track_id);
    return (it != tracks_.end()) ? &it->second : nullptr;
}
