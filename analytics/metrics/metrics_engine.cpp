/*
 * metrics_engine.cpp
 *
 * 메트릭 상관 엔진 구현
 */

#include "metrics_engine.h"
#include <algorithm>
#include <set>
#include <variant>
#include "../../common/common_types.h"

namespace {

// 페이로드 필수 필드 검사
struct PayloadValidator {
    bool operator()(const VehicleArrival& p) const { return !p.track_id.empty(); }
    bool operator()(const VehicleExit& p) const { return !p.track_id.empty(); }
    bool operator()(const GreetStarted& p) const {
        return !p.vehicle_track_id.empty() && !p.person_track_id.empty();
    }
    bool operator()(const BayEntry& p) const { return !p.track_id.empty(); }
    bool operator()(const BayExit& p) const { return !p.track_id.empty(); }
    bool operator()(const LobbyEnter& p) const { return !p.track_id.empty(); }
    bool operator()(const LobbyExit& p) const { return !p.track_id.empty(); }
    bool operator()(const ZoneDwell& p) const { return !p.track_id.empty(); }
    bool operator()(const LineCrossing& p) const { return !p.track_id.empty(); }
};

}  // namespace

/**
 * @brief 이벤트 타입별 상관 처리 (site 잠금 상태에서 호출)
 *
 * 모든 페이로드 타입에 대한 operator() 가 있어야 std::visit 이 컴파일됨
 */
struct MetricsEngine::EventRouter {
    MetricsEngine& engine;
    SiteState& state;
    const DomainEvent& event;
    std::vector<MetricValue>& out;

    void operator()(const VehicleArrival& p) {
        engine.onVehicleArrival(state, event, p);
    }
    void operator()(const VehicleExit&) {}
    void operator()(const GreetStarted& p) {
        if (auto metric = engine.onGreetStarted(state, event, p)) {
            out.push_back(std::move(*metric));
        }
    }
    void operator()(const BayEntry& p) {
        engine.onBayEntry(state, event, p);
    }
    void operator()(const BayExit& p) {
        if (auto metric = engine.onBayExit(state, event, p)) {
            out.push_back(std::move(*metric));
        }
    }
    void operator()(const LobbyEnter& p) {
        out.push_back(engine.onLobbyChange(state, event, p.door_id, true));
    }
    void operator()(const LobbyExit& p) {
        out.push_back(engine.onLobbyChange(state, event, p.door_id, false));
    }
    void operator()(const ZoneDwell&) {}
    void operator()(const LineCrossing&) {}
};

MetricsEngine::MetricsEngine(const Config& config, MetricSink* sink)
    : config_(config), sink_(sink) {
    logger = getLogger("DV_MetricsEngine_log");
    logger->info("MetricsEngine 생성 - TTG 윈도우: {}초, 도착 보관: {}초 (최대 {}건), 베이 진입 보관: {}초",
                 config_.ttg_match_window_sec, config_.arrival_retention_sec,
                 config_.arrival_buffer_capacity, config_.bay_entry_retention_sec);
}

bool MetricsEngine::validateEvent(const DomainEvent& event) const {
    if (event.tenant_id.empty() || event.site_id.empty()) {
        logger->warn("tenant/site 없는 이벤트 건너뜀 - event: {}, type: {}",
                     event.event_id, getEventTypeName(event));
        return false;
    }
    if (event.timestamp <= 0) {
        logger->warn("timestamp 없는 이벤트 건너뜀 - event: {}, type: {}",
                     event.event_id, getEventTypeName(event));
        return false;
    }
    if (!std::visit(PayloadValidator{}, event.payload)) {
        logger->warn("track_id 없는 이벤트 건너뜀 - event: {}, type: {}",
                     event.event_id, getEventTypeName(event));
        return false;
    }
    return true;
}

std::vector<MetricValue> MetricsEngine::processEvent(const DomainEvent& event) {
    std::vector<MetricValue> metrics;

    if (!validateEvent(event)) {
        malformed_events_++;
        return metrics;
    }
    events_processed_++;

    SiteState& state = getOrCreateSiteState(event.site_id);
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        state.tenant_id = event.tenant_id;
        std::visit(EventRouter{*this, state, event, metrics}, event.payload);
    }

    // 사이트 잠금 밖에서 기록
    if (sink_) {
        for (const auto& metric : metrics) {
            sink_->record(metric);
        }
    }
    return metrics;
}

void MetricsEngine::onVehicleArrival(SiteState& state, const DomainEvent& event,
                                     const VehicleArrival& payload) {
    state.arrivals.emplace(event.timestamp,
                           ArrivalRecord{payload.track_id, event.event_id, event.camera_id});

    // 쓰기 시점 정리: 보관 기간 초과분 제거
    double cutoff = event.timestamp - config_.arrival_retention_sec;
    state.arrivals.erase(state.arrivals.begin(), state.arrivals.lower_bound(cutoff));

    // 용량 초과 시 가장 오래된 것부터 제거
    while (state.arrivals.size() > config_.arrival_buffer_capacity) {
        state.arrivals.erase(state.arrivals.begin());
    }

    logger->debug("도착 기록 - site: {}, track: {}, 버퍼: {}건",
                  event.site_id, payload.track_id, state.arrivals.size());
}

std::optional<MetricValue> MetricsEngine::onGreetStarted(SiteState& state, const DomainEvent& event,
                                                         const GreetStarted& payload) {
    // 후보: greet 이전이면서 매칭 윈도우 이내인 같은 트랙의 도착
    double window_start = event.timestamp - config_.ttg_match_window_sec;
    auto begin = state.arrivals.upper_bound(window_start);
    auto end = state.arrivals.lower_bound(event.timestamp);

    std::optional<double> nearest_arrival;
    for (auto it = begin; it != end; ++it) {
        if (it->second.track_id != payload.vehicle_track_id) {
            continue;
        }
        // 시간순 정렬이므로 마지막 매칭이 가장 가까운 선행 도착
        nearest_arrival = it->first;
    }

    if (!nearest_arrival) {
        unmatched_greets_++;
        logger->debug("매칭되는 도착 없음 - site: {}, vehicle: {}, zone: {}",
                      event.site_id, payload.vehicle_track_id, payload.zone_id);
        return std::nullopt;
    }

    double ttg = event.timestamp - *nearest_arrival;
    MetricValue metric = makeMetric(event, MetricName::TIME_TO_GREET, ttg, MetricUnits::SECONDS);
    metric.dimensions["camera_id"] = event.camera_id;
    metric.dimensions["zone_id"] = payload.zone_id;
    ttg_metrics_++;

    logger->info("TTG 계산 - site: {}, vehicle: {}, person: {}, ttg: {:.1f}초",
                 event.site_id, payload.vehicle_track_id, payload.person_track_id, ttg);
    return metric;
}

void MetricsEngine::onBayEntry(SiteState& state, const DomainEvent& event, const BayEntry& payload) {
    // 쓰기 시점 정리: 진출 없이 오래된 진입 제거
    double cutoff = event.timestamp - config_.bay_entry_retention_sec;
    for (auto it = state.open_bay_entries.begin(); it != state.open_bay_entries.end();) {
        if (it->second.timestamp < cutoff) {
            it = state.open_bay_entries.erase(it);
        } else {
            ++it;
        }
    }

    auto existing = state.open_bay_entries.find(payload.track_id);
    if (existing != state.open_bay_entries.end()) {
        logger->debug("미종결 베이 진입 덮어씀 - track: {}, 이전 bay: {}, 새 bay: {}",
                      payload.track_id, existing->second.bay_id, payload.bay_id);
    }

    // 마지막 진입 우선
    state.open_bay_entries[payload.track_id] =
        BayEntryRecord{event.timestamp, payload.bay_id, event.event_id};
}

std::optional<MetricValue> MetricsEngine::onBayExit(SiteState& state, const DomainEvent& event,
                                                    const BayExit& payload) {
    auto it = state.open_bay_entries.find(payload.track_id);
    if (it == state.open_bay_entries.end()) {
        unmatched_bay_exits_++;
        logger->debug("매칭되는 베이 진입 없음 - site: {}, track: {}, bay: {}",
                      event.site_id, payload.track_id, payload.bay_id);
        return std::nullopt;
    }

    double rack_time = event.timestamp - it->second.timestamp;
    if (rack_time < 0) {
        // 현재 진입보다 이전 방문의 진출 - 진입은 유지
        unmatched_bay_exits_++;
        logger->warn("베이 진출이 진입보다 이전 - site: {}, track: {}, 차이: {:.1f}초",
                     event.site_id, payload.track_id, rack_time);
        return std::nullopt;
    }
    state.open_bay_entries.erase(it);

    MetricValue metric = makeMetric(event, MetricName::RACK_TIME, rack_time, MetricUnits::SECONDS);
    metric.dimensions["bay_id"] = payload.bay_id;
    metric.is_estimated = true;
    rack_time_metrics_++;

    logger->info("Rack time 계산 - site: {}, track: {}, bay: {}, {:.1f}초",
                 event.site_id, payload.track_id, payload.bay_id, rack_time);
    return metric;
}

MetricValue MetricsEngine::onLobbyChange(SiteState& state, const DomainEvent& event,
                                         const std::string& door_id, bool entering) {
    if (entering) {
        state.lobby_occupancy++;
    } else {
        state.lobby_occupancy = std::max(0, state.lobby_occupancy - 1);
    }

    MetricValue metric = makeMetric(event, MetricName::LOBBY_OCCUPANCY,
                                    static_cast<double>(state.lobby_occupancy), MetricUnits::PERSONS);
    metric.dimensions["door_id"] = door_id;
    lobby_metrics_++;

    logger->debug("로비 인원 - site: {}, door: {}, {}: {}명",
                  event.site_id, door_id, entering ? "입장" : "퇴장", state.lobby_occupancy);
    return metric;
}

MetricValue MetricsEngine::makeMetric(const DomainEvent& event, MetricName name, double value,
                                      const std::string& unit) const {
    MetricValue metric;
    metric.metric_id = event.event_id;
    metric.tenant_id = event.tenant_id;
    metric.site_id = event.site_id;
    metric.metric_name = name;
    metric.window_start = event.timestamp;
    metric.window_size = WindowSize::ONE_MINUTE;
    metric.value = value;
    metric.unit = unit;
    metric.created_at = getCurTimeSec();
    return metric;
}

int MetricsEngine::computeThroughput(const std::string& site_id, double start_time, double end_time,
                                     bool end_inclusive) const {
    SiteState* state = findSiteState(site_id);
    if (!state || end_time < start_time) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    std::set<std::string> distinct_tracks;
    auto begin = state->arrivals.lower_bound(start_time);
    auto end = end_inclusive ? state->arrivals.upper_bound(end_time)
                             : state->arrivals.lower_bound(end_time);
    for (auto it = begin; it != end; ++it) {
        distinct_tracks.insert(it->second.track_id);
    }
    return static_cast<int>(distinct_tracks.size());
}

std::optional<MetricValue> MetricsEngine::throughputMetric(const std::string& site_id, double start_time,
                                                           double end_time, WindowSize window_size,
                                                           bool end_inclusive) const {
    SiteState* state = findSiteState(site_id);
    if (!state) {
        return std::nullopt;
    }

    std::string tenant_id;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        tenant_id = state->tenant_id;
    }

    MetricValue metric;
    metric.metric_id = generateEventId();
    metric.tenant_id = tenant_id;
    metric.site_id = site_id;
    metric.metric_name = MetricName::DRIVE_THROUGHPUT;
    metric.window_start = start_time;
    metric.window_size = window_size;
    metric.value = computeThroughput(site_id, start_time, end_time, end_inclusive);
    metric.unit = MetricUnits::VEHICLES;
    metric.created_at = getCurTimeSec();
    return metric;
}

int MetricsEngine::getLobbyOccupancy(const std::string& site_id) const {
    SiteState* state = findSiteState(site_id);
    if (!state) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->lobby_occupancy;
}

size_t MetricsEngine::getArrivalBufferSize(const std::string& site_id) const {
    SiteState* state = findSiteState(site_id);
    if (!state) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->arrivals.size();
}

size_t MetricsEngine::getOpenBayEntryCount(const std::string& site_id) const {
    SiteState* state = findSiteState(site_id);
    if (!state) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->open_bay_entries.size();
}

std::vector<std::string> MetricsEngine::knownSites() const {
    std::lock_guard<std::mutex> lock(sites_mutex_);
    std::vector<std::string> sites;
    for (const auto& [site_id, state] : sites_) {
        sites.push_back(site_id);
    }
    return sites;
}

MetricsEngine::SiteState& MetricsEngine::getOrCreateSiteState(const std::string& site_id) {
    std::lock_guard<std::mutex> lock(sites_mutex_);
    auto& state = sites_[site_id];
    if (!state) {
        state = std::make_unique<SiteState>();
        logger->info("사이트 상태 생성 - site: {}", site_id);
    }
    return *state;
}

MetricsEngine::SiteState* MetricsEngine::findSiteState(const std::string& site_id) const {
    std::lock_guard<std::mutex> lock(sites_mutex_);
    auto it = sites_.find(site_id);
    return (it != sites_.end()) ? it->second.get() : nullptr;
}

MetricsEngine::Statistics MetricsEngine::getStatistics() const {
    Statistics stats;
    stats.events_processed = events_processed_.load();
    stats.malformed_events = malformed_events_.load();
    stats.unmatched_greets = unmatched_greets_.load();
    stats.unmatched_bay_exits = unmatched_bay_exits_.load();
    stats.ttg_metrics = ttg_metrics_.load();
    stats.rack_time_metrics = rack_time_metrics_.load();
    stats.lobby_metrics = lobby_metrics_.load();
    return stats;
}
