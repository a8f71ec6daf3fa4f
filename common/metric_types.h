/**
 * @file metric_types.h
 * @brief 메트릭 값 타입 정의
 */

#ifndef METRIC_TYPES_H
#define METRIC_TYPES_H

#include <map>
#include <string>

enum class MetricName {
    TIME_TO_GREET = 0,      // 도착 → 응대 (초)
    RACK_TIME = 1,          // 베이 점유 시간 (초)
    LOBBY_OCCUPANCY = 2,    // 로비 인원 (명)
    DRIVE_THROUGHPUT = 3    // 구간 내 도착 차량 수 (대)
};

enum class WindowSize {
    ONE_MINUTE = 0,
    FIVE_MINUTES = 1,
    FIFTEEN_MINUTES = 2,
    ONE_HOUR = 3,
    ONE_DAY = 4,
    ONE_WEEK = 5,
    ONE_MONTH = 6
};

// 메트릭 단위
namespace MetricUnits {
    const std::string SECONDS = "seconds";
    const std::string PERSONS = "persons";
    const std::string VEHICLES = "vehicles";
}

/**
 * @brief 메트릭 값 (생성 후 변경 불가)
 */
struct MetricValue {
    std::string metric_id;
    std::string tenant_id;
    std::string site_id;
    MetricName metric_name = MetricName::TIME_TO_GREET;
    double window_start = 0;
    WindowSize window_size = WindowSize::ONE_MINUTE;
    double value = 0.0;
    std::string unit;
    std::map<std::string, std::string> dimensions;  // camera_id, bay_id, door_id 등
    bool is_estimated = false;
    double created_at = 0;
};

inline std::string metricNameToString(MetricName name) {
    switch (name) {
        case MetricName::TIME_TO_GREET:    return "time_to_greet";
        case MetricName::RACK_TIME:        return "rack_time";
        case MetricName::LOBBY_OCCUPANCY:  return "lobby_occupancy";
        case MetricName::DRIVE_THROUGHPUT: return "drive_throughput";
    }
    return "unknown";
}

inline bool parseMetricName(const std::string& name, MetricName& out) {
    if (name == "time_to_greet") { out = MetricName::TIME_TO_GREET; return true; }
    if (name == "rack_time") { out = MetricName::RACK_TIME; return true; }
    if (name == "lobby_occupancy") { out = MetricName::LOBBY_OCCUPANCY; return true; }
    if (name == "drive_throughput") { out = MetricName::DRIVE_THROUGHPUT; return true; }
    return false;
}

inline std::string windowSizeToString(WindowSize size) {
    switch (size) {
        case WindowSize::ONE_MINUTE:      return "1m";
        case WindowSize::FIVE_MINUTES:    return "5m";
        case WindowSize::FIFTEEN_MINUTES: return "15m";
        case WindowSize::ONE_HOUR:        return "1h";
        case WindowSize::ONE_DAY:         return "1d";
        case WindowSize::ONE_WEEK:        return "1w";
        case WindowSize::ONE_MONTH:       return "1mo";
    }
    return "1m";
}

inline bool parseWindowSize(const std::string& name, WindowSize& out) {
    if (name == "1m") { out = WindowSize::ONE_MINUTE; return true; }
    if (name == "5m") { out = WindowSize::FIVE_MINUTES; return true; }
    if (name == "15m") { out = WindowSize::FIFTEEN_MINUTES; return true; }
    if (name == "1h") { out = WindowSize::ONE_HOUR; return true; }
    if (name == "1d") { out = WindowSize::ONE_DAY; return true; }
    if (name == "1w") { out = WindowSize::ONE_WEEK; return true; }
    if (name == "1mo") { out = WindowSize::ONE_MONTH; return true; }
    return false;
}

/**
 * @brief 분 단위 구간을 가장 가까운 윈도우 크기로 변환 (처리량 보고용)
 */
inline WindowSize windowSizeFromMinutes(int minutes) {
    if (minutes <= 1) return WindowSize::ONE_MINUTE;
    if (minutes <= 5) return WindowSize::FIVE_MINUTES;
    if (minutes <= 15) return WindowSize::FIFTEEN_MINUTES;
    return WindowSize::ONE_HOUR;
}

#endif // METRIC_TYPES_H
