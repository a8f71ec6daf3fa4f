/*
 * metric_store.h
 *
 * SQLite 메트릭 저장소
 * 24시간 자동 삭제 트리거를 가진 metric_values 테이블 사용
 */

#ifndef METRIC_STORE_H
#define METRIC_STORE_H

#include <memory>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>
#include "../sink/sink_interfaces.h"

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

/**
 * @brief SQLite 메트릭 저장소
 *
 * metric_values 스키마:
 * - row_id: PRIMARY KEY AUTOINCREMENT
 * - metric_id: 메트릭 ID (트리거 이벤트 ID)
 * - tenant_id, site_id
 * - metric_name: time_to_greet, rack_time, lobby_occupancy, drive_throughput
 * - window_start: 윈도우 시작 (Unix 초)
 * - window_size: 1m, 5m, ...
 * - value, unit
 * - dimensions: JSON 문자열
 * - is_estimated: 0/1
 * - created_at: 생성 시각
 * - timestamp: DB 저장 시각 (자동)
 */
class MetricStore : public MetricSink {
public:
    /**
     * @brief 생성자
     * @param db_path DB 디렉토리 (없으면 생성)
     * @param db_name DB 파일명 (":memory:" 이면 메모리 DB)
     */
    MetricStore(const std::string& db_path, const std::string& db_name);
    ~MetricStore() override;

    /**
     * @brief MetricSink 구현 (실패는 로그만 남김)
     */
    void record(const MetricValue& metric) override;

    /**
     * @brief 메트릭 삽입
     * @return 성공 시 0, 실패 시 음수
     */
    int insertMetric(const MetricValue& metric);

    /**
     * @brief 메트릭 조회 (window_start 기준, 양 끝 포함, 시간순)
     */
    std::vector<MetricValue> queryMetrics(const std::string& site_id, MetricName metric_name,
                                          double start_time, double end_time) const;

    /**
     * @brief 데이터베이스 최적화 (VACUUM)
     * @return 성공 시 0, 실패 시 음수
     */
    int optimize();

    bool isHealthy() const;

    bool tableExists(const std::string& table_name) const;

private:
    sqlite3* openDatabase(const std::string& db_name);
    int executeSQL(const std::string& sql);
    bool createSchema();

    sqlite3* main_db = nullptr;
    std::string db_path;
    std::string main_db_name;

    mutable std::mutex db_mutex;

    std::shared_ptr<spdlog::logger> logger;
};

#endif // METRIC_STORE_H
