/*
 * metric_store.cpp
 *
 * SQLite 메트릭 저장소 구현
 */

#include "metric_store.h"
#include <sys/stat.h>
#include "../serialization/event_json.h"

MetricStore::MetricStore(const std::string& db_path, const std::string& db_name)
    : db_path(db_path), main_db_name(db_name) {
    logger = getLogger("DV_SQLite_log");
    logger->info("MetricStore 초기화 시작");
    logger->info("SQLite runtime version: {}", sqlite3_libversion());
    logger->info("Database configuration - Path: {}, DB: {}", db_path, db_name);

    // 디렉토리 생성 확인
    if (db_name != ":memory:" && !db_path.empty()) {
        struct stat st = {0};
        if (stat(db_path.c_str(), &st) == -1) {
            if (mkdir(db_path.c_str(), 0755) == 0) {
                logger->info("Database directory created: {}", db_path);
            } else {
                logger->error("Failed to create database directory: {}", db_path);
            }
        }
    }

    main_db = openDatabase(main_db_name);
    if (main_db && !createSchema()) {
        sqlite3_close(main_db);
        main_db = nullptr;
    }

    if (main_db) {
        logger->info("SQLite database initialized successfully");
    } else {
        logger->error("Failed to initialize database");
    }
}

MetricStore::~MetricStore() {
    logger->info("MetricStore 종료");

    std::lock_guard<std::mutex> lock(db_mutex);
    if (main_db) {
        sqlite3_close(main_db);
        main_db = nullptr;
    }
}

sqlite3* MetricStore::openDatabase(const std::string& db_name) {
    std::string full_path = db_name;
    if (db_name != ":memory:" && !db_path.empty()) {
        full_path = db_path + "/" + db_name;
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open(full_path.c_str(), &db);
    if (rc != SQLITE_OK) {
        logger->error("Cannot open database {}: {}", full_path, sqlite3_errmsg(db));
        sqlite3_close(db);
        return nullptr;
    }

    // 성능 최적화를 위한 PRAGMA 설정
    const char* pragmas[] = {
        "PRAGMA journal_mode=WAL",
        "PRAGMA synchronous=NORMAL",
        "PRAGMA cache_size=10000",
        "PRAGMA temp_store=MEMORY"
    };
    for (const char* pragma : pragmas) {
        char* error_msg = nullptr;
        if (sqlite3_exec(db, pragma, nullptr, nullptr, &error_msg) != SQLITE_OK) {
            logger->warn("PRAGMA warning ({}): {}", pragma, error_msg ? error_msg : "unknown");
            sqlite3_free(error_msg);
        }
    }

    return db;
}

bool MetricStore::createSchema() {
    const char* table_sql = R"SQL(
        CREATE TABLE IF NOT EXISTS metric_values(
            row_id INTEGER PRIMARY KEY AUTOINCREMENT,
            metric_id TEXT,
            tenant_id TEXT,
            site_id TEXT,
            metric_name TEXT,
            window_start REAL,
            window_size TEXT,
            value REAL,
            unit TEXT,
            dimensions TEXT,
            is_estimated INTEGER,
            created_at REAL,
            timestamp INTEGER DEFAULT (strftime('%s', 'now'))
        );
        CREATE INDEX IF NOT EXISTS idx_timestamp ON metric_values(timestamp);
        CREATE INDEX IF NOT EXISTS idx_site_metric ON metric_values(site_id, metric_name, window_start);
    )SQL";

    if (executeSQL(table_sql) != 0) {
        logger->error("Failed to create metric_values");
        return false;
    }

    // 자동 삭제 트리거 (24시간)
    const char* trigger_sql = R"SQL(
        CREATE TRIGGER IF NOT EXISTS cleanup_metric_values AFTER INSERT ON metric_values
        BEGIN
            DELETE FROM metric_values WHERE timestamp < (strftime('%s', 'now') - 86400);
        END;
    )SQL";

    if (executeSQL(trigger_sql) != 0) {
        logger->error("Failed to create cleanup trigger");
        return false;
    }
    return true;
}

int MetricStore::executeSQL(const std::string& sql) {
    if (!main_db) return -1;

    char* error_msg = nullptr;
    int rc = sqlite3_exec(main_db, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        logger->error("SQL error: {}", error_msg ? error_msg : "Unknown error");
        sqlite3_free(error_msg);
        return -1;
    }

    return 0;
}

void MetricStore::record(const MetricValue& metric) {
    if (insertMetric(metric) != 0) {
        logger->warn("메트릭 저장 실패 - metric: {}, name: {}",
                     metric.metric_id, metricNameToString(metric.metric_name));
    }
}

int MetricStore::insertMetric(const MetricValue& metric) {
    std::lock_guard<std::mutex> lock(db_mutex);

    if (!main_db) return -1;

    const char* sql = R"SQL(
        INSERT INTO metric_values (metric_id, tenant_id, site_id, metric_name,
                                   window_start, window_size, value, unit,
                                   dimensions, is_estimated, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )SQL";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(main_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        logger->error("Failed to prepare insert: {}", sqlite3_errmsg(main_db));
        return -1;
    }

    std::string metric_name = metricNameToString(metric.metric_name);
    std::string window_size = windowSizeToString(metric.window_size);
    std::string dimensions = toCompactString(metricToJson(metric)["dimensions"]);

    sqlite3_bind_text(stmt, 1, metric.metric_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, metric.tenant_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, metric.site_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, metric_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 5, metric.window_start);
    sqlite3_bind_text(stmt, 6, window_size.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 7, metric.value);
    sqlite3_bind_text(stmt, 8, metric.unit.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 9, dimensions.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 10, metric.is_estimated ? 1 : 0);
    sqlite3_bind_double(stmt, 11, metric.created_at);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        logger->error("Failed to insert metric: {}", sqlite3_errmsg(main_db));
        return -1;
    }

    logger->debug("Metric inserted: {} ({}={})", metric.metric_id, metric_name, metric.value);
    return 0;
}

std::vector<MetricValue> MetricStore::queryMetrics(const std::string& site_id, MetricName metric_name,
                                                   double start_time, double end_time) const {
    std::vector<MetricValue> results;
    std::lock_guard<std::mutex> lock(db_mutex);

    if (!main_db) return results;

    const char* sql = R"SQL(
        SELECT metric_id, tenant_id, site_id, window_start, window_size, value,
               unit, dimensions, is_estimated, created_at
        FROM metric_values
        WHERE site_id = ? AND metric_name = ? AND window_start >= ? AND window_start <= ?
        ORDER BY window_start ASC, row_id ASC
    )SQL";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(main_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        logger->error("Failed to prepare query: {}", sqlite3_errmsg(main_db));
        return results;
    }

    std::string name = metricNameToString(metric_name);
    sqlite3_bind_text(stmt, 1, site_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 3, start_time);
    sqlite3_bind_double(stmt, 4, end_time);

    auto columnText = [stmt](int col) {
        const unsigned char* text = sqlite3_column_text(stmt, col);
        return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
    };

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        MetricValue metric;
        metric.metric_id = columnText(0);
        metric.tenant_id = columnText(1);
        metric.site_id = columnText(2);
        metric.metric_name = metric_name;
        metric.window_start = sqlite3_column_double(stmt, 3);
        if (!parseWindowSize(columnText(4), metric.window_size)) {
            metric.window_size = WindowSize::ONE_MINUTE;
        }
        metric.value = sqlite3_column_double(stmt, 5);
        metric.unit = columnText(6);
        metric.is_estimated = sqlite3_column_int(stmt, 8) != 0;
        metric.created_at = sqlite3_column_double(stmt, 9);

        Json::Value dimensions;
        if (parseJsonString(columnText(7), dimensions) && dimensions.isObject()) {
            for (const auto& key : dimensions.getMemberNames()) {
                metric.dimensions[key] = dimensions[key].asString();
            }
        }
        results.push_back(std::move(metric));
    }
    sqlite3_finalize(stmt);

    return results;
}

int MetricStore::optimize() {
    std::lock_guard<std::mutex> lock(db_mutex);
    if (!main_db) return -1;
    return executeSQL("VACUUM");
}

bool MetricStore::isHealthy() const {
    std::lock_guard<std::mutex> lock(db_mutex);
    return (main_db != nullptr);
}

bool MetricStore::tableExists(const std::string& table_name) const {
    std::lock_guard<std::mutex> lock(db_mutex);
    if (!main_db) return false;

    const char* sql = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(main_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sqlite3_bind_text(stmt, 1, table_name.c_str(), -1, SQLITE_TRANSIENT);

    bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
    sqlite3_finalize(stmt);
    return exists;
}
