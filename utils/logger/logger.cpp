/*
 * logger.cpp
 *
 * 모듈별 날짜 파일 로거
 * 경로/레벨은 ConfigManager 초기화 시 setLoggerConfig 로 주입
 */

#include "logger.hpp"
#include <cerrno>
#include <iostream>
#include <mutex>
#include <sys/stat.h>
#include <sys/types.h>

namespace {

std::string g_log_dir = "logs";
spdlog::level::level_enum g_level = spdlog::level::info;
std::mutex g_logger_mutex;
bool g_default_set = false;

spdlog::level::level_enum parseLevel(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

// 중간 디렉토리까지 생성 (mkdir -p)
bool makeDirectories(const std::string& dir) {
    if (dir.empty()) {
        return false;
    }
    for (size_t pos = dir.find('/', 1); ; pos = dir.find('/', pos + 1)) {
        std::string partial = dir.substr(0, pos);
        if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
            return false;
        }
        if (pos == std::string::npos) {
            break;
        }
    }
    struct stat st = {0};
    return stat(dir.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

}  // namespace

void setLoggerConfig(const std::string& log_path, const std::string& log_level) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);

    if (!log_path.empty()) {
        g_log_dir = log_path;
    }
    if (!log_level.empty()) {
        g_level = parseLevel(log_level);
    }

    spdlog::apply_all([](std::shared_ptr<spdlog::logger> l) {
        l->set_level(g_level);
    });

    std::cout << "[Logger] 로그 경로: " << g_log_dir
              << ", 레벨: " << spdlog::level::to_string_view(g_level).data() << std::endl;
}

std::shared_ptr<spdlog::logger> getLogger(const char* logger_name) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);

    if (auto existing = spdlog::get(logger_name)) {
        existing->set_level(g_level);
        return existing;
    }

    if (!makeDirectories(g_log_dir)) {
        std::cerr << "[Logger] 로그 디렉토리 생성 실패: " << g_log_dir << " - /tmp 사용" << std::endl;
        g_log_dir = "/tmp";
    }

    // <dir>/<name>.txt, 매일 23:59 회전
    std::string log_file = g_log_dir + "/" + logger_name + ".txt";
    auto file_logger = spdlog::daily_logger_mt(logger_name, log_file, 23, 59);
    file_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    file_logger->set_level(g_level);
    file_logger->flush_on(spdlog::level::info);

    if (!g_default_set) {
        spdlog::set_default_logger(file_logger);
        g_default_set = true;
    }
    return file_logger;
}
