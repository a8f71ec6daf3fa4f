#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/daily_file_sink.h>

/**
 * @brief 이름별 로거 반환 (없으면 날짜별 파일 로거 생성)
 * @param logger_name 로거 이름 (파일명으로도 사용)
 */
std::shared_ptr<spdlog::logger> getLogger(const char* logger_name);

/**
 * @brief 로그 경로와 레벨 설정
 *
 * 이후 getLogger 호출부터 적용 (기존 로거는 레벨만 갱신)
 * @param log_path 로그 디렉토리
 * @param log_level trace|debug|info|warn|error|critical|off
 */
void setLoggerConfig(const std::string& log_path, const std::string& log_level);

#endif // LOGGER_HPP
