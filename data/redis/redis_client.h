/*
 * redis_client.h
 *
 * 분석 결과 업링크용 Redis 발행 클라이언트
 * - 채널 타입(channel_types.h) → 설정된 채널명으로 PUBLISH
 * - 연결 끊김 시 재연결 간격 제한 (발행 호출 경로에서만 재시도)
 */

#ifndef REDIS_CLIENT_H
#define REDIS_CLIENT_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <hiredis/hiredis.h>
#include <memory>
#include <mutex>
#include <string>

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

class RedisClient {
public:
    // sendData 반환 코드
    static constexpr int SEND_OK = 0;
    static constexpr int SEND_NO_CONNECTION = -1;
    static constexpr int SEND_PUBLISH_FAILED = -2;
    static constexpr int SEND_UNKNOWN_CHANNEL = -3;
    static constexpr int SEND_EMPTY_PAYLOAD = -4;

    struct Config {
        std::string host = "127.0.0.1";
        int port = 6379;
        int connect_timeout_sec = 5;
        int reconnect_interval_sec = 5;
    };

    struct Statistics {
        uint64_t published = 0;
        uint64_t publish_failures = 0;
        uint64_t reconnect_attempts = 0;
        uint64_t bytes_sent = 0;
    };

    /**
     * @brief ConfigManager 의 redis.host / redis.port 로 생성
     */
    RedisClient();

    explicit RedisClient(const Config& config);

    RedisClient(const std::string& host, int port);

    ~RedisClient();

    RedisClient(const RedisClient&) = delete;
    RedisClient& operator=(const RedisClient&) = delete;

    /**
     * @brief 채널 타입으로 데이터 발행
     * @param channel_type ChannelType 값
     * @param payload JSON 문자열
     * @return SEND_OK 또는 음수 오류 코드
     */
    int sendData(int channel_type, const std::string& payload);

    void disconnect();

    bool isConnected() const { return connected_.load(); }
    const Config& getConfig() const { return config_; }
    Statistics getStatistics() const;

private:
    int connectLocked();
    bool ensureConnectedLocked();
    int publishLocked(const std::string& channel, const std::string& payload);

    Config config_;

    std::mutex ctx_mutex_;
    redisContext* ctx_ = nullptr;
    std::atomic<bool> connected_{false};
    std::chrono::steady_clock::time_point last_attempt_{};

    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> publish_failures_{0};
    std::atomic<uint64_t> reconnect_attempts_{0};
    std::atomic<uint64_t> bytes_sent_{0};

    std::shared_ptr<spdlog::logger> logger;
};

#endif // REDIS_CLIENT_H
