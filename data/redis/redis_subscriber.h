/*
 * redis_subscriber.h
 *
 * 인지(perception) 계층 입력 구독기
 * - perception:primitives : 프리미티브 JSON
 * - perception:detections : 추적 박스 프레임 JSON (라인/존 판정 활성 시)
 *
 * SUBSCRIBE 는 전용 연결이 필요하므로 RedisClient 와 별도 연결을 사용
 */

#ifndef REDIS_SUBSCRIBER_H
#define REDIS_SUBSCRIBER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <hiredis/hiredis.h>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "../serialization/event_json.h"

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

class RedisSubscriber {
public:
    using PrimitiveCallback = std::function<void(const Primitive&)>;
    using DetectionCallback = std::function<void(const DetectionFrame&)>;

    struct Statistics {
        uint64_t messages_received = 0;
        uint64_t primitives_parsed = 0;
        uint64_t frames_parsed = 0;
        uint64_t parse_failures = 0;
        uint64_t reconnects = 0;
    };

    RedisSubscriber(const std::string& ip, int port);
    ~RedisSubscriber();

    /**
     * @brief 프리미티브 콜백 설정 (start 이전에 호출)
     */
    void setPrimitiveCallback(PrimitiveCallback callback);

    /**
     * @brief 검출 프레임 콜백 설정 (설정하지 않으면 detections 채널 구독 안 함)
     */
    void setDetectionCallback(DetectionCallback callback);

    /**
     * @brief 구독 스레드 시작
     * @return 이미 실행 중이거나 콜백이 없으면 false
     */
    bool start();

    /**
     * @brief 구독 스레드 중지 (블로킹 읽기를 소켓 종료로 해제)
     */
    void stop();

    bool isRunning() const { return running_.load(); }
    bool isSubscribed() const { return subscribed_.load(); }
    Statistics getStatistics() const;

private:
    std::string redis_server_ip_;
    int redis_server_port_;

    redisContext* ctx_ = nullptr;
    std::mutex ctx_mutex_;

    PrimitiveCallback primitive_callback_;
    DetectionCallback detection_callback_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> subscribed_{false};
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    const std::chrono::seconds reconnect_interval_{5};

    std::atomic<uint64_t> messages_received_{0};
    std::atomic<uint64_t> primitives_parsed_{0};
    std::atomic<uint64_t> frames_parsed_{0};
    std::atomic<uint64_t> parse_failures_{0};
    std::atomic<uint64_t> reconnects_{0};

    std::shared_ptr<spdlog::logger> logger;

    void subscribeThread();
    bool connectAndSubscribe();
    void closeContext();
    void handleMessage(const std::string& channel, const std::string& payload);
};

#endif // REDIS_SUBSCRIBER_H
