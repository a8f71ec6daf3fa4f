/*
 * main.cpp
 *
 * dealer_vision_edge 진입점
 * 사용법: dealer_vision_edge [config.json]
 *
 * 1. 설정 로드 및 로거 설정
 * 2. 시스템 매니저 초기화 (라인/존 설정, SQLite)
 * 3. Redis 업링크 / 입력 구독 연결
 * 4. SIGINT/SIGTERM 수신 시 역순 종료
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include "common/common_types.h"
#include "data/redis/redis_client.h"
#include "data/redis/redis_event_publisher.h"
#include "data/redis/redis_subscriber.h"
#include "server/manager/system_manager.h"
#include "utils/config_manager.h"

static std::atomic<bool> g_quit{false};

static void handleSignal(int signum) {
    (void)signum;
    g_quit = true;
}

int main(int argc, char* argv[]) {
    std::string config_path = (argc > 1) ? argv[1] : DEFAULT_CONFIG_PATH;

    auto& config = ConfigManager::getInstance();
    if (!config.initialize(config_path)) {
        std::cerr << "설정 초기화 실패: " << config_path << std::endl;
        return 1;
    }

    auto logger = getLogger("DV_Main_log");
    logger->info("dealer_vision_edge 시작 - 설정: {}", config_path);

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    SystemManager system(SystemManager::configFromManager(config));
    if (!system.initialize(config.getZoneConfigPath())) {
        logger->error("시스템 매니저 초기화 실패 - 종료");
        return 1;
    }

    // 출력: Redis 업링크
    std::unique_ptr<RedisClient> redis_client;
    std::unique_ptr<RedisEventPublisher> redis_publisher;
    if (config.isRedisUplinkEnabled()) {
        redis_client = std::make_unique<RedisClient>();
        if (!redis_client->isConnected()) {
            // 연결 실패 시에도 재연결 시도를 계속하므로 기동은 유지
            logger->warn("Redis 초기 연결 실패 - 발행 시 재연결 시도");
        }
        redis_publisher = std::make_unique<RedisEventPublisher>(*redis_client);
        system.addEventPublisher(redis_publisher.get());
        system.addMetricSink(redis_publisher.get());
        logger->info("Redis 업링크 활성");
    } else {
        logger->info("Redis 업링크 비활성 (config.json에서 false로 설정됨)");
    }

    // 입력: 인지 계층 구독
    RedisSubscriber subscriber(config.getRedisHost(), config.getRedisPort());
    subscriber.setPrimitiveCallback([&system](const Primitive& primitive) {
        system.onPrimitive(primitive);
    });
    if (config.isCrossingDetectionEnabled()) {
        subscriber.setDetectionCallback([&system](const DetectionFrame& frame) {
            system.onDetections(frame);
        });
    }

    system.start();
    if (!subscriber.start()) {
        logger->error("입력 구독 시작 실패 - 종료");
        system.stop();
        return 1;
    }

    while (!g_quit.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    logger->info("종료 신호 수신 - 중지 시작");
    subscriber.stop();
    system.stop();
    if (redis_client) {
        redis_client->disconnect();
    }

    logger->info("dealer_vision_edge 종료");
    spdlog::shutdown();
    return 0;
}
