#ifndef CHANNEL_TYPES_H
#define CHANNEL_TYPES_H

#include <string>
#include "../../utils/config_manager.h"

/**
 * @brief Redis 채널 타입 열거형
 *
 * 입력 2개 (프리미티브, 검출 프레임), 출력 2개 (이벤트, 메트릭)
 */
enum ChannelType {
    CHANNEL_PRIMITIVES = 0,     // perception:primitives
    CHANNEL_DETECTIONS = 1,     // perception:detections
    CHANNEL_EVENTS = 2,         // analytics:events
    CHANNEL_METRICS = 3         // analytics:metrics
};

/**
 * @brief 채널 타입을 채널명으로 변환
 * @param type 채널 타입
 * @return 채널명 문자열 (설정에 없으면 "unknown_channel")
 */
inline std::string getChannelName(int type) {
    auto& config = ConfigManager::getInstance();
    std::string name;

    switch (type) {
        case CHANNEL_PRIMITIVES:
            name = config.getRedisChannel("primitives");
            break;
        case CHANNEL_DETECTIONS:
            name = config.getRedisChannel("detections");
            break;
        case CHANNEL_EVENTS:
            name = config.getRedisChannel("events");
            break;
        case CHANNEL_METRICS:
            name = config.getRedisChannel("metrics");
            break;
        default:
            break;
    }
    return name.empty() ? "unknown_channel" : name;
}

/**
 * @brief 채널명을 채널 타입으로 변환
 * @param name 채널명
 * @return 채널 타입 (-1: 알 수 없는 채널)
 */
inline int getChannelType(const std::string& name) {
    auto& config = ConfigManager::getInstance();

    if (name == config.getRedisChannel("primitives")) return CHANNEL_PRIMITIVES;
    if (name == config.getRedisChannel("detections")) return CHANNEL_DETECTIONS;
    if (name == config.getRedisChannel("events")) return CHANNEL_EVENTS;
    if (name == config.getRedisChannel("metrics")) return CHANNEL_METRICS;
    return -1;
}

#endif // CHANNEL_TYPES_H
