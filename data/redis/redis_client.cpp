/*
 * redis_client.cpp
 *
 * Redis 발행 클라이언트 구현
 */

#include "redis_client.h"
#include "channel_types.h"
#include "../../utils/config_manager.h"

namespace {

RedisClient::Config configFromManager() {
    auto& config = ConfigManager::getInstance();
    RedisClient::Config cfg;
    cfg.host = config.getRedisHost();
    cfg.port = config.getRedisPort();
    return cfg;
}

}  // namespace

RedisClient::RedisClient()
    : RedisClient(configFromManager()) {
}

RedisClient::RedisClient(const std::string& host, int port)
    : RedisClient(Config{host, port}) {
}

RedisClient::RedisClient(const Config& config)
    : config_(config) {
    logger = getLogger("DV_RedisClient_log");
    logger->info("RedisClient 초기화 - {}:{} (timeout {}초, 재연결 간격 {}초)",
                 config_.host, config_.port, config_.connect_timeout_sec,
                 config_.reconnect_interval_sec);

    std::lock_guard<std::mutex> lock(ctx_mutex_);
    last_attempt_ = std::chrono::steady_clock::now();
    connectLocked();
}

RedisClient::~RedisClient() {
    disconnect();
}

int RedisClient::connectLocked() {
    if (ctx_) {
        redisFree(ctx_);
        ctx_ = nullptr;
    }

    struct timeval timeout = {config_.connect_timeout_sec, 0};
    ctx_ = redisConnectWithTimeout(config_.host.c_str(), config_.port, timeout);
    if (!ctx_ || ctx_->err) {
        logger->error("Redis 연결 실패 - {}:{} ({})", config_.host, config_.port,
                      ctx_ ? ctx_->errstr : "context 할당 실패");
        if (ctx_) {
            redisFree(ctx_);
            ctx_ = nullptr;
        }
        connected_ = false;
        return SEND_NO_CONNECTION;
    }

    auto* reply = static_cast<redisReply*>(redisCommand(ctx_, "PING"));
    if (!reply || reply->type == REDIS_REPLY_ERROR) {
        logger->error("Redis PING 실패 - {}:{}", config_.host, config_.port);
        if (reply) {
            freeReplyObject(reply);
        }
        redisFree(ctx_);
        ctx_ = nullptr;
        connected_ = false;
        return SEND_NO_CONNECTION;
    }
    freeReplyObject(reply);

    connected_ = true;
    logger->info("Redis 연결 성공 - {}:{}", config_.host, config_.port);
    return SEND_OK;
}

bool RedisClient::ensureConnectedLocked() {
    if (connected_ && ctx_ && ctx_->err == 0) {
        return true;
    }

    auto now = std::chrono::steady_clock::now();
    if (now - last_attempt_ < std::chrono::seconds(config_.reconnect_interval_sec)) {
        return false;
    }
    last_attempt_ = now;
    reconnect_attempts_++;

    logger->info("Redis 재연결 시도 ({}회차)", reconnect_attempts_.load());
    return connectLocked() == SEND_OK;
}

int RedisClient::publishLocked(const std::string& channel, const std::string& payload) {
    auto* reply = static_cast<redisReply*>(redisCommand(ctx_, "PUBLISH %b %b",
                                                        channel.data(), channel.size(),
                                                        payload.data(), payload.size()));
    if (!reply) {
        logger->error("PUBLISH 실패 - 채널: {}, 오류: {}", channel, ctx_->errstr);
        connected_ = false;
        return SEND_PUBLISH_FAILED;
    }

    int result = SEND_OK;
    if (reply->type == REDIS_REPLY_ERROR) {
        logger->error("PUBLISH 오류 응답 - 채널: {}, 응답: {}", channel,
                      std::string(reply->str, reply->len));
        result = SEND_PUBLISH_FAILED;
    } else if (reply->type == REDIS_REPLY_INTEGER) {
        logger->trace("PUBLISH - 채널: {}, 구독자: {}", channel, reply->integer);
    }
    freeReplyObject(reply);
    return result;
}

int RedisClient::sendData(int channel_type, const std::string& payload) {
    std::string channel = getChannelName(channel_type);
    if (channel == "unknown_channel") {
        logger->error("설정되지 않은 채널 타입: {}", channel_type);
        publish_failures_++;
        return SEND_UNKNOWN_CHANNEL;
    }
    if (payload.empty()) {
        logger->warn("빈 페이로드 발행 요청 무시 - 채널: {}", channel);
        publish_failures_++;
        return SEND_EMPTY_PAYLOAD;
    }

    std::lock_guard<std::mutex> lock(ctx_mutex_);
    if (!ensureConnectedLocked()) {
        logger->debug("Redis 연결 없음 - 채널 {} 발행 실패", channel);
        publish_failures_++;
        return SEND_NO_CONNECTION;
    }

    int result = publishLocked(channel, payload);
    if (result != SEND_OK) {
        publish_failures_++;
        return result;
    }

    published_++;
    bytes_sent_ += payload.size();
    return SEND_OK;
}

void RedisClient::disconnect() {
    std::lock_guard<std::mutex> lock(ctx_mutex_);
    if (ctx_) {
        redisFree(ctx_);
        ctx_ = nullptr;
        logger->info("Redis 연결 해제 - 발행: {}, 실패: {}", published_.load(), publish_failures_.load());
    }
    connected_ = false;
}

RedisClient::Statistics RedisClient::getStatistics() const {
    Statistics stats;
    stats.published = published_.load();
    stats.publish_failures = publish_failures_.load();
    stats.reconnect_attempts = reconnect_attempts_.load();
    stats.bytes_sent = bytes_sent_.load();
    return stats;
}
