/*
 * redis_subscriber.cpp
 *
 * 입력 채널 구독 루프
 * 연결이 끊기면 reconnect_interval_ 마다 재연결 후 재구독
 */

#include "redis_subscriber.h"
#include "channel_types.h"
#include <sys/socket.h>

RedisSubscriber::RedisSubscriber(const std::string& ip, int port)
    : redis_server_ip_(ip), redis_server_port_(port) {
    logger = getLogger("DV_RedisSubscriber_log");
    logger->info("RedisSubscriber 생성 - {}:{}", redis_server_ip_, redis_server_port_);
}

RedisSubscriber::~RedisSubscriber() {
    stop();
}

void RedisSubscriber::setPrimitiveCallback(PrimitiveCallback callback) {
    primitive_callback_ = std::move(callback);
}

void RedisSubscriber::setDetectionCallback(DetectionCallback callback) {
    detection_callback_ = std::move(callback);
}

bool RedisSubscriber::start() {
    if (running_.load()) {
        logger->warn("구독 스레드가 이미 실행 중");
        return false;
    }
    if (!primitive_callback_ && !detection_callback_) {
        logger->error("등록된 콜백 없음 - 구독 시작 불가");
        return false;
    }

    running_ = true;
    thread_ = std::thread(&RedisSubscriber::subscribeThread, this);
    logger->info("구독 스레드 시작");
    return true;
}

void RedisSubscriber::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    {
        // 블로킹 redisGetReply 해제
        std::lock_guard<std::mutex> lock(ctx_mutex_);
        if (ctx_ && ctx_->fd >= 0) {
            shutdown(ctx_->fd, SHUT_RDWR);
        }
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }

    auto stats = getStatistics();
    logger->info("구독 스레드 중지 - 수신: {}, 프리미티브: {}, 프레임: {}, 파싱 실패: {}, 재연결: {}",
                 stats.messages_received, stats.primitives_parsed, stats.frames_parsed,
                 stats.parse_failures, stats.reconnects);
}

bool RedisSubscriber::connectAndSubscribe() {
    std::lock_guard<std::mutex> lock(ctx_mutex_);

    struct timeval timeout = {5, 0};
    ctx_ = redisConnectWithTimeout(redis_server_ip_.c_str(), redis_server_port_, timeout);
    if (!ctx_ || ctx_->err) {
        if (ctx_) {
            logger->error("구독 연결 실패: {}", ctx_->errstr);
            redisFree(ctx_);
            ctx_ = nullptr;
        } else {
            logger->error("구독 연결 할당 실패");
        }
        return false;
    }

    // 연결 타임아웃이 읽기에도 적용되므로 해제 (메시지 대기는 무기한)
    struct timeval no_timeout = {0, 0};
    if (redisSetTimeout(ctx_, no_timeout) != REDIS_OK) {
        logger->warn("구독 소켓 타임아웃 해제 실패");
    }

    std::string primitives = getChannelName(CHANNEL_PRIMITIVES);
    std::string detections = getChannelName(CHANNEL_DETECTIONS);

    int subscribed = 0;
    if (primitive_callback_) {
        if (redisAppendCommand(ctx_, "SUBSCRIBE %b", primitives.c_str(), primitives.length()) == REDIS_OK) {
            subscribed++;
        }
    }
    if (detection_callback_) {
        if (redisAppendCommand(ctx_, "SUBSCRIBE %b", detections.c_str(), detections.length()) == REDIS_OK) {
            subscribed++;
        }
    }

    // SUBSCRIBE 응답 확인
    for (int i = 0; i < subscribed; ++i) {
        void* raw = nullptr;
        if (redisGetReply(ctx_, &raw) != REDIS_OK || !raw) {
            logger->error("SUBSCRIBE 응답 수신 실패: {}", ctx_->errstr);
            redisFree(ctx_);
            ctx_ = nullptr;
            return false;
        }
        freeReplyObject(raw);
    }

    if (primitive_callback_) logger->info("채널 구독: {}", primitives);
    if (detection_callback_) logger->info("채널 구독: {}", detections);
    return subscribed > 0;
}

void RedisSubscriber::closeContext() {
    std::lock_guard<std::mutex> lock(ctx_mutex_);
    if (ctx_) {
        redisFree(ctx_);
        ctx_ = nullptr;
    }
    subscribed_ = false;
}

void RedisSubscriber::subscribeThread() {
    bool first_attempt = true;

    while (running_.load()) {
        if (!first_attempt) {
            std::unique_lock<std::mutex> lock(cv_mutex_);
            if (cv_.wait_for(lock, reconnect_interval_, [this]() { return !running_.load(); })) {
                break;
            }
            reconnects_++;
            logger->info("구독 재연결 시도...");
        }
        first_attempt = false;

        if (!connectAndSubscribe()) {
            closeContext();
            continue;
        }
        subscribed_ = true;

        while (running_.load()) {
            void* raw = nullptr;
            if (redisGetReply(ctx_, &raw) != REDIS_OK || !raw) {
                if (running_.load()) {
                    logger->error("구독 수신 오류: {}", ctx_->errstr);
                }
                break;
            }

            redisReply* reply = static_cast<redisReply*>(raw);
            // ["message", channel, payload]
            if (reply->type == REDIS_REPLY_ARRAY && reply->elements == 3 &&
                reply->element[0]->type == REDIS_REPLY_STRING &&
                std::string(reply->element[0]->str, reply->element[0]->len) == "message") {
                std::string channel(reply->element[1]->str, reply->element[1]->len);
                std::string payload(reply->element[2]->str, reply->element[2]->len);
                freeReplyObject(reply);

                messages_received_++;
                try {
                    handleMessage(channel, payload);
                } catch (const std::exception& e) {
                    // 콜백 예외로 구독 루프가 멈추면 안 됨
                    logger->error("메시지 처리 중 예외 - 채널: {}, 오류: {}", channel, e.what());
                }
            } else {
                freeReplyObject(reply);
            }
        }

        closeContext();
    }

    logger->info("구독 스레드 종료");
}

void RedisSubscriber::handleMessage(const std::string& channel, const std::string& payload) {
    Json::Value root;
    std::string errors;
    if (!parseJsonString(payload, root, &errors)) {
        parse_failures_++;
        logger->warn("JSON 파싱 실패 - 채널: {}, 오류: {}", channel, errors);
        return;
    }

    int type = getChannelType(channel);
    if (type == CHANNEL_PRIMITIVES && primitive_callback_) {
        auto primitive = primitiveFromJson(root);
        if (!primitive) {
            parse_failures_++;
            logger->warn("프리미티브 형식 오류 - 무시: {}", payload);
            return;
        }
        primitives_parsed_++;
        primitive_callback_(*primitive);
    } else if (type == CHANNEL_DETECTIONS && detection_callback_) {
        auto frame = detectionsFromJson(root);
        if (!frame) {
            parse_failures_++;
            logger->warn("검출 프레임 형식 오류 - 무시");
            return;
        }
        frames_parsed_++;
        detection_callback_(*frame);
    } else {
        logger->debug("처리 대상 아닌 채널 메시지: {}", channel);
    }
}

RedisSubscriber::Statistics RedisSubscriber::getStatistics() const {
    Statistics stats;
    stats.messages_received = messages_received_.load();
    stats.primitives_parsed = primitives_parsed_.load();
    stats.frames_parsed = frames_parsed_.load();
    stats.parse_failures = parse_failures_.load();
    stats.reconnects = reconnects_.load();
    return stats;
}
