/*
 * event_classifier.h
 *
 * 프리미티브 → 도메인 이벤트 분류기
 * - 라인 통과: 라인 의미 타입에 따라 0 또는 1개의 이벤트 생성
 * - 존 진입/이탈: 레지스트리만 갱신, 이벤트 없음
 * - 설정에 없는 라인/존: 설정 미스로 집계 (예외 없음)
 */

#ifndef EVENT_CLASSIFIER_H
#define EVENT_CLASSIFIER_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include "../../common/domain_event.h"
#include "../../common/primitive.h"
#include "../../roi_module/zone_config_store.h"
#include "../../tracking/track_registry.h"

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

class EventClassifier {
public:
    // 분류 통계
    struct Statistics {
        uint64_t primitives_processed = 0;
        uint64_t events_emitted = 0;
        uint64_t config_misses = 0;         // 알 수 없는 라인/존 참조
    };

    explicit EventClassifier(const ZoneConfigStore& zone_store);

    /**
     * @brief 프리미티브 하나를 분류
     * @param primitive 입력 프리미티브 (유효성은 호출자가 검증)
     * @param registry 카메라의 트랙 레지스트리 (갱신됨)
     * @param now 수신 시각. 레지스트리 기록과 이벤트 시각 모두 이 값 (스캔 틱과 같은 시계)
     * @return 생성된 도메인 이벤트 (없으면 nullopt)
     */
    std::optional<DomainEvent> classify(const Primitive& primitive, TrackRegistry& registry, double now);

    Statistics getStatistics() const;

private:
    std::optional<DomainEvent> classifyLineCrossing(const Primitive& primitive, TrackRegistry& registry,
                                                    double now);
    void handleZoneEntry(const Primitive& primitive, TrackRegistry& registry, double now);
    void handleZoneExit(const Primitive& primitive, TrackRegistry& registry);

    /**
     * @brief 라인 타입과 객체 클래스로 이벤트 페이로드 결정
     */
    EventPayload dispatchLinePayload(const LineDef& line, const Primitive& primitive) const;

    const ZoneConfigStore& zone_store_;

    std::atomic<uint64_t> primitives_processed_{0};
    std::atomic<uint64_t> events_emitted_{0};
    std::atomic<uint64_t> config_misses_{0};

    std::shared_ptr<spdlog::logger> logger;
};

#endif // EVENT_CLASSIFIER_H
