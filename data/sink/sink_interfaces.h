/**
 * @file sink_interfaces.h
 * @brief 이벤트/메트릭 출력 인터페이스
 *
 * 코어는 이 인터페이스로만 결과를 넘기며, 전송 보장/재시도는 구현체 책임
 */

#ifndef SINK_INTERFACES_H
#define SINK_INTERFACES_H

#include "../../common/domain_event.h"
#include "../../common/metric_types.h"

/**
 * @brief 도메인 이벤트 발행 인터페이스 (호출자 관점에서 비차단)
 */
class EventPublisher {
public:
    virtual ~EventPublisher() = default;
    virtual void publish(const DomainEvent& event) = 0;
};

/**
 * @brief 메트릭 값 기록 인터페이스
 */
class MetricSink {
public:
    virtual ~MetricSink() = default;
    virtual void record(const MetricValue& metric) = 0;
};

#endif // SINK_INTERFACES_H
