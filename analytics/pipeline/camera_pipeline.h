/*
 * camera_pipeline.h
 *
 * 카메라 단위 워커
 * - 트랙 레지스트리, 분류기, 스캐너를 소유
 * - 프리미티브 처리와 스캔 틱을 하나의 뮤텍스로 직렬화
 * - 스캔 틱마다 reap 을 반드시 수행 (레지스트리 무한 증가 방지)
 */

#ifndef CAMERA_PIPELINE_H
#define CAMERA_PIPELINE_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "../classifier/event_classifier.h"
#include "../scanner/dwell_scanner.h"
#include "../../common/domain_event.h"
#include "../../common/primitive.h"
#include "../../roi_module/zone_config_store.h"
#include "../../tracking/track_registry.h"

#ifndef __logger__
#define __logger__
#include "logger.hpp"
#endif

class CameraPipeline {
public:
    struct Config {
        DwellScanner::Config scanner;
        double track_max_age_sec = 60.0;
    };

    struct Statistics {
        uint64_t primitives_received = 0;
        uint64_t malformed_primitives = 0;
        uint64_t tracks_reaped = 0;
        size_t active_tracks = 0;
        EventClassifier::Statistics classifier;
        DwellScanner::Statistics scanner;
    };

    CameraPipeline(const CameraIdentity& identity, const ZoneConfigStore& zone_store,
                   const Config& config);

    /**
     * @brief 프리미티브 처리
     * @param primitive 입력 프리미티브 (timestamp 는 유효성 검사에만 사용)
     * @param now 수신 시각. 트랙/존 진입 시각과 이벤트 시각이 이 값이며 onScanTick 의 now 와 같은 시계여야 함
     * @return 분류 결과 이벤트 (없거나 잘못된 프리미티브면 nullopt)
     */
    std::optional<DomainEvent> onPrimitive(const Primitive& primitive, double now);

    /**
     * @brief 스캔 틱 (응대 근접 → 체류 → reap 순서)
     * @param now 현재 시각
     * @return 생성된 이벤트 목록
     */
    std::vector<DomainEvent> onScanTick(double now);

    const CameraIdentity& getIdentity() const { return identity_; }

    size_t getTrackCount() const;

    /**
     * @brief 트랙 스냅샷 (디버깅/테스트용)
     */
    std::optional<TrackedObject> getTrack(const std::string& track_id) const;

    Statistics getStatistics() const;

private:
    bool validatePrimitive(const Primitive& primitive) const;

    CameraIdentity identity_;
    Config config_;

    mutable std::mutex state_mutex_;
    TrackRegistry registry_;
    EventClassifier classifier_;
    DwellScanner scanner_;

    std::atomic<uint64_t> primitives_received_{0};
    std::atomic<uint64_t> malformed_primitives_{0};
    std::atomic<uint64_t> tracks_reaped_{0};

    std::shared_ptr<spdlog::logger> logger;
};

#endif // CAMERA_PIPELINE_H
