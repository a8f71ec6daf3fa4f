/*
 * track_registry.h
 *
 * 카메라 단위 트랙 상태 레지스트리
 * - 관측 중인 트랙과 각 트랙의 존 체류 상태를 보관
 * - 카메라 파이프라인이 소유하며 분류기/스캐너에 참조로 전달
 * - 내부 잠금 없음 (소유자가 직렬화)
 */

#ifndef TRACK_REGISTRY_H
#define TRACK_REGISTRY_H

#include <map>
#include <string>
#include "../common/object_data.h"

class TrackRegistry {
public:
    /**
     * @brief 트랙 갱신 (없으면 생성)
     * @param track_id 트랙 ID
     * @param object_class 객체 클래스 (생성 시에만 기록)
     * @param now 관측 시각
     */
    void touch(const std::string& track_id, ObjectClass object_class, double now);

    /**
     * @brief 존 진입 기록 (이미 기록되어 있으면 무시)
     * @return 새로 기록되었으면 true
     */
    bool enterZone(const std::string& track_id, const std::string& zone_id, double now);

    /**
     * @brief 존 이탈 (기록이 없으면 무시)
     * @return 기록을 제거했으면 true
     */
    bool exitZone(const std::string& track_id, const std::string& zone_id);

    /**
     * @brief 라인 통과 기록 (순서 유지, 중복 제외)
     */
    void markLineCrossed(const std::string& track_id, const std::string& line_id);

    /**
     * @brief 존 진입 시각 재설정 (체류 이벤트 재무장)
     */
    void rearmZone(const std::string& track_id, const std::string& zone_id, double now);

    /**
     * @brief last_seen 이 now - max_age 보다 오래된 트랙 제거
     * @return 제거된 트랙 수
     */
    size_t reap(double max_age_sec, double now);

    const TrackedObject* find(const std::string& track_id) const;
    const std::map<std::string, TrackedObject>& tracks() const { return tracks_; }
    size_t size() const { return tracks_.size(); }
    bool empty() const { return tracks_.empty(); }

private:
    std::map<std::string, TrackedObject> tracks_;
};

#endif // TRACK_REGISTRY_H
