#ifndef ROI_UTILS_H
#define ROI_UTILS_H

#include <limits>
#include <vector>
#include "../common/object_data.h"

using roi = std::vector<ObjPoint>;

// 방향 판정 결과
const int ORIENTATION_COLLINEAR = 0;
const int ORIENTATION_CLOCKWISE = 1;
const int ORIENTATION_COUNTERCLOCKWISE = 2;

/**
 * @brief 점이 다각형 내부인지 판정 (ray casting)
 * @return 꼭짓점이 3개 미만이면 false
 */
bool insidePolygon(ObjPoint p1, const roi& ROI);

bool onSegment(ObjPoint p, ObjPoint q, ObjPoint r);

/**
 * @brief 순서쌍 (p, q, r) 의 방향
 * @return 0: 일직선, 1: 시계방향, 2: 반시계방향
 */
int orientation(ObjPoint p, ObjPoint q, ObjPoint r);

/**
 * @brief 선분 p1q1 과 p2q2 의 교차 여부
 */
bool intersect(ObjPoint p1, ObjPoint q1, ObjPoint p2, ObjPoint q2);

#endif // ROI_UTILS_H
