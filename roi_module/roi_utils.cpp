#include "roi_utils.h"
#include <algorithm>

bool insidePolygon(ObjPoint p1, const roi& ROI) {
    int n = static_cast<int>(ROI.size());
    if (n < 3)
        return false;

    // 수평 반직선과 변의 교차 횟수 (짝홀 규칙)
    bool inside = false;
    for (int i = 0, j = n - 1; i < n; j = i++) {
        const ObjPoint& a = ROI[i];
        const ObjPoint& b = ROI[j];
        if ((a.y > p1.y) != (b.y > p1.y)) {
            double x_cross = (b.x - a.x) * (p1.y - a.y) / (b.y - a.y) + a.x;
            if (p1.x < x_cross)
                inside = !inside;
        }
    }
    return inside;
}

bool onSegment(ObjPoint p, ObjPoint q, ObjPoint r) {
    return q.x <= std::max(p.x, r.x) && q.x >= std::min(p.x, r.x) &&
           q.y <= std::max(p.y, r.y) && q.y >= std::min(p.y, r.y);
}

int orientation(ObjPoint p, ObjPoint q, ObjPoint r) {
    double val = (q.y - p.y) * (r.x - q.x) -
                 (q.x - p.x) * (r.y - q.y);

    if (val == 0.0)
        return ORIENTATION_COLLINEAR;
    return (val > 0) ? ORIENTATION_CLOCKWISE : ORIENTATION_COUNTERCLOCKWISE;
}

bool intersect(ObjPoint p1, ObjPoint q1, ObjPoint p2, ObjPoint q2) {
    int o1 = orientation(p1, q1, p2);
    int o2 = orientation(p1, q1, q2);
    int o3 = orientation(p2, q2, p1);
    int o4 = orientation(p2, q2, q1);

    // 일반적인 경우
    if (o1 != o2 && o3 != o4)
        return true;

    // 일직선 위에서 끝점이 다른 선분 위에 놓이는 경우
    if (o1 == ORIENTATION_COLLINEAR && onSegment(p1, p2, q1))
        return true;
    if (o2 == ORIENTATION_COLLINEAR && onSegment(p1, q2, q1))
        return true;
    if (o3 == ORIENTATION_COLLINEAR && onSegment(p2, p1, q2))
        return true;
    if (o4 == ORIENTATION_COLLINEAR && onSegment(p2, q1, q2))
        return true;

    return false;
}
