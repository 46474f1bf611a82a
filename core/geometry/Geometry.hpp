#pragma once
#include <cmath>
#include <vector>

namespace sm {

// Simple 2D point
struct Point {
    float x;
    float y;
};

inline bool operator==(const Point& a, const Point& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point& a, const Point& b) { return !(a == b); }

inline float distance(const Point& a, const Point& b) {
    float dx = a.x - b.x;
    float dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

// Extrema of a point sequence. top is the largest y.
struct Bounds {
    float left{0.f};
    float right{0.f};
    float top{0.f};
    float bottom{0.f};

    float width() const { return right - left; }
    float height() const { return top - bottom; }
};

inline bool operator==(const Bounds& a, const Bounds& b) {
    return a.left == b.left && a.right == b.right && a.top == b.top && a.bottom == b.bottom;
}

// Arithmetic mean of the points; the origin for an empty sequence.
inline Point centerOfMass(const std::vector<Point>& points) {
    if (points.empty())
        return {0.f, 0.f};
    float sumX = 0.f;
    float sumY = 0.f;
    for (const auto& p : points) {
        sumX += p.x;
        sumY += p.y;
    }
    const float n = static_cast<float>(points.size());
    return {sumX / n, sumY / n};
}

constexpr int kMedianMaxIterations = 500;
constexpr float kMedianTolerance = 0.001f;

// Weiszfeld's algorithm, seeded at the center of mass. Points sitting on the
// current estimate are left out of that iteration's weighted sum.
inline Point geometricMedian(const std::vector<Point>& points) {
    if (points.size() < 2)
        return centerOfMass(points);

    Point estimate = centerOfMass(points);
    for (int i = 0; i < kMedianMaxIterations; ++i) {
        float numX = 0.f;
        float numY = 0.f;
        float weightSum = 0.f;
        for (const auto& p : points) {
            float d = distance(estimate, p);
            if (d == 0.f)
                continue;
            numX += p.x / d;
            numY += p.y / d;
            weightSum += 1.f / d;
        }
        // every point coincides with the estimate
        if (weightSum == 0.f)
            return estimate;

        Point next{numX / weightSum, numY / weightSum};
        if (distance(estimate, next) < kMedianTolerance)
            return next;
        estimate = next;
    }
    return estimate;
}

inline Bounds computeBounds(const std::vector<Point>& points) {
    Bounds b;
    if (points.empty())
        return b;
    b.left = b.right = points.front().x;
    b.top = b.bottom = points.front().y;
    for (const auto& p : points) {
        if (p.x < b.left)
            b.left = p.x;
        if (p.x > b.right)
            b.right = p.x;
        if (p.y > b.top)
            b.top = p.y;
        if (p.y < b.bottom)
            b.bottom = p.y;
    }
    return b;
}

} // namespace sm
