#pragma once
#include <algorithm>
#include <array>
#include <cmath>
#include <string>
#include <utility>
#include <vector>
#include "core/geometry/Geometry.hpp"
#include "utils/Logger.hpp"

namespace sm {

using GridMap = std::vector<std::vector<float>>;    // [row][col]
using CircleMap = std::vector<std::array<float, 4>>; // [ring][quadrant]
using FlatMap = std::vector<int>;

enum class CircleCenter { Mass, Median };
enum class Axis { Horizontal, Vertical };

// Closed interval along one axis, start/end in stroke order.
struct LineSegment {
    float start;
    float end;
};

// Minimum box and circle sizes, tuned for input coordinates spanning
// roughly 1200x800. Scale them with the capture surface.
constexpr float kMinBitmapWidth = 50.f;
constexpr float kMinBitmapHeight = 50.f;
constexpr float kMinBitmapRadius = 25.f;

// Quadrant of a point about a center; zero offsets count as positive.
// (+,+) = 0, (+,-) = 1, (-,-) = 2, (-,+) = 3
inline int quadrantOf(const Point& p, const Point& center) {
    const bool xPositive = p.x - center.x >= 0.f;
    const bool yPositive = p.y - center.y >= 0.f;
    if (xPositive)
        return yPositive ? 0 : 1;
    return yPositive ? 3 : 2;
}

// Splits a stroke into straight runs along one axis. A run ends when the
// next two points both turn against the current trend, or when the step to
// the next point is longer than a sixth of the perpendicular extent.
inline std::vector<LineSegment> lineSegments(const std::vector<Point>& points, Axis axis,
                                             const Bounds& bounds) {
    std::vector<LineSegment> segments;
    if (points.empty())
        return segments;

    auto coord = [axis](const Point& p) { return axis == Axis::Horizontal ? p.x : p.y; };
    if (points.size() <= 3) {
        segments.push_back({coord(points.front()), coord(points.back())});
        return segments;
    }

    const float gapLimit =
        (axis == Axis::Horizontal ? bounds.height() : bounds.width()) / 6.f;
    float start = coord(points[0]);
    bool increasing = coord(points[2]) > start;
    for (size_t i = 0; i + 2 < points.size(); ++i) {
        const float cur = coord(points[i]);
        const float next = coord(points[i + 1]);
        const float after = coord(points[i + 2]);
        const bool reversed = increasing ? (next < cur && after < cur)
                                         : (next > cur && after > cur);
        if (reversed || distance(points[i], points[i + 1]) > gapLimit) {
            segments.push_back({start, cur});
            start = next;
            increasing = !increasing;
        }
    }
    segments.push_back({start, coord(points.back())});
    return segments;
}

// A Bitmap encodes one stroke into four density representations that share a
// single precision p:
//   grid map     p x p cells over the bounding box
//   circle maps  p rings x 4 quadrants, around the center of mass and around
//                the geometric median
//   flat maps    p*p bins of line-segment density along x and along y
// The source points are kept so the maps can be rebuilt at another precision.
class Bitmap {
public:
    Bitmap(std::vector<Point> points, int precision)
        : m_points(std::move(points)), m_bounds(computeBounds(m_points)) {
        encode(precision);
    }

    Bitmap() : Bitmap(std::vector<Point>(), 4) {}

    int precision() const { return m_precision; }
    const Bounds& bounds() const { return m_bounds; }
    size_t pointCount() const { return m_points.size(); }
    const std::vector<Point>& points() const { return m_points; }

    const GridMap& gridMap() const { return m_gridMap; }

    const CircleMap& circleMap(CircleCenter center = CircleCenter::Median) const {
        return center == CircleCenter::Median ? m_medianCircleMap : m_massCircleMap;
    }

    const FlatMap& flatMap(Axis axis) const {
        return axis == Axis::Horizontal ? m_flatMapHorizontal : m_flatMapVertical;
    }

    // Rebuilds every map at the new precision. Bounds do not change.
    void setPrecision(int precision) { encode(precision); }

private:
    void encode(int precision) {
        if (precision < 1) {
            SM_LOG(LogLevel::Warn, "Bitmap precision " + std::to_string(precision) +
                                       " raised to 1");
            precision = 1;
        }
        m_precision = precision;
        m_gridMap = buildGridMap();
        m_massCircleMap = buildCircleMap(CircleCenter::Mass);
        m_medianCircleMap = buildCircleMap(CircleCenter::Median);
        m_flatMapHorizontal = buildFlatMap(Axis::Horizontal);
        m_flatMapVertical = buildFlatMap(Axis::Vertical);
    }

    GridMap buildGridMap() const {
        const int p = m_precision;
        GridMap grid(p, std::vector<float>(p, 0.f));
        if (m_points.empty())
            return grid;
        if (m_points.size() == 1) {
            grid[p / 2][p / 2] = 1.f;
            return grid;
        }

        float left = m_bounds.left;
        float height = std::max(m_bounds.height(), kMinBitmapHeight);
        float width = m_bounds.width();
        if (width < kMinBitmapWidth) {
            const float mid = (m_bounds.left + m_bounds.right) / 2.f;
            left = mid - kMinBitmapWidth / 2.f;
            width = kMinBitmapWidth;
        }

        const float cellHeight = height / p;
        const float cellWidth = width / p;
        for (const auto& pt : m_points) {
            int row = static_cast<int>((pt.y - m_bounds.bottom) / cellHeight);
            int col = static_cast<int>((pt.x - left) / cellWidth);
            row = clampIndex(row, p);
            col = clampIndex(col, p);
            grid[row][col] += 1.f;
        }

        const float n = static_cast<float>(m_points.size());
        for (auto& row : grid)
            for (auto& cell : row)
                cell /= n;
        return grid;
    }

    CircleMap buildCircleMap(CircleCenter which) const {
        const int p = m_precision;
        CircleMap map(p, std::array<float, 4>{0.f, 0.f, 0.f, 0.f});
        if (m_points.empty())
            return map;

        const Point center =
            which == CircleCenter::Median ? geometricMedian(m_points) : centerOfMass(m_points);
        float radius = 0.f;
        for (const auto& pt : m_points)
            radius = std::max(radius, distance(pt, center));
        radius = std::max(radius, kMinBitmapRadius);

        const float ringWidth = radius / p;
        for (const auto& pt : m_points) {
            int ring = std::min(static_cast<int>(distance(pt, center) / ringWidth), p - 1);
            map[ring][quadrantOf(pt, center)] += 1.f;
        }

        const float n = static_cast<float>(m_points.size());
        for (auto& ring : map)
            for (auto& cell : ring)
                cell /= n;
        return map;
    }

    FlatMap buildFlatMap(Axis axis) const {
        const size_t length = static_cast<size_t>(m_precision) * m_precision;
        FlatMap map(length, 0);
        if (m_points.size() < 2)
            return map;

        const std::vector<LineSegment> segments = lineSegments(m_points, axis, m_bounds);
        const float origin = axis == Axis::Horizontal ? m_bounds.left : m_bounds.bottom;
        const float extent = axis == Axis::Horizontal ? m_bounds.width() : m_bounds.height();
        if (extent <= 0.f) {
            // every bin collapses onto the same coordinate and holds every segment
            std::fill(map.begin(), map.end(), static_cast<int>(segments.size()));
            return map;
        }

        const float binWidth = extent / static_cast<float>(length);
        for (size_t i = 0; i < length; ++i) {
            const float lo = origin + binWidth * static_cast<float>(i);
            const float hi = origin + binWidth * static_cast<float>(i + 1);
            for (const auto& seg : segments) {
                if (std::min(seg.start, seg.end) <= hi && std::max(seg.start, seg.end) >= lo)
                    ++map[i];
            }
        }
        return map;
    }

    // Indices past the far edge land in the last cell, negative ones in the middle.
    static int clampIndex(int index, int p) {
        if (index >= p)
            return p - 1;
        if (index < 0)
            return p / 2;
        return index;
    }

    std::vector<Point> m_points;
    Bounds m_bounds;
    int m_precision{4};
    GridMap m_gridMap;
    CircleMap m_massCircleMap;
    CircleMap m_medianCircleMap;
    FlatMap m_flatMapHorizontal;
    FlatMap m_flatMapVertical;
};

} // namespace sm
