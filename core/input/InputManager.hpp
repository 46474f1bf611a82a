#pragma once
#include <utility>
#include <vector>
#include "core/geometry/Geometry.hpp"

namespace sm {

// InputManager collects the points of one drawing. Points that barely move
// from the last one, or land on top of earlier points, are dropped so dense
// scribbling does not skew the density maps. After a pen lift the overlap
// check relaxes to the draw distance so a new stroke can start close to an
// old one.
class InputManager {
public:
    explicit InputManager(float drawDistance = 2.f, float overlapDistance = 10.f)
        : m_drawDistance(drawDistance), m_overlapDistance(overlapDistance) {}

    void startCapture() {
        m_points.clear();
        m_penLifted = true;
        m_capturing = true;
    }

    void stopCapture() { m_capturing = false; }

    bool capturing() const { return m_capturing; }

    // Returns true when the point was kept.
    bool addPoint(float x, float y) {
        if (!m_capturing)
            return false;
        Point p{x, y};
        if (!shouldAddPoint(p))
            return false;
        m_points.push_back(p);
        // the first point of a drawing keeps the lift, so the second point is
        // still checked against the relaxed tolerance
        if (m_points.size() > 1)
            m_penLifted = false;
        return true;
    }

    void liftPen() { m_penLifted = true; }
    bool penLifted() const { return m_penLifted; }

    void setDrawDistance(float distance) { m_drawDistance = distance; }
    void setOverlapDistance(float distance) { m_overlapDistance = distance; }
    float drawDistance() const { return m_drawDistance; }
    float overlapDistance() const { return m_overlapDistance; }

    const std::vector<Point>& points() const { return m_points; }

    // Loads a finished drawing, for example a stored symbol, without
    // filtering it again.
    void replacePoints(std::vector<Point> points) {
        m_points = std::move(points);
        m_penLifted = true;
    }

    void clear() {
        m_points.clear();
        m_penLifted = true;
    }

    // Ends the capture and hands over the finished point sequence.
    std::vector<Point> finalize() {
        stopCapture();
        std::vector<Point> out = std::move(m_points);
        m_points.clear();
        m_penLifted = true;
        return out;
    }

private:
    bool shouldAddPoint(const Point& p) const {
        if (m_points.empty())
            return true;
        if (distance(p, m_points.back()) < m_drawDistance)
            return false;
        const float tolerance = m_penLifted ? m_drawDistance : m_overlapDistance;
        for (size_t i = 0; i + 1 < m_points.size(); ++i) {
            if (distance(p, m_points[i]) < tolerance)
                return false;
        }
        return true;
    }

    float m_drawDistance;
    float m_overlapDistance;
    bool m_capturing{false};
    bool m_penLifted{true};
    std::vector<Point> m_points;
};

} // namespace sm
