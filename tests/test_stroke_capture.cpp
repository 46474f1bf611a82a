#include "core/input/InputManager.hpp"
#include <cassert>

int main() {
    sm::InputManager input(2.f, 10.f);
    assert(!input.capturing());
    assert(!input.addPoint(0.f, 0.f));
    assert(input.points().empty());

    input.startCapture();
    assert(input.capturing());
    assert(input.penLifted());
    assert(input.addPoint(0.f, 0.f));
    assert(input.penLifted());  // the opening point does not end the lift
    assert(!input.addPoint(1.f, 0.f));  // too close to the last point
    assert(input.penLifted());
    assert(input.addPoint(5.f, 0.f));
    assert(!input.penLifted());
    assert(!input.addPoint(8.f, 0.f));  // overlaps (0,0)
    assert(input.addPoint(20.f, 0.f));
    assert(input.points().size() == 3);

    // a fresh stroke may start near old ink
    input.liftPen();
    assert(input.addPoint(3.f, 0.f));
    assert(!input.penLifted());
    assert(!input.addPoint(3.5f, 0.f));

    auto points = input.finalize();
    assert(points.size() == 4);
    assert(points[3] == (sm::Point{3.f, 0.f}));
    assert(!input.capturing());
    assert(input.points().empty());
    assert(!input.addPoint(50.f, 50.f));

    input.setDrawDistance(0.f);
    input.setOverlapDistance(0.f);
    assert(input.drawDistance() == 0.f && input.overlapDistance() == 0.f);
    input.startCapture();
    assert(input.addPoint(1.f, 1.f));
    assert(input.addPoint(1.f, 1.f));
    input.clear();
    assert(input.points().empty() && input.capturing());

    // a stored drawing is taken as is, overlaps included
    input.replacePoints({{0.f, 0.f}, {0.5f, 0.f}, {0.f, 0.f}});
    assert(input.points().size() == 3);
    assert(input.penLifted());
    input.setDrawDistance(2.f);
    assert(!input.addPoint(1.f, 0.f));
    assert(input.addPoint(10.f, 0.f));
    assert(input.points().size() == 4);
    return 0;
}
