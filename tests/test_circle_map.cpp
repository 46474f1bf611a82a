#include "core/recognition/Bitmap.hpp"
#include <cassert>
#include <cmath>
#include <vector>

static float ringTotal(const sm::CircleMap& m, int ring) {
    return m[ring][0] + m[ring][1] + m[ring][2] + m[ring][3];
}

int main() {
    // quadrants around the center; zero offsets count as positive
    sm::Point c{0.f, 0.f};
    assert(sm::quadrantOf({1.f, 1.f}, c) == 0);
    assert(sm::quadrantOf({1.f, -1.f}, c) == 1);
    assert(sm::quadrantOf({-1.f, -1.f}, c) == 2);
    assert(sm::quadrantOf({-1.f, 1.f}, c) == 3);
    assert(sm::quadrantOf({0.f, 0.f}, c) == 0);
    assert(sm::quadrantOf({0.f, -1.f}, c) == 1);
    assert(sm::quadrantOf({-1.f, 0.f}, c) == 3);

    // small diamond: radius is raised to the minimum, points land in ring 1
    sm::Bitmap diamond({{10.f, 0.f}, {0.f, 10.f}, {-10.f, 0.f}, {0.f, -10.f}}, 4);
    for (sm::CircleCenter center : {sm::CircleCenter::Mass, sm::CircleCenter::Median}) {
        const sm::CircleMap& m = diamond.circleMap(center);
        assert(m.size() == 4);
        assert(ringTotal(m, 0) == 0.f);
        assert(m[1][0] == 0.5f);
        assert(m[1][1] == 0.25f);
        assert(m[1][2] == 0.f);
        assert(m[1][3] == 0.25f);
    }

    // points on the outer edge belong to the outermost ring
    sm::Bitmap pair({{-100.f, 0.f}, {100.f, 0.f}}, 4);
    const sm::CircleMap& edge = pair.circleMap(sm::CircleCenter::Mass);
    assert(edge[3][0] == 0.5f);
    assert(edge[3][3] == 0.5f);
    assert(ringTotal(edge, 0) == 0.f);

    // an outlier drags the center of mass away but not the median
    std::vector<sm::Point> cluster{{0.f, 0.f}, {1.f, 0.f}, {0.f, 1.f}, {1.f, 1.f}, {300.f, 300.f}};
    sm::Bitmap skewed(cluster, 4);
    const sm::CircleMap& byMedian = skewed.circleMap(sm::CircleCenter::Median);
    const sm::CircleMap& byMass = skewed.circleMap(sm::CircleCenter::Mass);
    assert(std::fabs(ringTotal(byMedian, 0) - 0.8f) < 1e-5f);
    assert(std::fabs(ringTotal(byMedian, 3) - 0.2f) < 1e-5f);
    assert(byMedian != byMass);
    float massTotal = 0.f;
    for (int r = 0; r < 4; ++r)
        massTotal += ringTotal(byMass, r);
    assert(std::fabs(massTotal - 1.f) < 1e-5f);
    return 0;
}
