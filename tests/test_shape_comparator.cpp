#include "core/recognition/CharacterLibrary.hpp"
#include "core/recognition/ShapeComparator.hpp"
#include <cassert>
#include <cmath>
#include <vector>

static bool near(double a, double b, double eps = 1e-5) { return std::fabs(a - b) < eps; }

static std::vector<sm::Point> loop() {
    std::vector<sm::Point> pts;
    for (int i = 0; i < 36; ++i) {
        float a = static_cast<float>(i) * 3.14159265f / 18.f;
        pts.push_back({200.f + 80.f * std::cos(a), 150.f + 60.f * std::sin(a)});
    }
    return pts;
}

int main() {
    // a shape compared with itself is a perfect match everywhere
    sm::Bitmap shape(loop(), 5);
    assert(sm::gridDifference(shape, shape) == 0.f);
    assert(sm::circleDifference(shape, shape) == 0.f);
    assert(sm::circleDifference(shape, shape, sm::CircleCenter::Mass) == 0.f);
    assert(sm::flatMapDifference(shape, shape, sm::Axis::Horizontal) == 0.f);
    assert(sm::flatMapDifference(shape, shape, sm::Axis::Vertical) == 0.f);

    // different precisions or a missing counterpart cannot be compared
    sm::Bitmap coarse(loop(), 4);
    assert(sm::gridDifference(shape, coarse) == sm::kIncomparableDifference);
    assert(sm::circleDifference(shape, coarse) == sm::kIncomparableDifference);
    assert(sm::flatMapDifference(shape, coarse, sm::Axis::Vertical) == sm::kIncomparableDifference);
    assert(sm::gridDifference(shape, nullptr) == sm::kIncomparableDifference);
    assert(sm::circleDifference(shape, nullptr) == sm::kIncomparableDifference);
    assert(sm::flatMapDifference(shape, nullptr, sm::Axis::Horizontal) == sm::kIncomparableDifference);

    // one point against nothing
    sm::Bitmap dot({{10.f, 10.f}}, 2);
    sm::Bitmap blank(std::vector<sm::Point>(), 2);
    assert(near(sm::gridDifference(dot, blank), 0.25));
    assert(near(sm::circleDifference(dot, blank), 0.125));
    // the lone bin slides out of the overlap two shifts over
    assert(sm::flatMapDifference(dot, blank, sm::Axis::Horizontal) == 0.f);

    // shifted copies are forgiven
    sm::FlatMap a{0, 1, 1, 0, 0, 0, 0, 0, 0};
    sm::FlatMap b{0, 0, 1, 1, 0, 0, 0, 0, 0};
    assert(sm::flatMapArrayDifference(a, b, 0) > 0.2f);
    assert(sm::flatMapArrayDifference(a, b, 3) == 0.f);

    // nothing in common: the unshifted interior count wins
    sm::FlatMap ones{1, 1, 1, 1};
    sm::FlatMap zeros{0, 0, 0, 0};
    assert(near(sm::flatMapArrayDifference(ones, zeros, 2), 0.5));
    assert(sm::flatMapArrayDifference(ones, sm::FlatMap{1, 1}, 2) == sm::kIncomparableDifference);

    // bias pulls the larger of grid/circle toward the smaller
    double grid = 10.0, circle = 2.0;
    sm::biasCorrect(grid, circle);
    assert(circle == 2.0);
    assert(near(grid, 2.0 + 8.0 / 18.0));
    grid = 0.0;
    circle = 1.0;
    sm::biasCorrect(grid, circle);
    assert(grid == 0.0 && near(circle, 0.25));
    grid = circle = 3.0;
    sm::biasCorrect(grid, circle);
    assert(grid == 3.0 && circle == 3.0);

    // fused score: grid 25 and circle 12.5 after scaling, flat maps agree
    double score = sm::scoreBitmaps(dot, blank, sm::MapWeights());
    assert(near(score, 12.5 + 12.5 + 12.5 / 27.0, 1e-4));
    sm::MapWeights gridOnly{1.0, 0.0, 0.0, 0.0};
    assert(near(sm::scoreBitmaps(dot, blank, gridOnly), 12.5 + 12.5 / 27.0, 1e-4));
    return 0;
}
