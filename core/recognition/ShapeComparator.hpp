#pragma once
#include <algorithm>
#include <cstdlib>
#include <string>
#include "Bitmap.hpp"
#include "utils/Logger.hpp"

namespace sm {

// Returned by every comparison when two bitmaps cannot be compared.
constexpr float kIncomparableDifference = 100.f;

namespace detail {

inline bool comparable(const Bitmap& shape, const Bitmap* reference, const char* what) {
    if (!reference)
        return false;
    if (shape.precision() != reference->precision()) {
        SM_LOG(LogLevel::Warn, std::string(what) + ": precision " +
                                   std::to_string(shape.precision()) + " does not match " +
                                   std::to_string(reference->precision()));
        return false;
    }
    return true;
}

// Mismatch fraction of two equal-length arrays with b shifted by `shift`
// bins (positive compares a[i] with b[i - shift]).
inline float shiftedMismatch(const FlatMap& a, const FlatMap& b, int shift) {
    const int length = static_cast<int>(a.size());
    const int overlap = length - std::abs(shift);
    if (overlap <= 0)
        return 1.f;
    float diff = 0.f;
    const int begin = shift > 0 ? shift : 0;
    const int end = shift > 0 ? length : length + shift;
    for (int i = begin; i < end; ++i) {
        if (a[i] != b[i - shift])
            diff += 1.f / static_cast<float>(overlap);
    }
    return diff;
}

} // namespace detail

// Mean squared error over all p*p grid cells.
inline float gridDifference(const Bitmap& shape, const Bitmap* reference) {
    if (!detail::comparable(shape, reference, "Grid comparison"))
        return kIncomparableDifference;
    const GridMap& a = shape.gridMap();
    const GridMap& b = reference->gridMap();
    const int p = shape.precision();
    float total = 0.f;
    for (int row = 0; row < p; ++row) {
        for (int col = 0; col < p; ++col) {
            float d = a[row][col] - b[row][col];
            total += d * d;
        }
    }
    return total / static_cast<float>(p * p);
}

// Mean squared error over the p rings x 4 quadrants of one circle map.
// Scoring uses the median-centered map; the mass-centered one is kept for
// direct comparisons.
inline float circleDifference(const Bitmap& shape, const Bitmap* reference,
                              CircleCenter center = CircleCenter::Median) {
    if (!detail::comparable(shape, reference, "Circle comparison"))
        return kIncomparableDifference;
    const CircleMap& a = shape.circleMap(center);
    const CircleMap& b = reference->circleMap(center);
    const int p = shape.precision();
    float total = 0.f;
    for (int ring = 0; ring < p; ++ring) {
        for (int q = 0; q < 4; ++q) {
            float d = a[ring][q] - b[ring][q];
            total += d * d;
        }
    }
    return total / static_cast<float>(p * 4);
}

// Smallest mismatch fraction between two equal-length flat maps over shifts
// of up to maxShift bins either way. The unshifted pass skips the two edge
// bins, whose values are the least reliable, but still divides by the full
// length.
inline float flatMapArrayDifference(const FlatMap& a, const FlatMap& b, int maxShift) {
    const size_t length = a.size();
    if (b.size() != length)
        return kIncomparableDifference;

    float lowest = 0.f;
    for (size_t i = 1; i + 1 < length; ++i) {
        if (a[i] != b[i])
            lowest += 1.f / static_cast<float>(length);
    }
    for (int n = 1; n <= maxShift; ++n) {
        lowest = std::min(lowest, detail::shiftedMismatch(a, b, n));
        lowest = std::min(lowest, detail::shiftedMismatch(a, b, -n));
    }
    return lowest;
}

inline float flatMapDifference(const Bitmap& shape, const Bitmap* reference, Axis axis) {
    if (!detail::comparable(shape, reference, "Flat map comparison"))
        return kIncomparableDifference;
    return flatMapArrayDifference(shape.flatMap(axis), reference->flatMap(axis),
                                  shape.precision());
}

inline float gridDifference(const Bitmap& shape, const Bitmap& reference) {
    return gridDifference(shape, &reference);
}

inline float circleDifference(const Bitmap& shape, const Bitmap& reference,
                              CircleCenter center = CircleCenter::Median) {
    return circleDifference(shape, &reference, center);
}

inline float flatMapDifference(const Bitmap& shape, const Bitmap& reference, Axis axis) {
    return flatMapDifference(shape, &reference, axis);
}

// Grid and circle maps describe the same 2D density, so when one reports a
// much closer match the other is pulled toward it. The pull fades as the gap
// grows: bias = 1 / (2 * (1 + gap)).
inline void biasCorrect(double& grid, double& circle) {
    if (circle < grid) {
        double gap = grid - circle;
        double bias = 1.0 / (2.0 * (1.0 + gap));
        grid = circle + gap * bias;
    } else if (grid < circle) {
        double gap = circle - grid;
        double bias = 1.0 / (2.0 * (1.0 + gap));
        circle = grid + gap * bias;
    }
}

} // namespace sm
