#ifndef VALNOISE_SMOOTHING_H
#define VALNOISE_SMOOTHING_H

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include "grid.h"
#include "interpolation.h"

namespace valnoise {

/**
 * @struct SampleAnchors
 * @brief Periodic anchors of one index along one axis
 *
 * For sample period p = 2^octaveLevel on an axis of length n:
 *   lower = floor(i / p) * p
 *   upper = (lower + p) mod n
 *   blend = (i - lower) / p
 */
struct SampleAnchors {
    int lower;
    int upper;
    double blend;
};

namespace detail {

// 2^exponent mod modulus by square-and-multiply, modulus >= 1
inline std::int64_t powerOfTwoModulo(int exponent, int modulus) noexcept {
    const std::uint64_t m = static_cast<std::uint64_t>(modulus);
    std::uint64_t result = 1 % m;
    std::uint64_t base = 2 % m;
    unsigned int e = static_cast<unsigned int>(exponent);
    while (e > 0) {
        if (e & 1u) {
            result = (result * base) % m;
        }
        base = (base * base) % m;
        e >>= 1;
    }
    return static_cast<std::int64_t>(result);
}

inline SampleAnchors anchorsFor(int index, int octaveLevel, int extent) noexcept {
    std::int64_t lower = 0;
    if (octaveLevel < 31) {
        const std::int64_t period = std::int64_t{1} << octaveLevel;
        lower = (index / period) * period;
    }
    const std::int64_t upper = (lower + powerOfTwoModulo(octaveLevel, extent)) % extent;

    SampleAnchors anchors;
    anchors.lower = static_cast<int>(lower);
    anchors.upper = static_cast<int>(upper);
    // (i - lower) * 2^-level, exact for every representable level
    anchors.blend = std::ldexp(static_cast<double>(index - lower), -octaveLevel);
    return anchors;
}

} // namespace detail

// Anchors for index in [0, extent). Exact for any octave level: once the
// period outgrows the axis the lower anchor pins to 0 and the upper anchor
// is the period folded back into the axis.
inline SampleAnchors computeAnchors(int index, int octaveLevel, int extent) {
    if (octaveLevel < 0) {
        throw std::invalid_argument("Octave level must be non-negative");
    }
    if (extent < 1 || index < 0 || index >= extent) {
        throw std::out_of_range("Anchor index outside axis");
    }
    return detail::anchorsFor(index, octaveLevel, extent);
}

/**
 * @brief Periodic bilinear smoothing of one octave level into a preallocated grid
 *
 * @param[in] base White noise to smooth
 * @param[in] octaveLevel Zero-based octave level, must be non-negative
 * @param[out] smooth Grid with the same dimensions as base
 * @param columns Scratch space for the per-column anchors, resized to base.width()
 *
 * The upper anchors wrap around both axes, which makes the result tileable.
 * Does not allocate when columns already holds base.width() entries.
 */
inline void smoothNoiseInto(const Grid& base, int octaveLevel, Grid& smooth,
                            std::vector<SampleAnchors>& columns) {
    const int width = base.width();
    const int height = base.height();
    columns.resize(static_cast<std::size_t>(width));

    // Column anchors are the same for every row
    for (int w = 0; w < width; ++w) {
        columns[w] = detail::anchorsFor(w, octaveLevel, width);
    }

    for (int h = 0; h < height; ++h) {
        const SampleAnchors rows = detail::anchorsFor(h, octaveLevel, height);
        const double* lowerRow = base.row(rows.lower);
        const double* upperRow = base.row(rows.upper);
        double* out = smooth.row(h);

        for (int w = 0; w < width; ++w) {
            const SampleAnchors& col = columns[w];
            const double top = interpolate(lowerRow[col.lower], upperRow[col.lower], col.blend);
            const double bottom = interpolate(upperRow[col.upper], lowerRow[col.upper], col.blend);
            out[w] = interpolate(top, bottom, rows.blend);
        }
    }
}

// Smoothed copy of base at one octave level
inline Grid smoothNoise(const Grid& base, int octaveLevel) {
    if (octaveLevel < 0) {
        throw std::invalid_argument("Octave level must be non-negative");
    }
    Grid smooth(base.width(), base.height());
    std::vector<SampleAnchors> columns;
    smoothNoiseInto(base, octaveLevel, smooth, columns);
    return smooth;
}

} // namespace valnoise

#endif // VALNOISE_SMOOTHING_H
