#ifndef VALNOISE_OCTAVE_BLEND_H
#define VALNOISE_OCTAVE_BLEND_H

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include "constants.h"
#include "grid.h"
#include "omp_helper.h"
#include "smoothing.h"

namespace valnoise {

/**
 * @brief Blends octaveCount smoothed copies of base into one normalized grid
 *
 * Octave o is weighted by persistence^(o+1) and the sum is divided by the
 * total weight, so samples in [0,1) stay in [0,1].
 *
 * Smoothing runs OCTAVE_BATCH levels at a time across OpenMP threads. Each
 * thread reads the shared base grid and writes only its own output grid; the
 * blend of a batch starts after the parallel loop's barrier and always walks
 * the octaves in ascending order, so the result does not depend on the thread
 * count. Once the amplitude underflows to zero the remaining octaves would add
 * nothing and are skipped.
 *
 * @param[in] base White noise grid
 * @param[in] octaveCount Number of octaves, at least 1
 * @param[in] persistence Amplitude factor per octave, in (0,1]
 * @param[in] numThreads Requested OpenMP threads, see ThreadCount
 */
inline Grid combineOctaves(const Grid& base, int octaveCount,
                           double persistence = Constants::Noise::DEFAULT_PERSISTENCE,
                           int numThreads = ThreadCount::kDefault) {
    if (octaveCount < 1) {
        throw std::invalid_argument("Octave count must be at least 1");
    }
    if (!(persistence > 0.0 && persistence <= 1.0)) {
        throw std::invalid_argument("Persistence must be in (0, 1]");
    }

    const int width = base.width();
    const int height = base.height();
    const int threads = resolveThreadCount(numThreads);

    Grid noise(width, height);
    double amplitude = 1.0;
    double totalAmplitude = 0.0;

    // Scratch grids reused across batches, allocated before any parallel region
    const int batchSize = std::min(octaveCount, Constants::Noise::OCTAVE_BATCH);
    std::vector<Grid> smooth(static_cast<std::size_t>(batchSize), Grid(width, height));
    std::vector<std::vector<SampleAnchors>> columns(
        static_cast<std::size_t>(batchSize),
        std::vector<SampleAnchors>(static_cast<std::size_t>(width)));

    bool exhausted = false;
    for (std::int64_t first = 0; first < octaveCount && !exhausted; first += batchSize) {
        const int count = static_cast<int>(std::min<std::int64_t>(batchSize, octaveCount - first));
        const int level = static_cast<int>(first);

        // generate smooth noise
        #pragma omp parallel for num_threads(threads) schedule(dynamic)
        for (int i = 0; i < count; ++i) {
            smoothNoiseInto(base, level + i, smooth[i], columns[i]);
        }

        // blend noise together
        for (int i = 0; i < count; ++i) {
            amplitude *= persistence;
            if (amplitude == 0.0) {
                exhausted = true;
                break;
            }
            totalAmplitude += amplitude;

            const Grid& octave = smooth[i];
            #pragma omp parallel for num_threads(threads)
            for (int h = 0; h < height; ++h) {
                const double* in = octave.row(h);
                double* out = noise.row(h);
                for (int w = 0; w < width; ++w) {
                    out[w] += in[w] * amplitude;
                }
            }
        }
    }

    // normalisation
    #pragma omp parallel for num_threads(threads)
    for (int h = 0; h < height; ++h) {
        double* out = noise.row(h);
        for (int w = 0; w < width; ++w) {
            out[w] /= totalAmplitude;
        }
    }

    return noise;
}

} // namespace valnoise

#endif // VALNOISE_OCTAVE_BLEND_H
