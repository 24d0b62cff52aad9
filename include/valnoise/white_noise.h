#ifndef VALNOISE_WHITE_NOISE_H
#define VALNOISE_WHITE_NOISE_H

#include "grid.h"
#include "random_source.h"

namespace valnoise {

// Fills a width x height grid with raw draws, top row first and left to right
// within a row. Consumes exactly width * height draws from the source.
inline Grid generateWhiteNoise(int width, int height, RandomSource& random) {
    Grid noise(width, height);
    for (int h = 0; h < height; ++h) {
        double* row = noise.row(h);
        for (int w = 0; w < width; ++w) {
            row[w] = random.nextUnitFloat();
        }
    }
    return noise;
}

} // namespace valnoise

#endif // VALNOISE_WHITE_NOISE_H
