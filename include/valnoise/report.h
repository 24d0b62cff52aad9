#ifndef VALNOISE_REPORT_H
#define VALNOISE_REPORT_H

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <utility>

#include "grid.h"

namespace valnoise {

// ===== GRID STATISTICS =====

// (min, max) over every sample, (0, 0) for an empty grid
inline std::pair<double, double> noiseRange(const Grid& grid) {
    if (grid.empty()) {
        return {0.0, 0.0};
    }
    const auto bounds = std::minmax_element(grid.samples().begin(), grid.samples().end());
    return {*bounds.first, *bounds.second};
}

// ===== OUTPUT FUNCTIONS =====

inline void printGridResolution(int width, int height) {
    std::cout << "Grid Resolution: " << width << "x" << height << std::endl;
}

inline void printBufferSize(std::size_t numSamples) {
    std::cout << "Buffer Size: " << numSamples << " samples" << "\n"
              << "Buffer Size: " << numSamples * sizeof(double) / (1024.0 * 1024.0) << " MB" << std::endl;
}

inline void printNoiseRange(const Grid& grid) {
    const std::pair<double, double> range = noiseRange(grid);
    std::cout << "Noise range: " << range.first << " to " << range.second << std::endl;
}

} // namespace valnoise

#endif // VALNOISE_REPORT_H
