#ifndef VALNOISE_CONSTANTS_H
#define VALNOISE_CONSTANTS_H

namespace valnoise {
namespace Constants {
    // Noise generation defaults
    namespace Noise {
        constexpr int DEFAULT_WIDTH = 128;
        constexpr int DEFAULT_HEIGHT = 128;
        constexpr int DEFAULT_OCTAVE = 1;
        constexpr double DEFAULT_PERSISTENCE = 0.5;
        // Smoothed grids held in memory at once during blending
        constexpr int OCTAVE_BATCH = 8;
    }

    // Random source parameters
    namespace Random {
        // One 32-bit engine draw scaled into [0,1)
        constexpr double UNIT_SCALE = 1.0 / 4294967296.0;
    }

    // Demo run parameters
    namespace Demo {
        constexpr const char* SEED = "#AU";
        constexpr int SIZE = 1 << 9;
        constexpr int OCTAVE = 20;
    }
}
} // namespace valnoise

#endif // VALNOISE_CONSTANTS_H
