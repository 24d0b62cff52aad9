#ifndef VALNOISE_CONFIG_H
#define VALNOISE_CONFIG_H

#include <cmath>
#include <cstddef>
#include <string>

#include "constants.h"
#include "errors.h"
#include "omp_helper.h"
#include "seed.h"

namespace valnoise {
namespace Config {

// ===== NOISE CONFIGURATION =====
/**
 * @struct Noise
 * @brief Parameters of one noise generator
 *
 * Initializes default size, octave count and persistence.
 * The seed is absent by default, which makes every generator unique.
 *
 * @see Constants::Noise for default values
 */
struct Noise {
    Seed seed{};
    int width{Constants::Noise::DEFAULT_WIDTH};
    int height{Constants::Noise::DEFAULT_HEIGHT};
    int octave{Constants::Noise::DEFAULT_OCTAVE};
    double persistence{Constants::Noise::DEFAULT_PERSISTENCE};
    int threads{ThreadCount::kDefault};

    // ===== Constructors =====
    Noise() = default;

    Noise(const Seed& seedValue, int widthValue, int heightValue, int octaveValue)
        : seed(seedValue), width(widthValue), height(heightValue), octave(octaveValue) {}

    std::size_t numSamples() const {
        return static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    }

    // Throws ConfigurationError on the first invalid field
    void validate() const {
        if (width <= 0) {
            throw ConfigurationError("width must be positive, got " + std::to_string(width));
        }
        if (height <= 0) {
            throw ConfigurationError("height must be positive, got " + std::to_string(height));
        }
        if (octave <= 0) {
            throw ConfigurationError("octave must be positive, got " + std::to_string(octave));
        }
        if (!std::isfinite(persistence) || persistence <= 0.0 || persistence > 1.0) {
            throw ConfigurationError("persistence must be in (0, 1], got " +
                                     std::to_string(persistence));
        }
        if (threads < 0) {
            throw ConfigurationError("threads must be non-negative, got " +
                                     std::to_string(threads));
        }
    }
};

} // namespace Config
} // namespace valnoise

#endif // VALNOISE_CONFIG_H
