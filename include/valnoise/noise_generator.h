#ifndef VALNOISE_NOISE_GENERATOR_H
#define VALNOISE_NOISE_GENERATOR_H

#include <memory>
#include <stdexcept>
#include <utility>

#include "config.h"
#include "grid.h"
#include "interpolation.h"
#include "octave_blend.h"
#include "random_source.h"
#include "white_noise.h"

namespace valnoise {

// ===== MAIN NOISE GENERATOR CLASS =====
/**
 * @class NoiseGenerator
 * @brief Seeded, tileable multi-octave value noise
 *
 * Every call to generate() draws a fresh white-noise grid from the owned
 * random source and blends its smoothed octaves. The source is never reset
 * between calls, so successive grids differ until reseed() is called.
 */
class NoiseGenerator {
public:
    explicit NoiseGenerator(const Config::Noise& config = Config::Noise())
        : config_(validated(config))
        , random_(new SeededRandomSource(config.seed))
    {}

    // Uses an injected random source in place of the seeded one
    NoiseGenerator(const Config::Noise& config, std::unique_ptr<RandomSource> random)
        : config_(validated(config))
        , random_(std::move(random))
    {
        if (!random_) {
            throw std::invalid_argument("NoiseGenerator needs a random source");
        }
    }

    int width() const { return config_.width; }
    int height() const { return config_.height; }
    int octave() const { return config_.octave; }
    double persistence() const { return config_.persistence; }
    const Config::Noise& config() const { return config_; }

    // height x width grid with every sample in [0,1]
    Grid generate() {
        const Grid whiteNoise = generateWhiteNoise(config_.width, config_.height, *random_);
        return combineOctaves(whiteNoise, config_.octave, config_.persistence, config_.threads);
    }

    Grid operator()() { return generate(); }

    // Restarts the draw sequence with a fresh seeded source
    void reseed(const Seed& seed) {
        config_.seed = seed;
        random_.reset(new SeededRandomSource(seed));
    }

    static double interpolate(double x, double y, double alpha) noexcept {
        return valnoise::interpolate(x, y, alpha);
    }

private:
    static const Config::Noise& validated(const Config::Noise& config) {
        config.validate();
        return config;
    }

    Config::Noise config_;
    std::unique_ptr<RandomSource> random_;
};

} // namespace valnoise

#endif // VALNOISE_NOISE_GENERATOR_H
