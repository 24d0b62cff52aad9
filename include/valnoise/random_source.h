#ifndef VALNOISE_RANDOM_SOURCE_H
#define VALNOISE_RANDOM_SOURCE_H

#include <cstdint>
#include <random>
#include <vector>

#include "constants.h"
#include "seed.h"

namespace valnoise {

// ===== RANDOM SOURCE INTERFACE =====
// Anything that can hand out uniform draws in [0,1)
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Next uniform draw in [0,1)
    virtual double nextUnitFloat() = 0;
};

// ===== MERSENNE TWISTER SOURCE =====
/**
 * @class SeededRandomSource
 * @brief RandomSource backed by std::mt19937
 *
 * Two sources built from equal seeds replay the same sequence. An absent
 * seed pulls its state from std::random_device.
 */
class SeededRandomSource : public RandomSource {
public:
    SeededRandomSource() { reseed(Seed()); }

    explicit SeededRandomSource(const Seed& seed) { reseed(seed); }

    double nextUnitFloat() override {
        // 32 random bits scaled by 2^-32, never reaches 1
        return static_cast<double>(engine_()) * Constants::Random::UNIT_SCALE;
    }

    // Restart the sequence from a new seed
    void reseed(const Seed& seed) {
        if (seed.isSet()) {
            const std::vector<std::uint32_t> words = seed.words();
            std::seed_seq sequence(words.begin(), words.end());
            engine_.seed(sequence);
        } else {
            std::random_device entropy;
            std::seed_seq sequence{entropy(), entropy(), entropy(), entropy(),
                                   entropy(), entropy(), entropy(), entropy()};
            engine_.seed(sequence);
        }
    }

private:
    std::mt19937 engine_;
};

} // namespace valnoise

#endif // VALNOISE_RANDOM_SOURCE_H
