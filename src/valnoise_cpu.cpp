// STL
#include <iostream>

// Project Headers
#include "valnoise/config.h"
#include "valnoise/constants.h"
#include "valnoise/noise_generator.h"
#include "valnoise/omp_helper.h"
#include "valnoise/report.h"
#include "valnoise/timer.h"

using namespace valnoise;

int main() {
  std::cout << "CPU version running" << std::endl;
  Timer timer;

  // ===== CONFIG SETUP =====
  Config::Noise noiseConfig(Constants::Demo::SEED, Constants::Demo::SIZE,
                            Constants::Demo::SIZE, Constants::Demo::OCTAVE);
  noiseConfig.threads = ThreadCount::kDefault;

  try {
    NoiseGenerator generator(noiseConfig);

    // ===== OUTPUT CONFIG =====
    printGridResolution(generator.width(), generator.height());
    printBufferSize(noiseConfig.numSamples());
    setOpenMPThreads(noiseConfig.threads);
    printNumberOfThreads();
    std::cout << "Octaves: " << generator.octave() << std::endl;

    // ===== NOISE GENERATION =====
    timer.start("GENERATING VALUE NOISE");
    const Grid noise = generator();
    timer.stop();

    // ===== POST-PROCESSING =====
    printNoiseRange(noise);
  } catch (const ConfigurationError& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
