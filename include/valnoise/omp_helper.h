#ifndef VALNOISE_OMP_HELPER_H
#define VALNOISE_OMP_HELPER_H

#include <iostream>
#include <omp.h>

namespace valnoise {

enum ThreadCount { kDefault = 0, kSingle = 1 };

// ===== OPENMP FUNCTIONS =====
// Maps a requested thread count onto what the runtime offers:
// kDefault uses every available thread, anything above the maximum falls back
// to the maximum.
inline int resolveThreadCount(int numThreads) {
    const int maxThreads = omp_get_max_threads();
    switch (numThreads) {
        case ThreadCount::kDefault:
            return maxThreads;
        case ThreadCount::kSingle:
            return 1;
        default:
            if (numThreads < 0 || numThreads > maxThreads) {
                std::cerr << "Invalid number of threads specified (" << numThreads
                          << "). Using Default..." << std::endl;
                return maxThreads;
            }
            return numThreads;
    }
}

inline void setOpenMPThreads(int numThreads) {
    omp_set_num_threads(resolveThreadCount(numThreads));
}

inline void printNumberOfThreads() {
    int numThreads = 1; // Default 1 thread
    #pragma omp parallel
    {
        #pragma omp single
        {
            numThreads = omp_get_num_threads();
        }
    }
    // Print number of threads used vs available
    std::cout << "Number of Threads: " << numThreads << " / " << omp_get_max_threads() << std::endl;
}

} // namespace valnoise

#endif // VALNOISE_OMP_HELPER_H
