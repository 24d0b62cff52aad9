#ifndef VALNOISE_TIMER_H
#define VALNOISE_TIMER_H

#include <chrono>
#include <iostream>
#include <string>

namespace valnoise {

// Wall-clock timer for labelled stages, prints on stop()
class Timer {
public:
    void start(const std::string& label) {
        label_ = label;
        std::cout << "===== " << label_ << " =====" << std::endl;
        begin_ = std::chrono::high_resolution_clock::now();
    }

    // Returns elapsed seconds since the matching start()
    double stop() {
        auto end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double> elapsed = end - begin_;
        std::cout << "EXECUTION TIME: " << elapsed.count() << " SECONDS" << std::endl;
        return elapsed.count();
    }

    const std::string& label() const { return label_; }

private:
    std::string label_;
    std::chrono::time_point<std::chrono::high_resolution_clock> begin_{
        std::chrono::high_resolution_clock::now()};
};

} // namespace valnoise

#endif // VALNOISE_TIMER_H
