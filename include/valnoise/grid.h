#ifndef VALNOISE_GRID_H
#define VALNOISE_GRID_H

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace valnoise {

/**
 * @class Grid
 * @brief Fixed-size 2D buffer of noise samples
 *
 * Samples are stored in a single 1D vector in row-major order, so sample
 * (row, col) lives at index row * width + col.
 */
class Grid {
public:
    Grid() = default;

    Grid(int width, int height, double fill = 0.0)
        : width_(width)
        , height_(height)
        , samples_(cellCount(width, height), fill)
    {}

    int width() const { return width_; }
    int height() const { return height_; }
    std::size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }

    // Unchecked access
    double& operator()(int row, int col) {
        return samples_[index(row, col)];
    }
    double operator()(int row, int col) const {
        return samples_[index(row, col)];
    }

    // Bounds-checked access
    double& at(int row, int col) {
        checkBounds(row, col);
        return samples_[index(row, col)];
    }
    double at(int row, int col) const {
        checkBounds(row, col);
        return samples_[index(row, col)];
    }

    // Pointer to the first sample of a row
    double* row(int r) { return samples_.data() + index(r, 0); }
    const double* row(int r) const { return samples_.data() + index(r, 0); }

    double* data() { return samples_.data(); }
    const double* data() const { return samples_.data(); }

    const std::vector<double>& samples() const { return samples_; }

    bool operator==(const Grid& other) const {
        return width_ == other.width_ && height_ == other.height_ &&
               samples_ == other.samples_;
    }
    bool operator!=(const Grid& other) const { return !(*this == other); }

private:
    static std::size_t cellCount(int width, int height) {
        if (width < 0 || height < 0) {
            throw std::invalid_argument("Grid dimensions must be non-negative");
        }
        return static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    }

    std::size_t index(int row, int col) const {
        return static_cast<std::size_t>(row) * static_cast<std::size_t>(width_) +
               static_cast<std::size_t>(col);
    }

    void checkBounds(int row, int col) const {
        if (row < 0 || row >= height_ || col < 0 || col >= width_) {
            throw std::out_of_range("Grid index (" + std::to_string(row) + ", " +
                                    std::to_string(col) + ") outside " +
                                    std::to_string(height_) + "x" +
                                    std::to_string(width_));
        }
    }

    int width_{0};
    int height_{0};
    std::vector<double> samples_;
};

} // namespace valnoise

#endif // VALNOISE_GRID_H
