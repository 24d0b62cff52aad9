#ifndef VALNOISE_INTERPOLATION_H
#define VALNOISE_INTERPOLATION_H

namespace valnoise {

// basic linear interpolation, alpha is not clamped
inline double interpolate(double x, double y, double alpha) noexcept {
    return x * (1.0 - alpha) + alpha * y;
}

} // namespace valnoise

#endif // VALNOISE_INTERPOLATION_H
