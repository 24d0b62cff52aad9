#ifndef VALNOISE_ERRORS_H
#define VALNOISE_ERRORS_H

#include <stdexcept>
#include <string>

namespace valnoise {

// Thrown once at construction when a noise configuration is malformed
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument("valnoise: " + what) {}
};

} // namespace valnoise

#endif // VALNOISE_ERRORS_H
