#ifndef VALIDATION_H
#define VALIDATION_H

#include <cmath>
#include <stdexcept>
#include <string>

// Invariant checks for the update phases. Active in debug builds only;
// release builds (NDEBUG) compile every check to nothing.
namespace validation {

#ifndef NDEBUG

inline void checkFinite(double value, const char* what) {
    if (!std::isfinite(value)) {
        throw std::logic_error(std::string(what) + " is not finite");
    }
}

inline void checkNonNegative(double value, const char* what) {
    if (!(value >= 0.0)) {
        throw std::logic_error(std::string(what) + " is negative (" + std::to_string(value) + ")");
    }
}

inline void checkUnitInterval(double value, const char* what) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw std::logic_error(std::string(what) + " outside [0,1] (" + std::to_string(value) + ")");
    }
}

inline void checkZero(double value, const char* what) {
    if (value != 0.0) {
        throw std::logic_error(std::string(what) + " expected 0 (got " + std::to_string(value) + ")");
    }
}

#else

inline void checkFinite(double, const char*) {}
inline void checkNonNegative(double, const char*) {}
inline void checkUnitInterval(double, const char*) {}
inline void checkZero(double, const char*) {}

#endif

}  // namespace validation

#endif
