#pragma once

#include <cmath>

namespace geodna {

static const double PI = 3.141592653589793;

// Floored modulus: the result has the sign of m.
inline double _mod(double x, double m) {
    return std::fmod(std::fmod(x, m) + m, m);
}

inline double _deg2rad(double degrees) {
    return degrees * (PI / 180.0);
}

inline double _rad2deg(double radians) {
    return radians * (180.0 / PI);
}

} // namespace geodna
