#include "geodna/geodna.hpp"
#include "angles.hpp"

#include <cmath>
#include <unordered_map>
#include <vector>

namespace geodna {

static const std::vector<char> CODE_ALPHABET = {'g', 'a', 't', 'c'};
static const std::unordered_map<char, int> CODE_ALPHABET_VALUE = {
        {'g', 0}, {'a', 1}, {'t', 2}, {'c', 3}
    };

static void _check_code(const std::string &code) {
    if (code.empty()) {
        throw InvalidCodeException("Code cannot be empty");
    }
    if (code[0] != 'e' && code[0] != 'w') {
        throw InvalidCodeException("Code must start with 'e' or 'w': " + code);
    }
    for (size_t i = 1; i < code.size(); ++i) {
        if (CODE_ALPHABET_VALUE.find(code[i]) == CODE_ALPHABET_VALUE.end()) {
            throw InvalidCodeException("Invalid character in code: " + std::string(1, code[i]));
        }
    }
}

LatLng normalize(double latitude, double longitude) {
    LatLng point;
    point.lat = _mod(latitude + 90.0, 180.0) - 90.0;
    point.lng = _mod(longitude + 180.0, 360.0) - 180.0;
    return point;
}

std::string encode(double latitude, double longitude, int precision, bool radians) {
    // Validate input parameters
    if (precision < 1) {
        throw InvalidPrecisionException("Precision must be at least 1, got " + std::to_string(precision));
    }

    if (radians) {
        latitude = _rad2deg(latitude);
        longitude = _rad2deg(longitude);
    }
    if (!std::isfinite(latitude) || !std::isfinite(longitude)) {
        throw InvalidInputException("Latitude and longitude must be finite");
    }
    LatLng point = normalize(latitude, longitude);

    std::string code;
    code.reserve(precision);

    double LON_MIN, LON_MAX;
    if (point.lng < 0) {
        code.push_back('w');
        LON_MIN = -180.0;
        LON_MAX = 0.0;
    } else {
        code.push_back('e');
        LON_MIN = 0.0;
        LON_MAX = 180.0;
    }
    double LAT_MIN = -90.0;
    double LAT_MAX = 90.0;

    while (code.size() < static_cast<size_t>(precision)) {
        int ch = 0;

        double mid = (LON_MIN + LON_MAX) / 2.0;
        if (point.lng > mid) {
            ch |= 2;
            LON_MIN = mid;
        } else {
            LON_MAX = mid;
        }

        mid = (LAT_MIN + LAT_MAX) / 2.0;
        if (point.lat > mid) {
            ch |= 1;
            LAT_MIN = mid;
        } else {
            LAT_MAX = mid;
        }

        code.push_back(CODE_ALPHABET[ch]);
    }
    return code;
}

void boundingBox(const std::string &code, BBox &bound) {
    _check_code(code);

    double LON_MIN = code[0] == 'w' ? -180.0 : 0.0;
    double LON_MAX = code[0] == 'w' ? 0.0 : 180.0;
    double LAT_MIN = -90.0;
    double LAT_MAX = 90.0;

    for (size_t i = 1; i < code.size(); ++i) {
        int value = CODE_ALPHABET_VALUE.at(code[i]);

        double mid = (LON_MIN + LON_MAX) / 2.0;
        if (value & 2) {
            LON_MIN = mid;
        } else {
            LON_MAX = mid;
        }

        mid = (LAT_MIN + LAT_MAX) / 2.0;
        if (value & 1) {
            LAT_MIN = mid;
        } else {
            LAT_MAX = mid;
        }
    }

    bound.west = LON_MIN;
    bound.east = LON_MAX;
    bound.south = LAT_MIN;
    bound.north = LAT_MAX;
}

void decode(const std::string &code, LatLng &point, bool radians) {
    BBox bound;
    boundingBox(code, bound);

    point.lat = (bound.south + bound.north) / 2.0;
    point.lng = (bound.west + bound.east) / 2.0;

    if (radians) {
        point.lat = _deg2rad(point.lat);
        point.lng = _deg2rad(point.lng);
    }
}

std::string parent(const std::string &code) {
    if (code.size() > 1) {
        return code.substr(0, code.size() - 1);
    }
    return code;
}

void children(const std::string &code, std::vector<std::string> &out) {
    _check_code(code);
    for (const char &c : CODE_ALPHABET) {
        out.push_back(code + c);
    }
}

} // namespace geodna
