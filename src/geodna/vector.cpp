#include "geodna/geodna.hpp"
#include "angles.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <stdexcept>

namespace geodna {

LatLng addVector(const std::string &code, double dlat, double dlng) {
    LatLng point;
    decode(code, point);

    LatLng result;
    result.lat = _mod(point.lat + 90.0 + dlat, 180.0) - 90.0;
    result.lng = _mod(point.lng + 180.0 + dlng, 360.0) - 180.0;
    return result;
}

double distanceInKm(const std::string &a, const std::string &b) {
    LatLng pa, pb;
    decode(a, pa);
    decode(b, pb);

    // Across the antimeridian: shift both points half a turn so the short
    // path no longer wraps.
    if (pa.lng * pb.lng < 0.0 && std::abs(pa.lng - pb.lng) > 180.0) {
        pa = addVector(a, 0.0, 180.0);
        pb = addVector(b, 0.0, 180.0);
    }

    double x = (_deg2rad(pb.lng) - _deg2rad(pa.lng)) * std::cos((_deg2rad(pa.lat) + _deg2rad(pb.lat)) / 2.0);
    double y = _deg2rad(pb.lat) - _deg2rad(pa.lat);
    double d = std::sqrt(x * x + y * y) * GEODNA_RADIUS_OF_EARTH;
    return d / 1000.0;
}

std::string pointFromPointBearingAndDistance(const std::string &code, double bearing, double distance_km) {
    return pointFromPointBearingAndDistance(code, bearing, distance_km, static_cast<int>(code.size()));
}

std::string pointFromPointBearingAndDistance(const std::string &code, double bearing, double distance_km,
                                             int precision) {
    LatLng start;
    decode(code, start, true);

    double angular = distance_km * 1000.0 / GEODNA_RADIUS_OF_EARTH;
    double lat2 = std::asin(std::sin(start.lat) * std::cos(angular) +
                            std::cos(start.lat) * std::sin(angular) * std::cos(bearing));
    double lng2 = start.lng + std::atan2(std::sin(bearing) * std::sin(angular) * std::cos(start.lat),
                                         std::cos(angular) - std::sin(start.lat) * std::sin(lat2));

    return encode(lat2, lng2, precision, true);
}

std::vector<std::string> neighbours(const std::string &code) {
    BBox bound;
    boundingBox(code, bound);
    double width = std::abs(bound.east - bound.west);
    double height = std::abs(bound.north - bound.south);
    int precision = static_cast<int>(code.size());

    std::vector<std::string> result;
    result.reserve(8);
    for (int i = -1; i <= 1; ++i) {
        for (int j = -1; j <= 1; ++j) {
            if (i == 0 && j == 0) {
                continue;
            }
            LatLng moved = addVector(code, height * i, width * j);
            result.push_back(encode(moved.lat, moved.lng, precision));
        }
    }
    return result;
}

std::vector<std::string> neighboursWithinRadius(const std::string &code, double radius_km, int precision) {
    // Validate input parameters
    if (precision < 1) {
        throw InvalidPrecisionException("Precision must be at least 1, got " + std::to_string(precision));
    }
    if (!std::isfinite(radius_km) || radius_km < 0) {
        throw InvalidInputException("Radius must be a finite, non-negative number of kilometres");
    }

    // Corners of a square that encloses the circle.
    double rh = radius_km * std::sqrt(2.0);
    std::string start = pointFromPointBearingAndDistance(code, -(PI / 4), rh, precision);
    std::string end = pointFromPointBearingAndDistance(code, PI / 4, rh, precision);

    BBox cell;
    boundingBox(start, cell);
    LatLng start_point, end_point;
    decode(start, start_point);
    decode(end, end_point);

    double dheight = std::abs(cell.north - cell.south);
    double dwidth = std::abs(cell.east - cell.west);
    double delta = std::abs(normalize(0.0, std::abs(end_point.lng - start_point.lng)).lng);

    double estimate = (std::floor(delta / dwidth) + 1) * (std::floor(delta / dheight) + 1);
    if (estimate > GEODNA_MAX_CELLS) {
        throw std::out_of_range("Search area too big for precision " + std::to_string(precision));
    }

    spdlog::debug("geodna radius search around {}: {} km, start {}, end {}, delta {}, cell {}x{}", code,
                  radius_km, start, end, delta, dwidth, dheight);

    std::vector<std::string> result;
    size_t scanned = 0;
    double tlat = 0.0;
    double tlng = 0.0;
    std::string current = start;

    while (tlat <= delta) {
        while (tlng <= delta) {
            LatLng next = addVector(current, 0.0, dwidth);
            current = encode(next.lat, next.lng, precision);
            if (distanceInKm(current, code) <= radius_km) {
                result.push_back(current);
            }
            tlng += dwidth;
            ++scanned;
        }

        tlat += dheight;
        LatLng row = addVector(start, -tlat, 0.0);
        current = encode(row.lat, row.lng, precision);
        tlng = 0.0;
    }

    spdlog::debug("geodna radius search around {}: kept {} of {} cells", code, result.size(), scanned);
    return result;
}

} // namespace geodna
