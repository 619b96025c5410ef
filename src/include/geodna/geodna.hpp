#pragma once

#include "geodna/exception.hpp"

#include <string>
#include <vector>

#define GEODNA_VERSION "0.4"
#define GEODNA_DEFAULT_PRECISION 22
#define GEODNA_RADIUS_DEFAULT_PRECISION 12
#define GEODNA_RADIUS_OF_EARTH 6378100.0
#define GEODNA_MAX_CELLS 10000000

namespace geodna {

/** @struct LatLng
@brief latitude/longitude, in degrees unless a call asks for radians
*/
typedef struct {
    double lat;  ///< latitude
    double lng;  ///< longitude
} LatLng;

/** @struct BBox
 *  @brief  Rectangle covered by a code, in degrees
 */
typedef struct {
    double north;  ///< north latitude
    double south;  ///< south latitude
    double east;   ///< east longitude
    double west;   ///< west longitude
} BBox;

/**
 * Wraps latitude into [-90, 90) and longitude into [-180, 180).
 */
LatLng normalize(double latitude, double longitude);

/**
 * Encodes a point into a code of `precision` characters, the hemisphere
 * marker included.
 *
 * @throws InvalidPrecisionException if precision < 1
 * @throws InvalidInputException if a coordinate is NaN or infinite
 */
std::string encode(double latitude, double longitude, int precision = GEODNA_DEFAULT_PRECISION,
                   bool radians = false);

/**
 * Center of the rectangle a code covers.
 *
 * @throws InvalidCodeException
 */
void decode(const std::string &code, LatLng &point, bool radians = false);

/**
 * Rectangle a code covers.
 *
 * @throws InvalidCodeException
 */
void boundingBox(const std::string &code, BBox &bound);

/// Code minus its last character. A hemisphere marker is its own parent.
std::string parent(const std::string &code);

/// Appends the four codes one level below `code`, in alphabet order.
void children(const std::string &code, std::vector<std::string> &out);

/**
 * Decodes `code` and moves the point by (dlat, dlng) degrees, wrapping the
 * result the way normalize() does.
 */
LatLng addVector(const std::string &code, double dlat, double dlng);

/**
 * Equirectangular distance between the centers of two codes. Not a
 * great-circle distance; good enough at neighbour scale.
 */
double distanceInKm(const std::string &a, const std::string &b);

/**
 * Code of the point reached from `code` travelling `distance_km` on
 * `bearing` (radians, clockwise from north). The result has the
 * precision of `code` unless one is given.
 */
std::string pointFromPointBearingAndDistance(const std::string &code, double bearing, double distance_km);
std::string pointFromPointBearingAndDistance(const std::string &code, double bearing, double distance_km,
                                             int precision);

/// The 8 surrounding codes, row by row from the south-west.
std::vector<std::string> neighbours(const std::string &code);

/**
 * Codes of `precision` whose centers lie within `radius_km` of `code`.
 * Experimental: scans every cell of the enclosing square.
 */
std::vector<std::string> neighboursWithinRadius(const std::string &code, double radius_km,
                                                int precision = GEODNA_RADIUS_DEFAULT_PRECISION);

/**
 * Merges complete groups of four siblings into their parent until nothing
 * more merges. Keeps first-seen order.
 */
std::vector<std::string> reduce(const std::vector<std::string> &codes);

} // namespace geodna
