#pragma once

#include <string>
#include <vector>

namespace geodna {

/// POLYGON WKT of the rectangle of `code`, longitude first.
std::string boundingBoxWkt(const std::string &code);

/// POINT WKT of the center of `code`, longitude first.
std::string pointWkt(const std::string &code);

/**
 * Share of the rectangle of `a` that overlaps the rectangle of `b`, in
 * [0, 1].
 */
double areaRatio(const std::string &a, const std::string &b);

/**
 * Codes of exactly `precision` characters covering a POLYGON or
 * MULTIPOLYGON given as lon/lat WKT. Cells on the boundary are kept when
 * `full` is set, otherwise only when more than half of them is inside.
 *
 * @throws InvalidInputException on unreadable WKT
 * @throws std::out_of_range if the geometry needs more than GEODNA_MAX_CELLS cells
 */
std::vector<std::string> polyfill(const std::string &wkt, int precision, bool full = false);

} // namespace geodna
