#include "geodna/geometry.hpp"
#include "geodna/geodna.hpp"

#include <geos/geom/Envelope.h>
#include <geos/geom/Geometry.h>
#include <geos/io/WKTReader.h>
#include <geos/util/GEOSException.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace geodna {

std::string boundingBoxWkt(const std::string &code) {
    BBox bound;
    boundingBox(code, bound);

    std::ostringstream wkt;
    wkt.precision(16);
    wkt << "POLYGON(("
        << bound.west << " " << bound.south << ", "
        << bound.east << " " << bound.south << ", "
        << bound.east << " " << bound.north << ", "
        << bound.west << " " << bound.north << ", "
        << bound.west << " " << bound.south << "))";
    return wkt.str();
}

std::string pointWkt(const std::string &code) {
    LatLng point;
    decode(code, point);

    std::ostringstream wkt;
    wkt.precision(16);
    wkt << "POINT(" << point.lng << " " << point.lat << ")";
    return wkt.str();
}

static std::unique_ptr<geos::geom::Geometry> _read_wkt(geos::io::WKTReader &reader, const std::string &wkt) {
    try {
        std::unique_ptr<geos::geom::Geometry> geom = reader.read(wkt);
        if (!geom) {
            throw InvalidInputException("Failed to read geometry from WKT");
        }
        return geom;
    } catch (const geos::util::GEOSException &e) {
        throw InvalidInputException(std::string("Invalid WKT: ") + e.what());
    }
}

// Share of `cell` covered by `geometry`.
static double _cover_ratio(const geos::geom::Geometry &cell, const geos::geom::Geometry &geometry) {
    double cell_area = cell.getArea();
    if (cell_area == 0) {
        throw std::runtime_error("Cell area is zero, cannot calculate area ratio");
    }
    std::unique_ptr<geos::geom::Geometry> intersection = geometry.intersection(&cell);
    return intersection->getArea() / cell_area;
}

double areaRatio(const std::string &a, const std::string &b) {
    geos::io::WKTReader reader;
    std::unique_ptr<geos::geom::Geometry> geom_a = _read_wkt(reader, boundingBoxWkt(a));
    std::unique_ptr<geos::geom::Geometry> geom_b = _read_wkt(reader, boundingBoxWkt(b));
    return _cover_ratio(*geom_a, *geom_b);
}

// Upper bound on the cells of `precision` over the envelope of `geometry`.
static double _count_max_cells(const geos::geom::Geometry &geometry, int precision) {
    const geos::geom::Envelope *envelope = geometry.getEnvelopeInternal();
    if (envelope->isNull()) {
        return 0;
    }
    double cell_width = 360.0 / std::pow(2.0, precision);
    double cell_height = 180.0 / std::pow(2.0, precision - 1);

    double x_count = std::ceil(envelope->getWidth() / cell_width) + 1;
    double y_count = std::ceil(envelope->getHeight() / cell_height) + 1;
    return x_count * y_count;
}

std::vector<std::string> polyfill(const std::string &wkt, int precision, bool full) {
    // Validate input parameters
    if (precision < 1) {
        throw InvalidPrecisionException("Precision must be at least 1, got " + std::to_string(precision));
    }

    geos::io::WKTReader reader;
    std::unique_ptr<geos::geom::Geometry> geometry = _read_wkt(reader, wkt);

    double max_cells = _count_max_cells(*geometry, precision);
    if (max_cells > GEODNA_MAX_CELLS) {
        throw std::out_of_range("The area is too big or the precision is too high");
    }
    const geos::geom::Envelope *envelope = geometry->getEnvelopeInternal();

    // Depth first; `second` is true once a cell is known to lie inside.
    std::vector<std::pair<std::string, bool>> queue;
    queue.push_back(std::make_pair(std::string("w"), false));
    queue.push_back(std::make_pair(std::string("e"), false));

    std::vector<std::string> contained;
    std::vector<std::string> below;
    while (!queue.empty()) {
        std::pair<std::string, bool> current = queue.back();
        queue.pop_back();
        const std::string &key = current.first;
        bool inside = current.second;

        if (!inside) {
            BBox bound;
            boundingBox(key, bound);
            geos::geom::Envelope cell_envelope(bound.west, bound.east, bound.south, bound.north);
            if (!envelope->intersects(cell_envelope)) {
                continue;
            }

            std::unique_ptr<geos::geom::Geometry> cell = _read_wkt(reader, boundingBoxWkt(key));
            double ratio = _cover_ratio(*cell, *geometry);
            if (ratio == 0) {
                continue;
            }
            if (ratio >= 1.0) {
                inside = true;
            } else if (key.size() == static_cast<size_t>(precision)) {
                if (full || ratio > 0.5) {
                    contained.push_back(key);
                }
                continue;
            }
        }

        if (key.size() >= static_cast<size_t>(precision)) {
            contained.push_back(key);
            continue;
        }

        below.clear();
        children(key, below);
        for (auto it = below.rbegin(); it != below.rend(); ++it) {
            queue.push_back(std::make_pair(*it, inside));
        }
    }

    spdlog::debug("geodna polyfill at precision {}: {} cells (estimate {})", precision, contained.size(),
                  max_cells);
    return contained;
}

} // namespace geodna
