#define DUCKDB_EXTENSION_MAIN

#include "geodna_extension.hpp"
#include "geodna/geodna.hpp"
#include "geodna/geometry.hpp"
#include "duckdb.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/main/client_context.hpp"
#include "duckdb/main/config.hpp"
#include "duckdb/main/extension_util.hpp"
#include <duckdb/parser/parsed_data/create_scalar_function_info.hpp>
#include "duckdb/execution/expression_executor.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace duckdb {

static const char *DEFAULT_PRECISION_SETTING = "geodna_default_precision";

static list_entry_t PushDoubles(Vector &result, const std::vector<double> &values) {
    list_entry_t result_entry;
    result_entry.offset = ListVector::GetListSize(result);
    for (const double &value : values) {
        ListVector::PushBack(result, Value::DOUBLE(value));
    }
    result_entry.length = values.size();
    return result_entry;
}

static list_entry_t PushCodes(Vector &result, const std::vector<std::string> &codes) {
    list_entry_t result_entry;
    result_entry.offset = ListVector::GetListSize(result);
    for (const std::string &code : codes) {
        ListVector::PushBack(result, Value(code));
    }
    result_entry.length = codes.size();
    return result_entry;
}

inline void GeodnaEncode(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &inputs = args.data[0];
    auto &inputs2 = args.data[1];
    auto &inputs3 = args.data[2];
    TernaryExecutor::Execute<double, double, int32_t, string_t>(inputs, inputs2, inputs3, result, args.size(),
        [&](double latitude, double longitude, int32_t precision) {
            try {
                return StringVector::AddString(result, geodna::encode(latitude, longitude, precision));
            } catch (const std::exception &e) {
                throw std::runtime_error(std::string("Error in geodna_encode: ") + e.what());
            }
        });
}

// geodna_encode(lat, lon): precision comes from the geodna_default_precision setting.
inline void GeodnaEncodeDefault(DataChunk &args, ExpressionState &state, Vector &result) {
    int32_t precision = GEODNA_DEFAULT_PRECISION;
    Value setting;
    if (state.GetContext().TryGetCurrentSetting(DEFAULT_PRECISION_SETTING, setting) && !setting.IsNull()) {
        precision = setting.GetValue<int32_t>();
    }

    auto &inputs = args.data[0];
    auto &inputs2 = args.data[1];
    BinaryExecutor::Execute<double, double, string_t>(inputs, inputs2, result, args.size(),
        [&](double latitude, double longitude) {
            try {
                return StringVector::AddString(result, geodna::encode(latitude, longitude, precision));
            } catch (const std::exception &e) {
                throw std::runtime_error(std::string("Error in geodna_encode: ") + e.what());
            }
        });
}

inline void GeodnaDecode(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &inputs = args.data[0];
    UnaryExecutor::Execute<string_t, list_entry_t>(inputs, result, args.size(),
        [&](string_t code) {
            geodna::LatLng point;

            try {
                geodna::decode(code.GetString(), point);
            } catch (const std::exception &e) {
                throw std::runtime_error(std::string("Error in geodna_decode: ") + e.what());
            }

            return PushDoubles(result, {point.lat, point.lng});
        });
}

inline void GeodnaBoundingBox(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &inputs = args.data[0];
    UnaryExecutor::Execute<string_t, list_entry_t>(inputs, result, args.size(),
        [&](string_t code) {
            geodna::BBox bound;

            try {
                geodna::boundingBox(code.GetString(), bound);
            } catch (const std::exception &e) {
                throw std::runtime_error(std::string("Error in geodna_bounding_box: ") + e.what());
            }

            // [lat_min, lat_max, lon_min, lon_max]
            return PushDoubles(result, {bound.south, bound.north, bound.west, bound.east});
        });
}

inline void GeodnaBoundingBoxWkt(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &inputs = args.data[0];
    UnaryExecutor::Execute<string_t, string_t>(inputs, result, args.size(),
        [&](string_t code) {
            try {
                return StringVector::AddString(result, geodna::boundingBoxWkt(code.GetString()));
            } catch (const std::exception &e) {
                throw std::runtime_error(std::string("Error in geodna_bounding_box_wkt: ") + e.what());
            }
        });
}

inline void GeodnaPointWkt(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &inputs = args.data[0];
    UnaryExecutor::Execute<string_t, string_t>(inputs, result, args.size(),
        [&](string_t code) {
            try {
                return StringVector::AddString(result, geodna::pointWkt(code.GetString()));
            } catch (const std::exception &e) {
                throw std::runtime_error(std::string("Error in geodna_point_wkt: ") + e.what());
            }
        });
}

inline void GeodnaAddVector(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &inputs = args.data[0];
    auto &inputs2 = args.data[1];
    auto &inputs3 = args.data[2];
    TernaryExecutor::Execute<string_t, double, double, list_entry_t>(inputs, inputs2, inputs3, result, args.size(),
        [&](string_t code, double dlat, double dlng) {
            geodna::LatLng point;

            try {
                point = geodna::addVector(code.GetString(), dlat, dlng);
            } catch (const std::exception &e) {
                throw std::runtime_error(std::string("Error in geodna_add_vector: ") + e.what());
            }

            return PushDoubles(result, {point.lat, point.lng});
        });
}

inline void GeodnaDistanceKm(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &inputs = args.data[0];
    auto &inputs2 = args.data[1];
    BinaryExecutor::Execute<string_t, string_t, double>(inputs, inputs2, result, args.size(),
        [&](string_t a, string_t b) {
            try {
                return geodna::distanceInKm(a.GetString(), b.GetString());
            } catch (const std::exception &e) {
                throw std::runtime_error(std::string("Error in geodna_distance_km: ") + e.what());
            }
        });
}

inline void GeodnaProject(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &inputs = args.data[0];
    auto &inputs2 = args.data[1];
    auto &inputs3 = args.data[2];
    TernaryExecutor::Execute<string_t, double, double, string_t>(inputs, inputs2, inputs3, result, args.size(),
        [&](string_t code, double bearing, double distance_km) {
            try {
                return StringVector::AddString(
                    result, geodna::pointFromPointBearingAndDistance(code.GetString(), bearing, distance_km));
            } catch (const std::exception &e) {
                throw std::runtime_error(std::string("Error in geodna_project: ") + e.what());
            }
        });
}

inline void GeodnaNeighbours(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &inputs = args.data[0];
    UnaryExecutor::Execute<string_t, list_entry_t>(inputs, result, args.size(),
        [&](string_t code) {
            std::vector<std::string> neighbours;

            try {
                neighbours = geodna::neighbours(code.GetString());
            } catch (const std::exception &e) {
                throw std::runtime_error(std::string("Error in geodna_neighbours: ") + e.what());
            }

            return PushCodes(result, neighbours);
        });
}

inline void GeodnaNeighboursWithinRadius(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &inputs = args.data[0];
    auto &inputs2 = args.data[1];
    auto &inputs3 = args.data[2];
    TernaryExecutor::Execute<string_t, double, int32_t, list_entry_t>(inputs, inputs2, inputs3, result, args.size(),
        [&](string_t code, double radius_km, int32_t precision) {
            std::vector<std::string> neighbours;

            try {
                neighbours = geodna::neighboursWithinRadius(code.GetString(), radius_km, precision);
            } catch (const std::exception &e) {
                throw std::runtime_error(std::string("Error in geodna_neighbours_within_radius: ") + e.what());
            }

            return PushCodes(result, neighbours);
        });
}

inline void GeodnaReduce(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &inputs = args.data[0];
    auto &child = ListVector::GetEntry(inputs);
    UnifiedVectorFormat child_data;
    child.ToUnifiedFormat(ListVector::GetListSize(inputs), child_data);
    auto child_codes = UnifiedVectorFormat::GetData<string_t>(child_data);

    UnaryExecutor::Execute<list_entry_t, list_entry_t>(inputs, result, args.size(),
        [&](list_entry_t list) {
            std::vector<std::string> codes;
            codes.reserve(list.length);
            for (idx_t i = list.offset; i < list.offset + list.length; i++) {
                auto idx = child_data.sel->get_index(i);
                if (!child_data.validity.RowIsValid(idx)) {
                    continue;
                }
                codes.push_back(child_codes[idx].GetString());
            }

            return PushCodes(result, geodna::reduce(codes));
        });
}

inline void GeodnaParent(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &inputs = args.data[0];
    UnaryExecutor::Execute<string_t, string_t>(inputs, result, args.size(),
        [&](string_t code) {
            return StringVector::AddString(result, geodna::parent(code.GetString()));
        });
}

inline void GeodnaChildren(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &inputs = args.data[0];
    UnaryExecutor::Execute<string_t, list_entry_t>(inputs, result, args.size(),
        [&](string_t code) {
            std::vector<std::string> children;

            try {
                geodna::children(code.GetString(), children);
            } catch (const std::exception &e) {
                throw std::runtime_error(std::string("Error in geodna_children: ") + e.what());
            }

            return PushCodes(result, children);
        });
}

inline void GeodnaAreaRatio(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &inputs = args.data[0];
    auto &inputs2 = args.data[1];
    BinaryExecutor::Execute<string_t, string_t, double>(inputs, inputs2, result, args.size(),
        [&](string_t a, string_t b) {
            try {
                return geodna::areaRatio(a.GetString(), b.GetString());
            } catch (const std::exception &e) {
                throw std::runtime_error(std::string("Error in geodna_area_ratio: ") + e.what());
            }
        });
}

static void PolyfillExecute(DataChunk &args, Vector &result, bool full) {
    auto &inputs = args.data[0];
    auto &inputs2 = args.data[1];
    BinaryExecutor::Execute<string_t, int32_t, list_entry_t>(inputs, inputs2, result, args.size(),
        [&](string_t geometry, int32_t precision) {
            std::vector<std::string> codes;

            try {
                codes = geodna::polyfill(geometry.GetString(), precision, full);
            } catch (const std::exception &e) {
                throw std::runtime_error("Error in polyfill: " + std::string(e.what()));
            }

            return PushCodes(result, codes);
        });
}

inline void GeodnaPolyfill(DataChunk &args, ExpressionState &state, Vector &result) {
    PolyfillExecute(args, result, false);
}

inline void GeodnaPolyfillFull(DataChunk &args, ExpressionState &state, Vector &result) {
    PolyfillExecute(args, result, true);
}

static void RegisterScalar(DatabaseInstance &instance, const ScalarFunction &function) {
    ExtensionUtil::RegisterFunction(instance, function);
    spdlog::debug("geodna: registered {}", function.name);
}

static void LoadInternal(DatabaseInstance &instance) {
    auto &config = DBConfig::GetConfig(instance);
    config.AddExtensionOption(DEFAULT_PRECISION_SETTING, "Precision used by geodna_encode(lat, lon)",
                              LogicalType::INTEGER, Value::INTEGER(GEODNA_DEFAULT_PRECISION));

    ScalarFunctionSet geodna_encode_set("geodna_encode");
    geodna_encode_set.AddFunction(ScalarFunction({LogicalType::DOUBLE, LogicalType::DOUBLE}, LogicalType::VARCHAR, GeodnaEncodeDefault));
    geodna_encode_set.AddFunction(ScalarFunction({LogicalType::DOUBLE, LogicalType::DOUBLE, LogicalType::INTEGER}, LogicalType::VARCHAR, GeodnaEncode));
    ExtensionUtil::RegisterFunction(instance, geodna_encode_set);

    RegisterScalar(instance, ScalarFunction("geodna_decode", {LogicalType::VARCHAR}, LogicalType::LIST(LogicalType::DOUBLE), GeodnaDecode));
    RegisterScalar(instance, ScalarFunction("geodna_bounding_box", {LogicalType::VARCHAR}, LogicalType::LIST(LogicalType::DOUBLE), GeodnaBoundingBox));
    RegisterScalar(instance, ScalarFunction("geodna_bounding_box_wkt", {LogicalType::VARCHAR}, LogicalType::VARCHAR, GeodnaBoundingBoxWkt));
    RegisterScalar(instance, ScalarFunction("geodna_point_wkt", {LogicalType::VARCHAR}, LogicalType::VARCHAR, GeodnaPointWkt));
    RegisterScalar(instance, ScalarFunction("geodna_add_vector", {LogicalType::VARCHAR, LogicalType::DOUBLE, LogicalType::DOUBLE}, LogicalType::LIST(LogicalType::DOUBLE), GeodnaAddVector));
    RegisterScalar(instance, ScalarFunction("geodna_distance_km", {LogicalType::VARCHAR, LogicalType::VARCHAR}, LogicalType::DOUBLE, GeodnaDistanceKm));
    RegisterScalar(instance, ScalarFunction("geodna_project", {LogicalType::VARCHAR, LogicalType::DOUBLE, LogicalType::DOUBLE}, LogicalType::VARCHAR, GeodnaProject));
    RegisterScalar(instance, ScalarFunction("geodna_neighbours", {LogicalType::VARCHAR}, LogicalType::LIST(LogicalType::VARCHAR), GeodnaNeighbours));
    RegisterScalar(instance, ScalarFunction("geodna_neighbours_within_radius", {LogicalType::VARCHAR, LogicalType::DOUBLE, LogicalType::INTEGER}, LogicalType::LIST(LogicalType::VARCHAR), GeodnaNeighboursWithinRadius));
    RegisterScalar(instance, ScalarFunction("geodna_reduce", {LogicalType::LIST(LogicalType::VARCHAR)}, LogicalType::LIST(LogicalType::VARCHAR), GeodnaReduce));
    RegisterScalar(instance, ScalarFunction("geodna_parent", {LogicalType::VARCHAR}, LogicalType::VARCHAR, GeodnaParent));
    RegisterScalar(instance, ScalarFunction("geodna_children", {LogicalType::VARCHAR}, LogicalType::LIST(LogicalType::VARCHAR), GeodnaChildren));
    RegisterScalar(instance, ScalarFunction("geodna_area_ratio", {LogicalType::VARCHAR, LogicalType::VARCHAR}, LogicalType::DOUBLE, GeodnaAreaRatio));
    RegisterScalar(instance, ScalarFunction("geodna_polyfill", {LogicalType::VARCHAR, LogicalType::INTEGER}, LogicalType::LIST(LogicalType::VARCHAR), GeodnaPolyfill));
    RegisterScalar(instance, ScalarFunction("geodna_polyfill_full", {LogicalType::VARCHAR, LogicalType::INTEGER}, LogicalType::LIST(LogicalType::VARCHAR), GeodnaPolyfillFull));
}

void GeodnaExtension::Load(DuckDB &db) {
	LoadInternal(*db.instance);
}
std::string GeodnaExtension::Name() {
	return "geodna";
}

std::string GeodnaExtension::Version() const {
#ifdef EXT_VERSION_GEODNA
	return EXT_VERSION_GEODNA;
#else
	return GEODNA_VERSION;
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_EXTENSION_API void geodna_init(duckdb::DatabaseInstance &db) {
    duckdb::DuckDB db_wrapper(db);
    db_wrapper.LoadExtension<duckdb::GeodnaExtension>();
}

DUCKDB_EXTENSION_API const char *geodna_version() {
	return duckdb::DuckDB::LibraryVersion();
}
}

#ifndef DUCKDB_EXTENSION_MAIN
#error DUCKDB_EXTENSION_MAIN not defined
#endif
