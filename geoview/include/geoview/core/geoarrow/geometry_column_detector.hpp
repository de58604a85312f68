#pragma once
#include "geoview/common.hpp"

namespace geoview {

namespace core {

// How the values of a geometry column are encoded. DUCKDB_GEOMETRY is the spatial extension's internal
// serialization, a BLOB aliased as GEOMETRY, which is not WKB.
enum class GeometryEncoding : uint8_t { UNKNOWN = 0, WKB, HEX_WKB, WKT, GEOJSON, DUCKDB_GEOMETRY };

// Picks the column of a result set that holds geometries, first from the schema alone and, failing that, by
// looking at the values of a sample row. Both return DConstants::INVALID_INDEX when nothing qualifies.
struct GeometryColumnDetector {
	static constexpr const char *DUCKDB_GEOMETRY_ALIAS = "GEOMETRY";

	// In order of priority:
	//  1. the type name contains a geometry keyword (GEOMETRY, POINT, WKB, ...)
	//  2. a well-known geometry column name with a binary type
	//  3. a well-known geometry column name
	//  4. a name containing a geometry hint (geom, shape, ...) with a binary type
	//  5. a name containing a geometry hint
	static idx_t FindGeometryColumn(const vector<string> &names, const vector<string> &type_names);

	// Binary columns holding WKB first, then any column holding WKB, hex encoded WKB, WKT or a GeoJSON geometry.
	// `row` holds one value per column.
	static idx_t FindGeometryColumnFromRow(const vector<string> &names, const vector<string> &type_names,
	                                       const vector<Value> &row, GeometryEncoding *encoding = nullptr);

	// The encoding of a single value, UNKNOWN if it does not look like a geometry
	static GeometryEncoding SniffValue(const Value &value);

	static bool IsBinaryType(const string &type_name);
	static bool IsDuckDBGeometryType(const LogicalType &type);
	static bool IsWKT(const string &text);
	// A JSON object with a GeoJSON geometry "type" and non-null "coordinates"
	static bool IsGeoJSONGeometry(const string &text);
};

} // namespace core

} // namespace geoview
