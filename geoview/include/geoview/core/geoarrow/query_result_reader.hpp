#pragma once
#include "geoview/common.hpp"
#include "geoview/core/geoarrow/geoarrow_options.hpp"
#include "geoview/core/geoarrow/geoarrow_table.hpp"
#include "geoview/core/geoarrow/geometry_column_detector.hpp"

#include "duckdb/main/materialized_query_result.hpp"

namespace geoview {

namespace core {

// Turns a materialized DuckDB result into a GeoArrowInput batch: the geometry column becomes the WKB blobs, every
// other column an attribute column labelled with its DuckDB type.
struct QueryResultReader {
	// `geometry_column` names the geometry column explicitly, when empty it is detected. Throws an
	// InvalidInputException if the result holds an error, if there is no geometry column, or if the geometry
	// column holds DuckDB GEOMETRY values (these have to be selected through ST_AsWKB).
	static GeoArrowInput Read(MaterializedQueryResult &result, const string &geometry_column = string());

	// Read the result and build its GeoArrow tables with the options of the connection's settings
	static vector<GeoArrowResult> Build(ClientContext &context, MaterializedQueryResult &result,
	                                    const string &geometry_column = string(), BatchStatistics *stats = nullptr);

	// Index of the geometry column, detected from the schema and then from the first row
	static idx_t FindGeometryColumn(MaterializedQueryResult &result, GeometryEncoding *encoding = nullptr);

	// WKB bytes of a BLOB or hex encoded VARCHAR value. NULL, DuckDB GEOMETRY values and anything else give an
	// empty blob, which the decoder rejects.
	static string ToWKB(const Value &value);
};

} // namespace core

} // namespace geoview
