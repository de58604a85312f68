#include "catch.hpp"
#include "geoview/core/geoarrow/geoarrow_builder.hpp"
#include "geoview/core/geoarrow/query_result_reader.hpp"
#include "helpers/duckdb_geometry.hpp"
#include "helpers/wkb_builder.hpp"

#include "duckdb/main/connection.hpp"
#include "duckdb/main/extension_util.hpp"

using namespace geoview;
using namespace geoview::core;
using geoview::test::WKBBuilder;

static string HexLiteral(const string &wkb) {
	return "'" + WKBBuilder::ToHex(wkb) + "'";
}

TEST_CASE("Query results with a WKB column", "[bridge]") {
	DuckDB db(nullptr);
	Connection con(db);

	auto point = WKBBuilder::Point(1.5, 2.5);
	auto line = WKBBuilder::LineString({{0, 0}, {3, 4}});
	auto result = con.Query("SELECT * FROM (VALUES (1, 'a', from_hex(" + HexLiteral(point) + ")), (2, 'b', from_hex(" +
	                        HexLiteral(line) + ")), (3, NULL, NULL)) t(id, name, geom) ORDER BY id");
	REQUIRE(!result->HasError());

	GeometryEncoding encoding = GeometryEncoding::UNKNOWN;
	REQUIRE(QueryResultReader::FindGeometryColumn(*result, &encoding) == 2);
	REQUIRE(encoding == GeometryEncoding::WKB);

	auto input = QueryResultReader::Read(*result);
	REQUIRE(input.RowCount() == 3);
	REQUIRE(input.wkb_blobs[0] == point);
	REQUIRE(input.wkb_blobs[1] == line);
	REQUIRE(input.wkb_blobs[2].empty());

	REQUIRE(input.attributes.size() == 2);
	REQUIRE(input.attributes[0].name == "id");
	REQUIRE(input.attributes[0].declared_type == "INTEGER");
	REQUIRE(input.attributes[1].name == "name");
	REQUIRE(input.attributes[1].declared_type == "VARCHAR");
	REQUIRE(input.attributes[1].values[2].IsNull());

	BatchStatistics stats;
	auto tables = GeoArrowBuilder::Build(input, GeoArrowOptions(), &stats);
	REQUIRE(tables.size() == 2);
	REQUIRE(tables[0].geometry_type == GeometryType::POINT);
	REQUIRE(tables[1].geometry_type == GeometryType::LINESTRING);
	REQUIRE(tables[1].table->GetAttribute("id").GetDouble(0) == 2);
	REQUIRE(stats.malformed_count == 1);
}

TEST_CASE("Query results with a hex WKB column", "[bridge]") {
	DuckDB db(nullptr);
	Connection con(db);

	auto wkb = WKBBuilder::Point(3, 4);
	auto result = con.Query("SELECT 7 AS id, " + HexLiteral(wkb) + " AS wkb_hex");
	REQUIRE(!result->HasError());

	GeometryEncoding encoding = GeometryEncoding::UNKNOWN;
	REQUIRE(QueryResultReader::FindGeometryColumn(*result, &encoding) == 1);
	REQUIRE(encoding == GeometryEncoding::HEX_WKB);

	auto input = QueryResultReader::Read(*result);
	REQUIRE(input.wkb_blobs[0] == wkb);
}

TEST_CASE("Query results probed by their first row", "[bridge]") {
	DuckDB db(nullptr);
	Connection con(db);

	auto wkb = WKBBuilder::Polygon({{{0, 0}, {1, 0}, {1, 1}, {0, 0}}});
	auto result = con.Query("SELECT 'x' AS label, from_hex(" + HexLiteral(wkb) + ") AS payload");
	REQUIRE(!result->HasError());
	REQUIRE(QueryResultReader::FindGeometryColumn(*result) == 1);

	auto tables = GeoArrowBuilder::Build(QueryResultReader::Read(*result));
	REQUIRE(tables.size() == 1);
	REQUIRE(tables[0].geometry_type == GeometryType::POLYGON);
}

TEST_CASE("Query results with an explicit geometry column", "[bridge]") {
	DuckDB db(nullptr);
	Connection con(db);

	auto wkb = WKBBuilder::Point(1, 1);
	auto result = con.Query("SELECT from_hex(" + HexLiteral(WKBBuilder::Point(9, 9)) + ") AS geom, from_hex(" +
	                        HexLiteral(wkb) + ") AS location");
	REQUIRE(!result->HasError());

	auto input = QueryResultReader::Read(*result, "location");
	REQUIRE(input.wkb_blobs[0] == wkb);
	REQUIRE(input.attributes.size() == 1);
	REQUIRE(input.attributes[0].name == "geom");

	REQUIRE_THROWS_AS(QueryResultReader::Read(*result, "missing"), InvalidInputException);
}

TEST_CASE("Query results without a geometry column", "[bridge]") {
	DuckDB db(nullptr);
	Connection con(db);

	auto result = con.Query("SELECT 1 AS id, 'x' AS name");
	REQUIRE(!result->HasError());
	REQUIRE(QueryResultReader::FindGeometryColumn(*result) == DConstants::INVALID_INDEX);
	REQUIRE_THROWS_WITH(QueryResultReader::Read(*result), Catch::Contains("No geometry column detected"));
}

TEST_CASE("Value conversion to WKB", "[bridge]") {
	auto wkb = WKBBuilder::Point(1, 2);
	REQUIRE(QueryResultReader::ToWKB(Value::BLOB_RAW(wkb)) == wkb);
	REQUIRE(QueryResultReader::ToWKB(Value(WKBBuilder::ToHex(wkb))) == wkb);
	REQUIRE(QueryResultReader::ToWKB(Value("POINT (1 2)")).empty());
	REQUIRE(QueryResultReader::ToWKB(Value(LogicalType::BLOB)).empty());
	REQUIRE(QueryResultReader::ToWKB(Value::INTEGER(3)).empty());
	REQUIRE(QueryResultReader::ToWKB(test::DuckDBGeometryValue(test::SerializedLineString())).empty());
}

TEST_CASE("Query results with a DuckDB GEOMETRY column", "[bridge]") {
	DuckDB db(nullptr);
	ExtensionUtil::RegisterType(*db.instance, "GEOMETRY", test::DuckDBGeometryType());
	Connection con(db);

	auto wkb = WKBBuilder::Point(5, 6);
	auto result = con.Query("SELECT from_hex('" + WKBBuilder::ToHex(test::SerializedLineString()) +
	                        "')::GEOMETRY AS geom, from_hex(" + HexLiteral(wkb) + ") AS wkb");
	REQUIRE(!result->HasError());
	REQUIRE(GeometryColumnDetector::IsDuckDBGeometryType(result->types[0]));

	GeometryEncoding encoding = GeometryEncoding::UNKNOWN;
	REQUIRE(QueryResultReader::FindGeometryColumn(*result, &encoding) == 0);
	REQUIRE(encoding == GeometryEncoding::DUCKDB_GEOMETRY);
	REQUIRE_THROWS_WITH(QueryResultReader::Read(*result), Catch::Contains("ST_AsWKB(geom)"));
	REQUIRE_THROWS_AS(QueryResultReader::Read(*result, "geom"), InvalidInputException);

	// Naming the WKB column explicitly still works
	auto input = QueryResultReader::Read(*result, "wkb");
	REQUIRE(input.wkb_blobs[0] == wkb);
	REQUIRE(input.attributes.size() == 1);
	REQUIRE(input.attributes[0].name == "geom");
}
