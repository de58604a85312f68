#include "catch.hpp"
#include "geoview/core/geoarrow/geometry_column_builder.hpp"

using namespace geoview;
using namespace geoview::core;

static void RequireValidOffsets(const GeometryColumn &column) {
	idx_t length = column.length;
	for (auto &offsets : column.offsets) {
		REQUIRE(offsets.size() == length + 1);
		REQUIRE(offsets[0] == 0);
		for (idx_t i = 1; i < offsets.size(); i++) {
			REQUIRE(offsets[i - 1] <= offsets[i]);
		}
		length = static_cast<idx_t>(offsets.back());
	}
	REQUIRE(length == column.CoordinateCount());
}

static Geometry Ring(const vector<VertexXY> &vertices) {
	return LineString::Create(vertices);
}

TEST_CASE("Point columns", "[builder]") {
	BoundsTracker bounds;
	vector<Geometry> points = {Point::Create(1, 2), Point::CreateEmpty(), Point::Create(-3, 4)};
	auto column = GeometryColumnBuilder::Build(GeometryType::POINT, points, bounds);

	REQUIRE(column.length == 3);
	REQUIRE(column.offsets.empty());
	REQUIRE(column.CoordinateCount() == 3);
	REQUIRE(column.GetCoordinate(0) == VertexXY(1, 2));
	REQUIRE(column.GetCoordinate(1).IsNaN());
	REQUIRE(column.GetCoordinate(2) == VertexXY(-3, 4));

	auto box = bounds.ToArray();
	REQUIRE(box[0] == -3);
	REQUIRE(box[1] == 2);
	REQUIRE(box[2] == 1);
	REQUIRE(box[3] == 4);
}

TEST_CASE("LineString and MultiPoint columns", "[builder]") {
	BoundsTracker bounds;

	vector<Geometry> lines = {LineString::Create({VertexXY(0, 0), VertexXY(1, 1), VertexXY(2, 0)}),
	                          LineString::Create({}), LineString::Create({VertexXY(5, 5), VertexXY(6, 6)})};
	auto line_column = GeometryColumnBuilder::Build(GeometryType::LINESTRING, lines, bounds);
	RequireValidOffsets(line_column);
	REQUIRE(line_column.offsets[0] == vector<int32_t>({0, 3, 3, 5}));

	vector<Geometry> multi_points = {MultiPoint::Create({Point::Create(1, 1), Point::Create(2, 2)}),
	                                 MultiPoint::Create({Point::Create(3, 3)})};
	auto point_column = GeometryColumnBuilder::Build(GeometryType::MULTIPOINT, multi_points, bounds);
	RequireValidOffsets(point_column);
	REQUIRE(point_column.offsets[0] == vector<int32_t>({0, 2, 3}));
	REQUIRE(point_column.coordinates == vector<double>({1, 1, 2, 2, 3, 3}));

	// Bounds are shared across both builds
	auto box = bounds.ToArray();
	REQUIRE(box[0] == 0);
	REQUIRE(box[1] == 0);
	REQUIRE(box[2] == 6);
	REQUIRE(box[3] == 6);
}

TEST_CASE("Polygon and MultiLineString columns", "[builder]") {
	BoundsTracker bounds;

	auto shell = Ring({VertexXY(0, 0), VertexXY(4, 0), VertexXY(4, 4), VertexXY(0, 0)});
	auto hole = Ring({VertexXY(1, 1), VertexXY(2, 1), VertexXY(1, 1)});
	vector<Geometry> polygons = {Polygon::Create({shell, hole}), Polygon::Create({}), Polygon::Create({shell})};
	auto polygon_column = GeometryColumnBuilder::Build(GeometryType::POLYGON, polygons, bounds);
	RequireValidOffsets(polygon_column);
	REQUIRE(polygon_column.offsets[0] == vector<int32_t>({0, 2, 2, 3}));
	REQUIRE(polygon_column.offsets[1] == vector<int32_t>({0, 4, 7, 11}));

	vector<Geometry> multi_lines = {MultiLineString::Create({hole, shell})};
	auto line_column = GeometryColumnBuilder::Build(GeometryType::MULTILINESTRING, multi_lines, bounds);
	RequireValidOffsets(line_column);
	REQUIRE(line_column.offsets[0] == vector<int32_t>({0, 2}));
	REQUIRE(line_column.offsets[1] == vector<int32_t>({0, 3, 7}));
	REQUIRE(line_column.GetCoordinate(3) == VertexXY(0, 0));
}

TEST_CASE("MultiPolygon columns", "[builder]") {
	BoundsTracker bounds;

	auto a = Polygon::Create({Ring({VertexXY(0, 0), VertexXY(1, 0), VertexXY(0, 0)})});
	auto b = Polygon::Create({Ring({VertexXY(5, 5), VertexXY(6, 5), VertexXY(6, 6), VertexXY(5, 5)}),
	                          Ring({VertexXY(5.5, 5.5), VertexXY(5.6, 5.5), VertexXY(5.5, 5.5)})});
	vector<Geometry> multi_polygons = {MultiPolygon::Create({a, b}), MultiPolygon::Create({}),
	                                   MultiPolygon::Create({b})};
	auto column = GeometryColumnBuilder::Build(GeometryType::MULTIPOLYGON, multi_polygons, bounds);

	RequireValidOffsets(column);
	REQUIRE(column.offsets.size() == 3);
	REQUIRE(column.offsets[0] == vector<int32_t>({0, 2, 2, 3}));
	REQUIRE(column.offsets[1] == vector<int32_t>({0, 1, 3, 5}));
	REQUIRE(column.offsets[2] == vector<int32_t>({0, 3, 7, 10, 14, 17}));
	REQUIRE(column.CoordinateCount() == 17);

	auto box = bounds.ToArray();
	REQUIRE(box[2] == 6);
	REQUIRE(box[3] == 6);
}

TEST_CASE("Rows of another type get empty slices", "[builder]") {
	BoundsTracker bounds;
	vector<Geometry> mixed = {LineString::Create({VertexXY(0, 0), VertexXY(1, 1)}), Point::Create(100, 100),
	                          Geometry()};

	auto line_column = GeometryColumnBuilder::Build(GeometryType::LINESTRING, mixed, bounds);
	RequireValidOffsets(line_column);
	REQUIRE(line_column.offsets[0] == vector<int32_t>({0, 2, 2, 2}));

	auto point_column = GeometryColumnBuilder::Build(GeometryType::POINT, mixed, bounds);
	REQUIRE(point_column.CoordinateCount() == 3);
	REQUIRE(point_column.GetCoordinate(0).IsNaN());
	REQUIRE(point_column.GetCoordinate(1) == VertexXY(100, 100));
	REQUIRE(point_column.GetCoordinate(2).IsNaN());
}

TEST_CASE("Building an UNKNOWN column is an error", "[builder]") {
	BoundsTracker bounds;
	vector<Geometry> geometries;
	REQUIRE_THROWS_AS(GeometryColumnBuilder::Build(GeometryType::UNKNOWN, geometries, bounds), InternalException);
}

TEST_CASE("Empty groups produce valid empty columns", "[builder]") {
	BoundsTracker bounds;
	vector<Geometry> geometries;
	auto column = GeometryColumnBuilder::Build(GeometryType::POLYGON, geometries, bounds);
	REQUIRE(column.length == 0);
	REQUIRE(column.offsets[0] == vector<int32_t>({0}));
	REQUIRE(column.offsets[1] == vector<int32_t>({0}));
	REQUIRE(bounds.IsEmpty());
}
