#include "catch.hpp"
#include "geoview/core/geoarrow/geoarrow_builder.hpp"
#include "helpers/wkb_builder.hpp"

using namespace geoview;
using namespace geoview::core;
using geoview::test::WKBBuilder;

static const char *CRS84_METADATA = R"({"crs":{"type":"name","properties":{"name":"urn:ogc:def:crs:OGC:1.3:CRS84"}}})";

TEST_CASE("A single point becomes one point table", "[geoarrow]") {
	GeoArrowInput input;
	input.wkb_blobs.push_back(WKBBuilder::Point(1.5, 2.5));

	BatchStatistics stats;
	auto results = GeoArrowBuilder::Build(input, GeoArrowOptions(), &stats);
	REQUIRE(results.size() == 1);

	auto &result = results[0];
	REQUIRE(result.geometry_type == GeometryType::POINT);
	REQUIRE(result.GetGeometryTypeName() == "point");
	REQUIRE(result.table->RowCount() == 1);
	REQUIRE(result.table->ColumnCount() == 1);
	REQUIRE(result.source_indices == vector<idx_t>({0}));

	auto bounds = result.bounds.ToArray();
	REQUIRE(bounds[0] == 1.5);
	REQUIRE(bounds[1] == 2.5);
	REQUIRE(bounds[2] == 1.5);
	REQUIRE(bounds[3] == 2.5);

	REQUIRE(stats.row_count == 1);
	REQUIRE(stats.accepted_count == 1);
	REQUIRE(stats.malformed_count == 0);
}

TEST_CASE("The geometry field carries the GeoArrow extension metadata", "[geoarrow]") {
	REQUIRE(GeoArrowBuilder::GetExtensionMetadata() == CRS84_METADATA);

	GeoArrowInput input;
	input.wkb_blobs.push_back(WKBBuilder::Polygon({{{0, 0}, {1, 0}, {1, 1}, {0, 0}}}));
	input.AddAttribute("name", "VARCHAR", {Value("square")});
	input.AddAttribute("area", "DOUBLE", {Value::DOUBLE(0.5)});

	auto results = GeoArrowBuilder::Build(input);
	REQUIRE(results.size() == 1);
	auto &schema = results[0].table->Schema();
	REQUIRE(schema.size() == 3);

	auto &geometry = schema[0];
	REQUIRE(geometry.name == "geometry");
	REQUIRE(geometry.format == "+l");
	REQUIRE(!geometry.nullable);
	REQUIRE(geometry.GetMetadata(GeoArrowField::EXTENSION_NAME_KEY) == "geoarrow.polygon");
	REQUIRE(geometry.GetMetadata(GeoArrowField::EXTENSION_METADATA_KEY) == CRS84_METADATA);

	REQUIRE(schema[1].name == "name");
	REQUIRE(schema[1].format == "u");
	REQUIRE(schema[1].nullable);
	REQUIRE(!schema[1].HasMetadata(GeoArrowField::EXTENSION_NAME_KEY));
	REQUIRE(schema[2].name == "area");
	REQUIRE(schema[2].format == "g");
}

TEST_CASE("Mixed batches split into groups with shared bounds", "[geoarrow]") {
	GeoArrowInput input;
	input.wkb_blobs.push_back(WKBBuilder::Point(0, 0));
	input.wkb_blobs.push_back(WKBBuilder::LineString({{10, 10}, {20, -5}}));
	input.wkb_blobs.push_back(WKBBuilder::Point(1, 1));
	input.wkb_blobs.push_back(WKBBuilder::LineString({{-3, 2}, {0, 0}}));
	input.wkb_blobs.push_back(WKBBuilder::Point(2, 2));

	auto results = GeoArrowBuilder::Build(input);
	REQUIRE(results.size() == 2);

	REQUIRE(results[0].geometry_type == GeometryType::POINT);
	REQUIRE(results[0].table->RowCount() == 3);
	REQUIRE(results[0].source_indices == vector<idx_t>({0, 2, 4}));

	REQUIRE(results[1].geometry_type == GeometryType::LINESTRING);
	REQUIRE(results[1].table->RowCount() == 2);
	REQUIRE(results[1].source_indices == vector<idx_t>({1, 3}));

	// Both groups report the union of all coordinates
	for (auto &result : results) {
		auto bounds = result.bounds.ToArray();
		REQUIRE(bounds[0] == -3);
		REQUIRE(bounds[1] == -5);
		REQUIRE(bounds[2] == 20);
		REQUIRE(bounds[3] == 10);
	}
	REQUIRE(results[0].bounds.box == results[1].bounds.box);
}

TEST_CASE("Undecodable and unsupported rows are dropped", "[geoarrow]") {
	GeoArrowInput input;
	input.wkb_blobs.push_back(WKBBuilder::Point(1, 1));
	input.wkb_blobs.push_back(string("\x01\x01\x00", 3));
	input.wkb_blobs.push_back(WKBBuilder::Collection(7, {WKBBuilder::Point(100, 100)}));
	input.wkb_blobs.push_back(string());
	input.wkb_blobs.push_back(WKBBuilder::Point(2, 2));
	input.AddAttribute("id", "INTEGER",
	                   {Value::INTEGER(0), Value::INTEGER(1), Value::INTEGER(2), Value::INTEGER(3), Value::INTEGER(4)});

	BatchStatistics stats;
	auto results = GeoArrowBuilder::Build(input, GeoArrowOptions(), &stats);
	REQUIRE(results.size() == 1);
	REQUIRE(results[0].source_indices == vector<idx_t>({0, 4}));
	REQUIRE(results[0].table->GetAttribute("id").numeric_data == vector<double>({0, 4}));

	auto bounds = results[0].bounds.ToArray();
	REQUIRE(bounds[2] == 2);
	REQUIRE(bounds[3] == 2);

	REQUIRE(stats.row_count == 5);
	REQUIRE(stats.accepted_count == 2);
	REQUIRE(stats.malformed_count == 2);
	REQUIRE(stats.unsupported_count == 1);
}

TEST_CASE("Empty batches yield no tables", "[geoarrow]") {
	GeoArrowInput input;
	REQUIRE(GeoArrowBuilder::Build(input).empty());

	input.wkb_blobs.push_back(string("\x01\x01\x00", 3));
	REQUIRE(GeoArrowBuilder::Build(input).empty());
}

TEST_CASE("Attribute columns follow each group's rows", "[geoarrow]") {
	GeoArrowInput input;
	vector<Value> names;
	vector<Value> scores;
	for (idx_t i = 0; i < 6; i++) {
		if (i % 3 == 0) {
			input.wkb_blobs.push_back(WKBBuilder::LineString({{double(i), 0}, {double(i), 1}}));
		} else {
			input.wkb_blobs.push_back(WKBBuilder::Point(double(i), double(i)));
		}
		names.push_back(Value("row" + std::to_string(i)));
		scores.push_back(Value::DOUBLE(i * 1.5));
	}
	input.AddAttribute("name", "VARCHAR", names);
	input.AddAttribute("score", "DOUBLE", scores);

	auto results = GeoArrowBuilder::Build(input);
	REQUIRE(results.size() == 2);
	for (auto &result : results) {
		auto &name = result.table->GetAttribute("name");
		auto &score = result.table->GetAttribute("score");
		REQUIRE(name.length == result.source_indices.size());
		for (idx_t i = 0; i < result.source_indices.size(); i++) {
			auto source = result.source_indices[i];
			REQUIRE(name.GetString(i) == names[source].ToString());
			REQUIRE(score.GetDouble(i) == scores[source].GetValue<double>());
		}
	}
}

TEST_CASE("Identical input gives identical tables", "[geoarrow]") {
	GeoArrowInput input;
	input.wkb_blobs.push_back(WKBBuilder::MultiPolygon({{{{0, 0}, {1, 0}, {1, 1}, {0, 0}}}}));
	input.wkb_blobs.push_back(WKBBuilder::MultiLineString({{{0, 0}, {1, 1}}}));
	input.wkb_blobs.push_back(WKBBuilder::MultiPoint({{5, 5}}));
	input.wkb_blobs.push_back(WKBBuilder::MultiPolygon({{{{2, 2}, {3, 2}, {3, 3}, {2, 2}}}}));
	input.AddAttribute("label", "VARCHAR", {Value("a"), Value(), Value("c"), Value("d")});

	auto first = GeoArrowBuilder::Build(input);
	auto second = GeoArrowBuilder::Build(input);
	REQUIRE(first.size() == 3);
	REQUIRE(first.size() == second.size());
	for (idx_t i = 0; i < first.size(); i++) {
		REQUIRE(first[i].geometry_type == second[i].geometry_type);
		REQUIRE(first[i].source_indices == second[i].source_indices);
		REQUIRE(first[i].table->Equals(*second[i].table));
	}
	REQUIRE(!first[0].table->Equals(*first[1].table));
}

TEST_CASE("A known geometry type skips classification", "[geoarrow]") {
	GeoArrowInput input;
	input.wkb_blobs.push_back(WKBBuilder::Polygon({{{0, 0}, {1, 0}, {1, 1}, {0, 0}}}));
	input.wkb_blobs.push_back(WKBBuilder::Point(50, 50));
	input.wkb_blobs.push_back(string("\x01", 1));
	input.wkb_blobs.push_back(WKBBuilder::Polygon({{{2, 2}, {3, 2}, {3, 3}, {2, 2}}}));

	GeoArrowOptions options;
	options.known_type = GeometryType::POLYGON;
	BatchStatistics stats;
	auto results = GeoArrowBuilder::Build(input, options, &stats);

	REQUIRE(results.size() == 1);
	auto &result = results[0];
	REQUIRE(result.geometry_type == GeometryType::POLYGON);
	REQUIRE(result.table->RowCount() == 4);
	REQUIRE(result.source_indices == vector<idx_t>({0, 1, 2, 3}));
	REQUIRE(result.table->GetGeometry().offsets[0] == vector<int32_t>({0, 1, 1, 1, 2}));

	// The point never made it into the table, so it does not count towards the bounds
	auto bounds = result.bounds.ToArray();
	REQUIRE(bounds[2] == 3);
	REQUIRE(bounds[3] == 3);

	REQUIRE(stats.accepted_count == 2);
	REQUIRE(stats.malformed_count == 1);
	REQUIRE(stats.unsupported_count == 1);
}

TEST_CASE("Misaligned input is rejected", "[geoarrow]") {
	GeoArrowInput input;
	input.wkb_blobs.push_back(WKBBuilder::Point(1, 1));
	input.AddAttribute("id", "INTEGER", {Value::INTEGER(1), Value::INTEGER(2)});
	REQUIRE_THROWS_AS(GeoArrowBuilder::Build(input), InvalidInputException);

	GeoArrowInput reserved;
	reserved.wkb_blobs.push_back(WKBBuilder::Point(1, 1));
	reserved.AddAttribute("geometry", "VARCHAR", {Value("x")});
	REQUIRE_THROWS_AS(GeoArrowBuilder::Build(reserved), InvalidInputException);

	GeoArrowOptions options;
	options.attribute_sample_size = 0;
	REQUIRE_THROWS_AS(GeoArrowBuilder::Build(GeoArrowInput(), options), InvalidInputException);
}
