#pragma once
#include "geoview/common.hpp"
#include "geoview/core/geometry/bbox.hpp"
#include "geoview/core/geometry/geometry_type.hpp"

namespace geoview {

namespace core {

//------------------------------------------------------------------------------
// Input
//------------------------------------------------------------------------------
struct AttributeInput {
	string name;
	// Type label reported by the producer (e.g. the DuckDB column type), carried through as-is
	string declared_type;
	// One value per row: a number, a string or NULL
	vector<Value> values;
};

// One batch of rows: a WKB blob per row and any number of row-aligned attribute columns
struct GeoArrowInput {
	vector<string> wkb_blobs;
	vector<AttributeInput> attributes;

	idx_t RowCount() const {
		return wkb_blobs.size();
	}

	void AddAttribute(string name, string declared_type, vector<Value> values);

	// Throws if an attribute column is not aligned with the WKB blobs
	void Verify() const;
};

//------------------------------------------------------------------------------
// Columns
//------------------------------------------------------------------------------
// GeoArrow geometry column with interleaved coordinates. `offsets` holds one int32 offset buffer per List level,
// outermost (row level) first; point columns have none. Each buffer has one more entry than its level has
// elements.
struct GeometryColumn {
	GeometryType type = GeometryType::UNKNOWN;
	idx_t length = 0;
	vector<vector<int32_t>> offsets;
	// x0, y0, x1, y1, ...
	vector<double> coordinates;

	idx_t CoordinateCount() const {
		return coordinates.size() / 2;
	}

	VertexXY GetCoordinate(idx_t index) const {
		D_ASSERT(index < CoordinateCount());
		return VertexXY(coordinates[index * 2], coordinates[index * 2 + 1]);
	}

	// Field names of the nested levels, outermost first, ending with the coordinate level ("xy")
	static vector<string> GetLevelNames(GeometryType type);
};

enum class AttributeType : uint8_t { FLOAT64, UTF8 };

struct AttributeColumn {
	string name;
	string declared_type;
	AttributeType type = AttributeType::FLOAT64;
	idx_t length = 0;

	// FLOAT64 payload
	vector<double> numeric_data;
	// UTF8 payload, offsets has length + 1 entries
	vector<int32_t> string_offsets;
	vector<char> string_data;

	double GetDouble(idx_t row) const;
	string GetString(idx_t row) const;
};

//------------------------------------------------------------------------------
// Table
//------------------------------------------------------------------------------
struct GeoArrowField {
	static constexpr const char *EXTENSION_NAME_KEY = "ARROW:extension:name";
	static constexpr const char *EXTENSION_METADATA_KEY = "ARROW:extension:metadata";

	string name;
	// Arrow C data interface format string of the top-level type ("+l", "+w:2", "g", "u")
	string format;
	bool nullable = true;
	vector<std::pair<string, string>> metadata;

	bool HasMetadata(const string &key) const;
	// Empty string if the key is absent
	string GetMetadata(const string &key) const;
};

// An immutable record batch: one geometry column followed by the attribute columns
class GeoArrowTable {
public:
	static constexpr const char *GEOMETRY_FIELD_NAME = "geometry";

	GeoArrowTable(GeometryColumn geometry, vector<AttributeColumn> attributes, string extension_metadata);

	idx_t RowCount() const {
		return geometry.length;
	}
	idx_t ColumnCount() const {
		return 1 + attributes.size();
	}
	const vector<GeoArrowField> &Schema() const {
		return schema;
	}
	const GeometryColumn &GetGeometry() const {
		return geometry;
	}
	const vector<AttributeColumn> &GetAttributes() const {
		return attributes;
	}
	// Throws if there is no attribute with this name
	const AttributeColumn &GetAttribute(const string &name) const;

	// Bitwise comparison of every buffer and of the schema
	bool Equals(const GeoArrowTable &other) const;

private:
	vector<GeoArrowField> schema;
	GeometryColumn geometry;
	vector<AttributeColumn> attributes;
};

//------------------------------------------------------------------------------
// Result
//------------------------------------------------------------------------------
struct GeoArrowResult {
	shared_ptr<const GeoArrowTable> table;
	GeometryType geometry_type = GeometryType::UNKNOWN;
	// Union of every accepted coordinate of the batch, shared by all results of that batch
	BoundsTracker bounds;
	// Table row -> row of the input batch
	vector<idx_t> source_indices;

	string GetGeometryTypeName() const {
		return GeometryTypes::GetGeoArrowName(geometry_type);
	}
};

// Row-level outcome counters of one batch
struct BatchStatistics {
	idx_t row_count = 0;
	idx_t accepted_count = 0;
	// Rows whose WKB could not be decoded
	idx_t malformed_count = 0;
	// Rows that decoded to an unsupported type (e.g. GeometryCollection), or to another type than the known one
	idx_t unsupported_count = 0;
};

} // namespace core

} // namespace geoview
