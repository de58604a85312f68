#include "geoview/core/geoarrow/geometry_column_detector.hpp"
#include "geoview/core/geometry/wkb_util.hpp"

#include "yyjson.h"

namespace geoview {

namespace core {

constexpr const char *GeometryColumnDetector::DUCKDB_GEOMETRY_ALIAS;

static const char *const GEOMETRY_COLUMN_NAMES[] = {"geometry", "geom",     "wkb_geometry", "the_geom",
                                                    "shape",    "geo",      "wkt_geometry", "the_geog",
                                                    "geog",     "way",      "ora_geometry"};

static const char *const GEOMETRY_TYPE_KEYWORDS[] = {"geometry",   "geography",       "wkb",
                                                     "point",      "linestring",      "polygon",
                                                     "multipoint", "multilinestring", "multipolygon",
                                                     "geometrycollection", "sdo_geometry"};

static const char *const GEOMETRY_NAME_HINTS[] = {"geom", "geometry", "geo_", "_geo",
                                                  "wkb",  "wkt",      "shape", "spatial"};

static const char *const GEOJSON_TYPES[] = {"Point",           "LineString",  "Polygon", "MultiPoint",
                                            "MultiLineString", "MultiPolygon"};

static const char *const WKT_PREFIXES[] = {"POINT",      "LINESTRING",      "POLYGON",
                                           "MULTIPOINT", "MULTILINESTRING", "MULTIPOLYGON"};

// Hex strings shorter than a WKB header are not considered
static constexpr idx_t MIN_HEX_WKB_LENGTH = 10;

template <size_t N>
static bool ContainsAny(const string &text, const char *const (&needles)[N]) {
	for (auto needle : needles) {
		if (StringUtil::Contains(text, needle)) {
			return true;
		}
	}
	return false;
}

template <size_t N>
static bool EqualsAny(const string &text, const char *const (&candidates)[N]) {
	for (auto candidate : candidates) {
		if (text == candidate) {
			return true;
		}
	}
	return false;
}

bool GeometryColumnDetector::IsBinaryType(const string &type_name) {
	auto type = StringUtil::Lower(type_name);
	return StringUtil::Contains(type, "blob") || StringUtil::Contains(type, "binary") ||
	       StringUtil::Contains(type, "bytea");
}

bool GeometryColumnDetector::IsDuckDBGeometryType(const LogicalType &type) {
	return type.id() == LogicalTypeId::BLOB && type.HasAlias() && type.GetAlias() == DUCKDB_GEOMETRY_ALIAS;
}

idx_t GeometryColumnDetector::FindGeometryColumn(const vector<string> &names, const vector<string> &type_names) {
	if (names.size() != type_names.size()) {
		throw InvalidInputException("Got %llu column names but %llu column types", names.size(), type_names.size());
	}

	vector<string> lower_names;
	vector<string> lower_types;
	for (idx_t i = 0; i < names.size(); i++) {
		lower_names.push_back(StringUtil::Lower(names[i]));
		lower_types.push_back(StringUtil::Lower(type_names[i]));
	}

	for (idx_t i = 0; i < names.size(); i++) {
		if (ContainsAny(lower_types[i], GEOMETRY_TYPE_KEYWORDS)) {
			return i;
		}
	}
	for (idx_t i = 0; i < names.size(); i++) {
		if (EqualsAny(lower_names[i], GEOMETRY_COLUMN_NAMES) && IsBinaryType(lower_types[i])) {
			return i;
		}
	}
	for (idx_t i = 0; i < names.size(); i++) {
		if (EqualsAny(lower_names[i], GEOMETRY_COLUMN_NAMES)) {
			return i;
		}
	}
	for (idx_t i = 0; i < names.size(); i++) {
		if (ContainsAny(lower_names[i], GEOMETRY_NAME_HINTS) && IsBinaryType(lower_types[i])) {
			return i;
		}
	}
	for (idx_t i = 0; i < names.size(); i++) {
		if (ContainsAny(lower_names[i], GEOMETRY_NAME_HINTS)) {
			return i;
		}
	}
	return DConstants::INVALID_INDEX;
}

bool GeometryColumnDetector::IsWKT(const string &text) {
	auto trimmed = text;
	StringUtil::LTrim(trimmed);
	trimmed = StringUtil::Upper(trimmed);
	for (auto prefix : WKT_PREFIXES) {
		if (StringUtil::StartsWith(trimmed, prefix)) {
			return true;
		}
	}
	return false;
}

bool GeometryColumnDetector::IsGeoJSONGeometry(const string &text) {
	if (!StringUtil::StartsWith(text, "{")) {
		return false;
	}
	unique_ptr<yyjson_doc, void (*)(yyjson_doc *)> doc(yyjson_read(text.c_str(), text.size(), YYJSON_READ_NOFLAG),
	                                                   yyjson_doc_free);
	if (!doc) {
		return false;
	}
	auto root = yyjson_doc_get_root(doc.get());
	if (!yyjson_is_obj(root)) {
		return false;
	}
	auto type = yyjson_obj_get(root, "type");
	auto coordinates = yyjson_obj_get(root, "coordinates");
	if (!type || !yyjson_is_str(type) || !coordinates || yyjson_is_null(coordinates)) {
		return false;
	}
	return EqualsAny(string(yyjson_get_str(type)), GEOJSON_TYPES);
}

// A STRUCT with a GeoJSON "type" and non-null "coordinates", e.g. from read_json_auto
static bool IsGeoJSONStruct(const Value &value) {
	auto &type = value.type();
	if (type.id() != LogicalTypeId::STRUCT) {
		return false;
	}
	auto &children = StructValue::GetChildren(value);
	bool has_type = false;
	bool has_coordinates = false;
	for (idx_t i = 0; i < children.size(); i++) {
		auto &child_name = StructType::GetChildName(type, i);
		auto &child = children[i];
		if (child_name == "type" && child.type().id() == LogicalTypeId::VARCHAR && !child.IsNull()) {
			has_type = EqualsAny(StringValue::Get(child), GEOJSON_TYPES);
		} else if (child_name == "coordinates" && !child.IsNull()) {
			has_coordinates = true;
		}
	}
	return has_type && has_coordinates;
}

GeometryEncoding GeometryColumnDetector::SniffValue(const Value &value) {
	if (value.IsNull()) {
		return GeometryEncoding::UNKNOWN;
	}
	if (IsDuckDBGeometryType(value.type())) {
		return GeometryEncoding::DUCKDB_GEOMETRY;
	}
	switch (value.type().id()) {
	case LogicalTypeId::BLOB: {
		return WKBUtil::LooksLikeWKB(StringValue::Get(value)) ? GeometryEncoding::WKB : GeometryEncoding::UNKNOWN;
	}
	case LogicalTypeId::VARCHAR: {
		auto &text = StringValue::Get(value);
		string decoded;
		if (text.size() >= MIN_HEX_WKB_LENGTH && WKBUtil::TryDecodeHex(text, decoded) &&
		    WKBUtil::LooksLikeWKB(decoded)) {
			return GeometryEncoding::HEX_WKB;
		}
		if (IsWKT(text)) {
			return GeometryEncoding::WKT;
		}
		if (IsGeoJSONGeometry(text)) {
			return GeometryEncoding::GEOJSON;
		}
		return GeometryEncoding::UNKNOWN;
	}
	case LogicalTypeId::STRUCT:
		return IsGeoJSONStruct(value) ? GeometryEncoding::GEOJSON : GeometryEncoding::UNKNOWN;
	default:
		return GeometryEncoding::UNKNOWN;
	}
}

idx_t GeometryColumnDetector::FindGeometryColumnFromRow(const vector<string> &names, const vector<string> &type_names,
                                                        const vector<Value> &row, GeometryEncoding *encoding) {
	if (names.size() != type_names.size() || names.size() != row.size()) {
		throw InvalidInputException("Got %llu column names, %llu column types and %llu values", names.size(),
		                            type_names.size(), row.size());
	}

	for (idx_t i = 0; i < row.size(); i++) {
		if (!IsBinaryType(type_names[i]) || row[i].IsNull() || row[i].type().id() != LogicalTypeId::BLOB) {
			continue;
		}
		if (SniffValue(row[i]) == GeometryEncoding::WKB) {
			if (encoding) {
				*encoding = GeometryEncoding::WKB;
			}
			return i;
		}
	}

	for (idx_t i = 0; i < row.size(); i++) {
		auto value_encoding = SniffValue(row[i]);
		if (value_encoding != GeometryEncoding::UNKNOWN) {
			if (encoding) {
				*encoding = value_encoding;
			}
			return i;
		}
	}
	return DConstants::INVALID_INDEX;
}

} // namespace core

} // namespace geoview
