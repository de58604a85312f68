#include "geoview/core/geoarrow/geoarrow_table.hpp"

namespace geoview {

namespace core {

constexpr const char *GeoArrowField::EXTENSION_NAME_KEY;
constexpr const char *GeoArrowField::EXTENSION_METADATA_KEY;
constexpr const char *GeoArrowTable::GEOMETRY_FIELD_NAME;

//------------------------------------------------------------------------------
// GeoArrowInput
//------------------------------------------------------------------------------
void GeoArrowInput::AddAttribute(string name, string declared_type, vector<Value> values) {
	AttributeInput attribute;
	attribute.name = std::move(name);
	attribute.declared_type = std::move(declared_type);
	attribute.values = std::move(values);
	attributes.push_back(std::move(attribute));
}

void GeoArrowInput::Verify() const {
	for (auto &attribute : attributes) {
		if (attribute.values.size() != wkb_blobs.size()) {
			throw InvalidInputException("Attribute column \"%s\" has %llu values, but the batch has %llu rows",
			                            attribute.name, attribute.values.size(), wkb_blobs.size());
		}
		if (attribute.name == GeoArrowTable::GEOMETRY_FIELD_NAME) {
			throw InvalidInputException("Attribute column name \"%s\" is reserved for the geometry column",
			                            attribute.name);
		}
	}
}

//------------------------------------------------------------------------------
// GeometryColumn
//------------------------------------------------------------------------------
vector<string> GeometryColumn::GetLevelNames(GeometryType type) {
	switch (type) {
	case GeometryType::POINT:
		return {"xy"};
	case GeometryType::LINESTRING:
		return {"vertices", "xy"};
	case GeometryType::MULTIPOINT:
		return {"points", "xy"};
	case GeometryType::POLYGON:
		return {"rings", "vertices", "xy"};
	case GeometryType::MULTILINESTRING:
		return {"linestrings", "vertices", "xy"};
	case GeometryType::MULTIPOLYGON:
		return {"polygons", "rings", "vertices", "xy"};
	default:
		throw InternalException("GeometryColumn::GetLevelNames: unsupported geometry type %s",
		                        GeometryTypes::ToString(type));
	}
}

//------------------------------------------------------------------------------
// AttributeColumn
//------------------------------------------------------------------------------
double AttributeColumn::GetDouble(idx_t row) const {
	if (type != AttributeType::FLOAT64) {
		throw InvalidInputException("Attribute column \"%s\" is not numeric", name);
	}
	if (row >= length) {
		throw InvalidInputException("Row %llu is out of range for attribute column \"%s\"", row, name);
	}
	return numeric_data[row];
}

string AttributeColumn::GetString(idx_t row) const {
	if (type != AttributeType::UTF8) {
		throw InvalidInputException("Attribute column \"%s\" is not a string column", name);
	}
	if (row >= length) {
		throw InvalidInputException("Row %llu is out of range for attribute column \"%s\"", row, name);
	}
	auto begin = string_offsets[row];
	auto end = string_offsets[row + 1];
	return string(string_data.data() + begin, static_cast<size_t>(end - begin));
}

//------------------------------------------------------------------------------
// GeoArrowField
//------------------------------------------------------------------------------
bool GeoArrowField::HasMetadata(const string &key) const {
	for (auto &entry : metadata) {
		if (entry.first == key) {
			return true;
		}
	}
	return false;
}

string GeoArrowField::GetMetadata(const string &key) const {
	for (auto &entry : metadata) {
		if (entry.first == key) {
			return entry.second;
		}
	}
	return string();
}

//------------------------------------------------------------------------------
// GeoArrowTable
//------------------------------------------------------------------------------
GeoArrowTable::GeoArrowTable(GeometryColumn geometry_p, vector<AttributeColumn> attributes_p,
                             string extension_metadata)
    : geometry(std::move(geometry_p)), attributes(std::move(attributes_p)) {
	GeoArrowField geometry_field;
	geometry_field.name = GEOMETRY_FIELD_NAME;
	geometry_field.format = geometry.type == GeometryType::POINT ? "+w:2" : "+l";
	geometry_field.nullable = false;
	geometry_field.metadata.emplace_back(GeoArrowField::EXTENSION_NAME_KEY,
	                                     GeometryTypes::GetExtensionName(geometry.type));
	geometry_field.metadata.emplace_back(GeoArrowField::EXTENSION_METADATA_KEY, std::move(extension_metadata));
	schema.push_back(std::move(geometry_field));

	for (auto &attribute : attributes) {
		if (attribute.length != geometry.length) {
			throw InternalException("Attribute column \"%s\" has %llu rows, but the geometry column has %llu",
			                        attribute.name, attribute.length, geometry.length);
		}
		GeoArrowField field;
		field.name = attribute.name;
		field.format = attribute.type == AttributeType::FLOAT64 ? "g" : "u";
		field.nullable = true;
		schema.push_back(std::move(field));
	}
}

const AttributeColumn &GeoArrowTable::GetAttribute(const string &name) const {
	for (auto &attribute : attributes) {
		if (attribute.name == name) {
			return attribute;
		}
	}
	throw InvalidInputException("GeoArrow table has no attribute column \"%s\"", name);
}

template <class T>
static bool BitwiseEquals(const vector<T> &left, const vector<T> &right) {
	if (left.size() != right.size()) {
		return false;
	}
	return left.empty() || memcmp(left.data(), right.data(), left.size() * sizeof(T)) == 0;
}

bool GeoArrowTable::Equals(const GeoArrowTable &other) const {
	if (schema.size() != other.schema.size()) {
		return false;
	}
	for (idx_t i = 0; i < schema.size(); i++) {
		auto &field = schema[i];
		auto &other_field = other.schema[i];
		if (field.name != other_field.name || field.format != other_field.format ||
		    field.nullable != other_field.nullable || field.metadata != other_field.metadata) {
			return false;
		}
	}

	if (geometry.type != other.geometry.type || geometry.length != other.geometry.length ||
	    geometry.offsets.size() != other.geometry.offsets.size() ||
	    !BitwiseEquals(geometry.coordinates, other.geometry.coordinates)) {
		return false;
	}
	for (idx_t level = 0; level < geometry.offsets.size(); level++) {
		if (!BitwiseEquals(geometry.offsets[level], other.geometry.offsets[level])) {
			return false;
		}
	}

	for (idx_t i = 0; i < attributes.size(); i++) {
		auto &column = attributes[i];
		auto &other_column = other.attributes[i];
		if (column.name != other_column.name || column.type != other_column.type ||
		    column.length != other_column.length || !BitwiseEquals(column.numeric_data, other_column.numeric_data) ||
		    !BitwiseEquals(column.string_offsets, other_column.string_offsets) ||
		    !BitwiseEquals(column.string_data, other_column.string_data)) {
			return false;
		}
	}
	return true;
}

} // namespace core

} // namespace geoview
