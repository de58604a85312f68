#include "geoview/core/geometry/geometry.hpp"

namespace geoview {

namespace core {

//------------------------------------------------------------------------------
// Geometry
//------------------------------------------------------------------------------
bool Geometry::IsEmpty() const {
	switch (type) {
	case GeometryType::POINT:
		return vertices.empty() || vertices[0].IsNaN();
	case GeometryType::LINESTRING:
		return vertices.empty();
	case GeometryType::UNKNOWN:
		return true;
	default:
		for (auto &part : parts) {
			if (!part.IsEmpty()) {
				return false;
			}
		}
		return true;
	}
}

idx_t Geometry::VertexCount() const {
	if (IsSinglePart()) {
		return vertices.size();
	}
	idx_t count = 0;
	for (auto &part : parts) {
		count += part.VertexCount();
	}
	return count;
}

// NaN ordinates (empty points) compare equal to each other
static bool OrdinateEquals(double a, double b) {
	return a == b || (std::isnan(a) && std::isnan(b));
}

bool Geometry::operator==(const Geometry &other) const {
	if (type != other.type || vertices.size() != other.vertices.size() || parts.size() != other.parts.size()) {
		return false;
	}
	for (idx_t i = 0; i < vertices.size(); i++) {
		if (!OrdinateEquals(vertices[i].x, other.vertices[i].x) ||
		    !OrdinateEquals(vertices[i].y, other.vertices[i].y)) {
			return false;
		}
	}
	for (idx_t i = 0; i < parts.size(); i++) {
		if (parts[i] != other.parts[i]) {
			return false;
		}
	}
	return true;
}

//------------------------------------------------------------------------------
// WKT-like text representation, used in error messages and test output
//------------------------------------------------------------------------------
static string FormatOrdinate(double value) {
	if (std::isnan(value)) {
		return "NaN";
	}
	return Value::DOUBLE(value).ToString();
}

static string FormatBody(const Geometry &geom) {
	if (geom.IsSinglePart()) {
		auto &vertices = SinglePartGeometry::Vertices(geom);
		if (geom.GetType() == GeometryType::POINT && geom.IsEmpty()) {
			return "EMPTY";
		}
		vector<string> coords;
		for (auto &vertex : vertices) {
			coords.push_back(FormatOrdinate(vertex.x) + " " + FormatOrdinate(vertex.y));
		}
		return coords.empty() ? "EMPTY" : "(" + StringUtil::Join(coords, ", ") + ")";
	}
	auto &parts = MultiPartGeometry::Parts(geom);
	if (parts.empty()) {
		return "EMPTY";
	}
	vector<string> bodies;
	for (auto &part : parts) {
		bodies.push_back(FormatBody(part));
	}
	return "(" + StringUtil::Join(bodies, ", ") + ")";
}

string Geometry::ToString() const {
	if (type == GeometryType::UNKNOWN) {
		return "UNKNOWN";
	}
	return GeometryTypes::ToString(type) + " " + FormatBody(*this);
}

//------------------------------------------------------------------------------
// Factories
//------------------------------------------------------------------------------
static void VerifyParts(GeometryType type, const vector<Geometry> &parts, GeometryType expected) {
	for (auto &part : parts) {
		if (part.GetType() != expected) {
			throw InvalidInputException("%s can only contain %s parts, got %s", GeometryTypes::ToString(type),
			                            GeometryTypes::ToString(expected), GeometryTypes::ToString(part.GetType()));
		}
	}
}

Geometry Polygon::Create(vector<Geometry> rings) {
	VerifyParts(GeometryType::POLYGON, rings, GeometryType::LINESTRING);
	return MultiPartGeometry::Create(GeometryType::POLYGON, std::move(rings));
}

Geometry MultiPoint::Create(vector<Geometry> points) {
	VerifyParts(GeometryType::MULTIPOINT, points, GeometryType::POINT);
	return MultiPartGeometry::Create(GeometryType::MULTIPOINT, std::move(points));
}

Geometry MultiLineString::Create(vector<Geometry> line_strings) {
	VerifyParts(GeometryType::MULTILINESTRING, line_strings, GeometryType::LINESTRING);
	return MultiPartGeometry::Create(GeometryType::MULTILINESTRING, std::move(line_strings));
}

Geometry MultiPolygon::Create(vector<Geometry> polygons) {
	VerifyParts(GeometryType::MULTIPOLYGON, polygons, GeometryType::POLYGON);
	return MultiPartGeometry::Create(GeometryType::MULTIPOLYGON, std::move(polygons));
}

//------------------------------------------------------------------------------
// GeometryTypes
//------------------------------------------------------------------------------
constexpr idx_t GeometryTypes::SUPPORTED_TYPE_COUNT;

GeometryType GeometryTypes::FromName(const string &name) {
	string normalized;
	for (auto c : name) {
		if (!StringUtil::CharacterIsSpace(c)) {
			normalized += StringUtil::CharacterToUpper(c);
		}
	}
	for (idx_t i = 0; i < SUPPORTED_TYPE_COUNT; i++) {
		auto type = static_cast<GeometryType>(i);
		if (normalized == ToString(type)) {
			return type;
		}
	}
	return GeometryType::UNKNOWN;
}

} // namespace core

} // namespace geoview
