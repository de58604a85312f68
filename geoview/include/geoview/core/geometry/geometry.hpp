#pragma once

#include "geoview/common.hpp"
#include "geoview/core/geometry/geometry_type.hpp"
#include "geoview/core/geometry/vertex.hpp"

namespace geoview {

namespace core {

//------------------------------------------------------------------------------
// Geometry
//------------------------------------------------------------------------------
// A decoded 2D geometry. Single-part geometries (Point, LineString) own their vertices, multi-part geometries
// (Polygon, MultiPoint, MultiLineString, MultiPolygon) own their parts:
//  - Polygon parts are LineString rings, the first being the exterior
//  - MultiPoint parts are Points, MultiLineString parts are LineStrings, MultiPolygon parts are Polygons
// UNKNOWN geometries carry no payload.
class Geometry {
	friend struct SinglePartGeometry;
	friend struct MultiPartGeometry;

private:
	GeometryType type;
	vector<VertexXY> vertices;
	vector<Geometry> parts;

public:
	Geometry() : type(GeometryType::UNKNOWN) {
	}

	explicit Geometry(GeometryType type) : type(type) {
	}

public:
	GeometryType GetType() const {
		return type;
	}

	bool IsSinglePart() const {
		return GeometryTypes::IsSinglePart(type);
	}
	bool IsMultiPart() const {
		return GeometryTypes::IsMultiPart(type);
	}

	// Number of vertices for single-part geometries, number of parts otherwise
	idx_t Count() const {
		return IsSinglePart() ? vertices.size() : parts.size();
	}

	bool IsEmpty() const;

	// Total number of vertices, recursively
	idx_t VertexCount() const;

	bool operator==(const Geometry &other) const;
	bool operator!=(const Geometry &other) const {
		return !(*this == other);
	}

	string ToString() const;

public:
	// Used for tag dispatching
	struct Tags {
		// Base types
		struct AnyGeometry {};
		struct SinglePartGeometry : public AnyGeometry {};
		struct MultiPartGeometry : public AnyGeometry {};
		struct CollectionGeometry : public MultiPartGeometry {};
		// Concrete types
		struct Point : public SinglePartGeometry {};
		struct LineString : public SinglePartGeometry {};
		struct Polygon : public MultiPartGeometry {};
		struct MultiPoint : public CollectionGeometry {};
		struct MultiLineString : public CollectionGeometry {};
		struct MultiPolygon : public CollectionGeometry {};
		struct Unknown : public AnyGeometry {};
	};

	template <class T, class... ARGS>
	static auto Match(const Geometry &geom, ARGS &&...args)
	    -> decltype(T::Case(std::declval<Tags::Point>(), std::declval<const Geometry &>(), std::declval<ARGS>()...)) {
		switch (geom.type) {
		case GeometryType::POINT:
			return T::Case(Tags::Point {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::LINESTRING:
			return T::Case(Tags::LineString {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::POLYGON:
			return T::Case(Tags::Polygon {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::MULTIPOINT:
			return T::Case(Tags::MultiPoint {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::MULTILINESTRING:
			return T::Case(Tags::MultiLineString {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::MULTIPOLYGON:
			return T::Case(Tags::MultiPolygon {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::UNKNOWN:
			return T::Case(Tags::Unknown {}, geom, std::forward<ARGS>(args)...);
		default:
			throw NotImplementedException("Geometry::Match");
		}
	}
};

//------------------------------------------------------------------------------
// Accessors
//------------------------------------------------------------------------------
struct SinglePartGeometry {
	static const vector<VertexXY> &Vertices(const Geometry &geom) {
		D_ASSERT(geom.IsSinglePart());
		return geom.vertices;
	}

	static const VertexXY &GetVertex(const Geometry &geom, idx_t index) {
		D_ASSERT(geom.IsSinglePart());
		D_ASSERT(index < geom.vertices.size());
		return geom.vertices[index];
	}

protected:
	static Geometry Create(GeometryType type, vector<VertexXY> vertices) {
		Geometry geom(type);
		geom.vertices = std::move(vertices);
		return geom;
	}
};

struct MultiPartGeometry {
	static const vector<Geometry> &Parts(const Geometry &geom) {
		D_ASSERT(geom.IsMultiPart());
		return geom.parts;
	}

	static const Geometry &Part(const Geometry &geom, idx_t index) {
		D_ASSERT(geom.IsMultiPart());
		D_ASSERT(index < geom.parts.size());
		return geom.parts[index];
	}

protected:
	static Geometry Create(GeometryType type, vector<Geometry> parts) {
		Geometry geom(type);
		geom.parts = std::move(parts);
		return geom;
	}
};

//------------------------------------------------------------------------------
// Factories
//------------------------------------------------------------------------------
struct Point : public SinglePartGeometry {
	static Geometry Create(double x, double y) {
		vector<VertexXY> vertices;
		vertices.emplace_back(x, y);
		return SinglePartGeometry::Create(GeometryType::POINT, std::move(vertices));
	}

	// WKB has no "empty point" encoding other than NaN ordinates
	static Geometry CreateEmpty() {
		return Create(std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::quiet_NaN());
	}

	static const VertexXY &GetVertex(const Geometry &geom) {
		D_ASSERT(geom.GetType() == GeometryType::POINT);
		return SinglePartGeometry::GetVertex(geom, 0);
	}
};

struct LineString : public SinglePartGeometry {
	static Geometry Create(vector<VertexXY> vertices) {
		return SinglePartGeometry::Create(GeometryType::LINESTRING, std::move(vertices));
	}
};

struct Polygon : public MultiPartGeometry {
	// Every ring must be a LineString
	static Geometry Create(vector<Geometry> rings);
};

struct MultiPoint : public MultiPartGeometry {
	static Geometry Create(vector<Geometry> points);
};

struct MultiLineString : public MultiPartGeometry {
	static Geometry Create(vector<Geometry> line_strings);
};

struct MultiPolygon : public MultiPartGeometry {
	static Geometry Create(vector<Geometry> polygons);
};

} // namespace core

} // namespace geoview
