#include "geoview/core/geoarrow/geometry_column_builder.hpp"

namespace geoview {

namespace core {

//------------------------------------------------------------------------------
// Helpers
//------------------------------------------------------------------------------
static int32_t CastOffset(idx_t offset) {
	if (offset > static_cast<idx_t>(NumericLimits<int32_t>::Maximum())) {
		throw InvalidInputException("GeoArrow column has more than %d elements in one buffer",
		                            NumericLimits<int32_t>::Maximum());
	}
	return static_cast<int32_t>(offset);
}

static void AppendVertex(const VertexXY &vertex, GeometryColumn &column, BoundsTracker &bounds) {
	column.coordinates.push_back(vertex.x);
	column.coordinates.push_back(vertex.y);
	bounds.Update(vertex);
}

static void AppendVertices(const Geometry &geom, GeometryColumn &column, BoundsTracker &bounds) {
	for (auto &vertex : SinglePartGeometry::Vertices(geom)) {
		AppendVertex(vertex, column, bounds);
	}
}

// Number of parts of each geometry of the given type, summed
static idx_t CountParts(const vector<Geometry> &geometries, GeometryType type) {
	idx_t count = 0;
	for (auto &geom : geometries) {
		if (geom.GetType() == type) {
			count += geom.Count();
		}
	}
	return count;
}

static idx_t CountVertices(const vector<Geometry> &geometries, GeometryType type) {
	idx_t count = 0;
	for (auto &geom : geometries) {
		if (geom.GetType() == type) {
			count += geom.VertexCount();
		}
	}
	return count;
}

// Appends one List<xy> element per part of a geometry whose parts are single-part geometries (polygon rings,
// multilinestring members)
static void AppendPartList(const Geometry &geom, vector<int32_t> &part_offsets, GeometryColumn &column,
                           BoundsTracker &bounds) {
	for (auto &part : MultiPartGeometry::Parts(geom)) {
		part_offsets.push_back(CastOffset(column.CoordinateCount()));
		AppendVertices(part, column, bounds);
	}
}

//------------------------------------------------------------------------------
// Point: FixedSizeList(2)
//------------------------------------------------------------------------------
void GeometryColumnBuilder::BuildPoints(const vector<Geometry> &geometries, GeometryColumn &column,
                                        BoundsTracker &bounds) {
	column.coordinates.reserve(geometries.size() * 2);
	for (auto &geom : geometries) {
		if (geom.GetType() != GeometryType::POINT || geom.Count() == 0) {
			// Keep the column aligned with the rows
			AppendVertex(VertexXY(std::numeric_limits<double>::quiet_NaN()), column, bounds);
			continue;
		}
		AppendVertex(Point::GetVertex(geom), column, bounds);
	}
}

//------------------------------------------------------------------------------
// LineString: List<FixedSizeList(2)>
//------------------------------------------------------------------------------
void GeometryColumnBuilder::BuildLineStrings(const vector<Geometry> &geometries, GeometryColumn &column,
                                             BoundsTracker &bounds) {
	auto &vertex_offsets = column.offsets[0];
	vertex_offsets.reserve(geometries.size() + 1);
	column.coordinates.reserve(CountVertices(geometries, GeometryType::LINESTRING) * 2);

	for (auto &geom : geometries) {
		vertex_offsets.push_back(CastOffset(column.CoordinateCount()));
		if (geom.GetType() != GeometryType::LINESTRING) {
			continue;
		}
		AppendVertices(geom, column, bounds);
	}
	vertex_offsets.push_back(CastOffset(column.CoordinateCount()));
}

//------------------------------------------------------------------------------
// MultiPoint: List<FixedSizeList(2)>
//------------------------------------------------------------------------------
void GeometryColumnBuilder::BuildMultiPoints(const vector<Geometry> &geometries, GeometryColumn &column,
                                             BoundsTracker &bounds) {
	auto &point_offsets = column.offsets[0];
	point_offsets.reserve(geometries.size() + 1);
	column.coordinates.reserve(CountParts(geometries, GeometryType::MULTIPOINT) * 2);

	for (auto &geom : geometries) {
		point_offsets.push_back(CastOffset(column.CoordinateCount()));
		if (geom.GetType() != GeometryType::MULTIPOINT) {
			continue;
		}
		for (auto &point : MultiPartGeometry::Parts(geom)) {
			AppendVertex(Point::GetVertex(point), column, bounds);
		}
	}
	point_offsets.push_back(CastOffset(column.CoordinateCount()));
}

//------------------------------------------------------------------------------
// Polygon: List<List<FixedSizeList(2)>>
//------------------------------------------------------------------------------
void GeometryColumnBuilder::BuildPolygons(const vector<Geometry> &geometries, GeometryColumn &column,
                                          BoundsTracker &bounds) {
	auto &ring_offsets = column.offsets[0];
	auto &vertex_offsets = column.offsets[1];
	ring_offsets.reserve(geometries.size() + 1);
	vertex_offsets.reserve(CountParts(geometries, GeometryType::POLYGON) + 1);
	column.coordinates.reserve(CountVertices(geometries, GeometryType::POLYGON) * 2);

	for (auto &geom : geometries) {
		ring_offsets.push_back(CastOffset(vertex_offsets.size()));
		if (geom.GetType() != GeometryType::POLYGON) {
			continue;
		}
		AppendPartList(geom, vertex_offsets, column, bounds);
	}
	ring_offsets.push_back(CastOffset(vertex_offsets.size()));
	vertex_offsets.push_back(CastOffset(column.CoordinateCount()));
}

//------------------------------------------------------------------------------
// MultiLineString: List<List<FixedSizeList(2)>>
//------------------------------------------------------------------------------
void GeometryColumnBuilder::BuildMultiLineStrings(const vector<Geometry> &geometries, GeometryColumn &column,
                                                  BoundsTracker &bounds) {
	auto &line_offsets = column.offsets[0];
	auto &vertex_offsets = column.offsets[1];
	line_offsets.reserve(geometries.size() + 1);
	vertex_offsets.reserve(CountParts(geometries, GeometryType::MULTILINESTRING) + 1);
	column.coordinates.reserve(CountVertices(geometries, GeometryType::MULTILINESTRING) * 2);

	for (auto &geom : geometries) {
		line_offsets.push_back(CastOffset(vertex_offsets.size()));
		if (geom.GetType() != GeometryType::MULTILINESTRING) {
			continue;
		}
		AppendPartList(geom, vertex_offsets, column, bounds);
	}
	line_offsets.push_back(CastOffset(vertex_offsets.size()));
	vertex_offsets.push_back(CastOffset(column.CoordinateCount()));
}

//------------------------------------------------------------------------------
// MultiPolygon: List<List<List<FixedSizeList(2)>>>
//------------------------------------------------------------------------------
void GeometryColumnBuilder::BuildMultiPolygons(const vector<Geometry> &geometries, GeometryColumn &column,
                                               BoundsTracker &bounds) {
	auto &polygon_offsets = column.offsets[0];
	auto &ring_offsets = column.offsets[1];
	auto &vertex_offsets = column.offsets[2];

	idx_t polygon_count = 0;
	idx_t ring_count = 0;
	for (auto &geom : geometries) {
		if (geom.GetType() != GeometryType::MULTIPOLYGON) {
			continue;
		}
		polygon_count += geom.Count();
		for (auto &polygon : MultiPartGeometry::Parts(geom)) {
			ring_count += polygon.Count();
		}
	}
	polygon_offsets.reserve(geometries.size() + 1);
	ring_offsets.reserve(polygon_count + 1);
	vertex_offsets.reserve(ring_count + 1);
	column.coordinates.reserve(CountVertices(geometries, GeometryType::MULTIPOLYGON) * 2);

	for (auto &geom : geometries) {
		polygon_offsets.push_back(CastOffset(ring_offsets.size()));
		if (geom.GetType() != GeometryType::MULTIPOLYGON) {
			continue;
		}
		for (auto &polygon : MultiPartGeometry::Parts(geom)) {
			ring_offsets.push_back(CastOffset(vertex_offsets.size()));
			AppendPartList(polygon, vertex_offsets, column, bounds);
		}
	}
	polygon_offsets.push_back(CastOffset(ring_offsets.size()));
	ring_offsets.push_back(CastOffset(vertex_offsets.size()));
	vertex_offsets.push_back(CastOffset(column.CoordinateCount()));
}

//------------------------------------------------------------------------------
// Build
//------------------------------------------------------------------------------
GeometryColumn GeometryColumnBuilder::Build(GeometryType type, const vector<Geometry> &geometries,
                                            BoundsTracker &bounds) {
	if (!GeometryTypes::IsSupported(type)) {
		throw InternalException("Cannot build a GeoArrow column of type %s", GeometryTypes::ToString(type));
	}

	GeometryColumn column;
	column.type = type;
	column.length = geometries.size();
	column.offsets.resize(GeometryTypes::GetNestingDepth(type));

	switch (type) {
	case GeometryType::POINT:
		BuildPoints(geometries, column, bounds);
		break;
	case GeometryType::LINESTRING:
		BuildLineStrings(geometries, column, bounds);
		break;
	case GeometryType::POLYGON:
		BuildPolygons(geometries, column, bounds);
		break;
	case GeometryType::MULTIPOINT:
		BuildMultiPoints(geometries, column, bounds);
		break;
	case GeometryType::MULTILINESTRING:
		BuildMultiLineStrings(geometries, column, bounds);
		break;
	case GeometryType::MULTIPOLYGON:
		BuildMultiPolygons(geometries, column, bounds);
		break;
	default:
		throw InternalException("Cannot build a GeoArrow column of type %s", GeometryTypes::ToString(type));
	}
	return column;
}

} // namespace core

} // namespace geoview
