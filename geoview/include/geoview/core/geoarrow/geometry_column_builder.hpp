#pragma once
#include "geoview/common.hpp"
#include "geoview/core/geometry/bbox.hpp"
#include "geoview/core/geometry/geometry.hpp"
#include "geoview/core/geoarrow/geoarrow_table.hpp"

namespace geoview {

namespace core {

// Builds the GeoArrow (interleaved) column of one geometry group. Each builder makes two passes over the
// geometries: one to size the buffers, one to fill them. Geometries of another type than the column get a
// zero-length slice, or a [NaN, NaN] coordinate in a point column. Every written coordinate stretches `bounds`.
class GeometryColumnBuilder {
public:
	// Throws an InternalException for UNKNOWN
	static GeometryColumn Build(GeometryType type, const vector<Geometry> &geometries, BoundsTracker &bounds);

private:
	static void BuildPoints(const vector<Geometry> &geometries, GeometryColumn &column, BoundsTracker &bounds);
	static void BuildLineStrings(const vector<Geometry> &geometries, GeometryColumn &column, BoundsTracker &bounds);
	static void BuildMultiPoints(const vector<Geometry> &geometries, GeometryColumn &column, BoundsTracker &bounds);
	static void BuildPolygons(const vector<Geometry> &geometries, GeometryColumn &column, BoundsTracker &bounds);
	static void BuildMultiLineStrings(const vector<Geometry> &geometries, GeometryColumn &column,
	                                  BoundsTracker &bounds);
	static void BuildMultiPolygons(const vector<Geometry> &geometries, GeometryColumn &column, BoundsTracker &bounds);
};

} // namespace core

} // namespace geoview
