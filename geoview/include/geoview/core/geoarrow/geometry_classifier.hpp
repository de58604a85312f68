#pragma once
#include "geoview/common.hpp"
#include "geoview/core/geometry/geometry.hpp"

namespace geoview {

namespace core {

// The rows of one batch that share a GeoArrow geometry type
struct GeometryGroup {
	GeometryType type = GeometryType::UNKNOWN;
	vector<Geometry> geometries;
	// Source row of each geometry, ascending
	vector<idx_t> source_indices;

	idx_t Count() const {
		return geometries.size();
	}
};

// Partitions decoded geometries into the six GeoArrow native groups. Groups are kept in the order their type
// was first seen, rows within a group in the order they were added.
class GeometryClassifier {
public:
	// The group a geometry belongs to, UNKNOWN if it is rejected
	static GeometryType Classify(const Geometry &geom);

	// Returns false (and keeps nothing) if the geometry is rejected
	bool Add(idx_t row_idx, Geometry geom);

	const vector<GeometryGroup> &Groups() const {
		return groups;
	}
	vector<GeometryGroup> &Groups() {
		return groups;
	}

	// Number of rows across all groups
	idx_t AcceptedCount() const;

private:
	vector<GeometryGroup> groups;
	// GeometryType -> position in groups
	unordered_map<uint8_t, idx_t> group_map;
};

} // namespace core

} // namespace geoview
