#include "geoview/core/geoarrow/geometry_classifier.hpp"

namespace geoview {

namespace core {

struct ClassifyOp {
	static GeometryType Case(Geometry::Tags::Point, const Geometry &) {
		return GeometryType::POINT;
	}
	static GeometryType Case(Geometry::Tags::LineString, const Geometry &) {
		return GeometryType::LINESTRING;
	}
	static GeometryType Case(Geometry::Tags::Polygon, const Geometry &) {
		return GeometryType::POLYGON;
	}
	static GeometryType Case(Geometry::Tags::MultiPoint, const Geometry &) {
		return GeometryType::MULTIPOINT;
	}
	static GeometryType Case(Geometry::Tags::MultiLineString, const Geometry &) {
		return GeometryType::MULTILINESTRING;
	}
	static GeometryType Case(Geometry::Tags::MultiPolygon, const Geometry &) {
		return GeometryType::MULTIPOLYGON;
	}
	static GeometryType Case(Geometry::Tags::Unknown, const Geometry &) {
		return GeometryType::UNKNOWN;
	}
};

GeometryType GeometryClassifier::Classify(const Geometry &geom) {
	return Geometry::Match<ClassifyOp>(geom);
}

bool GeometryClassifier::Add(idx_t row_idx, Geometry geom) {
	auto type = Classify(geom);
	if (type == GeometryType::UNKNOWN) {
		return false;
	}

	auto key = static_cast<uint8_t>(type);
	auto entry = group_map.find(key);
	idx_t group_idx;
	if (entry == group_map.end()) {
		group_idx = groups.size();
		group_map[key] = group_idx;
		GeometryGroup group;
		group.type = type;
		groups.push_back(std::move(group));
	} else {
		group_idx = entry->second;
	}

	auto &group = groups[group_idx];
	D_ASSERT(group.source_indices.empty() || group.source_indices.back() < row_idx);
	group.geometries.push_back(std::move(geom));
	group.source_indices.push_back(row_idx);
	return true;
}

idx_t GeometryClassifier::AcceptedCount() const {
	idx_t count = 0;
	for (auto &group : groups) {
		count += group.Count();
	}
	return count;
}

} // namespace core

} // namespace geoview
