#pragma once

#include "geoview/common.hpp"
#include "geoview/core/geometry/vertex.hpp"

#include <array>
#include <limits>

namespace geoview {

namespace core {

// Axis-aligned bounding box. A default constructed box is "inverted" (min = +inf, max = -inf) so that the
// first stretch collapses it onto the first vertex. A box that was never stretched reports IsEmpty().
template <class V>
struct Box {
	using VERTEX_TYPE = V;
	using VALUE_TYPE = typename V::VALUE_TYPE;

	V min;
	V max;

	Box()
	    : min(std::numeric_limits<VALUE_TYPE>::infinity()), max(-std::numeric_limits<VALUE_TYPE>::infinity()) {
	}

	bool IsEmpty() const {
		for (idx_t i = 0; i < V::SIZE; i++) {
			if (min[i] > max[i]) {
				return true;
			}
		}
		return false;
	}

	void Stretch(const V &vertex) {
		for (idx_t i = 0; i < V::SIZE; i++) {
			min[i] = MinValue(min[i], vertex[i]);
			max[i] = MaxValue(max[i], vertex[i]);
		}
	}
};

template <class T>
using Box2D = Box<PointXY<T>>;

// Running 2D bounds over every accepted coordinate of a batch. Vertices with a NaN ordinate (empty points) are
// ignored.
struct BoundsTracker {
	Box2D<double> box;

	void Update(double x, double y) {
		if (std::isnan(x) || std::isnan(y)) {
			return;
		}
		box.Stretch(VertexXY(x, y));
	}

	void Update(const VertexXY &vertex) {
		Update(vertex.x, vertex.y);
	}

	bool IsEmpty() const {
		return box.IsEmpty();
	}

	// [minX, minY, maxX, maxY]
	std::array<double, 4> ToArray() const {
		return {{box.min.x, box.min.y, box.max.x, box.max.y}};
	}
};

} // namespace core

} // namespace geoview
