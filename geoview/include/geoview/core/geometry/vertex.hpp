#pragma once

#include "geoview/common.hpp"

namespace geoview {

namespace core {

template <class T>
struct PointXY {
	using VALUE_TYPE = T;
	static constexpr idx_t SIZE = 2;

public:
	T x;
	T y;

public:
	PointXY() = default;
	PointXY(const T &x_p, const T &y_p) : x(x_p), y(y_p) {
	}
	explicit PointXY(const T &val_p) : x(val_p), y(val_p) {
	}

	T &operator[](const idx_t i) {
		D_ASSERT(i < 2);
		return i == 0 ? x : y;
	}
	T operator[](const idx_t i) const {
		D_ASSERT(i < 2);
		return i == 0 ? x : y;
	}

	// Empty WKB points are encoded with NaN ordinates
	bool IsNaN() const {
		return std::isnan(x) || std::isnan(y);
	}

	bool operator==(const PointXY &other) const {
		return x == other.x && y == other.y;
	}

	bool operator!=(const PointXY &other) const {
		return x != other.x || y != other.y;
	}
};

using VertexXY = PointXY<double>;

} // namespace core

} // namespace geoview
