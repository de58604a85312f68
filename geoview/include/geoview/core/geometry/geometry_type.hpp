#pragma once
#include "geoview/common.hpp"

namespace geoview {

namespace core {

// The six geometry types that have a native GeoArrow layout, plus UNKNOWN for everything else (empty payload,
// GeometryCollection, unrecognized type codes).
enum class GeometryType : uint8_t {
	POINT = 0,
	LINESTRING,
	POLYGON,
	MULTIPOINT,
	MULTILINESTRING,
	MULTIPOLYGON,
	UNKNOWN
};

struct GeometryTypes {
	static constexpr idx_t SUPPORTED_TYPE_COUNT = 6;

	static bool IsSupported(GeometryType type) {
		return type != GeometryType::UNKNOWN;
	}

	static bool IsSinglePart(GeometryType type) {
		return type == GeometryType::POINT || type == GeometryType::LINESTRING;
	}

	static bool IsMultiPart(GeometryType type) {
		return type == GeometryType::POLYGON || type == GeometryType::MULTIPOINT ||
		       type == GeometryType::MULTILINESTRING || type == GeometryType::MULTIPOLYGON;
	}

	// The singular element type of a collection, UNKNOWN for anything else
	static GeometryType GetElementType(GeometryType type) {
		switch (type) {
		case GeometryType::MULTIPOINT:
			return GeometryType::POINT;
		case GeometryType::MULTILINESTRING:
			return GeometryType::LINESTRING;
		case GeometryType::MULTIPOLYGON:
			return GeometryType::POLYGON;
		default:
			return GeometryType::UNKNOWN;
		}
	}

	// Number of List levels above the FixedSizeList(2) coordinate level in the GeoArrow layout
	static idx_t GetNestingDepth(GeometryType type) {
		switch (type) {
		case GeometryType::POINT:
			return 0;
		case GeometryType::LINESTRING:
		case GeometryType::MULTIPOINT:
			return 1;
		case GeometryType::POLYGON:
		case GeometryType::MULTILINESTRING:
			return 2;
		case GeometryType::MULTIPOLYGON:
			return 3;
		default:
			throw InternalException("GeometryTypes::GetNestingDepth: unsupported geometry type %s", ToString(type));
		}
	}

	// Map a base WKB type code (1-indexed, flags already stripped) to a geometry type
	static GeometryType FromWKBCode(uint32_t code) {
		if (code == 0 || code > SUPPORTED_TYPE_COUNT) {
			return GeometryType::UNKNOWN;
		}
		// Subtract 1 since the WKB type is 1-indexed
		return static_cast<GeometryType>(code - 1);
	}

	static string ToString(GeometryType type) {
		switch (type) {
		case GeometryType::POINT:
			return "POINT";
		case GeometryType::LINESTRING:
			return "LINESTRING";
		case GeometryType::POLYGON:
			return "POLYGON";
		case GeometryType::MULTIPOINT:
			return "MULTIPOINT";
		case GeometryType::MULTILINESTRING:
			return "MULTILINESTRING";
		case GeometryType::MULTIPOLYGON:
			return "MULTIPOLYGON";
		case GeometryType::UNKNOWN:
			return "UNKNOWN";
		default:
			return StringUtil::Format("UNKNOWN(%d)", static_cast<int>(type));
		}
	}

	// Lowercase GeoArrow name, e.g. "multipolygon"
	static string GetGeoArrowName(GeometryType type) {
		if (!IsSupported(type)) {
			throw InternalException("GeometryTypes::GetGeoArrowName: unsupported geometry type %s", ToString(type));
		}
		return StringUtil::Lower(ToString(type));
	}

	// Arrow extension name, e.g. "geoarrow.point"
	static string GetExtensionName(GeometryType type) {
		return "geoarrow." + GetGeoArrowName(type);
	}

	// Normalize a geometry type name such as the output of ST_GeometryType ("MULTI POLYGON", "Point", ...).
	// Returns UNKNOWN for anything that is not one of the six supported types.
	static GeometryType FromName(const string &name);
};

} // namespace core

} // namespace geoview
