#pragma once
#include "geoview/common.hpp"
#include "geoview/core/geoarrow/geoarrow_options.hpp"
#include "geoview/core/geoarrow/geoarrow_table.hpp"
#include "geoview/core/geoarrow/geometry_classifier.hpp"

namespace geoview {

namespace core {

// Turns one batch of WKB rows into one GeoArrow table per geometry type found in the batch.
//
// Rows that fail to decode, or decode to an unsupported type, are dropped and counted in the statistics. All
// results of a batch share the same bounds: the union of every coordinate written to any of the tables.
class GeoArrowBuilder {
public:
	static constexpr const char *CRS84 = "urn:ogc:def:crs:OGC:1.3:CRS84";

	// Results are in the order each geometry type first appears in the batch. An empty batch, or a batch without
	// a single supported geometry, yields no results.
	static vector<GeoArrowResult> Build(const GeoArrowInput &input, const GeoArrowOptions &options,
	                                    BatchStatistics *stats = nullptr);
	static vector<GeoArrowResult> Build(const GeoArrowInput &input) {
		return Build(input, GeoArrowOptions());
	}

	// The ARROW:extension:metadata JSON of the geometry field, declaring OGC:CRS84
	static string GetExtensionMetadata();

private:
	static GeoArrowResult BuildGroup(const GeometryGroup &group, const GeoArrowInput &input,
	                                 const GeoArrowOptions &options, const string &extension_metadata,
	                                 BoundsTracker &bounds);
};

} // namespace core

} // namespace geoview
