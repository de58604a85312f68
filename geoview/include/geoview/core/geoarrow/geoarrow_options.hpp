#pragma once
#include "geoview/common.hpp"
#include "geoview/core/geometry/geometry_type.hpp"

namespace geoview {

namespace core {

struct GeoArrowOptions {
	static constexpr const char *SAMPLE_SIZE_SETTING = "geoarrow_attribute_sample_size";
	static constexpr idx_t DEFAULT_SAMPLE_SIZE = 100;

	// Number of leading rows (of each group's slice) inspected to decide whether an attribute column is numeric
	idx_t attribute_sample_size = DEFAULT_SAMPLE_SIZE;

	// When set (e.g. from GeoParquet metadata), skip classification and put every row in a single group of this
	// type. UNKNOWN means "classify every row".
	GeometryType known_type = GeometryType::UNKNOWN;

	bool HasKnownType() const {
		return known_type != GeometryType::UNKNOWN;
	}

	void Verify() const;

	// Read the options from the current DuckDB settings. QueryResultReader::Build goes through this, so an embedder
	// that builds tables from a connection picks up SET geoarrow_attribute_sample_size.
	static GeoArrowOptions FromContext(ClientContext &context);

	// Register the extension settings
	static void Register(DatabaseInstance &db);
};

} // namespace core

} // namespace geoview
