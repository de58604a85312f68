#include "geoview/core/geoarrow/geoarrow_builder.hpp"
#include "geoview/core/geoarrow/attribute_column_builder.hpp"
#include "geoview/core/geoarrow/geometry_column_builder.hpp"
#include "geoview/core/geometry/wkb_reader.hpp"

#include "yyjson.h"

namespace geoview {

namespace core {

constexpr const char *GeoArrowBuilder::CRS84;

string GeoArrowBuilder::GetExtensionMetadata() {
	auto doc = yyjson_mut_doc_new(nullptr);
	if (!doc) {
		throw InternalException("Could not allocate the GeoArrow extension metadata document");
	}
	auto root = yyjson_mut_obj(doc);
	yyjson_mut_doc_set_root(doc, root);

	auto crs = yyjson_mut_obj(doc);
	yyjson_mut_obj_add_val(doc, root, "crs", crs);
	yyjson_mut_obj_add_str(doc, crs, "type", "name");
	auto properties = yyjson_mut_obj(doc);
	yyjson_mut_obj_add_val(doc, crs, "properties", properties);
	yyjson_mut_obj_add_str(doc, properties, "name", CRS84);

	size_t json_size = 0;
	auto json_data = yyjson_mut_write(doc, 0, &json_size);
	yyjson_mut_doc_free(doc);
	if (!json_data) {
		throw InternalException("Could not write the GeoArrow extension metadata");
	}
	string result(json_data, json_size);
	free(json_data);
	return result;
}

GeoArrowResult GeoArrowBuilder::BuildGroup(const GeometryGroup &group, const GeoArrowInput &input,
                                           const GeoArrowOptions &options, const string &extension_metadata,
                                           BoundsTracker &bounds) {
	auto geometry = GeometryColumnBuilder::Build(group.type, group.geometries, bounds);
	auto attributes = AttributeColumnBuilder::Build(input.attributes, group.source_indices,
	                                                options.attribute_sample_size);

	GeoArrowResult result;
	result.table = make_shared_ptr<GeoArrowTable>(std::move(geometry), std::move(attributes), extension_metadata);
	result.geometry_type = group.type;
	result.source_indices = group.source_indices;
	return result;
}

vector<GeoArrowResult> GeoArrowBuilder::Build(const GeoArrowInput &input, const GeoArrowOptions &options,
                                              BatchStatistics *stats) {
	input.Verify();
	options.Verify();

	BatchStatistics local_stats;
	local_stats.row_count = input.RowCount();

	WKBReader reader;
	vector<GeoArrowResult> results;

	if (options.HasKnownType()) {
		// Every row goes into the one group, in source order. Rows of another type (or that do not decode) keep
		// their slot with an empty slice so the table stays aligned with the batch.
		GeometryGroup group;
		group.type = options.known_type;
		group.geometries.reserve(input.RowCount());
		group.source_indices.reserve(input.RowCount());
		for (idx_t row_idx = 0; row_idx < input.RowCount(); row_idx++) {
			Geometry geom;
			if (!reader.TryDeserialize(input.wkb_blobs[row_idx], geom)) {
				local_stats.malformed_count++;
			} else if (GeometryClassifier::Classify(geom) != options.known_type) {
				// Also covers supported types other than the known one, they only get an empty slice
				local_stats.unsupported_count++;
			} else {
				local_stats.accepted_count++;
			}
			group.geometries.push_back(std::move(geom));
			group.source_indices.push_back(row_idx);
		}

		if (!group.geometries.empty()) {
			BoundsTracker bounds;
			results.push_back(BuildGroup(group, input, options, GetExtensionMetadata(), bounds));
			results.back().bounds = bounds;
		}
		if (stats) {
			*stats = local_stats;
		}
		return results;
	}

	GeometryClassifier classifier;
	for (idx_t row_idx = 0; row_idx < input.RowCount(); row_idx++) {
		Geometry geom;
		if (!reader.TryDeserialize(input.wkb_blobs[row_idx], geom)) {
			local_stats.malformed_count++;
			continue;
		}
		if (!classifier.Add(row_idx, std::move(geom))) {
			local_stats.unsupported_count++;
		}
	}
	local_stats.accepted_count = classifier.AcceptedCount();

	if (!classifier.Groups().empty()) {
		auto extension_metadata = GetExtensionMetadata();
		BoundsTracker bounds;
		for (auto &group : classifier.Groups()) {
			results.push_back(BuildGroup(group, input, options, extension_metadata, bounds));
		}
		// Only now do the bounds cover every group
		for (auto &result : results) {
			result.bounds = bounds;
		}
	}

	if (stats) {
		*stats = local_stats;
	}
	return results;
}

} // namespace core

} // namespace geoview
