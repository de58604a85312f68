#include "geoview/core/geoarrow/geoarrow_options.hpp"

#include "duckdb/main/client_context.hpp"
#include "duckdb/main/config.hpp"

namespace geoview {

namespace core {

constexpr const char *GeoArrowOptions::SAMPLE_SIZE_SETTING;
constexpr idx_t GeoArrowOptions::DEFAULT_SAMPLE_SIZE;

void GeoArrowOptions::Verify() const {
	if (attribute_sample_size == 0) {
		throw InvalidInputException("%s must be at least 1", SAMPLE_SIZE_SETTING);
	}
}

GeoArrowOptions GeoArrowOptions::FromContext(ClientContext &context) {
	GeoArrowOptions options;
	Value sample_size;
	if (context.TryGetCurrentSetting(SAMPLE_SIZE_SETTING, sample_size) && !sample_size.IsNull()) {
		options.attribute_sample_size = sample_size.GetValue<uint64_t>();
	}
	options.Verify();
	return options;
}

static void SetSampleSize(ClientContext &context, SetScope scope, Value &parameter) {
	if (parameter.IsNull() || parameter.GetValue<uint64_t>() == 0) {
		throw InvalidInputException("%s must be at least 1", GeoArrowOptions::SAMPLE_SIZE_SETTING);
	}
}

void GeoArrowOptions::Register(DatabaseInstance &db) {
	auto &config = DBConfig::GetConfig(db);
	config.AddExtensionOption(SAMPLE_SIZE_SETTING,
	                          "Number of rows sampled per geometry group to decide whether an attribute column is "
	                          "numeric when building GeoArrow tables",
	                          LogicalType::UBIGINT, Value::UBIGINT(DEFAULT_SAMPLE_SIZE), SetSampleSize);
}

} // namespace core

} // namespace geoview
