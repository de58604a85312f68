#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "duckdb/main/extension_util.hpp"

#include "geoview/common.hpp"
#include "geoview/core/functions/scalar.hpp"
#include "geoview/core/geoarrow/geometry_classifier.hpp"
#include "geoview/core/geometry/wkb_reader.hpp"

namespace geoview {

namespace core {

//------------------------------------------------------------------------------
// WKB -> GeoArrow type name
//------------------------------------------------------------------------------
static void GeoArrowTypeFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	D_ASSERT(args.data.size() == 1);
	auto &input = args.data[0];
	auto count = args.size();

	WKBReader reader;
	UnaryExecutor::ExecuteWithNulls<string_t, string_t>(
	    input, result, count, [&](string_t blob, ValidityMask &mask, idx_t idx) {
		    Geometry geom;
		    if (!reader.TryDeserialize(const_data_ptr_cast(blob.GetData()), blob.GetSize(), geom)) {
			    mask.SetInvalid(idx);
			    return string_t();
		    }
		    auto type = GeometryClassifier::Classify(geom);
		    if (type == GeometryType::UNKNOWN) {
			    mask.SetInvalid(idx);
			    return string_t();
		    }
		    return StringVector::AddString(result, GeometryTypes::GetGeoArrowName(type));
	    });
}

//------------------------------------------------------------------------------
// Register functions
//------------------------------------------------------------------------------
void CoreScalarFunctions::RegisterStGeoArrowType(DatabaseInstance &db) {
	ScalarFunctionSet set("ST_GeoArrowType");
	set.AddFunction(ScalarFunction({LogicalType::BLOB}, LogicalType::VARCHAR, GeoArrowTypeFunction));
	ExtensionUtil::RegisterFunction(db, set);
}

} // namespace core

} // namespace geoview
