#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "duckdb/main/extension_util.hpp"

#include "geoview/common.hpp"
#include "geoview/core/functions/scalar.hpp"
#include "geoview/core/geometry/wkb_util.hpp"

namespace geoview {

namespace core {

//------------------------------------------------------------------------------
// BLOB -> BOOLEAN
//------------------------------------------------------------------------------
// Only the header is inspected, the body may still be malformed
static void IsWKBFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &input = args.data[0];
	auto count = args.size();

	UnaryExecutor::Execute<string_t, bool>(input, result, count, [&](string_t blob) {
		return WKBUtil::LooksLikeWKB(const_data_ptr_cast(blob.GetData()), blob.GetSize());
	});
}

//------------------------------------------------------------------------------
// Register functions
//------------------------------------------------------------------------------
void CoreScalarFunctions::RegisterStIsWKB(DatabaseInstance &db) {
	ScalarFunctionSet set("ST_IsWKB");
	set.AddFunction(ScalarFunction({LogicalType::BLOB}, LogicalType::BOOLEAN, IsWKBFunction));
	ExtensionUtil::RegisterFunction(db, set);
}

} // namespace core

} // namespace geoview
