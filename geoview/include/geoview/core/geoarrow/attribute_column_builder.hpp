#pragma once
#include "geoview/common.hpp"
#include "geoview/core/geoarrow/geoarrow_table.hpp"

namespace geoview {

namespace core {

// Builds the attribute columns of one geometry group, sliced to the group's source rows.
//
// A column is FLOAT64 if every non-null value among the first `sample_size` sliced rows has a numeric type,
// UTF8 otherwise. Strings that look like numbers do not count as numeric. Values that do not fit the inferred
// type are coerced: NaN in a FLOAT64 column, their textual form in a UTF8 column. NULL becomes NaN or "".
struct AttributeColumnBuilder {
	// Non-null and of a numeric logical type
	static bool IsNumeric(const Value &value);

	static AttributeType InferColumnType(const vector<Value> &values, const vector<idx_t> &indices,
	                                     idx_t sample_size);

	static double CoerceToDouble(const Value &value);
	static string CoerceToString(const Value &value);

	static AttributeColumn BuildColumn(const AttributeInput &input, const vector<idx_t> &indices, idx_t sample_size);

	// One column per attribute, in input order
	static vector<AttributeColumn> Build(const vector<AttributeInput> &attributes, const vector<idx_t> &indices,
	                                     idx_t sample_size);
};

} // namespace core

} // namespace geoview
