#include "geoview/core/geoarrow/attribute_column_builder.hpp"

namespace geoview {

namespace core {

bool AttributeColumnBuilder::IsNumeric(const Value &value) {
	return !value.IsNull() && value.type().IsNumeric();
}

AttributeType AttributeColumnBuilder::InferColumnType(const vector<Value> &values, const vector<idx_t> &indices,
                                                      idx_t sample_size) {
	const auto sample_end = MinValue<idx_t>(indices.size(), sample_size);
	for (idx_t i = 0; i < sample_end; i++) {
		D_ASSERT(indices[i] < values.size());
		auto &value = values[indices[i]];
		if (!value.IsNull() && !IsNumeric(value)) {
			return AttributeType::UTF8;
		}
	}
	return AttributeType::FLOAT64;
}

double AttributeColumnBuilder::CoerceToDouble(const Value &value) {
	if (!IsNumeric(value)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	return value.GetValue<double>();
}

string AttributeColumnBuilder::CoerceToString(const Value &value) {
	if (value.IsNull()) {
		return string();
	}
	return value.ToString();
}

AttributeColumn AttributeColumnBuilder::BuildColumn(const AttributeInput &input, const vector<idx_t> &indices,
                                                    idx_t sample_size) {
	AttributeColumn column;
	column.name = input.name;
	column.declared_type = input.declared_type;
	column.length = indices.size();
	column.type = InferColumnType(input.values, indices, sample_size);

	if (column.type == AttributeType::FLOAT64) {
		column.numeric_data.reserve(indices.size());
		for (auto &row_idx : indices) {
			column.numeric_data.push_back(CoerceToDouble(input.values[row_idx]));
		}
		return column;
	}

	column.string_offsets.reserve(indices.size() + 1);
	for (auto &row_idx : indices) {
		column.string_offsets.push_back(static_cast<int32_t>(column.string_data.size()));
		auto text = CoerceToString(input.values[row_idx]);
		column.string_data.insert(column.string_data.end(), text.begin(), text.end());
		if (column.string_data.size() > static_cast<idx_t>(NumericLimits<int32_t>::Maximum())) {
			throw InvalidInputException("Attribute column \"%s\" holds more than %d bytes of text", input.name,
			                            NumericLimits<int32_t>::Maximum());
		}
	}
	column.string_offsets.push_back(static_cast<int32_t>(column.string_data.size()));
	return column;
}

vector<AttributeColumn> AttributeColumnBuilder::Build(const vector<AttributeInput> &attributes,
                                                      const vector<idx_t> &indices, idx_t sample_size) {
	vector<AttributeColumn> columns;
	columns.reserve(attributes.size());
	for (auto &attribute : attributes) {
		columns.push_back(BuildColumn(attribute, indices, sample_size));
	}
	return columns;
}

} // namespace core

} // namespace geoview
