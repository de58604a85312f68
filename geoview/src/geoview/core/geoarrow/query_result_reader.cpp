#include "geoview/core/geoarrow/query_result_reader.hpp"
#include "geoview/core/geoarrow/geoarrow_builder.hpp"
#include "geoview/core/geometry/wkb_util.hpp"

namespace geoview {

namespace core {

static vector<string> GetTypeNames(const MaterializedQueryResult &result) {
	vector<string> type_names;
	for (auto &type : result.types) {
		type_names.push_back(type.ToString());
	}
	return type_names;
}

idx_t QueryResultReader::FindGeometryColumn(MaterializedQueryResult &result, GeometryEncoding *encoding) {
	auto type_names = GetTypeNames(result);
	auto column_idx = GeometryColumnDetector::FindGeometryColumn(result.names, type_names);
	if (column_idx != DConstants::INVALID_INDEX) {
		if (encoding) {
			auto &type = result.types[column_idx];
			if (GeometryColumnDetector::IsDuckDBGeometryType(type)) {
				*encoding = GeometryEncoding::DUCKDB_GEOMETRY;
			} else if (type.id() == LogicalTypeId::VARCHAR) {
				*encoding = GeometryEncoding::HEX_WKB;
			} else {
				*encoding = GeometryEncoding::WKB;
			}
		}
		return column_idx;
	}
	if (result.RowCount() == 0) {
		return DConstants::INVALID_INDEX;
	}

	vector<Value> row;
	for (idx_t col = 0; col < result.ColumnCount(); col++) {
		row.push_back(result.GetValue(col, 0));
	}
	return GeometryColumnDetector::FindGeometryColumnFromRow(result.names, type_names, row, encoding);
}

string QueryResultReader::ToWKB(const Value &value) {
	if (value.IsNull()) {
		return string();
	}
	if (GeometryColumnDetector::IsDuckDBGeometryType(value.type())) {
		return string();
	}
	switch (value.type().id()) {
	case LogicalTypeId::BLOB:
		return StringValue::Get(value);
	case LogicalTypeId::VARCHAR: {
		string decoded;
		if (WKBUtil::TryDecodeHex(StringValue::Get(value), decoded)) {
			return decoded;
		}
		return string();
	}
	default:
		return string();
	}
}

GeoArrowInput QueryResultReader::Read(MaterializedQueryResult &result, const string &geometry_column) {
	if (result.HasError()) {
		throw InvalidInputException("Cannot read a failed query result: %s", result.GetError());
	}

	idx_t geometry_idx = DConstants::INVALID_INDEX;
	if (!geometry_column.empty()) {
		for (idx_t col = 0; col < result.names.size(); col++) {
			if (result.names[col] == geometry_column) {
				geometry_idx = col;
				break;
			}
		}
		if (geometry_idx == DConstants::INVALID_INDEX) {
			throw InvalidInputException("Geometry column \"%s\" not found in the query result", geometry_column);
		}
	} else {
		geometry_idx = FindGeometryColumn(result);
		if (geometry_idx == DConstants::INVALID_INDEX) {
			throw InvalidInputException("No geometry column detected");
		}
	}
	if (GeometryColumnDetector::IsDuckDBGeometryType(result.types[geometry_idx])) {
		auto &name = result.names[geometry_idx];
		throw InvalidInputException(
		    "Geometry column \"%s\" holds DuckDB GEOMETRY values, select ST_AsWKB(%s) instead", name, name);
	}

	const auto row_count = result.RowCount();
	GeoArrowInput input;
	input.wkb_blobs.reserve(row_count);
	for (idx_t row = 0; row < row_count; row++) {
		input.wkb_blobs.push_back(ToWKB(result.GetValue(geometry_idx, row)));
	}

	for (idx_t col = 0; col < result.ColumnCount(); col++) {
		if (col == geometry_idx) {
			continue;
		}
		vector<Value> values;
		values.reserve(row_count);
		for (idx_t row = 0; row < row_count; row++) {
			values.push_back(result.GetValue(col, row));
		}
		input.AddAttribute(result.names[col], result.types[col].ToString(), std::move(values));
	}
	return input;
}

vector<GeoArrowResult> QueryResultReader::Build(ClientContext &context, MaterializedQueryResult &result,
                                                const string &geometry_column, BatchStatistics *stats) {
	auto input = Read(result, geometry_column);
	return GeoArrowBuilder::Build(input, GeoArrowOptions::FromContext(context), stats);
}

} // namespace core

} // namespace geoview
