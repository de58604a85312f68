#pragma once
#include "geoview/common.hpp"
#include "geoview/core/geoarrow/geoarrow_table.hpp"

#include "duckdb/common/arrow/arrow.hpp"

namespace geoview {

namespace core {

// Exports a GeoArrow table through the Arrow C data interface as a struct ("+s") record batch. The array
// buffers point straight into the table, which is kept alive until the consumer calls release.
struct ArrowExport {
	static void ToArrowSchema(const GeoArrowTable &table, ArrowSchema *out);
	static void ToArrowArray(const shared_ptr<const GeoArrowTable> &table, ArrowArray *out);
};

} // namespace core

} // namespace geoview
