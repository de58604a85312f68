#pragma once
#include "geoview/common.hpp"
#include "geoview/core/geometry/geometry.hpp"
#include "geoview/core/geometry/wkb_util.hpp"
#include "geoview/core/util/cursor.hpp"

namespace geoview {

namespace core {

// Decodes ISO WKB and PostGIS EWKB into a 2D Geometry. Z and M ordinates are parsed (so the cursor stays aligned)
// but dropped. SRIDs are skipped. A reader holds no state between calls, so one instance can be reused for a
// whole batch.
class WKBReader {
private:
	// Primitives
	uint8_t ReadByteOrder(Cursor &cursor);
	WKBTypeCode ReadType(Cursor &cursor, bool little_endian);
	uint32_t ReadCount(Cursor &cursor, bool little_endian, idx_t min_element_size);
	VertexXY ReadVertex(Cursor &cursor, bool little_endian, uint32_t extra_dims);

	// Geometries
	Geometry ReadPoint(Cursor &cursor, bool little_endian, uint32_t extra_dims);
	Geometry ReadLineString(Cursor &cursor, bool little_endian, uint32_t extra_dims);
	Geometry ReadPolygon(Cursor &cursor, bool little_endian, uint32_t extra_dims);
	Geometry ReadCollection(Cursor &cursor, bool little_endian, GeometryType collection_type);
	Geometry ReadGeometry(Cursor &cursor);

public:
	WKBReader() = default;

	// Throws a SerializationException on malformed input
	Geometry Deserialize(const_data_ptr_t wkb, idx_t size);
	Geometry Deserialize(const string &wkb) {
		return Deserialize(const_data_ptr_cast(wkb.data()), wkb.size());
	}

	// Returns false on malformed input instead of throwing. Unsupported geometry types (e.g. GeometryCollection)
	// still decode successfully, to an UNKNOWN geometry.
	bool TryDeserialize(const_data_ptr_t wkb, idx_t size, Geometry &result);
	bool TryDeserialize(const string &wkb, Geometry &result) {
		return TryDeserialize(const_data_ptr_cast(wkb.data()), wkb.size(), result);
	}
};

} // namespace core

} // namespace geoview
