#include "geoview/common.hpp"
#include "geoview/core/geometry/wkb_reader.hpp"
#include "geoview/core/geometry/geometry.hpp"

namespace geoview {

namespace core {

Geometry WKBReader::Deserialize(const_data_ptr_t wkb, idx_t size) {
	if (!wkb || size < WKBUtil::MIN_HEADER_SIZE) {
		throw SerializationException("WKB Reader: buffer of %llu bytes is too short to hold a geometry", size);
	}

	Cursor cursor(wkb, wkb + size);
	return ReadGeometry(cursor);
}

bool WKBReader::TryDeserialize(const_data_ptr_t wkb, idx_t size, Geometry &result) {
	try {
		result = Deserialize(wkb, size);
		return true;
	} catch (SerializationException &) {
		return false;
	}
}

uint8_t WKBReader::ReadByteOrder(Cursor &cursor) {
	auto marker = cursor.Read<uint8_t>();
	if (marker != WKBUtil::BIG_ENDIAN_MARKER && marker != WKBUtil::LITTLE_ENDIAN_MARKER) {
		throw SerializationException("WKB Reader: invalid byte order marker %d", static_cast<int>(marker));
	}
	return marker;
}

WKBTypeCode WKBReader::ReadType(Cursor &cursor, bool little_endian) {
	auto type = WKBUtil::ParseTypeCode(cursor.Read<uint32_t>(little_endian));
	if (type.has_srid) {
		// The SRID is not carried over, just skip it
		cursor.Skip(sizeof(uint32_t));
	}
	return type;
}

uint32_t WKBReader::ReadCount(Cursor &cursor, bool little_endian, idx_t min_element_size) {
	auto count = cursor.Read<uint32_t>(little_endian);
	// Reject counts the remaining bytes cannot possibly satisfy before allocating anything
	if (static_cast<idx_t>(count) * min_element_size > cursor.Remaining()) {
		throw SerializationException("WKB Reader: declared count %u exceeds the %llu remaining bytes", count,
		                             cursor.Remaining());
	}
	return count;
}

VertexXY WKBReader::ReadVertex(Cursor &cursor, bool little_endian, uint32_t extra_dims) {
	auto x = cursor.Read<double>(little_endian);
	auto y = cursor.Read<double>(little_endian);
	// Z and M are not preserved
	cursor.Skip(extra_dims * sizeof(double));
	return VertexXY(x, y);
}

Geometry WKBReader::ReadPoint(Cursor &cursor, bool little_endian, uint32_t extra_dims) {
	auto vertex = ReadVertex(cursor, little_endian, extra_dims);
	return Point::Create(vertex.x, vertex.y);
}

Geometry WKBReader::ReadLineString(Cursor &cursor, bool little_endian, uint32_t extra_dims) {
	const idx_t vertex_size = (2 + extra_dims) * sizeof(double);
	auto count = ReadCount(cursor, little_endian, vertex_size);
	vector<VertexXY> vertices;
	vertices.reserve(count);
	for (uint32_t i = 0; i < count; i++) {
		vertices.push_back(ReadVertex(cursor, little_endian, extra_dims));
	}
	return LineString::Create(std::move(vertices));
}

Geometry WKBReader::ReadPolygon(Cursor &cursor, bool little_endian, uint32_t extra_dims) {
	// Every ring carries at least its own point count
	auto ring_count = ReadCount(cursor, little_endian, sizeof(uint32_t));
	vector<Geometry> rings;
	rings.reserve(ring_count);
	for (uint32_t i = 0; i < ring_count; i++) {
		rings.push_back(ReadLineString(cursor, little_endian, extra_dims));
	}
	return Polygon::Create(std::move(rings));
}

Geometry WKBReader::ReadCollection(Cursor &cursor, bool little_endian, GeometryType collection_type) {
	const auto element_type = GeometryTypes::GetElementType(collection_type);
	D_ASSERT(element_type != GeometryType::UNKNOWN);

	// Every element is a full geometry with its own byte order and type header
	auto count = ReadCount(cursor, little_endian, WKBUtil::MIN_HEADER_SIZE);
	vector<Geometry> elements;
	elements.reserve(count);
	for (uint32_t i = 0; i < count; i++) {
		bool element_order = ReadByteOrder(cursor) == WKBUtil::LITTLE_ENDIAN_MARKER;
		auto element_code = ReadType(cursor, element_order);
		if (element_code.type != element_type) {
			throw SerializationException("WKB Reader: %s cannot contain a geometry of type code %u",
			                             GeometryTypes::ToString(collection_type), element_code.base_code);
		}
		const auto extra_dims = element_code.ExtraDimensions();
		switch (element_type) {
		case GeometryType::POINT:
			elements.push_back(ReadPoint(cursor, element_order, extra_dims));
			break;
		case GeometryType::LINESTRING:
			elements.push_back(ReadLineString(cursor, element_order, extra_dims));
			break;
		case GeometryType::POLYGON:
			elements.push_back(ReadPolygon(cursor, element_order, extra_dims));
			break;
		default:
			throw InternalException("WKB Reader: unexpected collection element type");
		}
	}

	switch (collection_type) {
	case GeometryType::MULTIPOINT:
		return MultiPoint::Create(std::move(elements));
	case GeometryType::MULTILINESTRING:
		return MultiLineString::Create(std::move(elements));
	default:
		return MultiPolygon::Create(std::move(elements));
	}
}

Geometry WKBReader::ReadGeometry(Cursor &cursor) {
	bool little_endian = ReadByteOrder(cursor) == WKBUtil::LITTLE_ENDIAN_MARKER;
	auto type = ReadType(cursor, little_endian);
	const auto extra_dims = type.ExtraDimensions();
	switch (type.type) {
	case GeometryType::POINT:
		return ReadPoint(cursor, little_endian, extra_dims);
	case GeometryType::LINESTRING:
		return ReadLineString(cursor, little_endian, extra_dims);
	case GeometryType::POLYGON:
		return ReadPolygon(cursor, little_endian, extra_dims);
	case GeometryType::MULTIPOINT:
	case GeometryType::MULTILINESTRING:
	case GeometryType::MULTIPOLYGON:
		return ReadCollection(cursor, little_endian, type.type);
	default:
		// GeometryCollection and unrecognized codes: no payload
		return Geometry(GeometryType::UNKNOWN);
	}
}

} // namespace core

} // namespace geoview
