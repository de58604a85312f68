#pragma once
#include "geoview/common.hpp"
#include "geoview/core/geometry/geometry_type.hpp"

namespace geoview {

namespace core {

// A decoded WKB type code. ISO WKB encodes Z/M in the thousands (1001 = Point Z, 2001 = Point M, 3001 = Point ZM),
// PostGIS EWKB encodes them (and the SRID presence) in the high bits. Both conventions are honored at once.
struct WKBTypeCode {
	// The 1-indexed base type code with all dimension flags removed (1 = Point ... 7 = GeometryCollection)
	uint32_t base_code;
	GeometryType type;
	bool has_z;
	bool has_m;
	bool has_srid;

	// Number of ordinates per vertex beyond x and y
	uint32_t ExtraDimensions() const {
		return (has_z ? 1 : 0) + (has_m ? 1 : 0);
	}
};

struct WKBHeader {
	bool little_endian;
	WKBTypeCode type;
	// Zero if the header carries no SRID
	uint32_t srid;
	// Byte order marker + type code (+ SRID)
	idx_t header_size;
};

struct WKBUtil {
	static constexpr uint8_t BIG_ENDIAN_MARKER = 0x00;
	static constexpr uint8_t LITTLE_ENDIAN_MARKER = 0x01;

	static constexpr uint32_t EWKB_Z_FLAG = 0x80000000;
	static constexpr uint32_t EWKB_M_FLAG = 0x40000000;
	static constexpr uint32_t EWKB_SRID_FLAG = 0x20000000;
	static constexpr uint32_t EWKB_FLAG_MASK = 0xE0000000;

	// Byte order marker + 4 byte type code
	static constexpr idx_t MIN_HEADER_SIZE = 5;

	static WKBTypeCode ParseTypeCode(uint32_t raw_type);

	// Read the header of a WKB blob without touching the body. Returns false if the blob is too short or the byte
	// order marker is invalid.
	static bool TryReadHeader(const_data_ptr_t data, idx_t size, WKBHeader &result);

	// Cheap sniffing: a valid byte order marker followed by a base type in 1..7. GeometryCollections count as WKB
	// here even though they are not decoded.
	static bool LooksLikeWKB(const_data_ptr_t data, idx_t size);
	static bool LooksLikeWKB(const string &blob) {
		return LooksLikeWKB(const_data_ptr_cast(blob.data()), blob.size());
	}

	// Non-empty, even length and only hexadecimal digits
	static bool IsHexString(const string &input);

	// Decode a hex encoded (E)WKB string. Returns false if the input is not a hex string.
	static bool TryDecodeHex(const string &hex, string &result);
};

} // namespace core

} // namespace geoview
