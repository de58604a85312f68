#include "geoview/core/geometry/wkb_util.hpp"
#include "geoview/core/util/cursor.hpp"

#include "duckdb/common/types/blob.hpp"

namespace geoview {

namespace core {

constexpr uint8_t WKBUtil::BIG_ENDIAN_MARKER;
constexpr uint8_t WKBUtil::LITTLE_ENDIAN_MARKER;
constexpr uint32_t WKBUtil::EWKB_Z_FLAG;
constexpr uint32_t WKBUtil::EWKB_M_FLAG;
constexpr uint32_t WKBUtil::EWKB_SRID_FLAG;
constexpr uint32_t WKBUtil::EWKB_FLAG_MASK;
constexpr idx_t WKBUtil::MIN_HEADER_SIZE;

WKBTypeCode WKBUtil::ParseTypeCode(uint32_t raw_type) {
	WKBTypeCode result;

	// Strip the EWKB flags before looking at the ISO ranges
	const auto stripped = raw_type & ~EWKB_FLAG_MASK;

	// Check for ISO WKB Z and M ranges
	const auto iso_wkb_props = (stripped % 10000) / 1000;
	result.has_z = (iso_wkb_props == 1) || (iso_wkb_props == 3);
	result.has_m = (iso_wkb_props == 2) || (iso_wkb_props == 3);

	// Check for EWKB Z and M flags
	result.has_z = result.has_z || ((raw_type & EWKB_Z_FLAG) != 0);
	result.has_m = result.has_m || ((raw_type & EWKB_M_FLAG) != 0);
	result.has_srid = (raw_type & EWKB_SRID_FLAG) != 0;

	result.base_code = stripped % 1000;
	result.type = GeometryTypes::FromWKBCode(result.base_code);
	return result;
}

bool WKBUtil::TryReadHeader(const_data_ptr_t data, idx_t size, WKBHeader &result) {
	if (!data || size < MIN_HEADER_SIZE) {
		return false;
	}
	const auto marker = data[0];
	if (marker != BIG_ENDIAN_MARKER && marker != LITTLE_ENDIAN_MARKER) {
		return false;
	}
	result.little_endian = marker == LITTLE_ENDIAN_MARKER;

	Cursor cursor(data + 1, data + size);
	result.type = ParseTypeCode(cursor.Read<uint32_t>(result.little_endian));
	result.srid = 0;
	if (result.type.has_srid) {
		if (cursor.Remaining() < sizeof(uint32_t)) {
			return false;
		}
		result.srid = cursor.Read<uint32_t>(result.little_endian);
	}
	result.header_size = 1 + cursor.Position();
	return true;
}

bool WKBUtil::LooksLikeWKB(const_data_ptr_t data, idx_t size) {
	WKBHeader header;
	if (!TryReadHeader(data, size, header)) {
		return false;
	}
	return header.type.base_code >= 1 && header.type.base_code <= 7;
}

bool WKBUtil::IsHexString(const string &input) {
	if (input.empty() || input.size() % 2 != 0) {
		return false;
	}
	for (auto c : input) {
		if (Blob::HEX_MAP[static_cast<uint8_t>(c)] == -1) {
			return false;
		}
	}
	return true;
}

bool WKBUtil::TryDecodeHex(const string &hex, string &result) {
	if (!IsHexString(hex)) {
		return false;
	}
	const auto hex_ptr = const_data_ptr_cast(hex.data());
	const auto hex_size = hex.size();

	result.clear();
	result.reserve(hex_size / 2);
	for (idx_t hex_idx = 0; hex_idx < hex_size; hex_idx += 2) {
		auto byte_a = Blob::HEX_MAP[hex_ptr[hex_idx]];
		auto byte_b = Blob::HEX_MAP[hex_ptr[hex_idx + 1]];
		D_ASSERT(byte_a != -1);
		D_ASSERT(byte_b != -1);

		result.push_back(static_cast<char>((byte_a << 4) + byte_b));
	}
	return true;
}

} // namespace core

} // namespace geoview
