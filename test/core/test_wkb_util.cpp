#include "catch.hpp"
#include "geoview/core/geometry/wkb_util.hpp"
#include "helpers/wkb_builder.hpp"

using namespace geoview;
using namespace geoview::core;
using geoview::test::WKBBuilder;

TEST_CASE("WKB type codes honor ISO and EWKB conventions", "[wkb]") {
	auto plain = WKBUtil::ParseTypeCode(3);
	REQUIRE(plain.type == GeometryType::POLYGON);
	REQUIRE(plain.ExtraDimensions() == 0);
	REQUIRE(!plain.has_srid);

	auto iso_zm = WKBUtil::ParseTypeCode(3006);
	REQUIRE(iso_zm.type == GeometryType::MULTIPOLYGON);
	REQUIRE(iso_zm.has_z);
	REQUIRE(iso_zm.has_m);
	REQUIRE(iso_zm.ExtraDimensions() == 2);

	auto ewkb = WKBUtil::ParseTypeCode(WKBUtil::EWKB_Z_FLAG | WKBUtil::EWKB_SRID_FLAG | 1);
	REQUIRE(ewkb.type == GeometryType::POINT);
	REQUIRE(ewkb.has_z);
	REQUIRE(!ewkb.has_m);
	REQUIRE(ewkb.has_srid);
	REQUIRE(ewkb.base_code == 1);

	auto collection = WKBUtil::ParseTypeCode(1007);
	REQUIRE(collection.base_code == 7);
	REQUIRE(collection.type == GeometryType::UNKNOWN);
}

TEST_CASE("WKB headers can be read without parsing the body", "[wkb]") {
	WKBHeader header;
	auto wkb = WKBBuilder(false).Header(2 | WKBUtil::EWKB_SRID_FLAG).UInt32(4326).Finish();
	REQUIRE(WKBUtil::TryReadHeader(const_data_ptr_cast(wkb.data()), wkb.size(), header));
	REQUIRE(!header.little_endian);
	REQUIRE(header.type.type == GeometryType::LINESTRING);
	REQUIRE(header.srid == 4326);
	REQUIRE(header.header_size == 9);

	// SRID flag without the SRID
	auto truncated = wkb.substr(0, 7);
	REQUIRE(!WKBUtil::TryReadHeader(const_data_ptr_cast(truncated.data()), truncated.size(), header));
}

TEST_CASE("WKB sniffing", "[wkb]") {
	REQUIRE(WKBUtil::LooksLikeWKB(WKBBuilder::Point(1, 2)));
	REQUIRE(WKBUtil::LooksLikeWKB(WKBBuilder::Collection(7, {})));
	REQUIRE(!WKBUtil::LooksLikeWKB(WKBBuilder(true).Header(8).Finish()));
	REQUIRE(!WKBUtil::LooksLikeWKB(string("\x01\x01\x00", 3)));
	REQUIRE(!WKBUtil::LooksLikeWKB(string("POINT (1 2)")));
}

TEST_CASE("Hex encoded WKB", "[wkb]") {
	auto wkb = WKBBuilder::Point(1.5, 2.5);
	auto hex = WKBBuilder::ToHex(wkb);
	REQUIRE(hex == "0101000000000000000000F83F0000000000000440");

	string decoded;
	REQUIRE(WKBUtil::TryDecodeHex(hex, decoded));
	REQUIRE(decoded == wkb);
	REQUIRE(WKBUtil::TryDecodeHex(StringUtil::Lower(hex), decoded));
	REQUIRE(decoded == wkb);

	REQUIRE(!WKBUtil::IsHexString(""));
	REQUIRE(!WKBUtil::IsHexString("ABC"));
	REQUIRE(!WKBUtil::TryDecodeHex("01XY", decoded));
}
