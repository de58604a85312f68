#pragma once
#include "geoview/common.hpp"

namespace geoview {

namespace core {

struct CoreScalarFunctions {
public:
	static void Register(DatabaseInstance &db) {
		RegisterStGeoArrowType(db);
		RegisterStIsWKB(db);
	}

private:
	static void RegisterStGeoArrowType(DatabaseInstance &db);
	static void RegisterStIsWKB(DatabaseInstance &db);
};

} // namespace core

} // namespace geoview
