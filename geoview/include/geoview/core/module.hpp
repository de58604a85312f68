#pragma once
#include "geoview/common.hpp"

namespace geoview {

namespace core {

struct CoreModule {
public:
	static void Register(DatabaseInstance &db);
};

} // namespace core

} // namespace geoview
