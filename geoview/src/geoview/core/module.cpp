#include "geoview/core/module.hpp"

#include "geoview/common.hpp"
#include "geoview/core/functions/scalar.hpp"
#include "geoview/core/geoarrow/geoarrow_options.hpp"

namespace geoview {

namespace core {

void CoreModule::Register(DatabaseInstance &db) {
	GeoArrowOptions::Register(db);
	CoreScalarFunctions::Register(db);
}

} // namespace core

} // namespace geoview
