#define DUCKDB_EXTENSION_MAIN

#include "geoview_extension.hpp"
#include "duckdb.hpp"

#include "geoview/core/module.hpp"

namespace duckdb {

static void LoadInternal(DatabaseInstance &instance) {
	geoview::core::CoreModule::Register(instance);
}

void GeoviewExtension::Load(DuckDB &db) {
	LoadInternal(*db.instance);
}

std::string GeoviewExtension::Name() {
	return "geoview";
}

} // namespace duckdb

extern "C" {

DUCKDB_EXTENSION_API void geoview_init(duckdb::DatabaseInstance &db) {
	LoadInternal(db);
}

DUCKDB_EXTENSION_API const char *geoview_version() {
	return duckdb::DuckDB::LibraryVersion();
}
}

#ifndef DUCKDB_EXTENSION_MAIN
#error DUCKDB_EXTENSION_MAIN not defined
#endif
