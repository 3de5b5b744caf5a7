#include "mssql_guid_extension.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include "guid/guid_settings.hpp"
#include "mssql_guid_functions.hpp"

namespace duckdb {

// Extension version string
static const char *GetMssqlGuidExtensionVersion() {
#ifdef MSSQL_GUID_VERSION
	return MSSQL_GUID_VERSION;
#else
	return "unknown";
#endif
}

static void MssqlGuidExtensionVersionFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto version = GetMssqlGuidExtensionVersion();
	result.SetVectorType(VectorType::CONSTANT_VECTOR);
	ConstantVector::GetData<string_t>(result)[0] = StringVector::AddString(result, version);
}

// Internal function to register extension functionality
static void LoadInternal(ExtensionLoader &loader) {
	// 1. Register GUID settings
	guid::RegisterGuidSettings(loader);

	// 2. Register conversion and generation functions
	RegisterMSSQLGuidFunctions(loader);

	// 3. Register utility functions (mssql_guid_extension_version)
	auto version_func = ScalarFunction("mssql_guid_extension_version", {},  // No arguments
	                                   LogicalType::VARCHAR, MssqlGuidExtensionVersionFunction);
	loader.RegisterFunction(version_func);
}

// Extension class methods
void MssqlGuidExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}

std::string MssqlGuidExtension::Name() {
	return "mssql_guid";
}

std::string MssqlGuidExtension::Version() const {
	return GetMssqlGuidExtensionVersion();
}

}  // namespace duckdb

extern "C" {

// Use the new DUCKDB_CPP_EXTENSION_ENTRY macro for loadable extension entry point
DUCKDB_CPP_EXTENSION_ENTRY(mssql_guid, loader) {
	duckdb::LoadInternal(loader);
}
}
