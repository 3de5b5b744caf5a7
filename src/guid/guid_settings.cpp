#include "guid/guid_settings.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/main/config.hpp"

namespace duckdb {
namespace guid {

GuidBinaryLayout GuidConfig::ParseBinaryLayout(const string &layout_str) {
	auto lower = StringUtil::Lower(layout_str);
	if (lower == "mssql") {
		return GuidBinaryLayout::MSSQL;
	} else if (lower == "rfc4122") {
		return GuidBinaryLayout::RFC4122;
	}
	throw InvalidInputException("Invalid mssql_guid_binary_layout: '%s'. Must be 'mssql' or 'rfc4122'", layout_str);
}

const char *GuidBinaryLayoutToString(GuidBinaryLayout layout) {
	switch (layout) {
	case GuidBinaryLayout::RFC4122:
		return "rfc4122";
	case GuidBinaryLayout::MSSQL:
	default:
		return "mssql";
	}
}

//===----------------------------------------------------------------------===//
// Setting Validators
//===----------------------------------------------------------------------===//

static void ValidateBinaryLayout(ClientContext &context, SetScope scope, Value &parameter) {
	GuidConfig::ParseBinaryLayout(parameter.ToString());
}

//===----------------------------------------------------------------------===//
// Registration
//===----------------------------------------------------------------------===//

void RegisterGuidSettings(ExtensionLoader &loader) {
	auto &db = loader.GetDatabaseInstance();
	auto &config = DBConfig::GetConfig(db);

	// mssql_guid_binary_layout - How 16-byte BLOBs are read by mssql_guid_scan
	config.AddExtensionOption("mssql_guid_binary_layout",
	                          "Layout of 16-byte BLOBs read by mssql_guid_scan: 'mssql' (wire order) or 'rfc4122'",
	                          LogicalType::VARCHAR, Value(DEFAULT_GUID_BINARY_LAYOUT), ValidateBinaryLayout,
	                          SetScope::GLOBAL);

	// mssql_guid_null_on_error - Return NULL for malformed input
	config.AddExtensionOption("mssql_guid_null_on_error",
	                          "Return NULL instead of raising an error when a GUID conversion fails",
	                          LogicalType::BOOLEAN, Value::BOOLEAN(DEFAULT_GUID_NULL_ON_ERROR), nullptr,
	                          SetScope::GLOBAL);
}

//===----------------------------------------------------------------------===//
// Configuration Loading
//===----------------------------------------------------------------------===//

GuidConfig LoadGuidConfig(ClientContext &context) {
	GuidConfig config;
	Value val;

	if (context.TryGetCurrentSetting("mssql_guid_binary_layout", val)) {
		config.binary_layout = GuidConfig::ParseBinaryLayout(val.ToString());
	}

	if (context.TryGetCurrentSetting("mssql_guid_null_on_error", val)) {
		config.null_on_error = val.GetValue<bool>();
	}

	return config;
}

}  // namespace guid
}  // namespace duckdb
