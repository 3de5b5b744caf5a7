#pragma once

#include "duckdb/main/client_context.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include "guid/guid.hpp"

namespace duckdb {
namespace guid {

//===----------------------------------------------------------------------===//
// GUID Configuration
//===----------------------------------------------------------------------===//

// Default values for GUID settings
constexpr const char *DEFAULT_GUID_BINARY_LAYOUT = "mssql";
constexpr bool DEFAULT_GUID_NULL_ON_ERROR = false;

// GUID configuration structure
// Loaded from DuckDB settings at runtime
struct GuidConfig {
	// Interpretation of 16-byte BLOBs in mssql_guid_scan
	GuidBinaryLayout binary_layout = GuidBinaryLayout::MSSQL;

	// Return NULL instead of raising on malformed input
	bool null_on_error = DEFAULT_GUID_NULL_ON_ERROR;

	// Parse 'mssql' / 'rfc4122' (case-insensitive)
	// @throws InvalidInputException for anything else
	static GuidBinaryLayout ParseBinaryLayout(const string &layout_str);
};

const char *GuidBinaryLayoutToString(GuidBinaryLayout layout);

//===----------------------------------------------------------------------===//
// Registration and Loading
//===----------------------------------------------------------------------===//

// Register all GUID settings with DuckDB
void RegisterGuidSettings(ExtensionLoader &loader);

// Load current GUID configuration from context settings
GuidConfig LoadGuidConfig(ClientContext &context);

}  // namespace guid
}  // namespace duckdb
