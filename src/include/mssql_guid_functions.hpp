//===----------------------------------------------------------------------===//
//                         DuckDB MSSQL GUID Extension
//
// mssql_guid_functions.hpp
//
// Scalar functions: mssql_guid_*
//===----------------------------------------------------------------------===//

#pragma once

#include "duckdb.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {

//===----------------------------------------------------------------------===//
// Scalar functions
//
//   mssql_guid_from_bytes(BLOB) -> UUID      SQL Server wire bytes to UUID
//   mssql_guid_to_bytes(UUID) -> BLOB        UUID to SQL Server wire bytes
//   mssql_guid_parse(VARCHAR) -> UUID        strict canonical text
//   mssql_guid_scan(BLOB | VARCHAR) -> UUID  storage boundary dispatch
//   mssql_guid_new() -> UUID                 random version 4 (volatile)
//   mssql_guid_version(UUID) -> UTINYINT
//   mssql_guid_variant(UUID) -> VARCHAR
//
// Conversions honor mssql_guid_null_on_error, mssql_guid_scan honors
// mssql_guid_binary_layout.
//===----------------------------------------------------------------------===//

ScalarFunction GetMSSQLGuidFromBytesFunction();
ScalarFunction GetMSSQLGuidToBytesFunction();
ScalarFunction GetMSSQLGuidParseFunction();
ScalarFunctionSet GetMSSQLGuidScanFunctions();
ScalarFunction GetMSSQLGuidNewFunction();
ScalarFunction GetMSSQLGuidVersionFunction();
ScalarFunction GetMSSQLGuidVariantFunction();

// Register all mssql_guid_* scalar functions
void RegisterMSSQLGuidFunctions(ExtensionLoader &loader);

}  // namespace duckdb
