//===----------------------------------------------------------------------===//
//                         DuckDB MSSQL GUID Extension
//
// guid/guid_json.hpp
//
// Minimal JSON string literal helpers used by the Guid / NullGuid hooks
//===----------------------------------------------------------------------===//

#pragma once

#include "duckdb/common/types.hpp"

#include <string>

namespace duckdb {
namespace guid {

// JSON text of a null value
constexpr const char *JSON_NULL = "null";

// Quote and escape a string as a JSON string literal
string EncodeJSONString(const string &value);

// Decode a JSON document holding a single string literal or null.
// Leading and trailing whitespace is ignored.
// @param body JSON text
// @param out  decoded string (cleared for null)
// @return false if the document is null, true for a string literal
// @throws InvalidInputException for any other JSON value or malformed literal
bool DecodeJSONString(const string &body, string &out);

}  // namespace guid
}  // namespace duckdb
