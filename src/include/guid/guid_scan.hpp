//===----------------------------------------------------------------------===//
//                         DuckDB MSSQL GUID Extension
//
// guid/guid_scan.hpp
//
// Storage boundary input: NULL, raw bytes or text
//===----------------------------------------------------------------------===//

#pragma once

#include "duckdb/common/types.hpp"
#include "duckdb/common/types/value.hpp"
#include "guid/guid.hpp"

#include <string>

namespace duckdb {
namespace guid {

enum class GuidScanKind : uint8_t {
	NULL_VALUE,  // SQL NULL
	BYTES,       // binary column (UNIQUEIDENTIFIER, VARBINARY)
	TEXT         // character column
};

//===----------------------------------------------------------------------===//
// GuidScanInput - Value handed over by the storage layer
//
// The shape of the input is resolved once, when the input is built, and
// Guid::Scan / NullGuid::Scan route on the kind alone.
//===----------------------------------------------------------------------===//

struct GuidScanInput {
	GuidScanKind kind = GuidScanKind::NULL_VALUE;

	// Raw bytes for BYTES, characters for TEXT, empty for NULL_VALUE
	string data;

	static GuidScanInput Null();
	static GuidScanInput Bytes(const_data_ptr_t data, idx_t length);
	static GuidScanInput Text(const string &text);

	// Map a DuckDB value: NULL -> NULL_VALUE, BLOB -> BYTES, VARCHAR -> TEXT
	// @throws InvalidTypeException for any other logical type
	static GuidScanInput FromValue(const Value &value);

	bool IsNull() const {
		return kind == GuidScanKind::NULL_VALUE;
	}

	const_data_ptr_t GetData() const {
		return reinterpret_cast<const_data_ptr_t>(data.data());
	}
	idx_t GetSize() const {
		return data.size();
	}
};

const char *GuidScanKindToString(GuidScanKind kind);

}  // namespace guid
}  // namespace duckdb
