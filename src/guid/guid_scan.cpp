//===----------------------------------------------------------------------===//
//                         DuckDB MSSQL GUID Extension
//
// guid_scan.cpp
//
// Storage boundary dispatch: Guid::Scan / Guid::ToValue
//===----------------------------------------------------------------------===//

#include "guid/guid_scan.hpp"

#include "duckdb/common/exception.hpp"
#include "tds/encoding/guid_encoding.hpp"

#include <cstdio>
#include <cstdlib>

// Debug logging controlled by MSSQL_GUID_DEBUG environment variable
static int GetScanDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("MSSQL_GUID_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define MSSQL_GUID_SCAN_DEBUG_LOG(lvl, fmt, ...)                           \
	do {                                                                   \
		if (GetScanDebugLevel() >= lvl) {                                  \
			fprintf(stderr, "[MSSQL GUID SCAN] " fmt "\n", ##__VA_ARGS__); \
		}                                                                  \
	} while (0)

namespace duckdb {
namespace guid {

const char *GuidScanKindToString(GuidScanKind kind) {
	switch (kind) {
	case GuidScanKind::NULL_VALUE:
		return "NULL";
	case GuidScanKind::BYTES:
		return "BYTES";
	case GuidScanKind::TEXT:
		return "TEXT";
	default:
		return "UNKNOWN";
	}
}

//===----------------------------------------------------------------------===//
// GuidScanInput
//===----------------------------------------------------------------------===//

GuidScanInput GuidScanInput::Null() {
	return GuidScanInput();
}

GuidScanInput GuidScanInput::Bytes(const_data_ptr_t data, idx_t length) {
	GuidScanInput input;
	input.kind = GuidScanKind::BYTES;
	input.data.assign(reinterpret_cast<const char *>(data), length);
	return input;
}

GuidScanInput GuidScanInput::Text(const string &text) {
	GuidScanInput input;
	input.kind = GuidScanKind::TEXT;
	input.data = text;
	return input;
}

GuidScanInput GuidScanInput::FromValue(const Value &value) {
	if (value.IsNull()) {
		return Null();
	}

	switch (value.type().id()) {
	case LogicalTypeId::BLOB: {
		auto &blob = StringValue::Get(value);
		return Bytes(reinterpret_cast<const_data_ptr_t>(blob.data()), blob.size());
	}
	case LogicalTypeId::VARCHAR:
		return Text(StringValue::Get(value));
	default:
		throw InvalidTypeException(value.type(), "MSSQL GUID Error: cannot convert " + value.type().ToString() +
		                                             " to UUID");
	}
}

//===----------------------------------------------------------------------===//
// Guid storage boundary
//===----------------------------------------------------------------------===//

Value Guid::ToValue() const {
	return Value(ToString());
}

void Guid::Scan(const GuidScanInput &src, GuidBinaryLayout layout) {
	switch (src.kind) {
	case GuidScanKind::BYTES:
		if (src.GetSize() == GUID_SIZE) {
			if (layout == GuidBinaryLayout::MSSQL) {
				MSSQL_GUID_SCAN_DEBUG_LOG(2, "Scan: 16-byte input decoded as UNIQUEIDENTIFIER wire bytes");
				*this = GuidEncoding::FromMSSQLBytes(src.GetData(), src.GetSize());
			} else {
				MSSQL_GUID_SCAN_DEBUG_LOG(2, "Scan: 16-byte input decoded as canonical bytes");
				UnmarshalBinary(src.GetData(), src.GetSize());
			}
			return;
		}
		MSSQL_GUID_SCAN_DEBUG_LOG(2, "Scan: %llu-byte input decoded as text", (unsigned long long)src.GetSize());
		*this = Parse(src.data);
		return;
	case GuidScanKind::TEXT:
		*this = Parse(src.data);
		return;
	case GuidScanKind::NULL_VALUE:
	default:
		throw InvalidTypeException("MSSQL GUID Error: cannot convert " + string(GuidScanKindToString(src.kind)) +
		                           " to UUID");
	}
}

}  // namespace guid
}  // namespace duckdb
