//===----------------------------------------------------------------------===//
//                         DuckDB MSSQL GUID Extension
//
// tds/encoding/guid_encoding.hpp
//
// SQL Server UNIQUEIDENTIFIER wire format <-> canonical Guid
//===----------------------------------------------------------------------===//

#pragma once

#include "duckdb/common/types.hpp"
#include "duckdb/common/types/hugeint.hpp"
#include "guid/guid.hpp"

#include <cstdint>

namespace duckdb {
namespace guid {

//===----------------------------------------------------------------------===//
// GuidEncoding - Convert SQL Server UNIQUEIDENTIFIER wire format
//
// TDS GUID format (mixed-endian):
//   bytes 0-3:   Data1 (little-endian uint32)
//   bytes 4-5:   Data2 (little-endian uint16)
//   bytes 6-7:   Data3 (little-endian uint16)
//   bytes 8-9:   Data4 (big-endian uint16)
//   bytes 10-15: Data5 (big-endian, 2 + 4 bytes)
//
// Canonical (RFC 4122) layout stores every field big-endian.
//===----------------------------------------------------------------------===//

class GuidEncoding {
public:
	// Decode wire bytes into a canonical Guid.
	// The fields are rendered to canonical text and parsed by Guid::Parse, so the
	// text codec stays the only writer of canonical byte order.
	// @throws InvalidInputException unless length == GUID_SIZE
	static Guid FromMSSQLBytes(const_data_ptr_t data, idx_t length);

	// Encode a canonical Guid into wire bytes
	// Output buffer must be 16 bytes
	static void ToMSSQLBytes(const Guid &guid, data_ptr_t output);
	static vector<uint8_t> ToMSSQLBytes(const Guid &guid);

	//===----------------------------------------------------------------------===//
	// DuckDB UUID interop
	//
	// DuckDB stores UUID as a big-endian hugeint_t with the top bit flipped
	// so that signed comparison sorts like the unsigned byte string.
	//===----------------------------------------------------------------------===//

	static hugeint_t ToUUID(const Guid &guid);
	static Guid FromUUID(const hugeint_t &uuid);

	// Convert SQL Server UNIQUEIDENTIFIER (16 bytes) straight to DuckDB UUID
	static hugeint_t ConvertGuid(const_data_ptr_t data, idx_t length);
};

}  // namespace guid
}  // namespace duckdb
