//===----------------------------------------------------------------------===//
//                         DuckDB MSSQL GUID Extension
//
// guid/null_guid.hpp
//
// NullGuid - Guid that may be NULL in the database
//===----------------------------------------------------------------------===//

#pragma once

#include "duckdb/common/types/value.hpp"
#include "guid/guid.hpp"
#include "guid/guid_scan.hpp"

namespace duckdb {
namespace guid {

//===----------------------------------------------------------------------===//
// NullGuid
//
// valid == false is distinct from a valid Nil GUID. An invalid NullGuid always
// holds Guid::Nil() after Scan / FromJSON.
//===----------------------------------------------------------------------===//

struct NullGuid {
	Guid guid;
	bool valid = false;

	NullGuid() = default;
	NullGuid(const Guid &guid_p, bool valid_p) : guid(guid_p), valid(valid_p) {
	}

	// NULL VARCHAR when invalid, otherwise the canonical text
	Value ToValue() const;

	// NULL input -> invalid + Nil; anything else is delegated to Guid::Scan.
	// On error the previous state is kept.
	void Scan(const GuidScanInput &src, GuidBinaryLayout layout = GuidBinaryLayout::MSSQL);

	// "null" when invalid
	string ToJSON() const;

	// JSON null or a string shorter than the canonical form -> invalid, no error.
	// Longer strings must parse.
	void FromJSON(const string &body);
};

}  // namespace guid
}  // namespace duckdb
