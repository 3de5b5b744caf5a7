#include "guid/null_guid.hpp"

#include "guid/guid_json.hpp"

namespace duckdb {
namespace guid {

Value NullGuid::ToValue() const {
	if (!valid) {
		return Value(LogicalType::VARCHAR);
	}
	return guid.ToValue();
}

void NullGuid::Scan(const GuidScanInput &src, GuidBinaryLayout layout) {
	if (src.IsNull()) {
		guid = Guid::Nil();
		valid = false;
		return;
	}

	Guid scanned;
	scanned.Scan(src, layout);
	guid = scanned;
	valid = true;
}

string NullGuid::ToJSON() const {
	if (!valid) {
		return JSON_NULL;
	}
	return guid.ToJSON();
}

void NullGuid::FromJSON(const string &body) {
	string value;
	if (!DecodeJSONString(body, value) || value.size() < GUID_CANONICAL_SIZE) {
		guid = Guid::Nil();
		valid = false;
		return;
	}

	guid = Guid::Parse(value);
	valid = true;
}

}  // namespace guid
}  // namespace duckdb
