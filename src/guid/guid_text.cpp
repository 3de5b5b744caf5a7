//===----------------------------------------------------------------------===//
//                         DuckDB MSSQL GUID Extension
//
// guid_text.cpp
//
// Canonical text codec: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
//===----------------------------------------------------------------------===//

#include "guid/guid.hpp"

#include "duckdb/common/exception.hpp"

#include <cstdio>
#include <cstdlib>

// Debug logging controlled by MSSQL_GUID_DEBUG environment variable
static int GetTextDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("MSSQL_GUID_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define MSSQL_GUID_TEXT_DEBUG_LOG(lvl, fmt, ...)                           \
	do {                                                                   \
		if (GetTextDebugLevel() >= lvl) {                                  \
			fprintf(stderr, "[MSSQL GUID TEXT] " fmt "\n", ##__VA_ARGS__); \
		}                                                                  \
	} while (0)

namespace duckdb {
namespace guid {

// Bytes per hyphen-separated group (8, 4, 4, 4, 12 hex digits)
static const idx_t GROUP_BYTES[GUID_GROUP_COUNT] = {4, 2, 2, 2, 6};

static const char HEX_DIGITS[] = "0123456789abcdef";

static int HexDigitValue(char c) {
	if (c >= '0' && c <= '9') {
		return c - '0';
	}
	if (c >= 'a' && c <= 'f') {
		return c - 'a' + 10;
	}
	if (c >= 'A' && c <= 'F') {
		return c - 'A' + 10;
	}
	return -1;
}

string Guid::ToString() const {
	char buffer[GUID_CANONICAL_SIZE];
	idx_t pos = 0;
	idx_t byte_idx = 0;

	for (idx_t group = 0; group < GUID_GROUP_COUNT; group++) {
		if (group > 0) {
			buffer[pos++] = '-';
		}
		for (idx_t i = 0; i < GROUP_BYTES[group]; i++) {
			uint8_t b = bytes_[byte_idx++];
			buffer[pos++] = HEX_DIGITS[b >> 4];
			buffer[pos++] = HEX_DIGITS[b & 0x0F];
		}
	}

	return string(buffer, GUID_CANONICAL_SIZE);
}

Guid Guid::Parse(const string &text) {
	return Parse(text.c_str(), text.size());
}

Guid Guid::Parse(const char *text, idx_t length) {
	if (length != GUID_CANONICAL_SIZE) {
		throw ConversionException("MSSQL GUID Error: Incorrect UUID length %d (expected %d): '%s'",
		                          static_cast<int64_t>(length), static_cast<int64_t>(GUID_CANONICAL_SIZE),
		                          string(text, length));
	}

	if (text[8] != '-' || text[13] != '-' || text[18] != '-' || text[23] != '-') {
		throw ConversionException("MSSQL GUID Error: Incorrect UUID format, expected hyphens at offsets 8, 13, 18 "
		                          "and 23: '%s'",
		                          string(text, length));
	}

	Guid result;
	idx_t src = 0;
	idx_t dst = 0;

	for (idx_t group = 0; group < GUID_GROUP_COUNT; group++) {
		if (group > 0) {
			src++;  // hyphen
		}
		for (idx_t i = 0; i < GROUP_BYTES[group]; i++) {
			int hi = HexDigitValue(text[src]);
			int lo = HexDigitValue(text[src + 1]);
			if (hi < 0 || lo < 0) {
				idx_t bad = hi < 0 ? src : src + 1;
				throw ConversionException(
				    "MSSQL GUID Error: Invalid hex digit '%s' at offset %d (group %d) in UUID '%s'",
				    string(1, text[bad]), static_cast<int64_t>(bad), static_cast<int64_t>(group + 1),
				    string(text, length));
			}
			result.bytes_[dst++] = static_cast<uint8_t>((hi << 4) | lo);
			src += 2;
		}
	}

	return result;
}

Guid Guid::ParseOrNil(const string &text) {
	if (text.size() != GUID_CANONICAL_SIZE) {
		MSSQL_GUID_TEXT_DEBUG_LOG(1, "ParseOrNil: length %llu, returning nil GUID", (unsigned long long)text.size());
		return Nil();
	}
	try {
		return Parse(text);
	} catch (const ConversionException &ex) {
		MSSQL_GUID_TEXT_DEBUG_LOG(1, "ParseOrNil: returning nil GUID: %s", ex.what());
		return Nil();
	}
}

}  // namespace guid
}  // namespace duckdb
