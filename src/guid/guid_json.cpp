//===----------------------------------------------------------------------===//
//                         DuckDB MSSQL GUID Extension
//
// guid_json.cpp
//
// JSON string literal encode/decode and the Guid JSON hooks
//===----------------------------------------------------------------------===//

#include "guid/guid_json.hpp"

#include "duckdb/common/exception.hpp"
#include "guid/guid.hpp"

#include <cstdio>

namespace duckdb {
namespace guid {

//===----------------------------------------------------------------------===//
// Helpers
//===----------------------------------------------------------------------===//

static bool IsJSONWhitespace(char c) {
	return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

static int HexValue(char c) {
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

// Parse the 4 hex digits of a \uXXXX escape starting at pos; limit is the closing quote
static uint32_t ParseUnicodeEscape(const string &body, idx_t pos, idx_t limit) {
	if (pos + 4 > limit) {
		throw InvalidInputException("MSSQL GUID Error: truncated \\u escape in JSON string: %s", body);
	}
	uint32_t code = 0;
	for (idx_t i = 0; i < 4; i++) {
		int v = HexValue(body[pos + i]);
		if (v < 0) {
			throw InvalidInputException("MSSQL GUID Error: invalid \\u escape in JSON string: %s", body);
		}
		code = (code << 4) | static_cast<uint32_t>(v);
	}
	return code;
}

static void AppendUTF8(uint32_t code, string &out) {
	if (code < 0x80) {
		out.push_back(static_cast<char>(code));
	} else if (code < 0x800) {
		out.push_back(static_cast<char>(0xC0 | (code >> 6)));
		out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
	} else if (code < 0x10000) {
		out.push_back(static_cast<char>(0xE0 | (code >> 12)));
		out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
	} else {
		out.push_back(static_cast<char>(0xF0 | (code >> 18)));
		out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
	}
}

//===----------------------------------------------------------------------===//
// EncodeJSONString / DecodeJSONString
//===----------------------------------------------------------------------===//

string EncodeJSONString(const string &value) {
	string result;
	result.reserve(value.size() + 2);
	result.push_back('"');
	for (char c : value) {
		switch (c) {
		case '"':
			result += "\\\"";
			break;
		case '\\':
			result += "\\\\";
			break;
		case '\b':
			result += "\\b";
			break;
		case '\f':
			result += "\\f";
			break;
		case '\n':
			result += "\\n";
			break;
		case '\r':
			result += "\\r";
			break;
		case '\t':
			result += "\\t";
			break;
		default:
			if (static_cast<unsigned char>(c) < 0x20) {
				char buf[8];
				snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
				result += buf;
			} else {
				result.push_back(c);
			}
			break;
		}
	}
	result.push_back('"');
	return result;
}

bool DecodeJSONString(const string &body, string &out) {
	out.clear();

	idx_t begin = 0;
	idx_t end = body.size();
	while (begin < end && IsJSONWhitespace(body[begin])) {
		begin++;
	}
	while (end > begin && IsJSONWhitespace(body[end - 1])) {
		end--;
	}

	if (body.compare(begin, end - begin, JSON_NULL) == 0) {
		return false;
	}

	if (end - begin < 2 || body[begin] != '"' || body[end - 1] != '"') {
		throw InvalidInputException("MSSQL GUID Error: expected a JSON string or null, got: %s", body);
	}

	for (idx_t pos = begin + 1; pos < end - 1; pos++) {
		char c = body[pos];
		if (c == '"') {
			throw InvalidInputException("MSSQL GUID Error: unexpected quote in JSON string: %s", body);
		}
		if (c != '\\') {
			out.push_back(c);
			continue;
		}

		pos++;
		if (pos >= end - 1) {
			throw InvalidInputException("MSSQL GUID Error: unterminated escape in JSON string: %s", body);
		}
		switch (body[pos]) {
		case '"':
			out.push_back('"');
			break;
		case '\\':
			out.push_back('\\');
			break;
		case '/':
			out.push_back('/');
			break;
		case 'b':
			out.push_back('\b');
			break;
		case 'f':
			out.push_back('\f');
			break;
		case 'n':
			out.push_back('\n');
			break;
		case 'r':
			out.push_back('\r');
			break;
		case 't':
			out.push_back('\t');
			break;
		case 'u': {
			uint32_t code = ParseUnicodeEscape(body, pos + 1, end - 1);
			pos += 4;
			// Surrogate pair
			if (code >= 0xD800 && code <= 0xDBFF && pos + 6 < end - 1 && body[pos + 1] == '\\' &&
			    body[pos + 2] == 'u') {
				uint32_t low = ParseUnicodeEscape(body, pos + 3, end - 1);
				if (low >= 0xDC00 && low <= 0xDFFF) {
					code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
					pos += 6;
				}
			}
			AppendUTF8(code, out);
			break;
		}
		default:
			throw InvalidInputException("MSSQL GUID Error: invalid escape '\\%s' in JSON string: %s",
			                            string(1, body[pos]), body);
		}
	}

	return true;
}

//===----------------------------------------------------------------------===//
// Guid JSON hooks
//===----------------------------------------------------------------------===//

string Guid::ToJSON() const {
	return EncodeJSONString(ToString());
}

void Guid::FromJSON(const string &body) {
	string value;
	DecodeJSONString(body, value);
	*this = Parse(value);
}

}  // namespace guid
}  // namespace duckdb
