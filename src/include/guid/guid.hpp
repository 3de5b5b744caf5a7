//===----------------------------------------------------------------------===//
//                         DuckDB MSSQL GUID Extension
//
// guid/guid.hpp
//
// 16-byte UNIQUEIDENTIFIER value with canonical text and binary codecs
//===----------------------------------------------------------------------===//

#pragma once

#include "duckdb/common/types.hpp"
#include "duckdb/common/types/value.hpp"

#include <array>
#include <cstdint>
#include <ostream>
#include <string>

namespace duckdb {
namespace guid {

//===----------------------------------------------------------------------===//
// Constants
//===----------------------------------------------------------------------===//

// Size of a GUID in bytes
constexpr idx_t GUID_SIZE = 16;

// Length of the canonical text form xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
constexpr idx_t GUID_CANONICAL_SIZE = 36;

// Number of hyphen-separated groups in the canonical text form
constexpr idx_t GUID_GROUP_COUNT = 5;

// Version stamped by the random generator
constexpr uint8_t GUID_VERSION_RANDOM = 4;

//! Layout family encoded in the top bits of byte 8
enum class GuidVariant : uint8_t {
	NCS = 0,        // 0xx
	RFC4122 = 1,    // 10x
	MICROSOFT = 2,  // 110
	FUTURE = 3      // 111
};

//! How a 16-byte buffer arriving at the storage boundary is interpreted
enum class GuidBinaryLayout : uint8_t {
	MSSQL,   // SQL Server mixed-endian wire bytes
	RFC4122  // canonical big-endian bytes
};

const char *GuidVariantToString(GuidVariant variant);

struct GuidScanInput;

//===----------------------------------------------------------------------===//
// Guid - UUID value stored in canonical (RFC 4122, big-endian) byte order
//
// The byte order held here is never ambiguous. Conversion from and to the
// SQL Server wire layout happens in tds/encoding/guid_encoding.hpp before any
// other operation touches the value.
//===----------------------------------------------------------------------===//

class Guid {
public:
	// Nil GUID (all zero bytes)
	Guid();
	explicit Guid(const std::array<uint8_t, GUID_SIZE> &bytes);

	static Guid Nil();

	//===----------------------------------------------------------------------===//
	// Raw Access
	//===----------------------------------------------------------------------===//

	const std::array<uint8_t, GUID_SIZE> &Bytes() const {
		return bytes_;
	}
	const_data_ptr_t Data() const {
		return bytes_.data();
	}

	bool IsNil() const;

	static bool Equal(const Guid &a, const Guid &b);

	bool operator==(const Guid &other) const;
	bool operator!=(const Guid &other) const;
	bool operator<(const Guid &other) const;

	//===----------------------------------------------------------------------===//
	// Version / Variant bits
	//===----------------------------------------------------------------------===//

	// Top nibble of byte 6
	uint8_t Version() const;

	// Classification of byte 8; tests the 1, 2 and 3 bit prefixes in that order
	GuidVariant Variant() const;

	// Replaces the top nibble of byte 6; any 4-bit value is accepted
	void SetVersion(uint8_t version);

	// Replaces the variant prefix bits of byte 8
	void SetVariant(GuidVariant variant);

	//===----------------------------------------------------------------------===//
	// Text Codec
	//===----------------------------------------------------------------------===//

	// Lower-case canonical form, 36 characters
	string ToString() const;

	// Strict canonical parse. Hex digits may be of either case.
	// @throws ConversionException on wrong length, misplaced hyphen or non-hex digit
	static Guid Parse(const string &text);
	static Guid Parse(const char *text, idx_t length);

	// Same as Parse but returns Nil on malformed input
	static Guid ParseOrNil(const string &text);

	//===----------------------------------------------------------------------===//
	// Binary Codec (canonical byte order, no endian conversion)
	//===----------------------------------------------------------------------===//

	vector<uint8_t> MarshalBinary() const;

	// @throws InvalidInputException unless length == GUID_SIZE
	void UnmarshalBinary(const_data_ptr_t data, idx_t length);

	static Guid FromBytes(const_data_ptr_t data, idx_t length);
	static Guid FromBytesOrNil(const_data_ptr_t data, idx_t length);

	//===----------------------------------------------------------------------===//
	// Storage Boundary (guid_scan.cpp)
	//===----------------------------------------------------------------------===//

	// Value written back to storage: always canonical text (VARCHAR)
	Value ToValue() const;

	// Reads a value delivered by the storage layer.
	// A 16-byte buffer is decoded according to layout, any other buffer
	// length and text input go through the Text Codec.
	// @throws InvalidTypeException for a NULL input
	void Scan(const GuidScanInput &src, GuidBinaryLayout layout = GuidBinaryLayout::MSSQL);

	//===----------------------------------------------------------------------===//
	// JSON (guid_json.cpp)
	//===----------------------------------------------------------------------===//

	// JSON string literal holding the canonical form
	string ToJSON() const;

	// Accepts a JSON string literal; JSON null decodes to an empty string and
	// therefore fails the length check
	void FromJSON(const string &body);

private:
	std::array<uint8_t, GUID_SIZE> bytes_;
};

std::ostream &operator<<(std::ostream &out, const Guid &guid);

}  // namespace guid
}  // namespace duckdb
