#include "tds/encoding/guid_encoding.hpp"

#include "duckdb/common/exception.hpp"

#include <cstdio>

namespace duckdb {
namespace guid {

static uint32_t LoadLittleEndian32(const_data_ptr_t p) {
	return static_cast<uint32_t>(p[0]) | static_cast<uint32_t>(p[1]) << 8 | static_cast<uint32_t>(p[2]) << 16 |
	       static_cast<uint32_t>(p[3]) << 24;
}

static uint16_t LoadLittleEndian16(const_data_ptr_t p) {
	return static_cast<uint16_t>(p[0] | p[1] << 8);
}

static uint32_t LoadBigEndian32(const_data_ptr_t p) {
	return static_cast<uint32_t>(p[0]) << 24 | static_cast<uint32_t>(p[1]) << 16 | static_cast<uint32_t>(p[2]) << 8 |
	       static_cast<uint32_t>(p[3]);
}

static uint16_t LoadBigEndian16(const_data_ptr_t p) {
	return static_cast<uint16_t>(p[0] << 8 | p[1]);
}

static void StoreLittleEndian32(uint32_t value, data_ptr_t p) {
	p[0] = static_cast<uint8_t>(value & 0xFF);
	p[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
	p[2] = static_cast<uint8_t>((value >> 16) & 0xFF);
	p[3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}

static void StoreLittleEndian16(uint16_t value, data_ptr_t p) {
	p[0] = static_cast<uint8_t>(value & 0xFF);
	p[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
}

static void StoreBigEndian32(uint32_t value, data_ptr_t p) {
	p[0] = static_cast<uint8_t>((value >> 24) & 0xFF);
	p[1] = static_cast<uint8_t>((value >> 16) & 0xFF);
	p[2] = static_cast<uint8_t>((value >> 8) & 0xFF);
	p[3] = static_cast<uint8_t>(value & 0xFF);
}

static void StoreBigEndian16(uint16_t value, data_ptr_t p) {
	p[0] = static_cast<uint8_t>((value >> 8) & 0xFF);
	p[1] = static_cast<uint8_t>(value & 0xFF);
}

static void CheckWireLength(idx_t length) {
	if (length != GUID_SIZE) {
		throw InvalidInputException("MSSQL GUID Error: UNIQUEIDENTIFIER must be exactly %d bytes long, got %d bytes",
		                            static_cast<int64_t>(GUID_SIZE), static_cast<int64_t>(length));
	}
}

//===----------------------------------------------------------------------===//
// Wire -> canonical
//===----------------------------------------------------------------------===//

Guid GuidEncoding::FromMSSQLBytes(const_data_ptr_t data, idx_t length) {
	CheckWireLength(length);

	uint32_t a = LoadLittleEndian32(data);
	uint16_t b = LoadLittleEndian16(data + 4);
	uint16_t c = LoadLittleEndian16(data + 6);

	uint16_t d = LoadBigEndian16(data + 8);
	uint16_t e = LoadBigEndian16(data + 10);
	uint32_t f = LoadBigEndian32(data + 12);

	char text[GUID_CANONICAL_SIZE + 1];
	snprintf(text, sizeof(text), "%08x-%04x-%04x-%04x-%04x%08x", static_cast<unsigned>(a), static_cast<unsigned>(b),
	         static_cast<unsigned>(c), static_cast<unsigned>(d), static_cast<unsigned>(e), static_cast<unsigned>(f));

	return Guid::Parse(text, GUID_CANONICAL_SIZE);
}

//===----------------------------------------------------------------------===//
// Canonical -> wire
//===----------------------------------------------------------------------===//

void GuidEncoding::ToMSSQLBytes(const Guid &guid, data_ptr_t output) {
	auto data = guid.Data();

	// Data1..Data3 are written little-endian
	StoreLittleEndian32(LoadBigEndian32(data), output);
	StoreLittleEndian16(LoadBigEndian16(data + 4), output + 4);
	StoreLittleEndian16(LoadBigEndian16(data + 6), output + 6);

	// Data4 and Data5 keep big-endian order
	StoreBigEndian16(LoadBigEndian16(data + 8), output + 8);
	StoreBigEndian16(LoadBigEndian16(data + 10), output + 10);
	StoreBigEndian32(LoadBigEndian32(data + 12), output + 12);
}

vector<uint8_t> GuidEncoding::ToMSSQLBytes(const Guid &guid) {
	vector<uint8_t> result(GUID_SIZE);
	ToMSSQLBytes(guid, result.data());
	return result;
}

//===----------------------------------------------------------------------===//
// DuckDB UUID interop
//===----------------------------------------------------------------------===//

hugeint_t GuidEncoding::ToUUID(const Guid &guid) {
	auto data = guid.Data();
	uint64_t upper = 0;
	uint64_t lower = 0;
	for (idx_t i = 0; i < 8; i++) {
		upper = (upper << 8) | data[i];
		lower = (lower << 8) | data[i + 8];
	}

	hugeint_t result;
	result.upper = static_cast<int64_t>(upper ^ (uint64_t(1) << 63));
	result.lower = lower;
	return result;
}

Guid GuidEncoding::FromUUID(const hugeint_t &uuid) {
	uint64_t upper = static_cast<uint64_t>(uuid.upper) ^ (uint64_t(1) << 63);
	uint64_t lower = uuid.lower;

	std::array<uint8_t, GUID_SIZE> bytes;
	for (idx_t i = 0; i < 8; i++) {
		bytes[i] = static_cast<uint8_t>((upper >> (56 - i * 8)) & 0xFF);
		bytes[i + 8] = static_cast<uint8_t>((lower >> (56 - i * 8)) & 0xFF);
	}
	return Guid(bytes);
}

hugeint_t GuidEncoding::ConvertGuid(const_data_ptr_t data, idx_t length) {
	return ToUUID(FromMSSQLBytes(data, length));
}

}  // namespace guid
}  // namespace duckdb
