//===----------------------------------------------------------------------===//
//                         DuckDB MSSQL GUID Extension
//
// guid.cpp
//
// Byte array core and binary codec
//===----------------------------------------------------------------------===//

#include "guid/guid.hpp"

#include "duckdb/common/exception.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>

// Debug logging controlled by MSSQL_GUID_DEBUG environment variable
static int GetCoreDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("MSSQL_GUID_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define MSSQL_GUID_CORE_DEBUG_LOG(lvl, fmt, ...)                           \
	do {                                                                   \
		if (GetCoreDebugLevel() >= lvl) {                                  \
			fprintf(stderr, "[MSSQL GUID CORE] " fmt "\n", ##__VA_ARGS__); \
		}                                                                  \
	} while (0)

namespace duckdb {
namespace guid {

const char *GuidVariantToString(GuidVariant variant) {
	switch (variant) {
	case GuidVariant::NCS:
		return "NCS";
	case GuidVariant::RFC4122:
		return "RFC4122";
	case GuidVariant::MICROSOFT:
		return "Microsoft";
	case GuidVariant::FUTURE:
	default:
		return "Future";
	}
}

Guid::Guid() {
	bytes_.fill(0);
}

Guid::Guid(const std::array<uint8_t, GUID_SIZE> &bytes) : bytes_(bytes) {
}

Guid Guid::Nil() {
	return Guid();
}

bool Guid::IsNil() const {
	return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

bool Guid::Equal(const Guid &a, const Guid &b) {
	return std::memcmp(a.bytes_.data(), b.bytes_.data(), GUID_SIZE) == 0;
}

bool Guid::operator==(const Guid &other) const {
	return Equal(*this, other);
}

bool Guid::operator!=(const Guid &other) const {
	return !Equal(*this, other);
}

bool Guid::operator<(const Guid &other) const {
	return std::memcmp(bytes_.data(), other.bytes_.data(), GUID_SIZE) < 0;
}

//===----------------------------------------------------------------------===//
// Version / Variant
//===----------------------------------------------------------------------===//

uint8_t Guid::Version() const {
	return bytes_[6] >> 4;
}

GuidVariant Guid::Variant() const {
	// The patterns share prefixes, so the shorter prefix must be tested first
	uint8_t b = bytes_[8];
	if ((b >> 7) == 0x00) {
		return GuidVariant::NCS;
	}
	if ((b >> 6) == 0x02) {
		return GuidVariant::RFC4122;
	}
	if ((b >> 5) == 0x06) {
		return GuidVariant::MICROSOFT;
	}
	return GuidVariant::FUTURE;
}

void Guid::SetVersion(uint8_t version) {
	bytes_[6] = static_cast<uint8_t>((bytes_[6] & 0x0F) | (version << 4));
}

void Guid::SetVariant(GuidVariant variant) {
	uint8_t b = bytes_[8];
	switch (variant) {
	case GuidVariant::NCS:
		b = static_cast<uint8_t>(b & (0xFF >> 1));
		break;
	case GuidVariant::RFC4122:
		b = static_cast<uint8_t>((b & (0xFF >> 2)) | (0x02 << 6));
		break;
	case GuidVariant::MICROSOFT:
		b = static_cast<uint8_t>((b & (0xFF >> 3)) | (0x06 << 5));
		break;
	case GuidVariant::FUTURE:
	default:
		b = static_cast<uint8_t>((b & (0xFF >> 3)) | (0x07 << 5));
		break;
	}
	bytes_[8] = b;
}

//===----------------------------------------------------------------------===//
// Binary Codec
//===----------------------------------------------------------------------===//

vector<uint8_t> Guid::MarshalBinary() const {
	return vector<uint8_t>(bytes_.begin(), bytes_.end());
}

void Guid::UnmarshalBinary(const_data_ptr_t data, idx_t length) {
	if (length != GUID_SIZE) {
		throw InvalidInputException("MSSQL GUID Error: UUID must be exactly %d bytes long, got %d bytes",
		                            static_cast<int64_t>(GUID_SIZE), static_cast<int64_t>(length));
	}
	std::memcpy(bytes_.data(), data, GUID_SIZE);
}

Guid Guid::FromBytes(const_data_ptr_t data, idx_t length) {
	Guid result;
	result.UnmarshalBinary(data, length);
	return result;
}

Guid Guid::FromBytesOrNil(const_data_ptr_t data, idx_t length) {
	if (length != GUID_SIZE) {
		MSSQL_GUID_CORE_DEBUG_LOG(1, "FromBytesOrNil: length %llu, returning nil GUID", (unsigned long long)length);
		return Nil();
	}
	return FromBytes(data, length);
}

std::ostream &operator<<(std::ostream &out, const Guid &guid) {
	return out << guid.ToString();
}

}  // namespace guid
}  // namespace duckdb
