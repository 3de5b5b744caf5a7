// test/cpp/test_guid_encoding.cpp
// Unit tests for GuidEncoding - UNIQUEIDENTIFIER mixed-endian wire format
//
// These tests do NOT require a running SQL Server instance.
// They check the byte layout against known SQL Server values.
//
// Tests cover:
// - Wire bytes -> canonical GUID
// - Canonical GUID -> wire bytes
// - DuckDB UUID (hugeint_t) interop
// - Length validation

#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "duckdb/common/exception.hpp"
#include "duckdb/common/types/hugeint.hpp"
#include "duckdb/common/types/uuid.hpp"
#include "tds/encoding/guid_encoding.hpp"

using namespace duckdb;
using namespace duckdb::guid;

//==============================================================================
// Helper Functions
//==============================================================================

std::string BytesToHex(const std::vector<uint8_t> &bytes) {
	std::stringstream ss;
	for (size_t i = 0; i < bytes.size(); i++) {
		if (i > 0)
			ss << " ";
		ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(bytes[i]);
	}
	return ss.str();
}

#define ASSERT_BYTES_EQ(actual, expected)                                                        \
	do {                                                                                         \
		if ((actual) != (expected)) {                                                            \
			std::cerr << "ASSERTION FAILED at " << __FILE__ << ":" << __LINE__ << std::endl;     \
			std::cerr << "  Expected bytes: " << BytesToHex(expected) << std::endl;              \
			std::cerr << "  Actual bytes:   " << BytesToHex(actual) << std::endl;                \
			throw std::runtime_error("assertion failed");                                        \
		}                                                                                        \
	} while (0)

#define ASSERT_EQ(actual, expected)                                                              \
	do {                                                                                         \
		if ((actual) != (expected)) {                                                            \
			std::cerr << "ASSERTION FAILED at " << __FILE__ << ":" << __LINE__ << std::endl;     \
			std::cerr << "  Expected: " << (expected) << std::endl;                              \
			std::cerr << "  Actual:   " << (actual) << std::endl;                                \
			throw std::runtime_error("assertion failed");                                        \
		}                                                                                        \
	} while (0)

#define ASSERT_THROWS(statement, exception_type)                                                 \
	do {                                                                                         \
		bool thrown = false;                                                                     \
		try {                                                                                    \
			statement;                                                                           \
		} catch (const exception_type &) {                                                       \
			thrown = true;                                                                       \
		}                                                                                        \
		if (!thrown) {                                                                           \
			std::cerr << "ASSERTION FAILED at " << __FILE__ << ":" << __LINE__ << std::endl;     \
			std::cerr << "  Expected exception: " #exception_type << std::endl;                  \
			throw std::runtime_error("assertion failed");                                        \
		}                                                                                        \
	} while (0)

// DNS namespace GUID as SQL Server sends it
static const std::vector<uint8_t> DNS_WIRE = {0x10, 0xb8, 0xa7, 0x6b, 0xad, 0x9d, 0xd1, 0x11,
                                              0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8};
static const char *DNS_TEXT = "6ba7b810-9dad-11d1-80b4-00c04fd430c8";

//==============================================================================
// Test: Wire -> canonical
//==============================================================================
void test_from_mssql_bytes() {
	std::cout << "\n=== Test: FromMSSQLBytes ===" << std::endl;

	auto guid = GuidEncoding::FromMSSQLBytes(DNS_WIRE.data(), DNS_WIRE.size());
	ASSERT_EQ(guid.ToString(), std::string(DNS_TEXT));
	std::cout << "  " << BytesToHex(DNS_WIRE) << " -> " << guid << std::endl;

	// 550e8400-e29b-41d4-a716-446655440000
	std::vector<uint8_t> wire = {0x00, 0x84, 0x0e, 0x55, 0x9b, 0xe2, 0xd4, 0x41,
	                             0xa7, 0x16, 0x44, 0x66, 0x55, 0x44, 0x00, 0x00};
	guid = GuidEncoding::FromMSSQLBytes(wire.data(), wire.size());
	ASSERT_EQ(guid.ToString(), std::string("550e8400-e29b-41d4-a716-446655440000"));

	// All zeros stays nil
	std::vector<uint8_t> zeros(GUID_SIZE, 0);
	ASSERT_EQ(GuidEncoding::FromMSSQLBytes(zeros.data(), zeros.size()).IsNil(), true);

	std::cout << "PASSED!" << std::endl;
}

//==============================================================================
// Test: Canonical -> wire
//==============================================================================
void test_to_mssql_bytes() {
	std::cout << "\n=== Test: ToMSSQLBytes ===" << std::endl;

	auto guid = Guid::Parse(DNS_TEXT);
	ASSERT_BYTES_EQ(GuidEncoding::ToMSSQLBytes(guid), DNS_WIRE);

	uint8_t buffer[GUID_SIZE];
	GuidEncoding::ToMSSQLBytes(guid, buffer);
	ASSERT_BYTES_EQ(std::vector<uint8_t>(buffer, buffer + GUID_SIZE), DNS_WIRE);

	// Last 8 bytes are never swapped
	auto canonical = guid.MarshalBinary();
	ASSERT_EQ(memcmp(canonical.data() + 8, buffer + 8, 8), 0);

	std::cout << "PASSED!" << std::endl;
}

//==============================================================================
// Test: Round trip over varied inputs
//==============================================================================
void test_round_trip() {
	std::cout << "\n=== Test: Wire round trip ===" << std::endl;

	std::vector<uint8_t> wire(GUID_SIZE);
	for (int seed = 0; seed < 64; seed++) {
		for (idx_t i = 0; i < GUID_SIZE; i++) {
			wire[i] = static_cast<uint8_t>((seed * 29 + i * 71 + 5) & 0xFF);
		}
		auto guid = GuidEncoding::FromMSSQLBytes(wire.data(), wire.size());
		ASSERT_BYTES_EQ(GuidEncoding::ToMSSQLBytes(guid), wire);
	}

	std::cout << "PASSED!" << std::endl;
}

//==============================================================================
// Test: Wire decode agrees with the text codec
//==============================================================================
void test_wire_matches_text_codec() {
	std::cout << "\n=== Test: Wire decode vs text codec ===" << std::endl;

	std::vector<uint8_t> wire(GUID_SIZE);
	for (int seed = 0; seed < 64; seed++) {
		for (idx_t i = 0; i < GUID_SIZE; i++) {
			wire[i] = static_cast<uint8_t>((seed * 53 + i * 17 + 3) & 0xFF);
		}

		// Data1..Data3 little-endian, Data4/Data5 as sent
		std::stringstream text;
		text << std::hex << std::setfill('0');
		const int order[GUID_SIZE] = {3, 2, 1, 0, 5, 4, 7, 6, 8, 9, 10, 11, 12, 13, 14, 15};
		for (idx_t i = 0; i < GUID_SIZE; i++) {
			if (i == 4 || i == 6 || i == 8 || i == 10) {
				text << "-";
			}
			text << std::setw(2) << static_cast<int>(wire[order[i]]);
		}

		auto decoded = GuidEncoding::FromMSSQLBytes(wire.data(), wire.size());
		ASSERT_EQ(decoded == Guid::Parse(text.str()), true);
		ASSERT_EQ(decoded.ToString(), text.str());
	}

	std::cout << "PASSED!" << std::endl;
}

//==============================================================================
// Test: DuckDB UUID interop
//==============================================================================
void test_uuid_interop() {
	std::cout << "\n=== Test: hugeint_t UUID interop ===" << std::endl;

	auto guid = Guid::Parse(DNS_TEXT);
	hugeint_t uuid = GuidEncoding::ToUUID(guid);
	ASSERT_EQ(UUID::ToString(uuid), std::string(DNS_TEXT));
	ASSERT_EQ(GuidEncoding::FromUUID(uuid) == guid, true);

	hugeint_t direct = GuidEncoding::ConvertGuid(DNS_WIRE.data(), DNS_WIRE.size());
	ASSERT_EQ(direct == uuid, true);

	// Ordering matches the unsigned byte string
	auto low = Guid::Parse("00000000-0000-0000-0000-000000000001");
	auto high = Guid::Parse("ff000000-0000-0000-0000-000000000000");
	ASSERT_EQ(GuidEncoding::ToUUID(low) < GuidEncoding::ToUUID(high), true);

	std::cout << "PASSED!" << std::endl;
}

//==============================================================================
// Test: Length validation
//==============================================================================
void test_length_validation() {
	std::cout << "\n=== Test: Length validation ===" << std::endl;

	ASSERT_THROWS(GuidEncoding::FromMSSQLBytes(DNS_WIRE.data(), 15), InvalidInputException);
	ASSERT_THROWS(GuidEncoding::FromMSSQLBytes(DNS_WIRE.data(), 0), InvalidInputException);
	ASSERT_THROWS(GuidEncoding::ConvertGuid(DNS_WIRE.data(), 17), InvalidInputException);

	std::cout << "PASSED!" << std::endl;
}

int main() {
	try {
		std::cout << "==========================================" << std::endl;
		std::cout << "GuidEncoding Unit Tests" << std::endl;
		std::cout << "==========================================" << std::endl;

		test_from_mssql_bytes();
		test_to_mssql_bytes();
		test_round_trip();
		test_wire_matches_text_codec();
		test_uuid_interop();
		test_length_validation();

		std::cout << "\n==========================================" << std::endl;
		std::cout << "ALL TESTS PASSED!" << std::endl;
		std::cout << "==========================================" << std::endl;
		return 0;

	} catch (const std::exception &e) {
		std::cerr << "\n==========================================" << std::endl;
		std::cerr << "TEST FAILED WITH EXCEPTION: " << e.what() << std::endl;
		std::cerr << "==========================================" << std::endl;
		return 1;
	}
}
