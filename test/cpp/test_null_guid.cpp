// test/cpp/test_null_guid.cpp
// Unit tests for NullGuid - GUID column that may hold SQL NULL
//
// These tests do NOT require a running SQL Server instance.

#include "catch.hpp"
#include "duckdb/common/exception.hpp"
#include "guid/null_guid.hpp"

using namespace duckdb;
using namespace duckdb::guid;

static const char *DNS_TEXT = "6ba7b810-9dad-11d1-80b4-00c04fd430c8";

TEST_CASE("NullGuid - defaults", "[guid][null_guid]") {
	NullGuid value;
	REQUIRE_FALSE(value.valid);
	REQUIRE(value.guid.IsNil());
}

TEST_CASE("NullGuid - ToValue", "[guid][null_guid]") {
	SECTION("Invalid is a NULL VARCHAR") {
		NullGuid value;
		auto out = value.ToValue();
		REQUIRE(out.IsNull());
		REQUIRE(out.type().id() == LogicalTypeId::VARCHAR);
	}

	SECTION("Valid nil is not NULL") {
		NullGuid value(Guid::Nil(), true);
		auto out = value.ToValue();
		REQUIRE_FALSE(out.IsNull());
		REQUIRE(StringValue::Get(out) == "00000000-0000-0000-0000-000000000000");
	}

	SECTION("Valid GUID") {
		NullGuid value(Guid::Parse(DNS_TEXT), true);
		REQUIRE(StringValue::Get(value.ToValue()) == DNS_TEXT);
	}
}

TEST_CASE("NullGuid - Scan", "[guid][null_guid]") {
	SECTION("NULL resets to invalid nil") {
		NullGuid value(Guid::Parse(DNS_TEXT), true);
		value.Scan(GuidScanInput::Null());
		REQUIRE_FALSE(value.valid);
		REQUIRE(value.guid.IsNil());
	}

	SECTION("Text input") {
		NullGuid value;
		value.Scan(GuidScanInput::Text(DNS_TEXT));
		REQUIRE(value.valid);
		REQUIRE(value.guid.ToString() == DNS_TEXT);
	}

	SECTION("Wire bytes") {
		const uint8_t wire[GUID_SIZE] = {0x10, 0xb8, 0xa7, 0x6b, 0xad, 0x9d, 0xd1, 0x11,
		                                 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8};
		NullGuid value;
		value.Scan(GuidScanInput::Bytes(wire, GUID_SIZE));
		REQUIRE(value.valid);
		REQUIRE(value.guid.ToString() == DNS_TEXT);
	}

	SECTION("Failure keeps the previous state") {
		NullGuid value;
		REQUIRE_THROWS_AS(value.Scan(GuidScanInput::Text("bogus")), ConversionException);
		REQUIRE_FALSE(value.valid);
		REQUIRE(value.guid.IsNil());
	}

	SECTION("Round trip through ToValue") {
		NullGuid value(Guid::Parse(DNS_TEXT), true);
		NullGuid back;
		back.Scan(GuidScanInput::FromValue(value.ToValue()));
		REQUIRE(back.valid);
		REQUIRE(back.guid == value.guid);

		NullGuid null_value;
		NullGuid null_back(Guid::Parse(DNS_TEXT), true);
		null_back.Scan(GuidScanInput::FromValue(null_value.ToValue()));
		REQUIRE_FALSE(null_back.valid);
	}
}

TEST_CASE("NullGuid - JSON", "[guid][null_guid][json]") {
	SECTION("Invalid encodes as null") {
		NullGuid value;
		REQUIRE(value.ToJSON() == "null");
	}

	SECTION("Valid encodes as a string") {
		NullGuid value(Guid::Parse(DNS_TEXT), true);
		REQUIRE(value.ToJSON() == "\"6ba7b810-9dad-11d1-80b4-00c04fd430c8\"");
	}

	SECTION("null decodes to invalid") {
		NullGuid value(Guid::Parse(DNS_TEXT), true);
		value.FromJSON("null");
		REQUIRE_FALSE(value.valid);
		REQUIRE(value.guid.IsNil());
	}

	SECTION("Short string decodes to invalid without error") {
		NullGuid value;
		value.FromJSON("\"\"");
		REQUIRE_FALSE(value.valid);
		value.FromJSON("\"6ba7b810\"");
		REQUIRE_FALSE(value.valid);
		REQUIRE(value.guid.IsNil());
	}

	SECTION("Canonical string decodes to valid") {
		NullGuid value;
		value.FromJSON("\"6ba7b810-9dad-11d1-80b4-00c04fd430c8\"");
		REQUIRE(value.valid);
		REQUIRE(value.guid.ToString() == DNS_TEXT);
	}

	SECTION("Malformed long string is an error") {
		NullGuid value;
		REQUIRE_THROWS_AS(value.FromJSON("\"zzzzzzzz-9dad-11d1-80b4-00c04fd430c8\""), ConversionException);
		REQUIRE_FALSE(value.valid);
	}

	SECTION("Non-string JSON is an error") {
		NullGuid value;
		REQUIRE_THROWS_AS(value.FromJSON("{}"), InvalidInputException);
	}
}
