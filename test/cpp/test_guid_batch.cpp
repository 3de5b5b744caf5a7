// test/cpp/test_guid_batch.cpp
// Unit tests for Batch - chunked GUID processing
//
// These tests do NOT require a running SQL Server instance.

#include "catch.hpp"
#include "duckdb/common/exception.hpp"
#include "guid/guid_batch.hpp"

#include <stdexcept>

using namespace duckdb;
using namespace duckdb::guid;

static vector<Guid> MakeGuids(idx_t count) {
	vector<Guid> guids;
	for (idx_t i = 0; i < count; i++) {
		std::array<uint8_t, GUID_SIZE> bytes;
		bytes.fill(0);
		bytes[15] = static_cast<uint8_t>(i + 1);
		guids.push_back(Guid(bytes));
	}
	return guids;
}

TEST_CASE("Batch - chunking", "[guid][batch]") {
	auto guids = MakeGuids(10);

	SECTION("Uneven split") {
		vector<idx_t> sizes;
		vector<Guid> visited;
		Batch(guids, 3, [&](const Guid *batch, idx_t count) {
			sizes.push_back(count);
			visited.insert(visited.end(), batch, batch + count);
		});
		REQUIRE(sizes == vector<idx_t>({3, 3, 3, 1}));
		REQUIRE(visited == guids);
	}

	SECTION("Even split") {
		vector<idx_t> sizes;
		Batch(guids, 5, [&](const Guid *, idx_t count) { sizes.push_back(count); });
		REQUIRE(sizes == vector<idx_t>({5, 5}));
	}

	SECTION("Batch size larger than input") {
		vector<idx_t> sizes;
		Batch(guids, 100, [&](const Guid *, idx_t count) { sizes.push_back(count); });
		REQUIRE(sizes == vector<idx_t>({10}));
	}

	SECTION("Batch size one") {
		idx_t calls = 0;
		Batch(guids, 1, [&](const Guid *batch, idx_t count) {
			REQUIRE(count == 1);
			REQUIRE(batch[0] == guids[calls]);
			calls++;
		});
		REQUIRE(calls == 10);
	}

	SECTION("Empty input never calls the handler") {
		idx_t calls = 0;
		Batch(vector<Guid>(), 3, [&](const Guid *, idx_t) { calls++; });
		REQUIRE(calls == 0);
	}
}

TEST_CASE("Batch - handler errors", "[guid][batch]") {
	auto guids = MakeGuids(10);

	SECTION("First error stops the remaining chunks") {
		idx_t calls = 0;
		REQUIRE_THROWS_AS(Batch(guids, 3,
		                        [&](const Guid *, idx_t) {
			                        calls++;
			                        if (calls == 2) {
				                        throw IOException("insert failed");
			                        }
		                        }),
		                  IOException);
		REQUIRE(calls == 2);
	}

	SECTION("Error is propagated unchanged") {
		try {
			Batch(guids, 4, [](const Guid *, idx_t) { throw std::runtime_error("handler failed"); });
			FAIL("expected std::runtime_error");
		} catch (const std::runtime_error &ex) {
			REQUIRE(string(ex.what()) == "handler failed");
		}
	}
}

TEST_CASE("Batch - invalid batch size", "[guid][batch]") {
	auto guids = MakeGuids(3);
	idx_t calls = 0;
	REQUIRE_THROWS_AS(Batch(guids, 0, [&](const Guid *, idx_t) { calls++; }), InvalidInputException);
	REQUIRE(calls == 0);
}
