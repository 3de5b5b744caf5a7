//===----------------------------------------------------------------------===//
//                         DuckDB MSSQL GUID Extension
//
// guid/guid_generator.hpp
//
// Random (version 4) GUID generation over an injected byte source
//===----------------------------------------------------------------------===//

#pragma once

#include "duckdb/common/types.hpp"
#include "guid/guid.hpp"

#include <memory>
#include <mutex>

namespace duckdb {
namespace guid {

//===----------------------------------------------------------------------===//
// GuidRandomSource - byte source used to fill new GUIDs
//===----------------------------------------------------------------------===//

class GuidRandomSource {
public:
	virtual ~GuidRandomSource() = default;

	// Fill up to size bytes of buffer
	// @return number of bytes written; fewer than size means the source ran dry
	virtual idx_t Read(data_ptr_t buffer, idx_t size) = 0;
};

// Forward declaration for PIMPL
struct CtrDrbgContext;

//===----------------------------------------------------------------------===//
// CtrDrbgRandomSource - mbedTLS CTR_DRBG seeded from the mbedTLS entropy pool
//
// Read() is serialized with a mutex, one instance may be shared by any number
// of threads.
//===----------------------------------------------------------------------===//

class CtrDrbgRandomSource : public GuidRandomSource {
public:
	// @throws IOException if the DRBG cannot be seeded
	CtrDrbgRandomSource();
	~CtrDrbgRandomSource() override;

	// Non-copyable
	CtrDrbgRandomSource(const CtrDrbgRandomSource &) = delete;
	CtrDrbgRandomSource &operator=(const CtrDrbgRandomSource &) = delete;

	// @throws IOException if the DRBG reports an error
	idx_t Read(data_ptr_t buffer, idx_t size) override;

private:
	std::unique_ptr<CtrDrbgContext> ctx_;
	std::mutex mutex_;
};

//===----------------------------------------------------------------------===//
// GuidGenerator
//
// Stateless between calls apart from the byte source. Construct one with a
// custom source for deterministic tests; Default() is the shared instance.
//===----------------------------------------------------------------------===//

class GuidGenerator {
public:
	// Uses a new CtrDrbgRandomSource
	GuidGenerator();
	explicit GuidGenerator(std::shared_ptr<GuidRandomSource> source);

	// Random bytes stamped with version 4 and the RFC 4122 variant
	// @throws IOException if the source supplies fewer than 16 bytes
	Guid NewRandom();

	// Process-wide generator backed by CTR_DRBG
	static GuidGenerator &Default();

private:
	std::shared_ptr<GuidRandomSource> source_;
};

// Convenience form over GuidGenerator::Default().
// Returns Guid::Nil() if generation fails; the error is only logged.
Guid NewRandomGuid();

}  // namespace guid
}  // namespace duckdb
