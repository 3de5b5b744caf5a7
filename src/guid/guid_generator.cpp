//===----------------------------------------------------------------------===//
//                         DuckDB MSSQL GUID Extension
//
// guid_generator.cpp
//
// Version 4 GUID generation. The default byte source is mbedTLS CTR_DRBG
// seeded from the platform entropy pool.
//===----------------------------------------------------------------------===//

#include "guid/guid_generator.hpp"

#include "duckdb/common/exception.hpp"

#include <mbedtls/ctr_drbg.h>
#include <mbedtls/entropy.h>
#include <mbedtls/error.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

// Debug logging controlled by MSSQL_GUID_DEBUG environment variable
static int GetGeneratorDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("MSSQL_GUID_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define MSSQL_GUID_GEN_DEBUG_LOG(lvl, fmt, ...)                           \
	do {                                                                  \
		if (GetGeneratorDebugLevel() >= lvl) {                            \
			fprintf(stderr, "[MSSQL GUID GEN] " fmt "\n", ##__VA_ARGS__); \
		}                                                                 \
	} while (0)

namespace duckdb {
namespace guid {

//===----------------------------------------------------------------------===//
// CtrDrbgRandomSource
//===----------------------------------------------------------------------===//

struct CtrDrbgContext {
	mbedtls_ctr_drbg_context ctr_drbg;
	mbedtls_entropy_context entropy;

	CtrDrbgContext() {
		mbedtls_ctr_drbg_init(&ctr_drbg);
		mbedtls_entropy_init(&entropy);
	}

	~CtrDrbgContext() {
		mbedtls_ctr_drbg_free(&ctr_drbg);
		mbedtls_entropy_free(&entropy);
	}
};

// Helper to format mbedTLS error
static std::string FormatMbedTlsError(int ret) {
	char buf[256];
	mbedtls_strerror(ret, buf, sizeof(buf));
	return std::string(buf);
}

CtrDrbgRandomSource::CtrDrbgRandomSource() : ctx_(new CtrDrbgContext()) {
	const char *pers = "duckdb_mssql_guid";
	int ret = mbedtls_ctr_drbg_seed(&ctx_->ctr_drbg, mbedtls_entropy_func, &ctx_->entropy,
	                                reinterpret_cast<const unsigned char *>(pers), strlen(pers));
	if (ret != 0) {
		throw IOException("MSSQL GUID Error: CTR DRBG seed failed: %s", FormatMbedTlsError(ret));
	}
	MSSQL_GUID_GEN_DEBUG_LOG(2, "CtrDrbgRandomSource: seeded");
}

CtrDrbgRandomSource::~CtrDrbgRandomSource() = default;

idx_t CtrDrbgRandomSource::Read(data_ptr_t buffer, idx_t size) {
	std::lock_guard<std::mutex> lock(mutex_);

	idx_t written = 0;
	while (written < size) {
		auto chunk = std::min<idx_t>(size - written, MBEDTLS_CTR_DRBG_MAX_REQUEST);
		int ret = mbedtls_ctr_drbg_random(&ctx_->ctr_drbg, buffer + written, chunk);
		if (ret != 0) {
			throw IOException("MSSQL GUID Error: CTR DRBG random failed: %s", FormatMbedTlsError(ret));
		}
		written += chunk;
	}
	return written;
}

//===----------------------------------------------------------------------===//
// GuidGenerator
//===----------------------------------------------------------------------===//

GuidGenerator::GuidGenerator() : source_(std::make_shared<CtrDrbgRandomSource>()) {
}

GuidGenerator::GuidGenerator(std::shared_ptr<GuidRandomSource> source) : source_(std::move(source)) {
	if (!source_) {
		throw InvalidInputException("MSSQL GUID Error: GuidGenerator requires a random source");
	}
}

Guid GuidGenerator::NewRandom() {
	std::array<uint8_t, GUID_SIZE> bytes;
	bytes.fill(0);

	// A short read is a hard failure, no retry
	idx_t read = source_->Read(bytes.data(), GUID_SIZE);
	if (read != GUID_SIZE) {
		throw IOException("MSSQL GUID Error: random source returned %d of %d bytes", static_cast<int64_t>(read),
		                  static_cast<int64_t>(GUID_SIZE));
	}

	Guid result(bytes);
	result.SetVersion(GUID_VERSION_RANDOM);
	result.SetVariant(GuidVariant::RFC4122);
	return result;
}

GuidGenerator &GuidGenerator::Default() {
	static GuidGenerator instance;
	return instance;
}

Guid NewRandomGuid() {
	try {
		return GuidGenerator::Default().NewRandom();
	} catch (const Exception &ex) {
		MSSQL_GUID_GEN_DEBUG_LOG(1, "NewRandomGuid: generation failed, returning nil GUID: %s", ex.what());
		return Guid::Nil();
	}
}

}  // namespace guid
}  // namespace duckdb
