#include "guid/guid_batch.hpp"

#include "duckdb/common/exception.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>

// Debug logging controlled by MSSQL_GUID_DEBUG environment variable
static int GetBatchDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("MSSQL_GUID_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define MSSQL_GUID_BATCH_DEBUG_LOG(lvl, fmt, ...)                           \
	do {                                                                    \
		if (GetBatchDebugLevel() >= lvl) {                                  \
			fprintf(stderr, "[MSSQL GUID BATCH] " fmt "\n", ##__VA_ARGS__); \
		}                                                                   \
	} while (0)

namespace duckdb {
namespace guid {

void Batch(const vector<Guid> &guids, idx_t batch_size, const GuidBatchHandler &on_batch) {
	if (batch_size == 0) {
		throw InvalidInputException("MSSQL GUID Error: batch size must be >= 1");
	}

	idx_t batch_number = 0;
	for (idx_t offset = 0; offset < guids.size(); offset += batch_size) {
		idx_t count = std::min<idx_t>(batch_size, guids.size() - offset);
		batch_number++;
		MSSQL_GUID_BATCH_DEBUG_LOG(2, "Batch %llu: offset=%llu count=%llu", (unsigned long long)batch_number,
		                           (unsigned long long)offset, (unsigned long long)count);
		on_batch(guids.data() + offset, count);
	}
}

}  // namespace guid
}  // namespace duckdb
