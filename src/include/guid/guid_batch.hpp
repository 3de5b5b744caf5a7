//===----------------------------------------------------------------------===//
//                         DuckDB MSSQL GUID Extension
//
// guid/guid_batch.hpp
//
// Split a list of GUIDs into bounded chunks for a caller-supplied handler
//===----------------------------------------------------------------------===//

#pragma once

#include "duckdb/common/types.hpp"
#include "guid/guid.hpp"

#include <functional>

namespace duckdb {
namespace guid {

// Receives a contiguous chunk of at most batch_size GUIDs.
// A handler reports failure by throwing.
using GuidBatchHandler = std::function<void(const Guid *batch, idx_t count)>;

// Invoke on_batch for consecutive chunks of guids, in order.
// The first exception thrown by on_batch propagates unchanged and the
// remaining chunks are not visited; effects of earlier chunks stay.
// @throws InvalidInputException if batch_size == 0
void Batch(const vector<Guid> &guids, idx_t batch_size, const GuidBatchHandler &on_batch);

}  // namespace guid
}  // namespace duckdb
