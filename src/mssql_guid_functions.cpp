#include "mssql_guid_functions.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "guid/guid.hpp"
#include "guid/guid_generator.hpp"
#include "guid/guid_scan.hpp"
#include "guid/guid_settings.hpp"
#include "tds/encoding/guid_encoding.hpp"

#include <cstdio>
#include <cstdlib>

// Debug logging controlled by MSSQL_GUID_DEBUG environment variable
static int GetFunctionDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("MSSQL_GUID_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define MSSQL_GUID_FN_DEBUG_LOG(level, fmt, ...)                         \
	do {                                                                 \
		if (GetFunctionDebugLevel() >= level) {                          \
			fprintf(stderr, "[MSSQL GUID FN] " fmt "\n", ##__VA_ARGS__); \
		}                                                                \
	} while (0)

namespace duckdb {

using guid::Guid;
using guid::GuidEncoding;

//===----------------------------------------------------------------------===//
// Conversion helper
//
// Runs op for every non-NULL input row. With mssql_guid_null_on_error set,
// a failing row becomes NULL instead of aborting the query.
//===----------------------------------------------------------------------===//

template <class OP>
static void ExecuteGuidConversion(DataChunk &args, ExpressionState &state, Vector &result, OP op) {
	auto config = guid::LoadGuidConfig(state.GetContext());

	UnaryExecutor::ExecuteWithNulls<string_t, hugeint_t>(
	    args.data[0], result, args.size(), [&](string_t input, ValidityMask &mask, idx_t idx) {
		    if (!config.null_on_error) {
			    return op(input, config);
		    }
		    try {
			    return op(input, config);
		    } catch (const Exception &ex) {
			    MSSQL_GUID_FN_DEBUG_LOG(1, "conversion failed, returning NULL: %s", ex.what());
			    mask.SetInvalid(idx);
			    return hugeint_t(0);
		    }
	    });
}

//===----------------------------------------------------------------------===//
// mssql_guid_from_bytes(BLOB) -> UUID
//===----------------------------------------------------------------------===//

static void MSSQLGuidFromBytesFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	ExecuteGuidConversion(args, state, result, [](string_t input, const guid::GuidConfig &) {
		return GuidEncoding::ConvertGuid(reinterpret_cast<const_data_ptr_t>(input.GetData()), input.GetSize());
	});
}

ScalarFunction GetMSSQLGuidFromBytesFunction() {
	return ScalarFunction("mssql_guid_from_bytes", {LogicalType::BLOB}, LogicalType::UUID,
	                      MSSQLGuidFromBytesFunction);
}

//===----------------------------------------------------------------------===//
// mssql_guid_to_bytes(UUID) -> BLOB
//===----------------------------------------------------------------------===//

static void MSSQLGuidToBytesFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	UnaryExecutor::Execute<hugeint_t, string_t>(args.data[0], result, args.size(), [&](hugeint_t input) {
		uint8_t wire[guid::GUID_SIZE];
		GuidEncoding::ToMSSQLBytes(GuidEncoding::FromUUID(input), wire);
		return StringVector::AddStringOrBlob(result, reinterpret_cast<const char *>(wire), guid::GUID_SIZE);
	});
}

ScalarFunction GetMSSQLGuidToBytesFunction() {
	return ScalarFunction("mssql_guid_to_bytes", {LogicalType::UUID}, LogicalType::BLOB, MSSQLGuidToBytesFunction);
}

//===----------------------------------------------------------------------===//
// mssql_guid_parse(VARCHAR) -> UUID
//===----------------------------------------------------------------------===//

static void MSSQLGuidParseFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	ExecuteGuidConversion(args, state, result, [](string_t input, const guid::GuidConfig &) {
		return GuidEncoding::ToUUID(Guid::Parse(input.GetData(), input.GetSize()));
	});
}

ScalarFunction GetMSSQLGuidParseFunction() {
	return ScalarFunction("mssql_guid_parse", {LogicalType::VARCHAR}, LogicalType::UUID, MSSQLGuidParseFunction);
}

//===----------------------------------------------------------------------===//
// mssql_guid_scan(BLOB | VARCHAR) -> UUID
//===----------------------------------------------------------------------===//

static void MSSQLGuidScanBlobFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	ExecuteGuidConversion(args, state, result, [](string_t input, const guid::GuidConfig &config) {
		auto src = guid::GuidScanInput::Bytes(reinterpret_cast<const_data_ptr_t>(input.GetData()), input.GetSize());
		Guid value;
		value.Scan(src, config.binary_layout);
		return GuidEncoding::ToUUID(value);
	});
}

static void MSSQLGuidScanTextFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	ExecuteGuidConversion(args, state, result, [](string_t input, const guid::GuidConfig &config) {
		auto src = guid::GuidScanInput::Text(input.GetString());
		Guid value;
		value.Scan(src, config.binary_layout);
		return GuidEncoding::ToUUID(value);
	});
}

ScalarFunctionSet GetMSSQLGuidScanFunctions() {
	ScalarFunctionSet scan_func("mssql_guid_scan");
	scan_func.AddFunction(ScalarFunction({LogicalType::BLOB}, LogicalType::UUID, MSSQLGuidScanBlobFunction));
	scan_func.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::UUID, MSSQLGuidScanTextFunction));
	return scan_func;
}

//===----------------------------------------------------------------------===//
// mssql_guid_new() -> UUID
//===----------------------------------------------------------------------===//

static void MSSQLGuidNewFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &generator = guid::GuidGenerator::Default();

	result.SetVectorType(VectorType::FLAT_VECTOR);
	auto result_data = FlatVector::GetData<hugeint_t>(result);
	for (idx_t i = 0; i < args.size(); i++) {
		result_data[i] = GuidEncoding::ToUUID(generator.NewRandom());
	}
}

ScalarFunction GetMSSQLGuidNewFunction() {
	ScalarFunction new_func("mssql_guid_new", {}, LogicalType::UUID, MSSQLGuidNewFunction);
	new_func.stability = FunctionStability::VOLATILE;
	return new_func;
}

//===----------------------------------------------------------------------===//
// mssql_guid_version(UUID) / mssql_guid_variant(UUID)
//===----------------------------------------------------------------------===//

static void MSSQLGuidVersionFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	UnaryExecutor::Execute<hugeint_t, uint8_t>(args.data[0], result, args.size(), [](hugeint_t input) {
		return GuidEncoding::FromUUID(input).Version();
	});
}

ScalarFunction GetMSSQLGuidVersionFunction() {
	return ScalarFunction("mssql_guid_version", {LogicalType::UUID}, LogicalType::UTINYINT,
	                      MSSQLGuidVersionFunction);
}

static void MSSQLGuidVariantFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	UnaryExecutor::Execute<hugeint_t, string_t>(args.data[0], result, args.size(), [&](hugeint_t input) {
		auto variant = GuidEncoding::FromUUID(input).Variant();
		return StringVector::AddString(result, guid::GuidVariantToString(variant));
	});
}

ScalarFunction GetMSSQLGuidVariantFunction() {
	return ScalarFunction("mssql_guid_variant", {LogicalType::UUID}, LogicalType::VARCHAR,
	                      MSSQLGuidVariantFunction);
}

//===----------------------------------------------------------------------===//
// Registration
//===----------------------------------------------------------------------===//

void RegisterMSSQLGuidFunctions(ExtensionLoader &loader) {
	loader.RegisterFunction(GetMSSQLGuidFromBytesFunction());
	loader.RegisterFunction(GetMSSQLGuidToBytesFunction());
	loader.RegisterFunction(GetMSSQLGuidParseFunction());
	loader.RegisterFunction(GetMSSQLGuidScanFunctions());
	loader.RegisterFunction(GetMSSQLGuidNewFunction());
	loader.RegisterFunction(GetMSSQLGuidVersionFunction());
	loader.RegisterFunction(GetMSSQLGuidVariantFunction());
}

}  // namespace duckdb
