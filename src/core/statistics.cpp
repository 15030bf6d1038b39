#include "basalt/statistics.h"

#include <cmath>
#include <sstream>
#include <string_view>
#include <arrow/compute/api.h>
#include <arrow/util/config.h>

#include "basalt/data_block.h"

namespace basalt {

namespace {

template <typename ScalarType>
int CompareValues(const arrow::Scalar& a, const arrow::Scalar& b) {
    const auto& va = static_cast<const ScalarType&>(a).value;
    const auto& vb = static_cast<const ScalarType&>(b).value;
    return (va < vb) ? -1 : (vb < va) ? 1 : 0;
}

std::string_view BinaryView(const arrow::Scalar& scalar) {
    const auto& binary = static_cast<const arrow::BaseBinaryScalar&>(scalar);
    if (!binary.value) return std::string_view();
    return std::string_view(reinterpret_cast<const char*>(binary.value->data()),
                            static_cast<size_t>(binary.value->size()));
}

bool ScalarPtrEquals(const std::shared_ptr<arrow::Scalar>& a,
                     const std::shared_ptr<arrow::Scalar>& b) {
    if (!a || !b) return a == b;
    return a->Equals(*b);
}

bool IsNaN(const arrow::Scalar& scalar) {
    switch (scalar.type->id()) {
        case arrow::Type::FLOAT:
            return std::isnan(static_cast<const arrow::FloatScalar&>(scalar).value);
        case arrow::Type::DOUBLE:
            return std::isnan(static_cast<const arrow::DoubleScalar&>(scalar).value);
        default:
            return false;
    }
}

// Drop bounds that do not describe a total order (NaN, or min > max
// from an all-NaN floating column).
Status NormalizeBounds(ColumnStatistics* stats) {
    if (!stats->HasBounds()) return Status::OK();

    if (!stats->min->is_valid || !stats->max->is_valid ||
        IsNaN(*stats->min) || IsNaN(*stats->max)) {
        stats->min = nullptr;
        stats->max = nullptr;
        return Status::OK();
    }

    int cmp = 0;
    BASALT_RETURN_NOT_OK(CompareScalars(*stats->min, *stats->max, &cmp));
    if (cmp > 0) {
        stats->min = nullptr;
        stats->max = nullptr;
    }
    return Status::OK();
}

Status ReduceColumn(ColumnId id, const ColumnStatistics& next, ColumnStatistics* acc) {
    if (!acc->type->Equals(*next.type)) {
        return Status::Corruption(
            "column " + std::to_string(id) + " changes type within a segment: " +
            acc->type->ToString() + " vs " + next.type->ToString());
    }

    acc->null_count += next.null_count;
    acc->row_count += next.row_count;
    return Status::OK();
}

} // namespace

bool ColumnStatistics::Equals(const ColumnStatistics& other) const {
    if (null_count != other.null_count || row_count != other.row_count) {
        return false;
    }
    if (!type || !other.type) {
        if (type != other.type) return false;
    } else if (!type->Equals(*other.type)) {
        return false;
    }
    return ScalarPtrEquals(min, other.min) && ScalarPtrEquals(max, other.max);
}

std::string ColumnStatistics::ToString() const {
    std::ostringstream ss;
    ss << "{type=" << (type ? type->ToString() : "?")
       << ", min=" << (min ? min->ToString() : "none")
       << ", max=" << (max ? max->ToString() : "none")
       << ", null_count=" << null_count
       << ", row_count=" << row_count << "}";
    return ss.str();
}

bool BlockStatisticsEquals(const BlockStatistics& a, const BlockStatistics& b) {
    if (a.size() != b.size()) return false;
    for (const auto& [id, stats] : a) {
        auto it = b.find(id);
        if (it == b.end() || !stats.Equals(it->second)) {
            return false;
        }
    }
    return true;
}

bool IsStatisticsSupported(const arrow::DataType& type) {
    switch (type.id()) {
        case arrow::Type::BOOL:
        case arrow::Type::INT8:
        case arrow::Type::INT16:
        case arrow::Type::INT32:
        case arrow::Type::INT64:
        case arrow::Type::UINT8:
        case arrow::Type::UINT16:
        case arrow::Type::UINT32:
        case arrow::Type::UINT64:
        case arrow::Type::FLOAT:
        case arrow::Type::DOUBLE:
        case arrow::Type::STRING:
        case arrow::Type::LARGE_STRING:
        case arrow::Type::BINARY:
        case arrow::Type::LARGE_BINARY:
        case arrow::Type::DATE32:
        case arrow::Type::DATE64:
        case arrow::Type::TIMESTAMP:
        case arrow::Type::DECIMAL128:
            return true;
        default:
            return false;
    }
}

Status CompareScalars(const arrow::Scalar& a, const arrow::Scalar& b, int* result) {
    if (!a.type->Equals(*b.type)) {
        return Status::UnsupportedType("cannot compare " + a.type->ToString() +
                                       " with " + b.type->ToString());
    }
    if (!a.is_valid || !b.is_valid) {
        return Status::InvalidArgument("cannot order null scalars");
    }

    switch (a.type->id()) {
        case arrow::Type::BOOL:
            *result = CompareValues<arrow::BooleanScalar>(a, b);
            break;
        case arrow::Type::INT8:
            *result = CompareValues<arrow::Int8Scalar>(a, b);
            break;
        case arrow::Type::INT16:
            *result = CompareValues<arrow::Int16Scalar>(a, b);
            break;
        case arrow::Type::INT32:
            *result = CompareValues<arrow::Int32Scalar>(a, b);
            break;
        case arrow::Type::INT64:
            *result = CompareValues<arrow::Int64Scalar>(a, b);
            break;
        case arrow::Type::UINT8:
            *result = CompareValues<arrow::UInt8Scalar>(a, b);
            break;
        case arrow::Type::UINT16:
            *result = CompareValues<arrow::UInt16Scalar>(a, b);
            break;
        case arrow::Type::UINT32:
            *result = CompareValues<arrow::UInt32Scalar>(a, b);
            break;
        case arrow::Type::UINT64:
            *result = CompareValues<arrow::UInt64Scalar>(a, b);
            break;
        case arrow::Type::FLOAT:
            *result = CompareValues<arrow::FloatScalar>(a, b);
            break;
        case arrow::Type::DOUBLE:
            *result = CompareValues<arrow::DoubleScalar>(a, b);
            break;
        case arrow::Type::DATE32:
            *result = CompareValues<arrow::Date32Scalar>(a, b);
            break;
        case arrow::Type::DATE64:
            *result = CompareValues<arrow::Date64Scalar>(a, b);
            break;
        case arrow::Type::TIMESTAMP:
            *result = CompareValues<arrow::TimestampScalar>(a, b);
            break;
        case arrow::Type::DECIMAL128:
            *result = CompareValues<arrow::Decimal128Scalar>(a, b);
            break;
        case arrow::Type::STRING:
        case arrow::Type::LARGE_STRING:
        case arrow::Type::BINARY:
        case arrow::Type::LARGE_BINARY: {
            int cmp = BinaryView(a).compare(BinaryView(b));
            *result = (cmp < 0) ? -1 : (cmp > 0) ? 1 : 0;
            break;
        }
        default:
            return Status::UnsupportedType("no ordering for type " + a.type->ToString());
    }
    return Status::OK();
}

Status EnsureComputeInitialized() {
#if ARROW_VERSION_MAJOR >= 21
    // Kernels live in a separate library that registers itself on demand
    static const arrow::Status status = arrow::compute::Initialize();
    return FromArrowStatus(status);
#else
    return Status::OK();
#endif
}

Status ComputeColumnStatistics(const arrow::Datum& column,
                               int64_t num_rows,
                               ColumnStatistics* stats) {
    const auto& type = column.type();
    if (!type || !IsStatisticsSupported(*type)) {
        return Status::UnsupportedType(
            "statistics are not supported for type " +
            (type ? type->ToString() : std::string("<none>")));
    }

    stats->type = type;
    stats->row_count = num_rows;
    stats->min = nullptr;
    stats->max = nullptr;

    if (column.is_scalar()) {
        const auto& constant = column.scalar();
        if (!constant->is_valid) {
            stats->null_count = num_rows;
            return Status::OK();
        }
        stats->null_count = 0;
        if (num_rows > 0) {
            stats->min = constant;
            stats->max = constant;
        }
        return NormalizeBounds(stats);
    }

    if (!column.is_array()) {
        return Status::InvalidArgument("statistics need an array or a constant column");
    }

    stats->null_count = column.null_count();
    if (stats->null_count >= num_rows) {
        return Status::OK();
    }

    BASALT_RETURN_NOT_OK(EnsureComputeInitialized());
    auto min_max = arrow::compute::MinMax(column);
    if (!min_max.ok()) {
        return FromArrowStatus(min_max.status())
            .WithContext("min/max over " + type->ToString());
    }

    const auto& pair = min_max.ValueOrDie().scalar_as<arrow::StructScalar>();
    if (pair.is_valid && pair.value.size() >= 2) {
        stats->min = pair.value[0];
        stats->max = pair.value[1];
    }

    return NormalizeBounds(stats);
}

Status ComputeBlockStatistics(const DataBlock& block, BlockStatistics* stats) {
    BASALT_RETURN_NOT_OK(block.Validate());

    stats->clear();
    for (int i = 0; i < block.num_columns(); ++i) {
        ColumnStatistics column_stats;
        auto status = ComputeColumnStatistics(block.column(i), block.num_rows(),
                                              &column_stats);
        if (!status.ok()) {
            return status.WithContext("column '" + block.schema()->field(i)->name() + "'");
        }
        stats->emplace(static_cast<ColumnId>(i), std::move(column_stats));
    }
    return Status::OK();
}

Status ReduceBlockStatistics(const std::vector<const BlockStatistics*>& blocks,
                             BlockStatistics* reduced) {
    reduced->clear();
    if (blocks.empty()) {
        return Status::OK();
    }

    const BlockStatistics& first = *blocks.front();
    for (size_t i = 1; i < blocks.size(); ++i) {
        if (blocks[i]->size() != first.size()) {
            return Status::Corruption(
                "block " + std::to_string(i) + " has " +
                std::to_string(blocks[i]->size()) + " columns, expected " +
                std::to_string(first.size()));
        }
    }

    for (const auto& [id, first_stats] : first) {
        ColumnStatistics acc;
        acc.type = first_stats.type;
        bool bounds_unknown = false;

        for (size_t i = 0; i < blocks.size(); ++i) {
            auto it = blocks[i]->find(id);
            if (it == blocks[i]->end()) {
                return Status::Corruption("column " + std::to_string(id) +
                                          " is absent in block " + std::to_string(i));
            }
            const ColumnStatistics& next = it->second;
            if (!acc.type || !next.type) {
                return Status::Corruption("column " + std::to_string(id) +
                                          " has no declared type");
            }
            BASALT_RETURN_NOT_OK(ReduceColumn(id, next, &acc));

            if (!next.HasBounds()) {
                // A block of nulls contributes nothing; anything else poisons the range
                if (!next.AllNull()) bounds_unknown = true;
                continue;
            }

            int cmp = 0;
            if (!acc.min) {
                acc.min = next.min;
            } else {
                BASALT_RETURN_NOT_OK(CompareScalars(*next.min, *acc.min, &cmp));
                if (cmp < 0) acc.min = next.min;
            }
            if (!acc.max) {
                acc.max = next.max;
            } else {
                BASALT_RETURN_NOT_OK(CompareScalars(*next.max, *acc.max, &cmp));
                if (cmp > 0) acc.max = next.max;
            }
        }

        if (bounds_unknown) {
            acc.min = nullptr;
            acc.max = nullptr;
        }
        reduced->emplace(id, std::move(acc));
    }

    return Status::OK();
}

Status ReduceBlockStatistics(const std::vector<BlockStatistics>& blocks,
                             BlockStatistics* reduced) {
    std::vector<const BlockStatistics*> pointers;
    pointers.reserve(blocks.size());
    for (const auto& block : blocks) {
        pointers.push_back(&block);
    }
    return ReduceBlockStatistics(pointers, reduced);
}

} // namespace basalt
