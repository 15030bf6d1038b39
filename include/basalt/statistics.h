#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <arrow/api.h>
#include <basalt/status.h>

namespace basalt {

class DataBlock;

/**
 * @brief Positional column identifier within one append call
 *
 * Column ids are the field index in the block schema. They stay valid
 * only while the table schema keeps its column order and count.
 */
using ColumnId = uint32_t;

/**
 * @brief Value range and null count of one column at some granularity
 *
 * min/max are scalars of the column's declared type. They are null when
 * the scope holds no non-null value, or when no total order could be
 * established for it (a floating column whose values are all NaN).
 */
struct ColumnStatistics {
    std::shared_ptr<arrow::DataType> type;
    std::shared_ptr<arrow::Scalar> min;
    std::shared_ptr<arrow::Scalar> max;
    int64_t null_count = 0;
    int64_t row_count = 0;

    bool HasBounds() const { return min != nullptr && max != nullptr; }

    // True when the scope contains no non-null value (or no rows at all)
    bool AllNull() const { return null_count >= row_count; }

    bool Equals(const ColumnStatistics& other) const;
    std::string ToString() const;
};

/**
 * @brief Column id -> statistics, one entry per column of the schema
 */
using BlockStatistics = std::map<ColumnId, ColumnStatistics>;

bool BlockStatisticsEquals(const BlockStatistics& a, const BlockStatistics& b);

/**
 * @brief Whether statistics can be computed and compared for a type
 *
 * Supported: boolean, signed and unsigned integers, float, double,
 * (large) string, (large) binary, date32, date64, timestamp, decimal128.
 */
bool IsStatisticsSupported(const arrow::DataType& type);

/**
 * @brief Three-way compare two non-null scalars of the same type
 *
 * @param result -1 if a < b, 0 if equal, 1 if a > b
 * @return UnsupportedType if the types differ or have no ordering
 */
Status CompareScalars(const arrow::Scalar& a, const arrow::Scalar& b, int* result);

// Register the Arrow compute kernels once per process
Status EnsureComputeInitialized();

/**
 * @brief Statistics of a single column
 *
 * A constant (scalar) column is handled in O(1): the constant is both
 * bounds and the null count is 0 or num_rows.
 */
Status ComputeColumnStatistics(const arrow::Datum& column,
                               int64_t num_rows,
                               ColumnStatistics* stats);

/**
 * @brief Statistics of every column of a block, keyed by position
 */
Status ComputeBlockStatistics(const DataBlock& block, BlockStatistics* stats);

/**
 * @brief Column-wise reduction over the blocks of one segment
 *
 * min of mins, max of maxes, sums of null and row counts. Every input
 * must carry the same column ids and types; a mismatch is Corruption.
 * When a block with non-null values has no bounds, the aggregate bound
 * is left unknown for that column instead of being guessed.
 */
Status ReduceBlockStatistics(const std::vector<const BlockStatistics*>& blocks,
                             BlockStatistics* reduced);

Status ReduceBlockStatistics(const std::vector<BlockStatistics>& blocks,
                             BlockStatistics* reduced);

} // namespace basalt
