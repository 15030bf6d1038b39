#pragma once

#include <memory>
#include <vector>
#include <arrow/api.h>
#include <arrow/datum.h>
#include <basalt/status.h>

namespace basalt {

/**
 * @brief In-memory columnar batch handed to the block writer
 *
 * Each column is either a materialized arrow::Array or a constant
 * arrow::Scalar repeated num_rows times. Constant columns let the writer
 * derive statistics in O(1) instead of scanning the column.
 */
class DataBlock {
public:
    DataBlock(std::shared_ptr<arrow::Schema> schema,
              std::vector<arrow::Datum> columns,
              int64_t num_rows);

    /**
     * @brief Wrap an Arrow RecordBatch (all columns materialized)
     */
    static std::shared_ptr<DataBlock> FromRecordBatch(
        const std::shared_ptr<arrow::RecordBatch>& batch);

    /**
     * @brief Check that column count, kinds and lengths agree with the schema
     */
    Status Validate() const;

    const std::shared_ptr<arrow::Schema>& schema() const { return schema_; }
    const std::vector<arrow::Datum>& columns() const { return columns_; }
    const arrow::Datum& column(int i) const { return columns_[i]; }
    int num_columns() const { return static_cast<int>(columns_.size()); }
    int64_t num_rows() const { return num_rows_; }

    bool IsConstantColumn(int i) const { return columns_[i].is_scalar(); }

    /**
     * @brief Estimated in-memory footprint in bytes
     *
     * Arrays report their buffer sizes; a constant column counts one value.
     */
    int64_t MemorySize() const;

    /**
     * @brief Materialize constant columns and build a RecordBatch
     */
    Status ToRecordBatch(std::shared_ptr<arrow::RecordBatch>* batch) const;

private:
    std::shared_ptr<arrow::Schema> schema_;
    std::vector<arrow::Datum> columns_;
    int64_t num_rows_;
};

using DataBlockPtr = std::shared_ptr<DataBlock>;

/**
 * @brief Lazy, finite, non-restartable sequence of blocks
 *
 * Next() blocks until the upstream producer delivers the next block and
 * sets *block to nullptr once the sequence is exhausted.
 */
class DataBlockStream {
public:
    virtual ~DataBlockStream() = default;

    virtual Status Next(DataBlockPtr* block) = 0;
};

/**
 * @brief Stream over blocks already held in memory
 */
class VectorDataBlockStream : public DataBlockStream {
public:
    explicit VectorDataBlockStream(std::vector<DataBlockPtr> blocks)
        : blocks_(std::move(blocks)) {}

    Status Next(DataBlockPtr* block) override;

private:
    std::vector<DataBlockPtr> blocks_;
    size_t position_ = 0;
};

/**
 * @brief Stream adapter over an arrow::RecordBatchReader
 */
class RecordBatchReaderStream : public DataBlockStream {
public:
    explicit RecordBatchReaderStream(std::shared_ptr<arrow::RecordBatchReader> reader)
        : reader_(std::move(reader)) {}

    Status Next(DataBlockPtr* block) override;

private:
    std::shared_ptr<arrow::RecordBatchReader> reader_;
};

} // namespace basalt
