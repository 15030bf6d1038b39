#include "basalt/data_block.h"

#include <arrow/util/byte_size.h>

namespace basalt {

DataBlock::DataBlock(std::shared_ptr<arrow::Schema> schema,
                     std::vector<arrow::Datum> columns,
                     int64_t num_rows)
    : schema_(std::move(schema)),
      columns_(std::move(columns)),
      num_rows_(num_rows) {}

std::shared_ptr<DataBlock> DataBlock::FromRecordBatch(
    const std::shared_ptr<arrow::RecordBatch>& batch) {
    std::vector<arrow::Datum> columns;
    columns.reserve(batch->num_columns());
    for (const auto& array : batch->columns()) {
        columns.emplace_back(array);
    }
    return std::make_shared<DataBlock>(batch->schema(), std::move(columns),
                                       batch->num_rows());
}

Status DataBlock::Validate() const {
    if (!schema_) {
        return Status::InvalidArgument("DataBlock has no schema");
    }
    if (num_rows_ < 0) {
        return Status::InvalidArgument("DataBlock has negative row count");
    }
    if (schema_->num_fields() != num_columns()) {
        return Status::InvalidArgument(
            "DataBlock column count " + std::to_string(num_columns()) +
            " does not match schema field count " +
            std::to_string(schema_->num_fields()));
    }

    for (int i = 0; i < num_columns(); ++i) {
        const auto& column = columns_[i];
        const auto& field = schema_->field(i);

        if (column.is_array()) {
            if (column.length() != num_rows_) {
                return Status::InvalidArgument(
                    "Column '" + field->name() + "' has " +
                    std::to_string(column.length()) + " rows, expected " +
                    std::to_string(num_rows_));
            }
        } else if (!column.is_scalar()) {
            return Status::InvalidArgument(
                "Column '" + field->name() + "' must be an array or a constant");
        }

        if (!column.type()->Equals(*field->type())) {
            return Status::InvalidArgument(
                "Column '" + field->name() + "' has type " +
                column.type()->ToString() + ", schema declares " +
                field->type()->ToString());
        }
    }

    return Status::OK();
}

int64_t DataBlock::MemorySize() const {
    int64_t total = 0;
    for (const auto& column : columns_) {
        if (column.is_array()) {
            total += arrow::util::TotalBufferSize(*column.array());
            continue;
        }

        const auto& scalar = column.scalar();
        if (!scalar->is_valid) continue;
        if (arrow::is_base_binary_like(scalar->type->id())) {
            const auto& binary = static_cast<const arrow::BaseBinaryScalar&>(*scalar);
            total += binary.value ? binary.value->size() : 0;
        } else if (const auto* fixed =
                       dynamic_cast<const arrow::FixedWidthType*>(scalar->type.get())) {
            total += (fixed->bit_width() + 7) / 8;
        }
    }
    return total;
}

Status DataBlock::ToRecordBatch(std::shared_ptr<arrow::RecordBatch>* batch) const {
    BASALT_RETURN_NOT_OK(Validate());

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    arrays.reserve(columns_.size());
    for (const auto& column : columns_) {
        if (column.is_array()) {
            arrays.push_back(column.make_array());
        } else {
            std::shared_ptr<arrow::Array> materialized;
            BASALT_ARROW_ASSIGN_OR_RETURN(
                materialized, arrow::MakeArrayFromScalar(*column.scalar(), num_rows_));
            arrays.push_back(std::move(materialized));
        }
    }

    *batch = arrow::RecordBatch::Make(schema_, num_rows_, std::move(arrays));
    return Status::OK();
}

Status VectorDataBlockStream::Next(DataBlockPtr* block) {
    if (position_ >= blocks_.size()) {
        *block = nullptr;
        return Status::OK();
    }
    *block = std::move(blocks_[position_++]);
    return Status::OK();
}

Status RecordBatchReaderStream::Next(DataBlockPtr* block) {
    std::shared_ptr<arrow::RecordBatch> batch;
    auto status = reader_->ReadNext(&batch);
    if (!status.ok()) {
        return FromArrowStatus(status).WithContext("reading upstream batch");
    }
    *block = batch ? DataBlock::FromRecordBatch(batch) : nullptr;
    return Status::OK();
}

} // namespace basalt
