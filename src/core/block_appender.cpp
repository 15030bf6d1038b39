#include "basalt/block_appender.h"

#include <algorithm>

#include "basalt/block_io.h"
#include "basalt/logging.h"
#include "basalt/statistics.h"

namespace basalt {

BASALT_LOG_TAG(BlockAppender);

//==============================================================================
// AppendAccumulator
//==============================================================================

void AppendAccumulator::Add(BlockMetaPtr block, uint64_t file_size) {
    row_count_ += block->row_count;
    uncompressed_byte_size_ += block->block_size;
    compressed_byte_size_ += file_size;
    blocks_.push_back(std::move(block));
}

Status AppendAccumulator::Finish(SegmentInfo* segment) {
    std::vector<const BlockStatistics*> block_stats;
    block_stats.reserve(blocks_.size());
    for (const auto& block : blocks_) {
        block_stats.push_back(&block->col_stats);
    }

    SegmentInfo result;
    BASALT_RETURN_NOT_OK(ReduceBlockStatistics(block_stats, &result.summary.col_stats));
    result.summary.row_count = row_count_;
    result.summary.block_count = blocks_.size();
    result.summary.uncompressed_byte_size = uncompressed_byte_size_;
    result.summary.compressed_byte_size = compressed_byte_size_;
    result.blocks = std::move(blocks_);

    *this = AppendAccumulator();
    *segment = std::move(result);
    return Status::OK();
}

//==============================================================================
// BlockAppender
//==============================================================================

BlockAppender::BlockAppender(std::shared_ptr<DataAccessor> accessor,
                             std::shared_ptr<LocationGenerator> locations,
                             BlockWriteOptions options)
    : accessor_(std::move(accessor)),
      locations_(std::move(locations)),
      options_(options) {}

Status BlockAppender::AppendBlocks(DataBlockStream* stream, SegmentInfo* segment) {
    AppendAccumulator acc;
    std::shared_ptr<arrow::Schema> schema;

    while (true) {
        DataBlockPtr block;
        BASALT_RETURN_NOT_OK(stream->Next(&block));
        if (!block) break;

        auto status = block->Validate();
        if (!status.ok()) {
            return status.WithStage(OperationStage::kWrite);
        }
        if (!schema) {
            schema = block->schema();
        } else if (!schema->Equals(*block->schema(), /*check_metadata=*/false)) {
            return Status::InvalidArgument(
                "block schema " + block->schema()->ToString() +
                " differs from the first block's " + schema->ToString());
        }

        std::vector<DataBlockPtr> pieces;
        BASALT_RETURN_NOT_OK(SliceDataBlock(block, options_.max_rows_per_block, &pieces));
        for (const auto& piece : pieces) {
            BASALT_RETURN_NOT_OK(AppendBlock(*piece, &acc));
        }
    }

    BASALT_RETURN_NOT_OK(acc.Finish(segment));
    BASALT_LOG_INFO(BlockAppender) << "appended " << segment->summary.block_count
                                   << " blocks, " << segment->summary.row_count
                                   << " rows, " << segment->summary.compressed_byte_size
                                   << " bytes";
    return Status::OK();
}

Status BlockAppender::AppendBlock(const DataBlock& block, AppendAccumulator* acc) {
    BlockStatistics stats;
    auto status = ComputeBlockStatistics(block, &stats);
    if (!status.ok()) {
        return status.WithStage(OperationStage::kWrite);
    }

    std::string location = locations_->NextBlockLocation();

    std::shared_ptr<arrow::io::OutputStream> sink;
    status = accessor_->GetWriter(location, &sink);
    if (!status.ok()) {
        return status.WithContext("block " + location).WithStage(OperationStage::kWrite);
    }

    BlockFileInfo file_info;
    status = WriteBlockFile(block, stats, options_, sink, &file_info);
    if (!status.ok()) {
        BASALT_LOG_WARN(BlockAppender) << "failed to write block " << location << ": "
                                       << status.ToString();
        return status.WithContext("block " + location).WithStage(OperationStage::kWrite);
    }

    auto meta = std::make_shared<BlockMeta>();
    meta->location.path = location;
    meta->location.meta_size = file_info.meta_size;
    meta->row_count = static_cast<uint64_t>(block.num_rows());
    meta->block_size = static_cast<uint64_t>(block.MemorySize());
    meta->col_stats = std::move(stats);

    BASALT_LOG_DEBUG(BlockAppender) << "wrote block " << location << " rows="
                                    << meta->row_count << " bytes=" << file_info.file_size;

    acc->Add(std::move(meta), file_info.file_size);
    return Status::OK();
}

Status SliceDataBlock(const DataBlockPtr& block, size_t max_rows,
                      std::vector<DataBlockPtr>* pieces) {
    pieces->clear();
    const int64_t num_rows = block->num_rows();
    if (max_rows == 0 || num_rows <= static_cast<int64_t>(max_rows)) {
        pieces->push_back(block);
        return Status::OK();
    }

    BASALT_RETURN_NOT_OK(block->Validate());
    const int64_t step = static_cast<int64_t>(max_rows);
    for (int64_t offset = 0; offset < num_rows; offset += step) {
        int64_t length = std::min(step, num_rows - offset);

        std::vector<arrow::Datum> columns;
        columns.reserve(block->num_columns());
        for (const auto& column : block->columns()) {
            if (column.is_scalar()) {
                columns.push_back(column);
            } else {
                columns.emplace_back(column.make_array()->Slice(offset, length));
            }
        }
        pieces->push_back(std::make_shared<DataBlock>(block->schema(), std::move(columns),
                                                      length));
    }
    return Status::OK();
}

} // namespace basalt
