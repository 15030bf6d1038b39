/**
 * BlockAppender - turns a stream of in-memory blocks into one segment
 *
 * Each incoming block is persisted as its own block file, described by a
 * BlockMeta, and folded into the segment summary. The appender never
 * publishes anything: the returned SegmentInfo still has to be written
 * and referenced from a snapshot by the caller.
 */

#pragma once

#include <memory>
#include <vector>
#include <basalt/data_accessor.h>
#include <basalt/data_block.h>
#include <basalt/locations.h>
#include <basalt/metadata.h>
#include <basalt/options.h>
#include <basalt/status.h>

namespace basalt {

/**
 * @brief Running totals of one append call
 */
class AppendAccumulator {
public:
    void Add(BlockMetaPtr block, uint64_t file_size);

    /**
     * @brief Reduce the accumulated blocks into a segment
     *
     * The accumulator is left empty afterwards.
     */
    Status Finish(SegmentInfo* segment);

    uint64_t block_count() const { return blocks_.size(); }
    uint64_t row_count() const { return row_count_; }

private:
    std::vector<BlockMetaPtr> blocks_;
    uint64_t row_count_ = 0;
    uint64_t uncompressed_byte_size_ = 0;
    uint64_t compressed_byte_size_ = 0;
};

class BlockAppender {
public:
    BlockAppender(std::shared_ptr<DataAccessor> accessor,
                  std::shared_ptr<LocationGenerator> locations,
                  BlockWriteOptions options = BlockWriteOptions());

    /**
     * @brief Persist every block of `stream` and describe them as a segment
     *
     * Blocks are written strictly one after another in stream order.
     * Column ids are the field positions of the first block's schema and
     * every later block must share that schema.
     *
     * On failure no segment is returned. Block files already written stay
     * behind unreferenced. Storage and encoding failures are tagged
     * OperationStage::kWrite.
     */
    Status AppendBlocks(DataBlockStream* stream, SegmentInfo* segment);

private:
    Status AppendBlock(const DataBlock& block, AppendAccumulator* acc);

    std::shared_ptr<DataAccessor> accessor_;
    std::shared_ptr<LocationGenerator> locations_;
    BlockWriteOptions options_;
};

/**
 * @brief Split a block into pieces of at most `max_rows` rows
 *
 * Constant columns are shared by every piece. max_rows == 0 keeps the
 * block whole.
 */
Status SliceDataBlock(const DataBlockPtr& block, size_t max_rows,
                      std::vector<DataBlockPtr>* pieces);

} // namespace basalt
