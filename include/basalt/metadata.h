#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <arrow/api.h>
#include <basalt/statistics.h>
#include <basalt/status.h>

namespace basalt {

// Current version of the segment and snapshot record layouts
constexpr uint32_t kMetadataFormatVersion = 1;

/**
 * @brief Storage location of one block file
 */
struct BlockLocation {
    std::string path;
    uint64_t meta_size = 0;  // Bytes of auxiliary metadata embedded in the file

    bool operator==(const BlockLocation& other) const {
        return path == other.path && meta_size == other.meta_size;
    }
};

/**
 * @brief One physical block file and its statistics
 *
 * Created only by the block writer and never mutated afterwards.
 */
struct BlockMeta {
    BlockLocation location;
    uint64_t row_count = 0;
    uint64_t block_size = 0;  // In-memory size estimate of the block
    BlockStatistics col_stats;

    bool Equals(const BlockMeta& other) const;
};

using BlockMetaPtr = std::shared_ptr<const BlockMeta>;

/**
 * @brief Aggregate statistics over a set of blocks
 */
struct Stats {
    uint64_t row_count = 0;
    uint64_t block_count = 0;
    uint64_t uncompressed_byte_size = 0;
    uint64_t compressed_byte_size = 0;
    BlockStatistics col_stats;

    bool Equals(const Stats& other) const;
};

/**
 * @brief Immutable group of blocks with one summary
 */
struct SegmentInfo {
    std::vector<BlockMetaPtr> blocks;
    Stats summary;

    bool Equals(const SegmentInfo& other) const;
};

using SegmentInfoPtr = std::shared_ptr<const SegmentInfo>;

/**
 * @brief Versioned root of a table: an ordered list of segment locations
 *
 * A snapshot is never modified once published; the next version copies
 * the segment list and appends to it.
 */
struct TableSnapshot {
    std::string snapshot_id;
    std::optional<std::string> prev_snapshot_id;
    std::shared_ptr<arrow::Schema> schema;
    Stats summary;
    std::vector<std::string> segments;

    bool Equals(const TableSnapshot& other) const;
};

using TableSnapshotPtr = std::shared_ptr<const TableSnapshot>;

/**
 * @brief Merge segment summaries into one table-wide summary
 */
Status ReduceStats(const std::vector<const Stats*>& parts, Stats* reduced);

/**
 * @brief Build the snapshot that follows `prev`
 *
 * Copies prev's segment list, appends the new segment locations, and
 * folds the new segment summaries into the table summary. `prev` may be
 * null for the first snapshot of a table.
 */
Status MergeSnapshot(const TableSnapshot* prev,
                     const std::string& snapshot_id,
                     const std::shared_ptr<arrow::Schema>& schema,
                     const std::vector<std::string>& new_segment_locations,
                     const std::vector<const SegmentInfo*>& new_segments,
                     TableSnapshot* next);

} // namespace basalt
