#include "basalt/metadata.h"

namespace basalt {

bool BlockMeta::Equals(const BlockMeta& other) const {
    return location == other.location &&
           row_count == other.row_count &&
           block_size == other.block_size &&
           BlockStatisticsEquals(col_stats, other.col_stats);
}

bool Stats::Equals(const Stats& other) const {
    return row_count == other.row_count &&
           block_count == other.block_count &&
           uncompressed_byte_size == other.uncompressed_byte_size &&
           compressed_byte_size == other.compressed_byte_size &&
           BlockStatisticsEquals(col_stats, other.col_stats);
}

bool SegmentInfo::Equals(const SegmentInfo& other) const {
    if (blocks.size() != other.blocks.size()) return false;
    for (size_t i = 0; i < blocks.size(); ++i) {
        if (!blocks[i]->Equals(*other.blocks[i])) return false;
    }
    return summary.Equals(other.summary);
}

bool TableSnapshot::Equals(const TableSnapshot& other) const {
    if (snapshot_id != other.snapshot_id ||
        prev_snapshot_id != other.prev_snapshot_id ||
        segments != other.segments) {
        return false;
    }
    if (!schema || !other.schema) {
        if (schema != other.schema) return false;
    } else if (!schema->Equals(*other.schema, /*check_metadata=*/false)) {
        return false;
    }
    return summary.Equals(other.summary);
}

Status ReduceStats(const std::vector<const Stats*>& parts, Stats* reduced) {
    *reduced = Stats();

    std::vector<const BlockStatistics*> col_stats;
    for (const Stats* part : parts) {
        reduced->row_count += part->row_count;
        reduced->block_count += part->block_count;
        reduced->uncompressed_byte_size += part->uncompressed_byte_size;
        reduced->compressed_byte_size += part->compressed_byte_size;
        // An empty part (no blocks yet) has no columns to contribute
        if (part->block_count > 0) {
            col_stats.push_back(&part->col_stats);
        }
    }

    return ReduceBlockStatistics(col_stats, &reduced->col_stats);
}

Status MergeSnapshot(const TableSnapshot* prev,
                     const std::string& snapshot_id,
                     const std::shared_ptr<arrow::Schema>& schema,
                     const std::vector<std::string>& new_segment_locations,
                     const std::vector<const SegmentInfo*>& new_segments,
                     TableSnapshot* next) {
    if (new_segment_locations.size() != new_segments.size()) {
        return Status::InvalidArgument("segment locations and segments differ in count");
    }
    if (!schema) {
        return Status::InvalidArgument("snapshot requires a schema");
    }
    // Column ids are positional, so a schema change would silently
    // re-label statistics of older segments.
    if (prev && prev->schema &&
        !prev->schema->Equals(*schema, /*check_metadata=*/false)) {
        return Status::InvalidArgument(
            "table schema changed between snapshots: " + prev->schema->ToString() +
            " vs " + schema->ToString());
    }

    TableSnapshot result;
    result.snapshot_id = snapshot_id;
    result.schema = schema;

    std::vector<const Stats*> parts;
    if (prev) {
        result.prev_snapshot_id = prev->snapshot_id;
        result.segments = prev->segments;
        parts.push_back(&prev->summary);
    }
    for (size_t i = 0; i < new_segments.size(); ++i) {
        result.segments.push_back(new_segment_locations[i]);
        parts.push_back(&new_segments[i]->summary);
    }

    BASALT_RETURN_NOT_OK(ReduceStats(parts, &result.summary));

    *next = std::move(result);
    return Status::OK();
}

} // namespace basalt
