#pragma once

#include <memory>
#include <string>
#include <vector>
#include <arrow/api.h>
#include <arrow/compute/expression.h>
#include <basalt/data_accessor.h>
#include <basalt/metadata.h>
#include <basalt/metadata_cache.h>
#include <basalt/options.h>
#include <basalt/range_filter.h>
#include <basalt/status.h>
#include <basalt/task_scheduler.h>

namespace basalt {

/**
 * @brief Filters the planner pushed down to the scan
 */
struct PushDownInfo {
    std::vector<arrow::compute::Expression> filters;
};

/**
 * @brief Counters of one pruning call
 */
struct PruneMetrics {
    uint64_t segments_total = 0;
    uint64_t segments_pruned = 0;
    uint64_t blocks_total = 0;      // Blocks of segments that were not pruned
    uint64_t blocks_pruned = 0;
};

/**
 * @brief Selects the blocks of a snapshot that may hold matching rows
 *
 * Segment records are loaded on the scheduler with at most
 * min(max_concurrent_segment_loads, segment count) loads in flight. A
 * segment whose summary excludes the filter is dropped whole; otherwise
 * each of its blocks is tested on its own statistics.
 */
class BlockPruner {
public:
    BlockPruner(std::shared_ptr<DataAccessor> accessor,
                std::shared_ptr<TaskScheduler> scheduler,
                MetadataCaches caches = MetadataCaches(),
                PrunerOptions options = PrunerOptions());

    /**
     * @brief Resolve the snapshot stored at `snapshot_location` and prune it
     *
     * The filter is compiled before any storage access. Any failure
     * aborts the whole call without a partial result.
     */
    Status Apply(const std::string& snapshot_location,
                 const arrow::Schema& schema,
                 const PushDownInfo& push_down,
                 std::vector<BlockMetaPtr>* blocks,
                 PruneMetrics* metrics = nullptr);

    /**
     * @brief Prune an already resolved snapshot
     */
    Status Apply(const TableSnapshot& snapshot,
                 const arrow::Schema& schema,
                 const PushDownInfo& push_down,
                 std::vector<BlockMetaPtr>* blocks,
                 PruneMetrics* metrics = nullptr);

    const PrunerOptions& options() const { return options_; }

private:
    Status PruneSegments(const TableSnapshot& snapshot,
                         const RangeFilter& filter,
                         std::vector<BlockMetaPtr>* blocks,
                         PruneMetrics* metrics);

    std::shared_ptr<DataAccessor> accessor_;
    std::shared_ptr<TaskScheduler> scheduler_;
    MetadataCaches caches_;
    PrunerOptions options_;
};

} // namespace basalt
