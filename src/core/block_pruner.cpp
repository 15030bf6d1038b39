#include "basalt/block_pruner.h"

#include <algorithm>
#include <atomic>

#include "basalt/logging.h"
#include "basalt/metadata_io.h"

namespace basalt {

BASALT_LOG_TAG(BlockPruner);

namespace {

// State shared by the workers of one pruning call
struct PruneState {
    const TableSnapshot* snapshot = nullptr;
    const RangeFilter* filter = nullptr;
    std::atomic<size_t> next_segment{0};
    std::vector<std::vector<BlockMetaPtr>> survivors;  // Indexed by segment
    std::atomic<uint64_t> segments_pruned{0};
    std::atomic<uint64_t> blocks_total{0};
    std::atomic<uint64_t> blocks_pruned{0};
};

Status PruneSegment(const SegmentInfo& segment,
                    const RangeFilter& filter,
                    PruneState* state,
                    std::vector<BlockMetaPtr>* survivors) {
    bool may_match = true;
    BASALT_RETURN_NOT_OK(filter.Eval(segment.summary.col_stats, &may_match));
    if (!may_match) {
        state->segments_pruned.fetch_add(1);
        return Status::OK();
    }

    state->blocks_total.fetch_add(segment.blocks.size());
    for (const auto& block : segment.blocks) {
        BASALT_RETURN_NOT_OK(filter.Eval(block->col_stats, &may_match));
        if (may_match) {
            survivors->push_back(block);
        } else {
            state->blocks_pruned.fetch_add(1);
        }
    }
    return Status::OK();
}

} // namespace

BlockPruner::BlockPruner(std::shared_ptr<DataAccessor> accessor,
                         std::shared_ptr<TaskScheduler> scheduler,
                         MetadataCaches caches,
                         PrunerOptions options)
    : accessor_(std::move(accessor)),
      scheduler_(std::move(scheduler)),
      caches_(std::move(caches)),
      options_(options) {
    if (!scheduler_) {
        scheduler_ = std::make_shared<TaskScheduler>(options_.worker_threads);
    }
}

Status BlockPruner::Apply(const std::string& snapshot_location,
                          const arrow::Schema& schema,
                          const PushDownInfo& push_down,
                          std::vector<BlockMetaPtr>* blocks,
                          PruneMetrics* metrics) {
    std::unique_ptr<RangeFilter> filter;
    BASALT_RETURN_NOT_OK(
        RangeFilter::Create(push_down.filters, schema, options_.conjoin_filters, &filter));

    TableSnapshotPtr snapshot;
    auto status = SnapshotReader::Read(accessor_.get(), snapshot_location,
                                       caches_.snapshots.get(), &snapshot);
    if (!status.ok()) {
        BASALT_LOG_WARN(BlockPruner) << "cannot resolve snapshot: " << status.ToString();
        return status;
    }

    return PruneSegments(*snapshot, *filter, blocks, metrics);
}

Status BlockPruner::Apply(const TableSnapshot& snapshot,
                          const arrow::Schema& schema,
                          const PushDownInfo& push_down,
                          std::vector<BlockMetaPtr>* blocks,
                          PruneMetrics* metrics) {
    std::unique_ptr<RangeFilter> filter;
    BASALT_RETURN_NOT_OK(
        RangeFilter::Create(push_down.filters, schema, options_.conjoin_filters, &filter));
    return PruneSegments(snapshot, *filter, blocks, metrics);
}

Status BlockPruner::PruneSegments(const TableSnapshot& snapshot,
                                  const RangeFilter& filter,
                                  std::vector<BlockMetaPtr>* blocks,
                                  PruneMetrics* metrics) {
    const size_t segment_count = snapshot.segments.size();
    if (segment_count == 0) {
        blocks->clear();
        if (metrics) *metrics = PruneMetrics();
        return Status::OK();
    }

    PruneState state;
    state.snapshot = &snapshot;
    state.filter = &filter;
    state.survivors.resize(segment_count);

    // One worker per permitted in-flight load; each pulls segment indices
    // until none are left or another worker has failed.
    const size_t workers = std::min(std::max<size_t>(options_.max_concurrent_segment_loads, 1),
                                    segment_count);
    TaskGroup group;
    group.Add(workers);

    for (size_t w = 0; w < workers; ++w) {
        scheduler_->Schedule(MakeTask([this, &state, &group]() -> Status {
            while (!group.failed()) {
                size_t index = state.next_segment.fetch_add(1);
                if (index >= state.snapshot->segments.size()) break;

                const std::string& location = state.snapshot->segments[index];
                SegmentInfoPtr segment;
                BASALT_RETURN_NOT_OK(SegmentReader::Read(accessor_.get(), location,
                                                         caches_.segments.get(), &segment));

                auto status = PruneSegment(*segment, *state.filter, &state,
                                           &state.survivors[index]);
                if (!status.ok()) {
                    return status.WithContext("segment " + location)
                        .WithStage(OperationStage::kResolveSegment);
                }
            }
            return Status::OK();
        }), &group);
    }

    auto status = group.Wait();
    if (!status.ok()) {
        BASALT_LOG_WARN(BlockPruner) << "pruning " << snapshot.snapshot_id
                                     << " failed: " << status.ToString();
        return status;
    }

    std::vector<BlockMetaPtr> result;
    for (auto& survivors : state.survivors) {
        result.insert(result.end(), survivors.begin(), survivors.end());
    }

    PruneMetrics counters;
    counters.segments_total = segment_count;
    counters.segments_pruned = state.segments_pruned.load();
    counters.blocks_total = state.blocks_total.load();
    counters.blocks_pruned = state.blocks_pruned.load();

    BASALT_LOG_DEBUG(BlockPruner) << "snapshot " << snapshot.snapshot_id << ": pruned "
                                  << counters.segments_pruned << "/" << segment_count
                                  << " segments, " << counters.blocks_pruned << "/"
                                  << counters.blocks_total << " blocks, filter "
                                  << filter.ToString();

    *blocks = std::move(result);
    if (metrics) *metrics = counters;
    return Status::OK();
}

} // namespace basalt
