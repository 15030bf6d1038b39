/**
 * Table - append and prune over one table namespace
 *
 * Ties the block writer, the metadata records and the pruner together.
 * The table keeps the id of its current snapshot in process; persisting
 * that pointer (and arbitrating concurrent writers across processes) is
 * left to the caller's metadata store.
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <arrow/api.h>
#include <basalt/block_appender.h>
#include <basalt/block_pruner.h>
#include <basalt/data_accessor.h>
#include <basalt/locations.h>
#include <basalt/metadata.h>
#include <basalt/metadata_cache.h>
#include <basalt/options.h>
#include <basalt/status.h>
#include <basalt/task_scheduler.h>

namespace basalt {

class Table {
public:
    Table(std::shared_ptr<arrow::Schema> schema,
          const StorageOptions& options,
          std::shared_ptr<DataAccessor> accessor,
          std::shared_ptr<LocationGenerator> locations);

    /**
     * @brief Open a table rooted at options.root_path
     *
     * With a snapshot id the table starts from that snapshot, whose schema
     * must equal `schema`. Without one the table starts empty.
     */
    static Status Open(const StorageOptions& options,
                       std::shared_ptr<arrow::Schema> schema,
                       const std::optional<std::string>& snapshot_id,
                       std::unique_ptr<Table>* table);

    /**
     * @brief Write the blocks of `stream` as one new segment and commit
     *
     * Produces a new snapshot that references every segment of the
     * current one plus the new segment. An empty stream commits nothing.
     * `committed` (optional) receives the snapshot current after the call.
     */
    Status Append(DataBlockStream* stream, TableSnapshotPtr* committed = nullptr);

    /**
     * @brief Blocks of the current snapshot that may match the filters
     *
     * The snapshot is resolved once at the start; commits made while the
     * call runs are not observed.
     */
    Status Prune(const PushDownInfo& push_down,
                 std::vector<BlockMetaPtr>* blocks,
                 PruneMetrics* metrics = nullptr);

    // Load the rows of one block returned by Prune()
    Status ReadBlock(const BlockMeta& block, std::shared_ptr<arrow::RecordBatch>* batch);

    // Null until the first commit
    TableSnapshotPtr current_snapshot() const;

    const std::shared_ptr<arrow::Schema>& schema() const { return schema_; }
    const std::shared_ptr<DataAccessor>& accessor() const { return accessor_; }

private:
    Status Commit(const std::string& segment_location,
                  const SegmentInfo& segment,
                  TableSnapshotPtr* committed);

    std::shared_ptr<arrow::Schema> schema_;
    StorageOptions options_;
    std::shared_ptr<DataAccessor> accessor_;
    std::shared_ptr<LocationGenerator> locations_;
    MetadataCaches caches_;
    std::shared_ptr<TaskScheduler> scheduler_;
    BlockAppender appender_;
    BlockPruner pruner_;

    std::mutex commit_mutex_;           // Serializes snapshot creation
    mutable std::mutex current_mutex_;  // Guards current_
    TableSnapshotPtr current_;
};

} // namespace basalt
