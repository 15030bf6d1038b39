#include "basalt/table.h"

#include "basalt/block_io.h"
#include "basalt/logging.h"
#include "basalt/metadata_io.h"

namespace basalt {

BASALT_LOG_TAG(Table);

namespace {

// Rejects blocks whose schema differs from the table's before any write
class SchemaCheckedStream : public DataBlockStream {
public:
    SchemaCheckedStream(DataBlockStream* input, const arrow::Schema& schema)
        : input_(input), schema_(schema) {}

    Status Next(DataBlockPtr* block) override {
        BASALT_RETURN_NOT_OK(input_->Next(block));
        if (*block && !(*block)->schema()->Equals(schema_, /*check_metadata=*/false)) {
            return Status::InvalidArgument("block schema " + (*block)->schema()->ToString() +
                                           " does not match table schema " +
                                           schema_.ToString());
        }
        return Status::OK();
    }

private:
    DataBlockStream* input_;
    const arrow::Schema& schema_;
};

} // namespace

Table::Table(std::shared_ptr<arrow::Schema> schema,
             const StorageOptions& options,
             std::shared_ptr<DataAccessor> accessor,
             std::shared_ptr<LocationGenerator> locations)
    : schema_(std::move(schema)),
      options_(options),
      accessor_(std::move(accessor)),
      locations_(std::move(locations)),
      caches_(CreateLruMetadataCaches(options_.snapshot_cache_capacity,
                                      options_.segment_cache_capacity)),
      scheduler_(std::make_shared<TaskScheduler>(options_.pruner.worker_threads)),
      appender_(accessor_, locations_, options_.write),
      pruner_(accessor_, scheduler_, caches_, options_.pruner) {}

Status Table::Open(const StorageOptions& options,
                   std::shared_ptr<arrow::Schema> schema,
                   const std::optional<std::string>& snapshot_id,
                   std::unique_ptr<Table>* table) {
    BASALT_RETURN_NOT_OK(options.Validate());
    if (!schema) {
        return Status::InvalidArgument("table requires a schema");
    }
    for (const auto& field : schema->fields()) {
        if (!IsStatisticsSupported(*field->type())) {
            return Status::UnsupportedType("column '" + field->name() + "' of type " +
                                           field->type()->ToString() +
                                           " has no statistics");
        }
    }

    auto result = std::make_unique<Table>(
        schema, options, std::make_shared<LocalDataAccessor>(options.root_path),
        CreateUuidLocationGenerator());

    if (snapshot_id) {
        TableSnapshotPtr snapshot;
        BASALT_RETURN_NOT_OK(SnapshotReader::Read(result->accessor_.get(),
                                                  SnapshotLocation(*snapshot_id),
                                                  result->caches_.snapshots.get(), &snapshot));
        if (!snapshot->schema || !snapshot->schema->Equals(*schema, false)) {
            return Status::InvalidArgument("snapshot " + *snapshot_id +
                                           " was written with a different schema");
        }
        result->current_ = std::move(snapshot);
    }

    BASALT_LOG_INFO(Table) << "opened " << result->accessor_->GetName() << " at snapshot "
                           << (snapshot_id ? *snapshot_id : std::string("<none>"));
    *table = std::move(result);
    return Status::OK();
}

Status Table::Append(DataBlockStream* stream, TableSnapshotPtr* committed) {
    SchemaCheckedStream checked(stream, *schema_);

    SegmentInfo segment;
    BASALT_RETURN_NOT_OK(appender_.AppendBlocks(&checked, &segment));

    if (segment.blocks.empty()) {
        if (committed) *committed = current_snapshot();
        return Status::OK();
    }

    const std::string segment_location = locations_->NextSegmentLocation();
    BASALT_RETURN_NOT_OK(WriteSegment(accessor_.get(), segment_location, segment));
    return Commit(segment_location, segment, committed);
}

Status Table::Commit(const std::string& segment_location,
                     const SegmentInfo& segment,
                     TableSnapshotPtr* committed) {
    std::lock_guard<std::mutex> commit_lock(commit_mutex_);

    TableSnapshotPtr prev = current_snapshot();
    auto next = std::make_shared<TableSnapshot>();
    BASALT_RETURN_NOT_OK(MergeSnapshot(prev.get(), locations_->NextSnapshotId(), schema_,
                                       {segment_location}, {&segment}, next.get()));
    BASALT_RETURN_NOT_OK(WriteSnapshot(accessor_.get(), *next));

    if (caches_.snapshots) {
        caches_.snapshots->Put(SnapshotLocation(next->snapshot_id), next);
    }
    {
        std::lock_guard<std::mutex> lock(current_mutex_);
        current_ = next;
    }

    BASALT_LOG_INFO(Table) << "committed snapshot " << next->snapshot_id << " with "
                           << next->segments.size() << " segments, "
                           << next->summary.row_count << " rows";
    if (committed) *committed = std::move(next);
    return Status::OK();
}

Status Table::Prune(const PushDownInfo& push_down,
                    std::vector<BlockMetaPtr>* blocks,
                    PruneMetrics* metrics) {
    TableSnapshotPtr snapshot = current_snapshot();
    if (!snapshot) {
        // Still validate the filter against the schema
        std::unique_ptr<RangeFilter> filter;
        BASALT_RETURN_NOT_OK(RangeFilter::Create(push_down.filters, *schema_,
                                                 options_.pruner.conjoin_filters, &filter));
        blocks->clear();
        if (metrics) *metrics = PruneMetrics();
        return Status::OK();
    }
    return pruner_.Apply(*snapshot, *schema_, push_down, blocks, metrics);
}

Status Table::ReadBlock(const BlockMeta& block, std::shared_ptr<arrow::RecordBatch>* batch) {
    return ReadBlockFile(accessor_.get(), block.location.path, batch, nullptr);
}

TableSnapshotPtr Table::current_snapshot() const {
    std::lock_guard<std::mutex> lock(current_mutex_);
    return current_;
}

} // namespace basalt
