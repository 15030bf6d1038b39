#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <arrow/api.h>
#include <basalt/data_accessor.h>
#include <basalt/metadata.h>
#include <basalt/metadata_cache.h>
#include <basalt/status.h>

namespace basalt {

//==============================================================================
// Record codecs
//
// Segment and snapshot records are JSON documents. Every field the block
// writer produces round-trips exactly, including the declared type of
// each statistics bound.
//==============================================================================

Status SerializeBlockStatistics(const BlockStatistics& stats, std::string* json);
Status DeserializeBlockStatistics(std::string_view json, BlockStatistics* stats);

Status SerializeSegmentInfo(const SegmentInfo& segment, std::string* json);
Status DeserializeSegmentInfo(std::string_view json, SegmentInfo* segment);

Status SerializeTableSnapshot(const TableSnapshot& snapshot, std::string* json);
Status DeserializeTableSnapshot(std::string_view json, TableSnapshot* snapshot);

//==============================================================================
// Readers and writers over a DataAccessor
//==============================================================================

/**
 * @brief Loads snapshot records, consulting an optional cache first
 *
 * Failures are tagged OperationStage::kResolveSnapshot.
 */
class SnapshotReader {
public:
    static Status Read(DataAccessor* accessor,
                       const std::string& location,
                       SnapshotCache* cache,
                       TableSnapshotPtr* snapshot);
};

/**
 * @brief Loads segment records, consulting an optional cache first
 *
 * Failures are tagged OperationStage::kResolveSegment.
 */
class SegmentReader {
public:
    static Status Read(DataAccessor* accessor,
                       const std::string& location,
                       SegmentCache* cache,
                       SegmentInfoPtr* segment);
};

Status WriteSegment(DataAccessor* accessor,
                    const std::string& location,
                    const SegmentInfo& segment);

// Writes the record at SnapshotLocation(snapshot.snapshot_id)
Status WriteSnapshot(DataAccessor* accessor, const TableSnapshot& snapshot);

} // namespace basalt
