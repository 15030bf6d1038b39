#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <arrow/api.h>
#include <arrow/io/interfaces.h>
#include <basalt/data_accessor.h>
#include <basalt/data_block.h>
#include <basalt/options.h>
#include <basalt/statistics.h>
#include <basalt/status.h>

namespace basalt {

// Schema metadata key holding the block statistics JSON
constexpr const char* kStatisticsMetadataKey = "basalt.statistics";

/**
 * @brief Sizes reported after a block file is persisted
 */
struct BlockFileInfo {
    uint64_t file_size = 0;  // Bytes written to the sink
    uint64_t meta_size = 0;  // Bytes of embedded statistics JSON
};

/**
 * @brief Write one block as an Arrow IPC file
 *
 * Constant columns are materialized. The sink is closed on success, which
 * makes the object visible; on failure it is left unclosed so the
 * accessor can discard it.
 */
Status WriteBlockFile(const DataBlock& block,
                      const BlockStatistics& stats,
                      const BlockWriteOptions& options,
                      const std::shared_ptr<arrow::io::OutputStream>& sink,
                      BlockFileInfo* info);

/**
 * @brief Decode a block file previously written by WriteBlockFile
 *
 * `stats` may be null. When the file carries no embedded statistics it
 * is cleared.
 */
Status ReadBlockFile(const std::shared_ptr<arrow::Buffer>& data,
                     std::shared_ptr<arrow::RecordBatch>* batch,
                     BlockStatistics* stats);

Status ReadBlockFile(DataAccessor* accessor,
                     const std::string& location,
                     std::shared_ptr<arrow::RecordBatch>* batch,
                     BlockStatistics* stats);

} // namespace basalt
