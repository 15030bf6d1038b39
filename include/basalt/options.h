#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <basalt/status.h>

namespace basalt {

/**
 * @brief How block files are written
 */
struct BlockWriteOptions {
    enum class CompressionType {
        kNoCompression,
        kLZ4,
        kZSTD
    };
    CompressionType compression = CompressionType::kNoCompression;

    // Embed the block statistics JSON in the file's schema metadata
    bool embed_statistics = true;

    // Split incoming blocks larger than this many rows (0 = never split)
    size_t max_rows_per_block = 0;
};

/**
 * @brief Block pruning options
 */
struct PrunerOptions {
    // Upper bound on segment records being loaded at once
    size_t max_concurrent_segment_loads = 10;

    // Compile every top-level filter instead of only the first one
    bool conjoin_filters = false;

    // Threads of the scheduler that runs segment loads (0 = hardware)
    size_t worker_threads = 0;
};

/**
 * @brief Storage core configuration
 */
struct StorageOptions {
    // Root directory of the table namespace
    std::string root_path = "/tmp/basalt";

    BlockWriteOptions write;
    PrunerOptions pruner;

    // Parsed-metadata cache sizes, in entries (0 disables the cache)
    size_t snapshot_cache_capacity = 16;
    size_t segment_cache_capacity = 1024;

    /**
     * @brief Check value ranges
     */
    Status Validate() const;

    /**
     * @brief Parse options from a JSON document
     *
     * Missing keys keep their defaults; unknown keys are InvalidArgument.
     */
    static Status FromJson(const std::string& json, StorageOptions* options);

    std::string ToJson() const;
};

const char* CompressionTypeName(BlockWriteOptions::CompressionType type);

Status ParseCompressionType(const std::string& name,
                            BlockWriteOptions::CompressionType* type);

} // namespace basalt
