#include "basalt/options.h"

#include <nlohmann/json.hpp>

namespace basalt {

using nlohmann::json;

namespace {

// Fails on keys outside `allowed`
Status CheckKeys(const json& object, std::initializer_list<const char*> allowed,
                 const std::string& scope) {
    for (auto it = object.begin(); it != object.end(); ++it) {
        bool known = false;
        for (const char* key : allowed) {
            if (it.key() == key) {
                known = true;
                break;
            }
        }
        if (!known) {
            return Status::InvalidArgument("unknown option '" + scope + it.key() + "'");
        }
    }
    return Status::OK();
}

template <typename T>
void ReadIfPresent(const json& object, const char* key, T* value) {
    auto it = object.find(key);
    if (it != object.end()) {
        *value = it->get<T>();
    }
}

// Counts and capacities; get<size_t>() would wrap a negative number
Status ReadSizeIfPresent(const json& object, const char* key, size_t* value) {
    auto it = object.find(key);
    if (it == object.end()) {
        return Status::OK();
    }
    if (!it->is_number_unsigned()) {
        return Status::InvalidArgument(std::string("'") + key +
                                       "' must be a non-negative integer, got " + it->dump());
    }
    *value = it->get<size_t>();
    return Status::OK();
}

Status ParseWriteOptions(const json& j, BlockWriteOptions* write) {
    if (!j.is_object()) {
        return Status::InvalidArgument("'write' must be an object");
    }
    BASALT_RETURN_NOT_OK(CheckKeys(
        j, {"compression", "embed_statistics", "max_rows_per_block"}, "write."));

    auto it = j.find("compression");
    if (it != j.end()) {
        BASALT_RETURN_NOT_OK(
            ParseCompressionType(it->get<std::string>(), &write->compression));
    }
    ReadIfPresent(j, "embed_statistics", &write->embed_statistics);
    BASALT_RETURN_NOT_OK(ReadSizeIfPresent(j, "max_rows_per_block", &write->max_rows_per_block));
    return Status::OK();
}

Status ParsePrunerOptions(const json& j, PrunerOptions* pruner) {
    if (!j.is_object()) {
        return Status::InvalidArgument("'pruner' must be an object");
    }
    BASALT_RETURN_NOT_OK(CheckKeys(
        j, {"max_concurrent_segment_loads", "conjoin_filters", "worker_threads"},
        "pruner."));

    BASALT_RETURN_NOT_OK(ReadSizeIfPresent(j, "max_concurrent_segment_loads",
                                           &pruner->max_concurrent_segment_loads));
    ReadIfPresent(j, "conjoin_filters", &pruner->conjoin_filters);
    BASALT_RETURN_NOT_OK(ReadSizeIfPresent(j, "worker_threads", &pruner->worker_threads));
    return Status::OK();
}

} // namespace

const char* CompressionTypeName(BlockWriteOptions::CompressionType type) {
    switch (type) {
        case BlockWriteOptions::CompressionType::kNoCompression: return "none";
        case BlockWriteOptions::CompressionType::kLZ4: return "lz4";
        case BlockWriteOptions::CompressionType::kZSTD: return "zstd";
    }
    return "unknown";
}

Status ParseCompressionType(const std::string& name,
                            BlockWriteOptions::CompressionType* type) {
    if (name == "none") {
        *type = BlockWriteOptions::CompressionType::kNoCompression;
    } else if (name == "lz4") {
        *type = BlockWriteOptions::CompressionType::kLZ4;
    } else if (name == "zstd") {
        *type = BlockWriteOptions::CompressionType::kZSTD;
    } else {
        return Status::InvalidArgument("unknown compression '" + name + "'");
    }
    return Status::OK();
}

Status StorageOptions::Validate() const {
    if (root_path.empty()) {
        return Status::InvalidArgument("root_path must not be empty");
    }
    if (pruner.max_concurrent_segment_loads == 0) {
        return Status::InvalidArgument("max_concurrent_segment_loads must be positive");
    }
    if (pruner.worker_threads > 1024) {
        return Status::InvalidArgument("worker_threads must be at most 1024");
    }
    return Status::OK();
}

Status StorageOptions::FromJson(const std::string& text, StorageOptions* options) {
    StorageOptions result;
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            return Status::InvalidArgument("options must be a JSON object");
        }
        BASALT_RETURN_NOT_OK(CheckKeys(
            j, {"root_path", "write", "pruner", "snapshot_cache_capacity",
                "segment_cache_capacity"}, ""));

        ReadIfPresent(j, "root_path", &result.root_path);
        BASALT_RETURN_NOT_OK(ReadSizeIfPresent(j, "snapshot_cache_capacity",
                                               &result.snapshot_cache_capacity));
        BASALT_RETURN_NOT_OK(ReadSizeIfPresent(j, "segment_cache_capacity",
                                               &result.segment_cache_capacity));

        auto write = j.find("write");
        if (write != j.end()) {
            BASALT_RETURN_NOT_OK(ParseWriteOptions(*write, &result.write));
        }
        auto pruner = j.find("pruner");
        if (pruner != j.end()) {
            BASALT_RETURN_NOT_OK(ParsePrunerOptions(*pruner, &result.pruner));
        }
    } catch (const json::exception& e) {
        return Status::InvalidArgument(std::string("invalid options: ") + e.what());
    }

    BASALT_RETURN_NOT_OK(result.Validate());
    *options = std::move(result);
    return Status::OK();
}

std::string StorageOptions::ToJson() const {
    json j;
    j["root_path"] = root_path;
    j["write"] = {
        {"compression", CompressionTypeName(write.compression)},
        {"embed_statistics", write.embed_statistics},
        {"max_rows_per_block", write.max_rows_per_block},
    };
    j["pruner"] = {
        {"max_concurrent_segment_loads", pruner.max_concurrent_segment_loads},
        {"conjoin_filters", pruner.conjoin_filters},
        {"worker_threads", pruner.worker_threads},
    };
    j["snapshot_cache_capacity"] = snapshot_cache_capacity;
    j["segment_cache_capacity"] = segment_cache_capacity;
    return j.dump(2);
}

} // namespace basalt
