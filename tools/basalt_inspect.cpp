/**
 * basalt_inspect - print a snapshot and optionally prune it with a filter
 *
 *   basalt_inspect --root DIR --snapshot ID [--filter "column op value"]
 *                  [--config FILE] [--blocks]
 */

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <arrow/compute/expression.h>

#include <basalt/block_pruner.h>
#include <basalt/data_accessor.h>
#include <basalt/locations.h>
#include <basalt/metadata_cache.h>
#include <basalt/metadata_io.h>
#include <basalt/options.h>

namespace {

struct InspectConfig {
    std::string root;
    std::string snapshot_id;
    std::string filter;
    std::string config_file;
    bool show_blocks = false;
};

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " --root DIR --snapshot ID [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --root DIR           Table namespace directory" << std::endl;
    std::cout << "  --snapshot ID        Snapshot to inspect" << std::endl;
    std::cout << "  --filter EXPR        Prune with \"column op value\" (op: = != < <= > >=)"
              << std::endl;
    std::cout << "  --config FILE        Storage options as JSON" << std::endl;
    std::cout << "  --blocks             List every block of every segment" << std::endl;
    std::cout << "  --help, -h           Show this help message" << std::endl;
}

bool ParseCommandLine(int argc, char* argv[], InspectConfig* config) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--root" && i + 1 < argc) {
            config->root = argv[++i];
        } else if (arg == "--snapshot" && i + 1 < argc) {
            config->snapshot_id = argv[++i];
        } else if (arg == "--filter" && i + 1 < argc) {
            config->filter = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config->config_file = argv[++i];
        } else if (arg == "--blocks") {
            config->show_blocks = true;
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return false;
        }
    }
    return !config->snapshot_id.empty();
}

basalt::Status LoadOptions(const InspectConfig& config, basalt::StorageOptions* options) {
    if (!config.config_file.empty()) {
        std::ifstream in(config.config_file);
        if (!in) {
            return basalt::Status::IOError("cannot open " + config.config_file);
        }
        std::stringstream text;
        text << in.rdbuf();
        BASALT_RETURN_NOT_OK(basalt::StorageOptions::FromJson(text.str(), options));
    }
    if (!config.root.empty()) {
        options->root_path = config.root;
    }
    return options->Validate();
}

basalt::Status ParseFilter(const std::string& text, arrow::compute::Expression* expr) {
    std::istringstream in(text);
    std::string column, op, value;
    if (!(in >> column >> op) || !std::getline(in >> std::ws, value) || value.empty()) {
        return basalt::Status::InvalidArgument("filter must look like \"column op value\"");
    }

    std::string function;
    if (op == "=" || op == "==") function = "equal";
    else if (op == "!=") function = "not_equal";
    else if (op == "<") function = "less";
    else if (op == "<=") function = "less_equal";
    else if (op == ">") function = "greater";
    else if (op == ">=") function = "greater_equal";
    else return basalt::Status::InvalidArgument("unknown operator '" + op + "'");

    // The string literal is cast to the column type during compilation
    *expr = arrow::compute::call(function, {arrow::compute::field_ref(column),
                                            arrow::compute::literal(value)});
    return basalt::Status::OK();
}

void PrintStats(const basalt::Stats& stats, const arrow::Schema& schema,
                const std::string& indent) {
    std::cout << indent << "rows: " << stats.row_count << ", blocks: " << stats.block_count
              << ", bytes: " << stats.compressed_byte_size << " ("
              << stats.uncompressed_byte_size << " in memory)" << std::endl;
    for (const auto& [id, column] : stats.col_stats) {
        std::string name = id < static_cast<basalt::ColumnId>(schema.num_fields())
            ? schema.field(static_cast<int>(id))->name()
            : "#" + std::to_string(id);
        std::cout << indent << "  " << name << ": " << column.ToString() << std::endl;
    }
}

basalt::Status Run(const InspectConfig& config) {
    basalt::StorageOptions options;
    BASALT_RETURN_NOT_OK(LoadOptions(config, &options));

    auto accessor = std::make_shared<basalt::LocalDataAccessor>(options.root_path);
    auto caches = basalt::CreateLruMetadataCaches(options.snapshot_cache_capacity,
                                                  options.segment_cache_capacity);
    const std::string location = basalt::SnapshotLocation(config.snapshot_id);

    basalt::TableSnapshotPtr snapshot;
    BASALT_RETURN_NOT_OK(basalt::SnapshotReader::Read(accessor.get(), location,
                                                      caches.snapshots.get(), &snapshot));

    std::cout << "snapshot " << snapshot->snapshot_id << std::endl;
    std::cout << "  previous: " << snapshot->prev_snapshot_id.value_or("<none>") << std::endl;
    std::cout << "  schema: " << snapshot->schema->ToString(false) << std::endl;
    PrintStats(snapshot->summary, *snapshot->schema, "  ");

    std::cout << "segments (" << snapshot->segments.size() << "):" << std::endl;
    for (const auto& segment_location : snapshot->segments) {
        std::cout << "  " << segment_location << std::endl;
        if (!config.show_blocks) continue;

        basalt::SegmentInfoPtr segment;
        BASALT_RETURN_NOT_OK(basalt::SegmentReader::Read(accessor.get(), segment_location,
                                                         caches.segments.get(), &segment));
        PrintStats(segment->summary, *snapshot->schema, "    ");
        for (const auto& block : segment->blocks) {
            std::cout << "    block " << block->location.path << " rows=" << block->row_count
                      << std::endl;
        }
    }

    if (config.filter.empty()) {
        return basalt::Status::OK();
    }

    basalt::PushDownInfo push_down;
    arrow::compute::Expression expr;
    BASALT_RETURN_NOT_OK(ParseFilter(config.filter, &expr));
    push_down.filters.push_back(expr);

    basalt::BlockPruner pruner(accessor, nullptr, caches, options.pruner);
    std::vector<basalt::BlockMetaPtr> blocks;
    basalt::PruneMetrics metrics;
    BASALT_RETURN_NOT_OK(pruner.Apply(location, *snapshot->schema, push_down, &blocks,
                                      &metrics));

    std::cout << "filter " << expr.ToString() << ": " << blocks.size() << " candidate blocks ("
              << metrics.segments_pruned << "/" << metrics.segments_total
              << " segments pruned, " << metrics.blocks_pruned << "/" << metrics.blocks_total
              << " blocks pruned)" << std::endl;
    for (const auto& block : blocks) {
        std::cout << "  " << block->location.path << " rows=" << block->row_count << std::endl;
    }
    return basalt::Status::OK();
}

} // namespace

int main(int argc, char* argv[]) {
    InspectConfig config;
    if (!ParseCommandLine(argc, argv, &config)) {
        PrintUsage(argv[0]);
        return 2;
    }

    auto status = Run(config);
    if (!status.ok()) {
        std::cerr << "basalt_inspect: " << status.ToString() << std::endl;
        return 1;
    }
    return 0;
}
