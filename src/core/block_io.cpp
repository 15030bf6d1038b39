#include "basalt/block_io.h"

#include <arrow/io/memory.h>
#include <arrow/ipc/reader.h>
#include <arrow/ipc/writer.h>
#include <arrow/util/compression.h>
#include <arrow/util/key_value_metadata.h>

#include "basalt/metadata_io.h"

namespace basalt {

namespace {

Status MakeCodec(BlockWriteOptions::CompressionType type,
                 std::shared_ptr<arrow::util::Codec>* codec) {
    arrow::Compression::type compression;
    switch (type) {
        case BlockWriteOptions::CompressionType::kNoCompression:
            codec->reset();
            return Status::OK();
        case BlockWriteOptions::CompressionType::kLZ4:
            compression = arrow::Compression::LZ4_FRAME;
            break;
        case BlockWriteOptions::CompressionType::kZSTD:
            compression = arrow::Compression::ZSTD;
            break;
        default:
            return Status::InvalidArgument("unknown compression type");
    }

    auto result = arrow::util::Codec::Create(compression);
    if (!result.ok()) {
        return Status::InvalidArgument(std::string("compression ") +
                                       CompressionTypeName(type) +
                                       " unavailable: " + result.status().message());
    }
    *codec = std::shared_ptr<arrow::util::Codec>(result.MoveValueUnsafe());
    return Status::OK();
}

} // namespace

Status WriteBlockFile(const DataBlock& block,
                      const BlockStatistics& stats,
                      const BlockWriteOptions& options,
                      const std::shared_ptr<arrow::io::OutputStream>& sink,
                      BlockFileInfo* info) {
    if (!sink) {
        return Status::InvalidArgument("null block sink");
    }

    std::shared_ptr<arrow::RecordBatch> batch;
    BASALT_RETURN_NOT_OK(block.ToRecordBatch(&batch));

    BlockFileInfo result;
    if (options.embed_statistics) {
        std::string stats_json;
        BASALT_RETURN_NOT_OK(SerializeBlockStatistics(stats, &stats_json));
        result.meta_size = stats_json.size();

        auto existing = batch->schema()->metadata();
        auto metadata = existing ? existing->Copy()
                                 : std::make_shared<arrow::KeyValueMetadata>();
        BASALT_RETURN_ARROW_NOT_OK(metadata->Set(kStatisticsMetadataKey, stats_json));
        batch = batch->ReplaceSchemaMetadata(metadata);
    }

    auto write_options = arrow::ipc::IpcWriteOptions::Defaults();
    BASALT_RETURN_NOT_OK(MakeCodec(options.compression, &write_options.codec));

    auto writer_result = arrow::ipc::MakeFileWriter(sink, batch->schema(), write_options);
    if (!writer_result.ok()) {
        return Status::IOError("create block writer: " + writer_result.status().message());
    }
    auto writer = writer_result.MoveValueUnsafe();

    auto status = writer->WriteRecordBatch(*batch);
    if (!status.ok()) {
        return Status::IOError("write block: " + status.message());
    }
    status = writer->Close();
    if (!status.ok()) {
        return Status::IOError("finish block: " + status.message());
    }

    auto position = sink->Tell();
    if (!position.ok()) {
        return Status::IOError("block size: " + position.status().message());
    }
    result.file_size = static_cast<uint64_t>(*position);

    status = sink->Close();
    if (!status.ok()) {
        return Status::IOError("close block: " + status.message());
    }

    *info = result;
    return Status::OK();
}

Status ReadBlockFile(const std::shared_ptr<arrow::Buffer>& data,
                     std::shared_ptr<arrow::RecordBatch>* batch,
                     BlockStatistics* stats) {
    if (!data || data->size() == 0) {
        return Status::Corruption("empty block file");
    }

    auto input = std::make_shared<arrow::io::BufferReader>(data);
    auto reader_result = arrow::ipc::RecordBatchFileReader::Open(input);
    if (!reader_result.ok()) {
        return Status::Corruption("open block file: " + reader_result.status().message());
    }
    auto reader = reader_result.MoveValueUnsafe();

    if (reader->num_record_batches() != 1) {
        return Status::Corruption("block file holds " +
                                  std::to_string(reader->num_record_batches()) +
                                  " record batches, expected 1");
    }

    auto batch_result = reader->ReadRecordBatch(0);
    if (!batch_result.ok()) {
        return Status::Corruption("read block: " + batch_result.status().message());
    }

    if (stats) {
        stats->clear();
        auto metadata = reader->schema()->metadata();
        if (metadata) {
            auto value = metadata->Get(kStatisticsMetadataKey);
            if (value.ok()) {
                BASALT_RETURN_NOT_OK(DeserializeBlockStatistics(*value, stats));
            }
        }
    }

    *batch = batch_result.MoveValueUnsafe();
    return Status::OK();
}

Status ReadBlockFile(DataAccessor* accessor,
                     const std::string& location,
                     std::shared_ptr<arrow::RecordBatch>* batch,
                     BlockStatistics* stats) {
    std::shared_ptr<arrow::Buffer> data;
    BASALT_RETURN_NOT_OK(accessor->Read(location, &data));
    return ReadBlockFile(data, batch, stats).WithContext(location);
}

} // namespace basalt
