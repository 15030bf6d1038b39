#include <gtest/gtest.h>
#include <arrow/io/memory.h>
#include <arrow/util/compression.h>
#include <basalt/block_io.h>
#include <basalt/metadata_io.h>

#include "test_util/test_util.h"

namespace basalt {
namespace {

class BlockIOTest : public ::testing::Test {
protected:
    void SetUp() override {
        schema_ = arrow::schema({arrow::field("id", arrow::int64()),
                                 arrow::field("name", arrow::utf8())});
        block_ = test::MakeBlock(schema_, {test::MakeInt64Array({3, 1, std::nullopt, 9}),
                                           test::MakeStringArray({"c", "a", "d", "b"})});
        ASSERT_OK(ComputeBlockStatistics(*block_, &stats_));
    }

    void WriteToAccessor(const BlockWriteOptions& options, BlockFileInfo* info) {
        std::shared_ptr<arrow::io::OutputStream> sink;
        ASSERT_OK(accessor_.GetWriter("_b/block.arrow", &sink));
        ASSERT_OK(WriteBlockFile(*block_, stats_, options, sink, info));
    }

    std::shared_ptr<arrow::Schema> schema_;
    DataBlockPtr block_;
    BlockStatistics stats_;
    InMemoryDataAccessor accessor_;
};

TEST_F(BlockIOTest, RowsAndStatisticsSurviveRoundTrip) {
    BlockFileInfo info;
    WriteToAccessor(BlockWriteOptions(), &info);

    std::shared_ptr<arrow::Buffer> data;
    ASSERT_OK(accessor_.Read("_b/block.arrow", &data));
    EXPECT_EQ(info.file_size, static_cast<uint64_t>(data->size()));

    std::shared_ptr<arrow::RecordBatch> batch;
    BlockStatistics stats;
    ASSERT_OK(ReadBlockFile(data, &batch, &stats));

    std::shared_ptr<arrow::RecordBatch> expected;
    ASSERT_OK(block_->ToRecordBatch(&expected));
    EXPECT_TRUE(batch->Equals(*expected, /*check_metadata=*/false));
    EXPECT_TRUE(BlockStatisticsEquals(stats, stats_));
}

TEST_F(BlockIOTest, MetaSizeIsEmbeddedStatisticsLength) {
    BlockFileInfo info;
    WriteToAccessor(BlockWriteOptions(), &info);

    std::string json;
    ASSERT_OK(SerializeBlockStatistics(stats_, &json));
    EXPECT_EQ(info.meta_size, json.size());
    EXPECT_GT(info.file_size, info.meta_size);
}

TEST_F(BlockIOTest, StatisticsCanBeLeftOut) {
    BlockWriteOptions options;
    options.embed_statistics = false;
    BlockFileInfo info;
    WriteToAccessor(options, &info);
    EXPECT_EQ(info.meta_size, 0u);

    std::shared_ptr<arrow::RecordBatch> batch;
    BlockStatistics stats;
    ASSERT_OK(ReadBlockFile(&accessor_, "_b/block.arrow", &batch, &stats));
    EXPECT_TRUE(stats.empty());
    EXPECT_EQ(batch->num_rows(), 4);
}

TEST_F(BlockIOTest, CompressedBlockReadsBack) {
    if (!arrow::util::Codec::IsAvailable(arrow::Compression::ZSTD)) {
        GTEST_SKIP() << "zstd not built into Arrow";
    }
    BlockWriteOptions options;
    options.compression = BlockWriteOptions::CompressionType::kZSTD;
    BlockFileInfo info;
    WriteToAccessor(options, &info);

    std::shared_ptr<arrow::RecordBatch> batch;
    ASSERT_OK(ReadBlockFile(&accessor_, "_b/block.arrow", &batch, nullptr));
    EXPECT_EQ(batch->num_rows(), 4);
}

TEST_F(BlockIOTest, GarbageIsCorruption) {
    ASSERT_OK(accessor_.Put("_b/junk.arrow", arrow::Buffer::FromString("not arrow")));
    std::shared_ptr<arrow::RecordBatch> batch;
    auto status = ReadBlockFile(&accessor_, "_b/junk.arrow", &batch, nullptr);
    EXPECT_TRUE(status.IsCorruption()) << status.ToString();
    EXPECT_NE(status.message().find("_b/junk.arrow"), std::string::npos);
}

TEST_F(BlockIOTest, ConstantColumnIsMaterialized) {
    auto constant = std::make_shared<DataBlock>(
        test::Int64Schema(),
        std::vector<arrow::Datum>{arrow::Datum(std::make_shared<arrow::Int64Scalar>(5))}, 3);
    BlockStatistics stats;
    ASSERT_OK(ComputeBlockStatistics(*constant, &stats));

    std::shared_ptr<arrow::io::OutputStream> sink;
    ASSERT_OK(accessor_.GetWriter("_b/const.arrow", &sink));
    BlockFileInfo info;
    ASSERT_OK(WriteBlockFile(*constant, stats, BlockWriteOptions(), sink, &info));

    std::shared_ptr<arrow::RecordBatch> batch;
    ASSERT_OK(ReadBlockFile(&accessor_, "_b/const.arrow", &batch, nullptr));
    ASSERT_EQ(batch->num_rows(), 3);
    auto column = std::static_pointer_cast<arrow::Int64Array>(batch->column(0));
    EXPECT_EQ(column->Value(2), 5);
}

} // namespace
} // namespace basalt
