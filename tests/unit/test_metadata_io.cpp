/**
 * Tests for the segment/snapshot record codecs and their readers
 *
 * Records written by the block writer must come back field for field,
 * including the declared type of every statistics bound.
 */

#include <gtest/gtest.h>
#include <limits>
#include <arrow/util/decimal.h>
#include <basalt/data_accessor.h>
#include <basalt/locations.h>
#include <basalt/metadata_cache.h>
#include <basalt/metadata_io.h>

#include "test_util/test_util.h"

namespace basalt {
namespace {

ColumnStatistics Bounds(std::shared_ptr<arrow::Scalar> min, std::shared_ptr<arrow::Scalar> max,
                        int64_t nulls = 0, int64_t rows = 10) {
    ColumnStatistics stats;
    stats.type = min ? min->type : arrow::null();
    stats.min = std::move(min);
    stats.max = std::move(max);
    stats.null_count = nulls;
    stats.row_count = rows;
    return stats;
}

std::shared_ptr<arrow::Scalar> Decimal(const std::string& text, int32_t precision,
                                       int32_t scale) {
    auto value = arrow::Decimal128::FromString(text).ValueOrDie();
    return std::make_shared<arrow::Decimal128Scalar>(value,
                                                     arrow::decimal128(precision, scale));
}

// One column per supported type
BlockStatistics EveryTypeStatistics() {
    auto ts_type = arrow::timestamp(arrow::TimeUnit::MICRO, "UTC");
    BlockStatistics stats;
    ColumnId id = 0;
    stats[id++] = Bounds(std::make_shared<arrow::BooleanScalar>(false),
                         std::make_shared<arrow::BooleanScalar>(true));
    stats[id++] = Bounds(std::make_shared<arrow::Int8Scalar>(-128),
                         std::make_shared<arrow::Int8Scalar>(127));
    stats[id++] = Bounds(std::make_shared<arrow::Int16Scalar>(-300),
                         std::make_shared<arrow::Int16Scalar>(300));
    stats[id++] = Bounds(std::make_shared<arrow::Int32Scalar>(-70000),
                         std::make_shared<arrow::Int32Scalar>(70000));
    stats[id++] = Bounds(std::make_shared<arrow::Int64Scalar>(std::numeric_limits<int64_t>::min()),
                         std::make_shared<arrow::Int64Scalar>(std::numeric_limits<int64_t>::max()));
    stats[id++] = Bounds(std::make_shared<arrow::UInt8Scalar>(0),
                         std::make_shared<arrow::UInt8Scalar>(255));
    stats[id++] = Bounds(std::make_shared<arrow::UInt16Scalar>(1),
                         std::make_shared<arrow::UInt16Scalar>(65535));
    stats[id++] = Bounds(std::make_shared<arrow::UInt32Scalar>(2),
                         std::make_shared<arrow::UInt32Scalar>(4000000000u));
    stats[id++] = Bounds(std::make_shared<arrow::UInt64Scalar>(3),
                         std::make_shared<arrow::UInt64Scalar>(std::numeric_limits<uint64_t>::max()));
    stats[id++] = Bounds(std::make_shared<arrow::FloatScalar>(-1.5f),
                         std::make_shared<arrow::FloatScalar>(std::numeric_limits<float>::infinity()));
    stats[id++] = Bounds(std::make_shared<arrow::DoubleScalar>(-std::numeric_limits<double>::infinity()),
                         std::make_shared<arrow::DoubleScalar>(0.1));
    stats[id++] = Bounds(std::make_shared<arrow::StringScalar>("a \"quoted\" key"),
                         std::make_shared<arrow::StringScalar>("z\xc3\xa9"));
    stats[id++] = Bounds(std::make_shared<arrow::LargeStringScalar>("aa"),
                         std::make_shared<arrow::LargeStringScalar>("bb"));
    stats[id++] = Bounds(std::make_shared<arrow::BinaryScalar>(std::string("\x00\x01", 2)),
                         std::make_shared<arrow::BinaryScalar>(std::string("\xff", 1)));
    stats[id++] = Bounds(std::make_shared<arrow::LargeBinaryScalar>(std::string("\x10", 1)),
                         std::make_shared<arrow::LargeBinaryScalar>(std::string("\x20", 1)));
    stats[id++] = Bounds(std::make_shared<arrow::Date32Scalar>(18000),
                         std::make_shared<arrow::Date32Scalar>(19000));
    stats[id++] = Bounds(std::make_shared<arrow::Date64Scalar>(1555200000000),
                         std::make_shared<arrow::Date64Scalar>(1641600000000));
    stats[id++] = Bounds(std::make_shared<arrow::TimestampScalar>(1, ts_type),
                         std::make_shared<arrow::TimestampScalar>(1700000000000000, ts_type));
    stats[id++] = Bounds(Decimal("-12.34", 10, 2), Decimal("99.90", 10, 2));

    ColumnStatistics all_null;
    all_null.type = arrow::int64();
    all_null.null_count = 10;
    all_null.row_count = 10;
    stats[id++] = all_null;
    return stats;
}

TEST(MetadataIOTest, BlockStatisticsRoundTripEveryType) {
    BlockStatistics stats = EveryTypeStatistics();
    std::string json;
    ASSERT_OK(SerializeBlockStatistics(stats, &json));

    BlockStatistics decoded;
    ASSERT_OK(DeserializeBlockStatistics(json, &decoded));
    ASSERT_EQ(decoded.size(), stats.size());
    for (const auto& [id, column] : stats) {
        EXPECT_TRUE(column.Equals(decoded.at(id)))
            << "column " << id << ": " << column.ToString() << " vs "
            << decoded.at(id).ToString();
    }
}

TEST(MetadataIOTest, NaNBoundIsRejectedOnWrite) {
    BlockStatistics stats;
    stats[0] = Bounds(std::make_shared<arrow::DoubleScalar>(std::nan("")),
                      std::make_shared<arrow::DoubleScalar>(1.0));
    std::string json;
    EXPECT_TRUE(SerializeBlockStatistics(stats, &json).IsInvalidArgument());
}

SegmentInfo MakeSegment() {
    SegmentInfo segment;
    for (int i = 0; i < 3; ++i) {
        auto block = std::make_shared<BlockMeta>();
        block->location.path = "_b/block-" + std::to_string(i) + ".arrow";
        block->location.meta_size = 100 + i;
        block->row_count = 10;
        block->block_size = 80;
        block->col_stats[0] = Bounds(std::make_shared<arrow::Int64Scalar>(i * 10),
                                     std::make_shared<arrow::Int64Scalar>(i * 10 + 9));
        segment.blocks.push_back(block);
    }
    segment.summary.row_count = 30;
    segment.summary.block_count = 3;
    segment.summary.uncompressed_byte_size = 240;
    segment.summary.compressed_byte_size = 1234;
    segment.summary.col_stats[0] = Bounds(std::make_shared<arrow::Int64Scalar>(0),
                                          std::make_shared<arrow::Int64Scalar>(29), 0, 30);
    return segment;
}

TEST(MetadataIOTest, SegmentRoundTrip) {
    SegmentInfo segment = MakeSegment();
    std::string json;
    ASSERT_OK(SerializeSegmentInfo(segment, &json));

    SegmentInfo decoded;
    ASSERT_OK(DeserializeSegmentInfo(json, &decoded));
    EXPECT_TRUE(decoded.Equals(segment));
    EXPECT_EQ(decoded.blocks[2]->location.meta_size, 102u);
}

TEST(MetadataIOTest, SnapshotRoundTrip) {
    TableSnapshot snapshot;
    snapshot.snapshot_id = "s2";
    snapshot.prev_snapshot_id = "s1";
    snapshot.schema = arrow::schema({
        arrow::field("id", arrow::int64(), false),
        arrow::field("ts", arrow::timestamp(arrow::TimeUnit::NANO)),
        arrow::field("price", arrow::decimal128(12, 3)),
    });
    snapshot.summary = MakeSegment().summary;
    snapshot.segments = {"_sg/a.json", "_sg/b.json"};

    std::string json;
    ASSERT_OK(SerializeTableSnapshot(snapshot, &json));

    TableSnapshot decoded;
    ASSERT_OK(DeserializeTableSnapshot(json, &decoded));
    EXPECT_TRUE(decoded.Equals(snapshot));
    EXPECT_FALSE(decoded.schema->field(0)->nullable());
}

TEST(MetadataIOTest, FirstSnapshotHasNullPredecessor) {
    TableSnapshot snapshot;
    snapshot.snapshot_id = "s1";
    snapshot.schema = test::Int64Schema();

    std::string json;
    ASSERT_OK(SerializeTableSnapshot(snapshot, &json));
    EXPECT_NE(json.find("\"prev_snapshot_id\":null"), std::string::npos);

    TableSnapshot decoded;
    ASSERT_OK(DeserializeTableSnapshot(json, &decoded));
    EXPECT_FALSE(decoded.prev_snapshot_id.has_value());
    EXPECT_TRUE(decoded.segments.empty());
}

TEST(MetadataIOTest, MalformedRecordsAreCorruption) {
    SegmentInfo segment;
    EXPECT_TRUE(DeserializeSegmentInfo("not json", &segment).IsCorruption());
    EXPECT_TRUE(DeserializeSegmentInfo("{}", &segment).IsCorruption());
    EXPECT_TRUE(DeserializeSegmentInfo(R"({"format_version": 99, "blocks": [],
        "summary": {"row_count": 0, "block_count": 0, "uncompressed_byte_size": 0,
        "compressed_byte_size": 0, "col_stats": []}})", &segment).IsCorruption());

    BlockStatistics stats;
    EXPECT_TRUE(DeserializeBlockStatistics(
        R"([{"column_id": 0, "type": {"id": "int8"}, "min": 1000, "max": 1,
             "null_count": 0, "row_count": 1}])", &stats).IsCorruption());
    EXPECT_TRUE(DeserializeBlockStatistics(
        R"([{"column_id": 0, "type": {"id": "list"}, "min": null, "max": null,
             "null_count": 0, "row_count": 1}])", &stats).IsCorruption());
}

TEST(MetadataIOTest, BinaryBoundsAreHex) {
    BlockStatistics stats;
    ASSERT_OK(DeserializeBlockStatistics(
        R"([{"column_id": 0, "type": {"id": "binary"}, "min": "00ff", "max": "A0B1",
             "null_count": 0, "row_count": 2}])", &stats));
    auto min = std::static_pointer_cast<arrow::BinaryScalar>(stats.at(0).min);
    auto max = std::static_pointer_cast<arrow::BinaryScalar>(stats.at(0).max);
    EXPECT_EQ(min->value->ToString(), std::string("\x00\xff", 2));
    EXPECT_EQ(max->value->ToString(), std::string("\xa0\xb1", 2));

    std::string json;
    ASSERT_OK(SerializeBlockStatistics(stats, &json));
    EXPECT_NE(json.find("\"00FF\""), std::string::npos) << json;

    EXPECT_TRUE(DeserializeBlockStatistics(
        R"([{"column_id": 0, "type": {"id": "binary"}, "min": "0g", "max": "00",
             "null_count": 0, "row_count": 1}])", &stats).IsCorruption());
    EXPECT_TRUE(DeserializeBlockStatistics(
        R"([{"column_id": 0, "type": {"id": "binary"}, "min": "abc", "max": "00",
             "null_count": 0, "row_count": 1}])", &stats).IsCorruption());
}

TEST(MetadataIOTest, BlockCountMustMatchBlockList) {
    SegmentInfo segment = MakeSegment();
    segment.summary.block_count = 7;
    std::string json;
    ASSERT_OK(SerializeSegmentInfo(segment, &json));
    SegmentInfo decoded;
    EXPECT_TRUE(DeserializeSegmentInfo(json, &decoded).IsCorruption());
}

//==============================================================================
// Readers and writers
//==============================================================================

TEST(MetadataIOTest, SegmentReaderUsesCache) {
    auto memory = std::make_shared<InMemoryDataAccessor>();
    test::InstrumentedDataAccessor accessor(memory);
    ASSERT_OK(WriteSegment(&accessor, "_sg/one.json", MakeSegment()));

    LruMetadataCache<SegmentInfo> cache(4);
    SegmentInfoPtr first;
    ASSERT_OK(SegmentReader::Read(&accessor, "_sg/one.json", &cache, &first));
    SegmentInfoPtr second;
    ASSERT_OK(SegmentReader::Read(&accessor, "_sg/one.json", &cache, &second));

    EXPECT_EQ(accessor.read_count(), 1u);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(cache.hits(), 1u);
}

TEST(MetadataIOTest, MissingSegmentIsTaggedIOError) {
    InMemoryDataAccessor accessor;
    SegmentInfoPtr segment;
    auto status = SegmentReader::Read(&accessor, "_sg/missing.json", nullptr, &segment);
    EXPECT_TRUE(status.IsIOError()) << status.ToString();
    EXPECT_EQ(status.stage(), OperationStage::kResolveSegment);
    EXPECT_NE(status.message().find("_sg/missing.json"), std::string::npos);
}

TEST(MetadataIOTest, CorruptSnapshotIsTaggedCorruption) {
    InMemoryDataAccessor accessor;
    ASSERT_OK(accessor.Put(SnapshotLocation("bad"), arrow::Buffer::FromString("{]")));

    TableSnapshotPtr snapshot;
    auto status = SnapshotReader::Read(&accessor, SnapshotLocation("bad"), nullptr, &snapshot);
    EXPECT_TRUE(status.IsCorruption()) << status.ToString();
    EXPECT_EQ(status.stage(), OperationStage::kResolveSnapshot);
}

TEST(MetadataIOTest, WriteSnapshotUsesSnapshotLocation) {
    InMemoryDataAccessor accessor;
    TableSnapshot snapshot;
    snapshot.snapshot_id = "abc";
    snapshot.schema = test::Int64Schema();
    ASSERT_OK(WriteSnapshot(&accessor, snapshot));

    bool exists = false;
    ASSERT_OK(accessor.Exists("_ss/abc.json", &exists));
    EXPECT_TRUE(exists);
}

} // namespace
} // namespace basalt
