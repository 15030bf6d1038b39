/**
 * End-to-end table tests: append, prune and read back through a local
 * table namespace.
 */

#include <gtest/gtest.h>
#include <arrow/compute/expression.h>
#include <basalt/table.h>

#include "test_util/test_util.h"

namespace basalt {
namespace {

namespace cp = arrow::compute;

class TableTest : public test::BasaltTestBase {
protected:
    void SetUp() override {
        test::BasaltTestBase::SetUp();
        options_.root_path = test_path_;
    }

    std::unique_ptr<Table> OpenTable(std::optional<std::string> snapshot_id = std::nullopt) {
        std::unique_ptr<Table> table;
        auto status = Table::Open(options_, test::Int64Schema(), snapshot_id, &table);
        EXPECT_TRUE(status.ok()) << status.ToString();
        return table;
    }

    static Status AppendBlocks(Table* table, std::vector<DataBlockPtr> blocks,
                               TableSnapshotPtr* committed = nullptr) {
        VectorDataBlockStream stream(std::move(blocks));
        return table->Append(&stream, committed);
    }

    static PushDownInfo Greater(int64_t value) {
        PushDownInfo push_down;
        push_down.filters.push_back(cp::greater(cp::field_ref("x"), cp::literal(value)));
        return push_down;
    }

    StorageOptions options_;
};

TEST_F(TableTest, AppendPruneAndRead) {
    auto table = OpenTable();
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(table->current_snapshot(), nullptr);

    ASSERT_OK(AppendBlocks(table.get(), {test::MakeInt64Block({0, 10}),
                                         test::MakeInt64Block({20, 30})}));
    ASSERT_OK(AppendBlocks(table.get(), {test::MakeInt64Block({40, 50})}));

    auto snapshot = table->current_snapshot();
    ASSERT_NE(snapshot, nullptr);
    EXPECT_EQ(snapshot->segments.size(), 2u);
    EXPECT_EQ(snapshot->summary.row_count, 6u);
    EXPECT_EQ(snapshot->summary.block_count, 3u);

    std::vector<BlockMetaPtr> blocks;
    PruneMetrics metrics;
    ASSERT_OK(table->Prune(Greater(25), &blocks, &metrics));
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(metrics.blocks_pruned, 1u);

    std::shared_ptr<arrow::RecordBatch> batch;
    ASSERT_OK(table->ReadBlock(*blocks[1], &batch));
    auto column = std::static_pointer_cast<arrow::Int64Array>(batch->column(0));
    EXPECT_EQ(column->Value(0), 40);
    EXPECT_EQ(column->Value(1), 50);
}

TEST_F(TableTest, SnapshotsAreImmutable) {
    auto table = OpenTable();
    TableSnapshotPtr first;
    ASSERT_OK(AppendBlocks(table.get(), {test::MakeInt64Block({1, 2})}, &first));
    TableSnapshotPtr second;
    ASSERT_OK(AppendBlocks(table.get(), {test::MakeInt64Block({3, 4})}, &second));

    EXPECT_EQ(first->segments.size(), 1u);
    EXPECT_EQ(second->segments.size(), 2u);
    EXPECT_EQ(second->prev_snapshot_id, std::optional<std::string>(first->snapshot_id));
    EXPECT_FALSE(first->prev_snapshot_id.has_value());
}

TEST_F(TableTest, ReopenAtEarlierSnapshot) {
    TableSnapshotPtr first;
    {
        auto table = OpenTable();
        ASSERT_OK(AppendBlocks(table.get(), {test::MakeInt64Block({1, 2})}, &first));
        ASSERT_OK(AppendBlocks(table.get(), {test::MakeInt64Block({100, 200})}));
    }

    auto reopened = OpenTable(first->snapshot_id);
    ASSERT_NE(reopened, nullptr);
    std::vector<BlockMetaPtr> blocks;
    ASSERT_OK(reopened->Prune(PushDownInfo(), &blocks));
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(reopened->current_snapshot()->summary.row_count, 2u);
}

TEST_F(TableTest, EmptyAppendCommitsNothing) {
    auto table = OpenTable();
    ASSERT_OK(AppendBlocks(table.get(), {}));
    EXPECT_EQ(table->current_snapshot(), nullptr);
}

TEST_F(TableTest, PruneBeforeFirstCommit) {
    auto table = OpenTable();
    std::vector<BlockMetaPtr> blocks;
    ASSERT_OK(table->Prune(Greater(1), &blocks));
    EXPECT_TRUE(blocks.empty());

    PushDownInfo bad;
    bad.filters.push_back(cp::equal(cp::field_ref("nope"), cp::literal(int64_t{1})));
    EXPECT_TRUE(table->Prune(bad, &blocks).IsInvalidPredicate());
}

TEST_F(TableTest, RejectsForeignBlocks) {
    auto table = OpenTable();
    auto other = test::MakeBlock(arrow::schema({arrow::field("s", arrow::utf8())}),
                                 {test::MakeStringArray({"a"})});
    auto status = AppendBlocks(table.get(), {other});
    EXPECT_TRUE(status.IsInvalidArgument()) << status.ToString();
    EXPECT_EQ(table->current_snapshot(), nullptr);
}

TEST_F(TableTest, OpenUnknownSnapshotFails) {
    std::unique_ptr<Table> table;
    auto status = Table::Open(options_, test::Int64Schema(), std::string("missing"), &table);
    EXPECT_TRUE(status.IsIOError()) << status.ToString();
    EXPECT_EQ(status.stage(), OperationStage::kResolveSnapshot);
}

TEST_F(TableTest, OpenRejectsUnsupportedColumns) {
    std::unique_ptr<Table> table;
    auto schema = arrow::schema({arrow::field("l", arrow::list(arrow::int64()))});
    EXPECT_TRUE(Table::Open(options_, schema, std::nullopt, &table).IsUnsupportedType());
}

TEST(InMemoryTableTest, UsesInjectedCollaborators) {
    auto memory = std::make_shared<InMemoryDataAccessor>();
    Table table(test::Int64Schema(), StorageOptions(), memory,
                std::make_shared<test::SequentialLocationGenerator>());

    VectorDataBlockStream stream({test::MakeInt64Block({1})});
    TableSnapshotPtr committed;
    ASSERT_OK(table.Append(&stream, &committed));
    EXPECT_EQ(committed->snapshot_id, "snapshot-0");
    EXPECT_EQ(committed->segments, std::vector<std::string>{"_sg/segment-0.json"});

    // Block, segment and snapshot records
    EXPECT_EQ(memory->ObjectCount(), 3u);
}

} // namespace
} // namespace basalt
