/**
 * Test utilities for BasaltDB
 *
 * Fixtures, Arrow builders and storage decorators shared by the unit
 * tests.
 */

#pragma once

#include <gtest/gtest.h>
#include <arrow/api.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <basalt/data_accessor.h>
#include <basalt/data_block.h>
#include <basalt/locations.h>
#include <basalt/status.h>

namespace basalt {
namespace test {

#define ASSERT_OK(expr)                                  \
    do {                                                 \
        ::basalt::Status _st = (expr);                   \
        ASSERT_TRUE(_st.ok()) << _st.ToString();         \
    } while (0)

#define EXPECT_OK(expr)                                  \
    do {                                                 \
        ::basalt::Status _st = (expr);                   \
        EXPECT_TRUE(_st.ok()) << _st.ToString();         \
    } while (0)

//==============================================================================
// Fixtures
//==============================================================================

/**
 * @brief Fixture owning a fresh directory under /tmp
 */
class BasaltTestBase : public ::testing::Test {
protected:
    void SetUp() override;
    void TearDown() override;

    std::string test_path_;
};

//==============================================================================
// Arrow builders
//==============================================================================

std::shared_ptr<arrow::Array> MakeInt64Array(const std::vector<std::optional<int64_t>>& values);
std::shared_ptr<arrow::Array> MakeInt32Array(const std::vector<std::optional<int32_t>>& values);
std::shared_ptr<arrow::Array> MakeDoubleArray(const std::vector<std::optional<double>>& values);
std::shared_ptr<arrow::Array> MakeStringArray(
    const std::vector<std::optional<std::string>>& values);

// Block over fully materialized columns
DataBlockPtr MakeBlock(const std::shared_ptr<arrow::Schema>& schema,
                       const std::vector<std::shared_ptr<arrow::Array>>& columns);

// Single int64 column "x" holding `values`
DataBlockPtr MakeInt64Block(const std::vector<std::optional<int64_t>>& values);

std::shared_ptr<arrow::Schema> Int64Schema();

//==============================================================================
// Storage decorators
//==============================================================================

/**
 * @brief DataAccessor wrapper that counts, delays and fails operations
 *
 * Tracks the highest number of Read() calls in progress at once.
 */
class InstrumentedDataAccessor : public DataAccessor {
public:
    explicit InstrumentedDataAccessor(std::shared_ptr<DataAccessor> base)
        : base_(std::move(base)) {}

    Status GetWriter(const std::string& location,
                     std::shared_ptr<arrow::io::OutputStream>* writer) override;
    Status Read(const std::string& location,
                std::shared_ptr<arrow::Buffer>* data) override;
    Status Exists(const std::string& location, bool* exists) override;
    Status Put(const std::string& location,
               const std::shared_ptr<arrow::Buffer>& data) override;

    std::string GetName() const override { return "instrumented:" + base_->GetName(); }

    void SetReadDelay(std::chrono::milliseconds delay) { read_delay_ = delay; }

    // Reads of locations starting with `prefix` fail with IOError
    void FailReadsWithPrefix(const std::string& prefix);

    // Writer creation fails once `count` writers have been handed out
    void FailWritesAfter(int64_t count) { fail_writes_after_ = count; }

    uint64_t read_count() const { return read_count_.load(); }
    uint64_t write_count() const { return write_count_.load(); }
    uint64_t max_in_flight_reads() const { return max_in_flight_.load(); }
    uint64_t ReadCount(const std::string& location) const;
    void ResetCounters();

private:
    std::shared_ptr<DataAccessor> base_;
    std::chrono::milliseconds read_delay_{0};
    int64_t fail_writes_after_ = -1;

    mutable std::mutex mutex_;
    std::set<std::string> failing_prefixes_;
    std::vector<std::string> reads_;

    std::atomic<uint64_t> read_count_{0};
    std::atomic<uint64_t> write_count_{0};
    std::atomic<uint64_t> in_flight_{0};
    std::atomic<uint64_t> max_in_flight_{0};
};

/**
 * @brief Deterministic locations: _b/block-0.arrow, _sg/segment-0.json, ...
 */
class SequentialLocationGenerator : public LocationGenerator {
public:
    std::string NextBlockLocation() override;
    std::string NextSegmentLocation() override;
    std::string NextSnapshotId() override;

private:
    std::atomic<uint64_t> blocks_{0};
    std::atomic<uint64_t> segments_{0};
    std::atomic<uint64_t> snapshots_{0};
};

} // namespace test
} // namespace basalt
