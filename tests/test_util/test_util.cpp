#include "test_util.h"

#include <random>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace basalt {
namespace test {

void BasaltTestBase::SetUp() {
    std::random_device rd;
    test_path_ = "/tmp/basalt_test_" + std::to_string(getpid()) + "_" +
                 std::to_string(rd());
    if (fs::exists(test_path_)) {
        fs::remove_all(test_path_);
    }
    fs::create_directories(test_path_);
}

void BasaltTestBase::TearDown() {
    if (!test_path_.empty() && fs::exists(test_path_)) {
        fs::remove_all(test_path_);
    }
}

namespace {

template <typename Builder, typename T>
std::shared_ptr<arrow::Array> BuildArray(const std::vector<std::optional<T>>& values) {
    Builder builder;
    for (const auto& value : values) {
        arrow::Status status = value ? builder.Append(*value) : builder.AppendNull();
        EXPECT_TRUE(status.ok()) << status.ToString();
    }
    std::shared_ptr<arrow::Array> array;
    auto status = builder.Finish(&array);
    EXPECT_TRUE(status.ok()) << status.ToString();
    return array;
}

} // namespace

std::shared_ptr<arrow::Array> MakeInt64Array(const std::vector<std::optional<int64_t>>& values) {
    return BuildArray<arrow::Int64Builder>(values);
}

std::shared_ptr<arrow::Array> MakeInt32Array(const std::vector<std::optional<int32_t>>& values) {
    return BuildArray<arrow::Int32Builder>(values);
}

std::shared_ptr<arrow::Array> MakeDoubleArray(const std::vector<std::optional<double>>& values) {
    return BuildArray<arrow::DoubleBuilder>(values);
}

std::shared_ptr<arrow::Array> MakeStringArray(
    const std::vector<std::optional<std::string>>& values) {
    return BuildArray<arrow::StringBuilder>(values);
}

DataBlockPtr MakeBlock(const std::shared_ptr<arrow::Schema>& schema,
                       const std::vector<std::shared_ptr<arrow::Array>>& columns) {
    std::vector<arrow::Datum> data;
    int64_t num_rows = columns.empty() ? 0 : columns.front()->length();
    for (const auto& column : columns) {
        data.emplace_back(column);
    }
    return std::make_shared<DataBlock>(schema, std::move(data), num_rows);
}

std::shared_ptr<arrow::Schema> Int64Schema() {
    return arrow::schema({arrow::field("x", arrow::int64())});
}

DataBlockPtr MakeInt64Block(const std::vector<std::optional<int64_t>>& values) {
    return MakeBlock(Int64Schema(), {MakeInt64Array(values)});
}

//==============================================================================
// InstrumentedDataAccessor
//==============================================================================

Status InstrumentedDataAccessor::GetWriter(const std::string& location,
                                           std::shared_ptr<arrow::io::OutputStream>* writer) {
    uint64_t issued = write_count_.fetch_add(1);
    if (fail_writes_after_ >= 0 && static_cast<int64_t>(issued) >= fail_writes_after_) {
        return Status::IOError("injected write failure: " + location);
    }
    return base_->GetWriter(location, writer);
}

Status InstrumentedDataAccessor::Read(const std::string& location,
                                      std::shared_ptr<arrow::Buffer>* data) {
    read_count_.fetch_add(1);
    uint64_t now = in_flight_.fetch_add(1) + 1;
    uint64_t seen = max_in_flight_.load();
    while (now > seen && !max_in_flight_.compare_exchange_weak(seen, now)) {
    }

    bool fail = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reads_.push_back(location);
        for (const auto& prefix : failing_prefixes_) {
            if (location.compare(0, prefix.size(), prefix) == 0) fail = true;
        }
    }

    if (read_delay_.count() > 0) {
        std::this_thread::sleep_for(read_delay_);
    }

    Status status = fail ? Status::IOError("injected read failure: " + location)
                         : base_->Read(location, data);
    in_flight_.fetch_sub(1);
    return status;
}

Status InstrumentedDataAccessor::Exists(const std::string& location, bool* exists) {
    return base_->Exists(location, exists);
}

Status InstrumentedDataAccessor::Put(const std::string& location,
                                     const std::shared_ptr<arrow::Buffer>& data) {
    uint64_t issued = write_count_.fetch_add(1);
    if (fail_writes_after_ >= 0 && static_cast<int64_t>(issued) >= fail_writes_after_) {
        return Status::IOError("injected write failure: " + location);
    }
    return base_->Put(location, data);
}

void InstrumentedDataAccessor::FailReadsWithPrefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_prefixes_.insert(prefix);
}

uint64_t InstrumentedDataAccessor::ReadCount(const std::string& location) const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t count = 0;
    for (const auto& read : reads_) {
        if (read == location) ++count;
    }
    return count;
}

void InstrumentedDataAccessor::ResetCounters() {
    std::lock_guard<std::mutex> lock(mutex_);
    reads_.clear();
    read_count_ = 0;
    write_count_ = 0;
    max_in_flight_ = 0;
}

//==============================================================================
// SequentialLocationGenerator
//==============================================================================

std::string SequentialLocationGenerator::NextBlockLocation() {
    return std::string(kBlockPrefix) + "/block-" + std::to_string(blocks_.fetch_add(1)) +
           ".arrow";
}

std::string SequentialLocationGenerator::NextSegmentLocation() {
    return std::string(kSegmentPrefix) + "/segment-" +
           std::to_string(segments_.fetch_add(1)) + ".json";
}

std::string SequentialLocationGenerator::NextSnapshotId() {
    return "snapshot-" + std::to_string(snapshots_.fetch_add(1));
}

} // namespace test
} // namespace basalt
