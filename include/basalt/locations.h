#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <boost/uuid/random_generator.hpp>

namespace basalt {

// Storage prefixes inside a table namespace
constexpr const char* kBlockPrefix = "_b";
constexpr const char* kSegmentPrefix = "_sg";
constexpr const char* kSnapshotPrefix = "_ss";

/**
 * @brief Source of fresh, collision-free storage locations
 *
 * No two calls, concurrent or sequential, may return the same value for
 * the lifetime of the storage namespace.
 */
class LocationGenerator {
public:
    virtual ~LocationGenerator() = default;

    virtual std::string NextBlockLocation() = 0;
    virtual std::string NextSegmentLocation() = 0;
    virtual std::string NextSnapshotId() = 0;
};

/**
 * @brief Random (version 4) UUID based generator
 */
class UuidLocationGenerator : public LocationGenerator {
public:
    UuidLocationGenerator() = default;

    std::string NextBlockLocation() override;
    std::string NextSegmentLocation() override;
    std::string NextSnapshotId() override;

private:
    std::string NextUuid();

    std::mutex mutex_;
    boost::uuids::random_generator generator_;
};

// Location of the snapshot record with the given id
std::string SnapshotLocation(const std::string& snapshot_id);

std::shared_ptr<LocationGenerator> CreateUuidLocationGenerator();

} // namespace basalt
