#include "basalt/locations.h"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace basalt {

std::string UuidLocationGenerator::NextUuid() {
    // random_generator is not safe for concurrent use
    std::lock_guard<std::mutex> lock(mutex_);
    return boost::uuids::to_string(generator_());
}

std::string UuidLocationGenerator::NextBlockLocation() {
    return std::string(kBlockPrefix) + "/" + NextUuid() + ".arrow";
}

std::string UuidLocationGenerator::NextSegmentLocation() {
    return std::string(kSegmentPrefix) + "/" + NextUuid() + ".json";
}

std::string UuidLocationGenerator::NextSnapshotId() {
    return NextUuid();
}

std::string SnapshotLocation(const std::string& snapshot_id) {
    return std::string(kSnapshotPrefix) + "/" + snapshot_id + ".json";
}

std::shared_ptr<LocationGenerator> CreateUuidLocationGenerator() {
    return std::make_shared<UuidLocationGenerator>();
}

} // namespace basalt
