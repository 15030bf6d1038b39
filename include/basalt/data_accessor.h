#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>
#include <basalt/status.h>

namespace basalt {

/**
 * @brief Byte-level access to a storage namespace
 *
 * Locations are opaque relative paths inside the namespace. Read() and
 * GetWriter() are the only suspension points of the storage core, and
 * implementations must allow concurrent calls from several threads.
 */
class DataAccessor {
public:
    virtual ~DataAccessor() = default;

    /**
     * @brief Open a sink for a new object at `location`
     *
     * The object becomes readable once the returned stream is closed.
     */
    virtual Status GetWriter(const std::string& location,
                             std::shared_ptr<arrow::io::OutputStream>* writer) = 0;

    /**
     * @brief Read the whole object at `location`
     *
     * A missing object is an IOError.
     */
    virtual Status Read(const std::string& location,
                        std::shared_ptr<arrow::Buffer>* data) = 0;

    virtual Status Exists(const std::string& location, bool* exists) = 0;

    // Write a complete object in one call
    virtual Status Put(const std::string& location,
                       const std::shared_ptr<arrow::Buffer>& data);

    virtual std::string GetName() const = 0;
};

/**
 * @brief Accessor rooted at a local directory
 */
class LocalDataAccessor : public DataAccessor {
public:
    explicit LocalDataAccessor(std::string root_path);

    Status GetWriter(const std::string& location,
                     std::shared_ptr<arrow::io::OutputStream>* writer) override;
    Status Read(const std::string& location,
                std::shared_ptr<arrow::Buffer>* data) override;
    Status Exists(const std::string& location, bool* exists) override;

    std::string GetName() const override { return "local:" + root_path_; }

    const std::string& root_path() const { return root_path_; }

private:
    Status ResolvePath(const std::string& location, std::string* path) const;

    std::string root_path_;
};

/**
 * @brief Accessor keeping objects in process memory
 */
class InMemoryDataAccessor : public DataAccessor {
public:
    InMemoryDataAccessor() = default;

    Status GetWriter(const std::string& location,
                     std::shared_ptr<arrow::io::OutputStream>* writer) override;
    Status Read(const std::string& location,
                std::shared_ptr<arrow::Buffer>* data) override;
    Status Exists(const std::string& location, bool* exists) override;
    Status Put(const std::string& location,
               const std::shared_ptr<arrow::Buffer>& data) override;

    std::string GetName() const override { return "memory"; }

    size_t ObjectCount() const;

private:
    friend class MemoryObjectWriter;

    void Commit(const std::string& location, std::shared_ptr<arrow::Buffer> data);

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<arrow::Buffer>> objects_;
};

/**
 * @brief Reject locations that would escape the storage namespace
 */
Status ValidateLocation(const std::string& location);

} // namespace basalt
