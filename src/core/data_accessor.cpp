#include "basalt/data_accessor.h"

#include <filesystem>
#include <system_error>
#include <arrow/io/file.h>
#include <arrow/io/memory.h>

#include "basalt/logging.h"

namespace fs = std::filesystem;

namespace basalt {

BASALT_LOG_TAG(DataAccessor);

Status ValidateLocation(const std::string& location) {
    if (location.empty()) {
        return Status::InvalidArgument("empty storage location");
    }
    fs::path path(location);
    if (path.is_absolute()) {
        return Status::InvalidArgument("storage location must be relative: " + location);
    }
    for (const auto& part : path) {
        if (part == "..") {
            return Status::InvalidArgument("storage location escapes namespace: " + location);
        }
    }
    return Status::OK();
}

Status DataAccessor::Put(const std::string& location,
                         const std::shared_ptr<arrow::Buffer>& data) {
    std::shared_ptr<arrow::io::OutputStream> writer;
    BASALT_RETURN_NOT_OK(GetWriter(location, &writer));

    auto status = writer->Write(data);
    if (!status.ok()) {
        return Status::IOError("write " + location + ": " + status.message());
    }
    status = writer->Close();
    if (!status.ok()) {
        return Status::IOError("close " + location + ": " + status.message());
    }
    return Status::OK();
}

//==============================================================================
// LocalDataAccessor
//==============================================================================

// Writes to a temporary sibling and renames on Close, so readers never
// observe a partially written object.
class LocalObjectWriter : public arrow::io::OutputStream {
public:
    LocalObjectWriter(std::shared_ptr<arrow::io::FileOutputStream> file,
                      std::string temp_path,
                      std::string final_path)
        : file_(std::move(file)),
          temp_path_(std::move(temp_path)),
          final_path_(std::move(final_path)) {}

    ~LocalObjectWriter() override {
        if (!closed_) {
            // Abandoned write: leave nothing visible behind
            auto status = file_->Close();
            if (!status.ok()) {
                BASALT_LOG_WARN(DataAccessor) << "closing abandoned " << temp_path_
                                              << ": " << status.ToString();
            }
            std::error_code ec;
            if (!fs::remove(temp_path_, ec) && ec) {
                BASALT_LOG_WARN(DataAccessor) << "removing abandoned " << temp_path_
                                              << ": " << ec.message();
            }
        }
    }

    arrow::Status Write(const void* data, int64_t nbytes) override {
        return file_->Write(data, nbytes);
    }

    arrow::Status Flush() override { return file_->Flush(); }

    arrow::Result<int64_t> Tell() const override { return file_->Tell(); }

    bool closed() const override { return closed_; }

    arrow::Status Close() override {
        if (closed_) return arrow::Status::OK();
        ARROW_RETURN_NOT_OK(file_->Close());
        closed_ = true;

        std::error_code ec;
        fs::rename(temp_path_, final_path_, ec);
        if (ec) {
            std::error_code remove_ec;
            fs::remove(temp_path_, remove_ec);
            return arrow::Status::IOError("rename ", temp_path_, " -> ", final_path_,
                                          ": ", ec.message());
        }
        return arrow::Status::OK();
    }

private:
    std::shared_ptr<arrow::io::FileOutputStream> file_;
    std::string temp_path_;
    std::string final_path_;
    bool closed_ = false;
};

LocalDataAccessor::LocalDataAccessor(std::string root_path)
    : root_path_(std::move(root_path)) {}

Status LocalDataAccessor::ResolvePath(const std::string& location, std::string* path) const {
    BASALT_RETURN_NOT_OK(ValidateLocation(location));
    *path = (fs::path(root_path_) / location).string();
    return Status::OK();
}

Status LocalDataAccessor::GetWriter(const std::string& location,
                                    std::shared_ptr<arrow::io::OutputStream>* writer) {
    std::string path;
    BASALT_RETURN_NOT_OK(ResolvePath(location, &path));

    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        return Status::IOError("create directory for " + location + ": " + ec.message());
    }

    std::string temp_path = path + ".tmp";
    auto file = arrow::io::FileOutputStream::Open(temp_path);
    if (!file.ok()) {
        return Status::IOError("open " + location + " for writing: " +
                               file.status().message());
    }

    *writer = std::make_shared<LocalObjectWriter>(file.MoveValueUnsafe(),
                                                  std::move(temp_path), path);
    return Status::OK();
}

Status LocalDataAccessor::Read(const std::string& location,
                               std::shared_ptr<arrow::Buffer>* data) {
    std::string path;
    BASALT_RETURN_NOT_OK(ResolvePath(location, &path));

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Status::IOError("object not found: " + location);
    }

    auto file_result = arrow::io::ReadableFile::Open(path);
    if (!file_result.ok()) {
        return Status::IOError("open " + location + ": " + file_result.status().message());
    }
    auto file = file_result.MoveValueUnsafe();

    auto size = file->GetSize();
    if (!size.ok()) {
        return Status::IOError("stat " + location + ": " + size.status().message());
    }

    auto buffer = file->ReadAt(0, *size);
    if (!buffer.ok()) {
        return Status::IOError("read " + location + ": " + buffer.status().message());
    }
    if ((*buffer)->size() != *size) {
        return Status::IOError("short read on " + location);
    }

    auto close_status = file->Close();
    if (!close_status.ok()) {
        return Status::IOError("close " + location + ": " + close_status.message());
    }

    *data = buffer.MoveValueUnsafe();
    return Status::OK();
}

Status LocalDataAccessor::Exists(const std::string& location, bool* exists) {
    std::string path;
    BASALT_RETURN_NOT_OK(ResolvePath(location, &path));

    std::error_code ec;
    *exists = fs::is_regular_file(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Status::IOError("stat " + location + ": " + ec.message());
    }
    return Status::OK();
}

//==============================================================================
// InMemoryDataAccessor
//==============================================================================

class MemoryObjectWriter : public arrow::io::OutputStream {
public:
    MemoryObjectWriter(InMemoryDataAccessor* owner,
                       std::string location,
                       std::shared_ptr<arrow::io::BufferOutputStream> buffer)
        : owner_(owner),
          location_(std::move(location)),
          buffer_(std::move(buffer)) {}

    arrow::Status Write(const void* data, int64_t nbytes) override {
        return buffer_->Write(data, nbytes);
    }

    arrow::Result<int64_t> Tell() const override { return buffer_->Tell(); }

    bool closed() const override { return closed_; }

    arrow::Status Close() override {
        if (closed_) return arrow::Status::OK();
        ARROW_ASSIGN_OR_RAISE(auto contents, buffer_->Finish());
        closed_ = true;
        owner_->Commit(location_, std::move(contents));
        return arrow::Status::OK();
    }

private:
    InMemoryDataAccessor* owner_;
    std::string location_;
    std::shared_ptr<arrow::io::BufferOutputStream> buffer_;
    bool closed_ = false;
};

Status InMemoryDataAccessor::GetWriter(const std::string& location,
                                       std::shared_ptr<arrow::io::OutputStream>* writer) {
    BASALT_RETURN_NOT_OK(ValidateLocation(location));

    auto buffer = arrow::io::BufferOutputStream::Create();
    if (!buffer.ok()) {
        return Status::IOError("allocate buffer for " + location + ": " +
                               buffer.status().message());
    }
    *writer = std::make_shared<MemoryObjectWriter>(this, location, buffer.MoveValueUnsafe());
    return Status::OK();
}

Status InMemoryDataAccessor::Read(const std::string& location,
                                  std::shared_ptr<arrow::Buffer>* data) {
    BASALT_RETURN_NOT_OK(ValidateLocation(location));

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(location);
    if (it == objects_.end()) {
        return Status::IOError("object not found: " + location);
    }
    *data = it->second;
    return Status::OK();
}

Status InMemoryDataAccessor::Exists(const std::string& location, bool* exists) {
    BASALT_RETURN_NOT_OK(ValidateLocation(location));

    std::lock_guard<std::mutex> lock(mutex_);
    *exists = objects_.count(location) > 0;
    return Status::OK();
}

Status InMemoryDataAccessor::Put(const std::string& location,
                                 const std::shared_ptr<arrow::Buffer>& data) {
    BASALT_RETURN_NOT_OK(ValidateLocation(location));
    Commit(location, data);
    return Status::OK();
}

size_t InMemoryDataAccessor::ObjectCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.size();
}

void InMemoryDataAccessor::Commit(const std::string& location,
                                  std::shared_ptr<arrow::Buffer> data) {
    std::lock_guard<std::mutex> lock(mutex_);
    objects_[location] = std::move(data);
}

} // namespace basalt
