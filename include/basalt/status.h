#pragma once

#include <string>

namespace arrow {
class Status;
}  // namespace arrow

namespace basalt {

enum class StatusCode {
    kOk = 0,
    kNotFound = 1,
    kCorruption = 2,
    kIoError = 3,
    kInvalidArgument = 4,
    kUnsupportedType = 5,
    kInvalidPredicate = 6,
    kAborted = 7,
    kNotImplemented = 8,
    kInternalError = 9,
};

// Which part of the storage core produced a failure.
enum class OperationStage {
    kNone = 0,
    kWrite,
    kResolveSnapshot,
    kResolveSegment,
    kCompilePredicate,
};

inline const char* OperationStageName(OperationStage stage);

class Status {
public:
    Status() : code_(StatusCode::kOk) {}
    Status(StatusCode code) : code_(code) {}
    Status(StatusCode code, const std::string& message)
        : code_(code), message_(message) {}

    static Status OK() { return Status(); }
    static Status NotFound(const std::string& message = "") {
        return Status(StatusCode::kNotFound, message);
    }
    // Malformed or schema-incompatible metadata
    static Status Corruption(const std::string& message = "") {
        return Status(StatusCode::kCorruption, message);
    }
    static Status IOError(const std::string& message = "") {
        return Status(StatusCode::kIoError, message);
    }
    static Status InvalidArgument(const std::string& message = "") {
        return Status(StatusCode::kInvalidArgument, message);
    }
    // Statistics cannot be computed or compared for a column type
    static Status UnsupportedType(const std::string& message = "") {
        return Status(StatusCode::kUnsupportedType, message);
    }
    // Filter references unknown columns or operators
    static Status InvalidPredicate(const std::string& message = "") {
        return Status(StatusCode::kInvalidPredicate, message);
    }
    static Status Aborted(const std::string& message = "") {
        return Status(StatusCode::kAborted, message);
    }
    static Status NotImplemented(const std::string& message = "") {
        return Status(StatusCode::kNotImplemented, message);
    }
    static Status InternalError(const std::string& message = "") {
        return Status(StatusCode::kInternalError, message);
    }

    bool ok() const { return code_ == StatusCode::kOk; }
    bool IsNotFound() const { return code_ == StatusCode::kNotFound; }
    bool IsCorruption() const { return code_ == StatusCode::kCorruption; }
    bool IsIOError() const { return code_ == StatusCode::kIoError; }
    bool IsInvalidArgument() const { return code_ == StatusCode::kInvalidArgument; }
    bool IsUnsupportedType() const { return code_ == StatusCode::kUnsupportedType; }
    bool IsInvalidPredicate() const { return code_ == StatusCode::kInvalidPredicate; }
    bool IsAborted() const { return code_ == StatusCode::kAborted; }
    bool IsInternalError() const { return code_ == StatusCode::kInternalError; }

    StatusCode code() const { return code_; }
    const std::string& message() const { return message_; }
    OperationStage stage() const { return stage_; }

    /**
     * @brief Tag the failure with the stage that produced it.
     *
     * The first stage recorded wins, so a nested component that already
     * tagged its error keeps that tag while the error propagates.
     */
    Status WithStage(OperationStage stage) const {
        Status copy = *this;
        if (!copy.ok() && copy.stage_ == OperationStage::kNone) {
            copy.stage_ = stage;
        }
        return copy;
    }

    // Prefix the message with context such as a location
    Status WithContext(const std::string& context) const {
        if (ok()) return *this;
        Status copy(code_, context + ": " + message_);
        copy.stage_ = stage_;
        return copy;
    }

    std::string ToString() const;

private:
    StatusCode code_;
    std::string message_;
    OperationStage stage_ = OperationStage::kNone;
};

inline const char* OperationStageName(OperationStage stage) {
    switch (stage) {
        case OperationStage::kNone: return "none";
        case OperationStage::kWrite: return "write";
        case OperationStage::kResolveSnapshot: return "resolve-snapshot";
        case OperationStage::kResolveSegment: return "resolve-segment";
        case OperationStage::kCompilePredicate: return "compile-predicate";
    }
    return "unknown";
}

inline std::string Status::ToString() const {
    std::string result;
    switch (code_) {
        case StatusCode::kOk:
            result = "OK";
            break;
        case StatusCode::kNotFound:
            result = "NotFound";
            break;
        case StatusCode::kCorruption:
            result = "Corruption";
            break;
        case StatusCode::kIoError:
            result = "IOError";
            break;
        case StatusCode::kInvalidArgument:
            result = "InvalidArgument";
            break;
        case StatusCode::kUnsupportedType:
            result = "UnsupportedType";
            break;
        case StatusCode::kInvalidPredicate:
            result = "InvalidPredicate";
            break;
        case StatusCode::kAborted:
            result = "Aborted";
            break;
        case StatusCode::kNotImplemented:
            result = "NotImplemented";
            break;
        case StatusCode::kInternalError:
            result = "InternalError";
            break;
    }

    if (stage_ != OperationStage::kNone) {
        result += std::string(" [") + OperationStageName(stage_) + "]";
    }

    if (!message_.empty()) {
        result += ": " + message_;
    }

    return result;
}

/**
 * @brief Convert an Arrow status into a basalt Status.
 *
 * IOError keeps its code; serialization and invalid-data failures become
 * Corruption; type errors and unimplemented kernels become UnsupportedType.
 */
Status FromArrowStatus(const arrow::Status& status);

} // namespace basalt

#define BASALT_RETURN_NOT_OK(expr)                  \
    do {                                            \
        ::basalt::Status _basalt_status = (expr);   \
        if (!_basalt_status.ok()) {                 \
            return _basalt_status;                  \
        }                                           \
    } while (0)

#define BASALT_RETURN_ARROW_NOT_OK(expr)                                  \
    do {                                                                  \
        ::arrow::Status _arrow_status = (expr);                           \
        if (!_arrow_status.ok()) {                                        \
            return ::basalt::FromArrowStatus(_arrow_status);              \
        }                                                                 \
    } while (0)

#define BASALT_CONCAT_IMPL(x, y) x##y
#define BASALT_CONCAT(x, y) BASALT_CONCAT_IMPL(x, y)

#define BASALT_ARROW_ASSIGN_OR_RETURN_IMPL(result_name, lhs, rexpr)       \
    auto&& result_name = (rexpr);                                         \
    if (!result_name.ok()) {                                              \
        return ::basalt::FromArrowStatus(result_name.status());           \
    }                                                                     \
    lhs = std::move(result_name).ValueUnsafe();

// Evaluate an arrow::Result<T> expression, returning a basalt Status on error
#define BASALT_ARROW_ASSIGN_OR_RETURN(lhs, rexpr)                         \
    BASALT_ARROW_ASSIGN_OR_RETURN_IMPL(                                   \
        BASALT_CONCAT(_basalt_result_, __LINE__), lhs, rexpr)
