#include "basalt/status.h"

#include <arrow/status.h>

namespace basalt {

Status FromArrowStatus(const arrow::Status& status) {
    if (status.ok()) {
        return Status::OK();
    }

    switch (status.code()) {
        case arrow::StatusCode::IOError:
            return Status::IOError(status.message());
        case arrow::StatusCode::KeyError:
        case arrow::StatusCode::IndexError:
            return Status::NotFound(status.message());
        case arrow::StatusCode::Invalid:
        case arrow::StatusCode::SerializationError:
        case arrow::StatusCode::CapacityError:
            return Status::Corruption(status.message());
        case arrow::StatusCode::TypeError:
        case arrow::StatusCode::NotImplemented:
            return Status::UnsupportedType(status.message());
        case arrow::StatusCode::Cancelled:
            return Status::Aborted(status.message());
        case arrow::StatusCode::OutOfMemory:
        default:
            return Status::InternalError(status.ToString());
    }
}

} // namespace basalt
