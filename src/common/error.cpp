#include "error.h"

namespace driftwatch {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kConfigurationError:
        case ErrorCode::kEmptyData:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kFailedPrecondition:
        case ErrorCode::kNotFitted:
        case ErrorCode::kFeatureTypeMismatch:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kOutOfRange:
            return absl::StatusCode::kOutOfRange;
        case ErrorCode::kUnimplemented:
            return absl::StatusCode::kUnimplemented;
        case ErrorCode::kInternal:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    return absl::Status(ToAbslCode(code), absl::string_view(message.data(), message.size()));
}

}  // namespace driftwatch
