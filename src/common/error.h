#pragma once

/// @file error.h
/// @brief driftwatch error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace driftwatch {

/// @brief Error codes used across driftwatch
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kFailedPrecondition,
    kOutOfRange,
    kUnimplemented,
    kInternal,

    // driftwatch-specific error codes
    kConfigurationError,   ///< Invalid chunking/method/threshold configuration
    kNotFitted,            ///< Calculate called before Fit
    kFeatureTypeMismatch,  ///< Method or column incompatible with feature type
    kEmptyData,            ///< Table or sample without usable rows
};

/// @brief Convert a driftwatch error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Create a configuration error
inline absl::Status ConfigurationError(std::string_view message) {
    return MakeError(ErrorCode::kConfigurationError, message);
}

/// @brief Create a precondition error for unfitted calculators
inline absl::Status NotFittedError(std::string_view message) {
    return MakeError(ErrorCode::kNotFitted, message);
}

/// @brief Create a feature type mismatch error
inline absl::Status FeatureTypeMismatchError(std::string_view message) {
    return MakeError(ErrorCode::kFeatureTypeMismatch, message);
}

/// @brief Create an empty data error
inline absl::Status EmptyDataError(std::string_view message) {
    return MakeError(ErrorCode::kEmptyData, message);
}

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define DRIFTWATCH_RETURN_IF_ERROR(expr)                                       \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define DRIFTWATCH_ASSIGN_OR_RETURN(lhs, rhs)                                  \
    DRIFTWATCH_ASSIGN_OR_RETURN_IMPL(                                          \
        DRIFTWATCH_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define DRIFTWATCH_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                   \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define DRIFTWATCH_CONCAT(a, b) DRIFTWATCH_CONCAT_IMPL(a, b)
#define DRIFTWATCH_CONCAT_IMPL(a, b) a##b

/// @brief Check condition and return error if false
#define DRIFTWATCH_CHECK_OR_RETURN(condition, error_status)                    \
    do {                                                                        \
        if (!(condition)) {                                                     \
            return (error_status);                                              \
        }                                                                       \
    } while (0)

}  // namespace driftwatch
