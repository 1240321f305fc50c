#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace pod_device {

using Bytes = std::vector<uint8_t>;

// USB identifiers of the pod
constexpr uint16_t USB_VENDOR_ID = 0x1493;
constexpr uint16_t USB_PRODUCT_ID = 0x0020;

// Error codes
enum class ErrorCode {
    SUCCESS = 0,
    TRANSPORT_ERROR = 1,
    TIMEOUT = 2,
    UNEXPECTED_REPLY = 3,
    RETRIES_EXHAUSTED = 4,
    BLOCK_UNAVAILABLE = 5,
    TRANSACTION_FAILED = 6,
    INVALID_ARGUMENT = 7,
    NOT_CONNECTED = 8
};

// Convert ErrorCode to string
inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:            return "SUCCESS";
        case ErrorCode::TRANSPORT_ERROR:    return "TRANSPORT_ERROR";
        case ErrorCode::TIMEOUT:            return "TIMEOUT";
        case ErrorCode::UNEXPECTED_REPLY:   return "UNEXPECTED_REPLY";
        case ErrorCode::RETRIES_EXHAUSTED:  return "RETRIES_EXHAUSTED";
        case ErrorCode::BLOCK_UNAVAILABLE:  return "BLOCK_UNAVAILABLE";
        case ErrorCode::TRANSACTION_FAILED: return "TRANSACTION_FAILED";
        case ErrorCode::INVALID_ARGUMENT:   return "INVALID_ARGUMENT";
        case ErrorCode::NOT_CONNECTED:      return "NOT_CONNECTED";
        default:                            return "UNKNOWN_ERROR";
    }
}

// Result structure for operations
template<typename T>
struct Result {
    bool success = false;
    ErrorCode errorCode = ErrorCode::SUCCESS;
    std::string errorMessage;
    T value;

    static Result<T> ok(const T& value) {
        Result<T> result;
        result.success = true;
        result.value = value;
        return result;
    }

    static Result<T> error(ErrorCode code, const std::string& message) {
        Result<T> result;
        result.success = false;
        result.errorCode = code;
        result.errorMessage = message;
        return result;
    }

    explicit operator bool() const {
        return success;
    }
};

// Void result for operations without return value
using VoidResult = Result<bool>;

inline VoidResult makeSuccessResult() {
    return Result<bool>::ok(true);
}

inline VoidResult makeErrorResult(ErrorCode code, const std::string& message) {
    return Result<bool>::error(code, message);
}

} // namespace pod_device
