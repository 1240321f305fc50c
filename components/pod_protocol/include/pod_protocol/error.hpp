#pragma once

#include <stdexcept>
#include <string>

namespace pod_protocol {

/**
 * @brief Base exception class for all pod protocol errors
 */
class ProtocolError : public std::exception {
public:
    explicit ProtocolError(const std::string& message) : message_(message) {}
    const char* what() const noexcept override { return message_.c_str(); }

protected:
    std::string message_;
};

/**
 * @brief Exception thrown when a message cannot be decoded from its bytes
 */
class ParseError : public ProtocolError {
public:
    explicit ParseError(const std::string& message) : ProtocolError("Parse error: " + message) {}
};

/**
 * @brief Exception thrown when a body is accessed as the wrong shape
 */
class FieldAccessError : public ProtocolError {
public:
    explicit FieldAccessError(const std::string& message) : ProtocolError("Field access error: " + message) {}
};

/**
 * @brief Exception thrown when a value is outside of what the device accepts
 */
class ValidationError : public ProtocolError {
public:
    explicit ValidationError(const std::string& message) : ProtocolError("Validation error: " + message) {}
};

} // namespace pod_protocol
