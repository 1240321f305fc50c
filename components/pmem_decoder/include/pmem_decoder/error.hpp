#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace pmem_decoder {

/**
 * @brief Base exception class for memory image and log decoding errors
 */
class PmemError : public std::exception {
public:
    explicit PmemError(const std::string& message) : message_(message) {}
    const char* what() const noexcept override { return message_.c_str(); }

protected:
    std::string message_;
};

/**
 * @brief Exception thrown when the block source cannot deliver a block
 */
class BlockUnavailableError : public PmemError {
public:
    BlockUnavailableError(size_t blockIndex, const std::string& message)
        : PmemError("Block unavailable: " + std::to_string(blockIndex) + ": " + message),
          blockIndex_(blockIndex) {}

    size_t blockIndex() const { return blockIndex_; }

private:
    size_t blockIndex_;
};

/**
 * @brief Exception thrown when a structure in the image cannot be decoded
 */
class DecodeError : public PmemError {
public:
    explicit DecodeError(const std::string& message) : PmemError("Decode error: " + message) {}
};

} // namespace pmem_decoder
