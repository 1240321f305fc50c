#pragma once

#include "pmem_decoder/layout.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace pmem_decoder {

/**
 * @brief Interface for anything that can deliver 512-byte filesystem blocks
 */
class IBlockSource {
public:
    virtual ~IBlockSource() = default;

    /**
     * @brief Fetch one block
     * @param blockIndex Index of the block, the byte position is blockIndex * BLOCK_SIZE
     * @param out Receives the block data
     * @param error Receives a description on failure
     * @return true when the block was fetched
     */
    virtual bool fetchBlock(size_t blockIndex, Bytes& out, std::string& error) = 0;
};

/**
 * @brief Byte addressable filesystem image, fetched on demand
 *
 * Reads only fetch the blocks covering the requested range that have not
 * been retrieved yet. The buffer and the per-byte fetched bitmap are
 * guarded together by one mutex.
 */
class MemoryImage {
    // Restricts the captured-image constructor to the factories below
    struct CapturedTag {};

public:
    explicit MemoryImage(std::shared_ptr<IBlockSource> source, size_t size = FILESYSTEM_SIZE);
    MemoryImage(CapturedTag, Bytes data);
    ~MemoryImage() = default;

    // Non-copyable, non-movable
    MemoryImage(const MemoryImage&) = delete;
    MemoryImage& operator=(const MemoryImage&) = delete;
    MemoryImage(MemoryImage&&) = delete;
    MemoryImage& operator=(MemoryImage&&) = delete;

    /**
     * @brief Load a captured image from disk, every byte counts as fetched
     */
    static std::unique_ptr<MemoryImage> fromFile(const std::string& path);

    /**
     * @brief Wrap an in-memory image, every byte counts as fetched
     */
    static std::unique_ptr<MemoryImage> fromBytes(const Bytes& data);

    /**
     * @brief Read a byte range, fetching missing blocks first
     * @throws BlockUnavailableError when the source fails
     * @throws std::out_of_range when the range exceeds the image
     */
    Bytes read(size_t offset, size_t length);

    /**
     * @brief Store bytes retrieved elsewhere and mark them fetched
     */
    void store(size_t offset, const Bytes& data);

    // True when every byte of the range has been fetched, never fetches
    bool haveData(size_t offset, size_t length) const;

    /**
     * @brief Byte ranges [begin, end) that have not been fetched
     */
    std::vector<std::pair<size_t, size_t>> missingRanges() const;

    /**
     * @brief Write the image to disk, missing bytes are written as zero
     */
    void save(const std::string& path) const;

    size_t size() const { return data_.size(); }
    uint64_t fetchCount() const;

private:
    void checkRange(size_t offset, size_t length) const;
    bool blockComplete(size_t blockIndex) const;
    void fetchMissingBlocks(size_t offset, size_t length);

    std::shared_ptr<IBlockSource> source_;

    mutable std::mutex mutex_;
    Bytes data_;
    std::vector<bool> fetched_;
    uint64_t fetchCount_ = 0;
};

} // namespace pmem_decoder
