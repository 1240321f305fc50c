#pragma once

#include "pmem_decoder/layout.hpp"
#include "pmem_decoder/memory_image.hpp"

namespace pmem_decoder {

/**
 * @brief View of the PMEM file inside the filesystem image
 *
 * All PMEM pointers are offsets relative to the start of this file.
 */
class PmemFile {
public:
    explicit PmemFile(MemoryImage& image,
                      uint32_t imageOffset = PMEM_FILE_OFFSET,
                      uint32_t size = PMEM_FILE_SIZE);

    /**
     * @brief Read a byte range of the file
     * @throws std::out_of_range when the range exceeds the file
     */
    Bytes read(uint32_t offset, uint32_t length) const;

    uint16_t readU16(uint32_t offset) const;
    uint32_t readU32(uint32_t offset) const;

    uint32_t size() const { return size_; }
    uint32_t imageOffset() const { return imageOffset_; }

    Region trackLog() const { return {"track log", TRACK_LOG_OFFSET, size_}; }
    Region internalLog() const { return {"internal log", INTERNAL_LOG_OFFSET, INTERNAL_LOG_END}; }

private:
    MemoryImage& image_;
    uint32_t imageOffset_;
    uint32_t size_;
};

} // namespace pmem_decoder
