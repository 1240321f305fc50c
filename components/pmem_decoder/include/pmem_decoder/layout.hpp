#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pmem_decoder {

using Bytes = std::vector<uint8_t>;

// Filesystem image of the device
constexpr size_t FILESYSTEM_SIZE = 0x3C0000;
constexpr size_t BLOCK_SIZE = 512;

// BBPMEM.DAT inside the filesystem image
constexpr uint32_t PMEM_FILE_OFFSET = 0xBA00;
constexpr uint32_t PMEM_FILE_SIZE = 3750000;

// Regions, relative to the start of the PMEM file
constexpr uint32_t INTERNAL_LOG_OFFSET = 0x927C0;
constexpr uint32_t INTERNAL_LOG_END = 0xF4240;
constexpr uint32_t TRACK_LOG_OFFSET = 0xF4240;

constexpr size_t BLOCK_HEADER_SIZE = 18;
constexpr size_t SUB_BLOCK_HEADER_SIZE = 12;
constexpr uint8_t SUB_BLOCK_MAGIC[4] = {'P', 'M', 'E', 'M'};

// Entry types inside a track sub-block
namespace entry_type {
    constexpr uint8_t PERIODIC_SCHEMA = 0x00;
    constexpr uint8_t TRACK_METADATA = 0x01;
    constexpr uint8_t PERIODIC = 0x02;
    constexpr uint8_t EPISODIC = 0x03;
}

// Entry types inside the internal log
namespace log_entry_type {
    constexpr uint8_t HEADER = 0x02;
    constexpr uint8_t TEXT = 0x05;
}

/**
 * @brief A named byte range inside the PMEM file
 */
struct Region {
    const char* name;
    uint32_t start;
    uint32_t end;
};

} // namespace pmem_decoder
