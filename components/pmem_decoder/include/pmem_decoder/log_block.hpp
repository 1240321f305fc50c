#pragma once

#include "pmem_decoder/entry_cursor.hpp"
#include "pmem_decoder/layout.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace pmem_decoder {

class PmemFile;

struct BlockHeader {
    uint32_t last = 0;
    uint32_t first = 0;
    uint32_t entryCount = 0;
    uint32_t freeOffset = 0;
    uint16_t pad = 0;

    static BlockHeader decode(const Bytes& data);
};

struct SubBlock {
    uint32_t offset = 0;
    uint32_t next = 0;
    uint32_t prev = 0;
    uint32_t dataStart = 0;
    uint32_t dataEnd = 0;
};

/**
 * @brief Linked list of sub-blocks describing one region of the PMEM file
 *
 * Offsets in the headers are plain file offsets. The walk starts at the
 * header's first sub-block and stops after entryCount nodes, on a node
 * pointing at itself, on an offset visited before or on a bad magic.
 */
class LogBlock {
public:
    enum class State {
        UNLOADED,
        HEADER_LOADED,
        LOGS_ENUMERATED
    };

    LogBlock(const PmemFile& file, Region region);

    /**
     * @brief Read the block header at the start of the region
     */
    void loadBlockHeader();

    /**
     * @brief Walk the sub-block list, loading the header first if needed
     */
    void loadLogs();

    EntryCursor entries(const SubBlock& subBlock) const;

    State state() const { return state_; }
    const Region& region() const { return region_; }
    const BlockHeader& header() const { return header_; }
    const std::vector<SubBlock>& subBlocks() const { return subBlocks_; }

    nlohmann::json toJson() const;

private:
    uint32_t dataEnd(uint32_t position, uint32_t next) const;

    const PmemFile& file_;
    Region region_;
    State state_ = State::UNLOADED;
    BlockHeader header_;
    std::vector<SubBlock> subBlocks_;
};

} // namespace pmem_decoder
