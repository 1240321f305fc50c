#include "pmem_decoder/log_block.hpp"
#include "pmem_decoder/error.hpp"
#include "pmem_decoder/pmem_file.hpp"

#include <boost/endian/conversion.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace pmem_decoder {

BlockHeader BlockHeader::decode(const Bytes& data) {
    if (data.size() < BLOCK_HEADER_SIZE) {
        throw DecodeError("block header needs 18 bytes");
    }
    BlockHeader header;
    header.last = boost::endian::load_little_u32(data.data());
    header.first = boost::endian::load_little_u32(data.data() + 4);
    header.entryCount = boost::endian::load_little_u32(data.data() + 8);
    header.freeOffset = boost::endian::load_little_u32(data.data() + 12);
    header.pad = boost::endian::load_little_u16(data.data() + 16);
    return header;
}

LogBlock::LogBlock(const PmemFile& file, Region region)
    : file_(file),
      region_(region) {
}

void LogBlock::loadBlockHeader() {
    header_ = BlockHeader::decode(file_.read(region_.start, BLOCK_HEADER_SIZE));
    subBlocks_.clear();
    state_ = State::HEADER_LOADED;

    spdlog::debug("{}: first 0x{:X}, last 0x{:X}, {} entries, free 0x{:X}",
                  region_.name, header_.first, header_.last, header_.entryCount, header_.freeOffset);
}

void LogBlock::loadLogs() {
    if (state_ == State::UNLOADED) {
        loadBlockHeader();
    }
    subBlocks_.clear();

    std::set<uint32_t> visited;
    uint32_t current = header_.first;

    while (subBlocks_.size() < header_.entryCount) {
        if (current < region_.start || current >= region_.end ||
            region_.end - current < SUB_BLOCK_HEADER_SIZE) {
            spdlog::warn("{}: sub-block offset 0x{:X} outside of region", region_.name, current);
            break;
        }
        if (!visited.insert(current).second) {
            spdlog::warn("{}: sub-block list loops back to 0x{:X}", region_.name, current);
            break;
        }

        Bytes raw = file_.read(current, SUB_BLOCK_HEADER_SIZE);
        if (!std::equal(std::begin(SUB_BLOCK_MAGIC), std::end(SUB_BLOCK_MAGIC), raw.begin())) {
            spdlog::warn("{}: no sub-block magic at 0x{:X}", region_.name, current);
            break;
        }

        SubBlock subBlock;
        subBlock.offset = current;
        subBlock.next = boost::endian::load_little_u32(raw.data() + 4);
        subBlock.prev = boost::endian::load_little_u32(raw.data() + 8);
        subBlock.dataStart = current + SUB_BLOCK_HEADER_SIZE;
        subBlock.dataEnd = dataEnd(current, subBlock.next);
        subBlocks_.push_back(subBlock);

        spdlog::debug("{}: sub-block 0x{:X} next 0x{:X} prev 0x{:X} data [0x{:X}, 0x{:X})",
                      region_.name, current, subBlock.next, subBlock.prev,
                      subBlock.dataStart, subBlock.dataEnd);

        if (subBlock.next == current) {
            break;
        }
        current = subBlock.next;
    }

    if (subBlocks_.size() < header_.entryCount) {
        spdlog::info("{}: found {} of {} sub-blocks", region_.name, subBlocks_.size(), header_.entryCount);
    }
    state_ = State::LOGS_ENUMERATED;
}

EntryCursor LogBlock::entries(const SubBlock& subBlock) const {
    return EntryCursor(file_, subBlock.dataStart, subBlock.dataEnd);
}

uint32_t LogBlock::dataEnd(uint32_t position, uint32_t next) const {
    const uint32_t dataStart = position + SUB_BLOCK_HEADER_SIZE;
    if (next > position && next <= region_.end) {
        return next;
    }
    // The newest sub-block ends where the block header says free space begins
    if (next == position && header_.freeOffset > dataStart && header_.freeOffset <= region_.end) {
        return header_.freeOffset;
    }
    return region_.end;
}

nlohmann::json LogBlock::toJson() const {
    nlohmann::json subBlocks = nlohmann::json::array();
    for (const auto& subBlock : subBlocks_) {
        subBlocks.push_back({
            {"offset", subBlock.offset},
            {"next", subBlock.next},
            {"prev", subBlock.prev},
            {"data_start", subBlock.dataStart},
            {"data_end", subBlock.dataEnd}
        });
    }
    return {
        {"region", region_.name},
        {"first", header_.first},
        {"last", header_.last},
        {"entries", header_.entryCount},
        {"free", header_.freeOffset},
        {"sub_blocks", subBlocks}
    };
}

} // namespace pmem_decoder
