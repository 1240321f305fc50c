#pragma once

#include "pmem_decoder/log_block.hpp"
#include "pmem_decoder/records.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace pmem_decoder {

class PmemFile;

/**
 * @brief Diagnostic log the device keeps of its own events
 */
class InternalLog {
public:
    explicit InternalLog(const PmemFile& file);
    InternalLog(const PmemFile& file, Region region);

    /**
     * @brief Enumerate the sub-blocks and decode every entry
     */
    void load();

    const std::vector<Record>& records() const { return records_; }
    const LogBlock& block() const { return block_; }

    nlohmann::json toJson() const;

private:
    LogBlock block_;
    std::vector<Record> records_;
};

} // namespace pmem_decoder
