#include "pmem_decoder/internal_log.hpp"
#include "pmem_decoder/pmem_file.hpp"

#include <spdlog/spdlog.h>

namespace pmem_decoder {

InternalLog::InternalLog(const PmemFile& file)
    : InternalLog(file, file.internalLog()) {
}

InternalLog::InternalLog(const PmemFile& file, Region region)
    : block_(file, region) {
}

void InternalLog::load() {
    records_.clear();
    block_.loadLogs();

    for (const auto& subBlock : block_.subBlocks()) {
        EntryCursor cursor = block_.entries(subBlock);
        while (auto entry = cursor.next()) {
            records_.push_back(decodeInternalLogEntry(*entry));
        }
    }
    spdlog::info("Loaded {} internal log entries", records_.size());
}

nlohmann::json InternalLog::toJson() const {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& record : records_) {
        entries.push_back(pmem_decoder::toJson(record));
    }
    return entries;
}

} // namespace pmem_decoder
