#include "pmem_decoder/entry_cursor.hpp"
#include "pmem_decoder/pmem_file.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace pmem_decoder {

EntryCursor::EntryCursor(const PmemFile& file, uint32_t position, uint32_t end)
    : file_(&file),
      position_(position),
      end_(std::min(end, file.size())) {
}

std::optional<Entry> EntryCursor::next() {
    if (position_ >= end_ || end_ - position_ < 2) {
        return std::nullopt;
    }

    const uint16_t length = file_->readU16(position_);
    if (length == 0 || length > end_ - position_ - 2) {
        spdlog::debug("Entry stream ends at 0x{:X} (length {})", position_, length);
        return std::nullopt;
    }

    Bytes data = file_->read(position_ + 2, length);

    Entry entry;
    entry.offset = position_;
    entry.type = data[0];
    entry.body.assign(data.begin() + 1, data.end());

    position_ += 2 + length;
    return entry;
}

} // namespace pmem_decoder
