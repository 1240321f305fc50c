#pragma once

#include "pmem_decoder/layout.hpp"

#include <optional>

namespace pmem_decoder {

class PmemFile;

/**
 * @brief One length-prefixed entry of a sub-block
 */
struct Entry {
    uint32_t offset = 0;   // position of the length prefix
    uint8_t type = 0;
    Bytes body;            // bytes after the type byte

    uint32_t size() const { return static_cast<uint32_t>(2 + 1 + body.size()); }
};

/**
 * @brief Sequential reader over the entries in [position, end)
 *
 * A zero length or a length crossing the end terminates the stream; the
 * cursor does not advance past it.
 */
class EntryCursor {
public:
    EntryCursor(const PmemFile& file, uint32_t position, uint32_t end);

    std::optional<Entry> next();

    void seek(uint32_t position) { position_ = position; }
    uint32_t position() const { return position_; }
    uint32_t end() const { return end_; }

private:
    const PmemFile* file_;
    uint32_t position_;
    uint32_t end_;
};

} // namespace pmem_decoder
