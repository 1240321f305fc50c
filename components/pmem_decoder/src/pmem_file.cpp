#include "pmem_decoder/pmem_file.hpp"

#include <boost/endian/conversion.hpp>
#include <fmt/format.h>

#include <stdexcept>

namespace pmem_decoder {

PmemFile::PmemFile(MemoryImage& image, uint32_t imageOffset, uint32_t size)
    : image_(image),
      imageOffset_(imageOffset),
      size_(size) {
    if (static_cast<size_t>(imageOffset) + size > image.size()) {
        throw std::out_of_range(fmt::format("PMEM file 0x{:X}+{} exceeds image of {} bytes",
                                            imageOffset, size, image.size()));
    }
}

Bytes PmemFile::read(uint32_t offset, uint32_t length) const {
    if (offset > size_ || length > size_ - offset) {
        throw std::out_of_range(fmt::format("Range 0x{:X}+{} exceeds PMEM file", offset, length));
    }
    return image_.read(static_cast<size_t>(imageOffset_) + offset, length);
}

uint16_t PmemFile::readU16(uint32_t offset) const {
    Bytes data = read(offset, 2);
    return boost::endian::load_little_u16(data.data());
}

uint32_t PmemFile::readU32(uint32_t offset) const {
    Bytes data = read(offset, 4);
    return boost::endian::load_little_u32(data.data());
}

} // namespace pmem_decoder
