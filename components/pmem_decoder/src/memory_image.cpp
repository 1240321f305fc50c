#include "pmem_decoder/memory_image.hpp"
#include "pmem_decoder/error.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace pmem_decoder {

MemoryImage::MemoryImage(std::shared_ptr<IBlockSource> source, size_t size)
    : source_(std::move(source)),
      data_(size, 0),
      fetched_(size, false) {
}

MemoryImage::MemoryImage(CapturedTag, Bytes data)
    : data_(std::move(data)),
      fetched_(data_.size(), true) {
}

std::unique_ptr<MemoryImage> MemoryImage::fromFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open image file: " + path);
    }

    Bytes data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    spdlog::debug("Loaded image {} ({} bytes)", path, data.size());
    if (data.size() != FILESYSTEM_SIZE) {
        spdlog::warn("Image {} has {} bytes, expected {}", path, data.size(), FILESYSTEM_SIZE);
    }
    return std::make_unique<MemoryImage>(CapturedTag{}, std::move(data));
}

std::unique_ptr<MemoryImage> MemoryImage::fromBytes(const Bytes& data) {
    return std::make_unique<MemoryImage>(CapturedTag{}, data);
}

Bytes MemoryImage::read(size_t offset, size_t length) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkRange(offset, length);
    fetchMissingBlocks(offset, length);
    return Bytes(data_.begin() + offset, data_.begin() + offset + length);
}

void MemoryImage::store(size_t offset, const Bytes& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkRange(offset, data.size());
    std::copy(data.begin(), data.end(), data_.begin() + offset);
    std::fill(fetched_.begin() + offset, fetched_.begin() + offset + data.size(), true);
}

bool MemoryImage::haveData(size_t offset, size_t length) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (offset > data_.size() || length > data_.size() - offset) {
        return false;
    }
    return std::all_of(fetched_.begin() + offset, fetched_.begin() + offset + length,
                       [](bool fetched) { return fetched; });
}

std::vector<std::pair<size_t, size_t>> MemoryImage::missingRanges() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<size_t, size_t>> ranges;

    size_t position = 0;
    while (position < fetched_.size()) {
        if (fetched_[position]) {
            ++position;
            continue;
        }
        size_t begin = position;
        while (position < fetched_.size() && !fetched_[position]) {
            ++position;
        }
        ranges.emplace_back(begin, position);
    }
    return ranges;
}

void MemoryImage::save(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot create image file: " + path);
    }
    file.write(reinterpret_cast<const char*>(data_.data()), static_cast<std::streamsize>(data_.size()));
    if (!file) {
        throw std::runtime_error("Failed writing image file: " + path);
    }
    spdlog::info("Wrote {} bytes to {}", data_.size(), path);
}

uint64_t MemoryImage::fetchCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetchCount_;
}

void MemoryImage::checkRange(size_t offset, size_t length) const {
    if (offset > data_.size() || length > data_.size() - offset) {
        throw std::out_of_range(fmt::format("Range 0x{:X}+{} exceeds image of {} bytes",
                                            offset, length, data_.size()));
    }
}

bool MemoryImage::blockComplete(size_t blockIndex) const {
    const size_t begin = blockIndex * BLOCK_SIZE;
    const size_t end = std::min(begin + BLOCK_SIZE, fetched_.size());
    return std::all_of(fetched_.begin() + begin, fetched_.begin() + end,
                       [](bool fetched) { return fetched; });
}

void MemoryImage::fetchMissingBlocks(size_t offset, size_t length) {
    if (length == 0) {
        return;
    }

    const size_t firstBlock = offset / BLOCK_SIZE;
    const size_t lastBlock = (offset + length - 1) / BLOCK_SIZE;

    for (size_t blockIndex = firstBlock; blockIndex <= lastBlock; ++blockIndex) {
        if (blockComplete(blockIndex)) {
            continue;
        }
        if (!source_) {
            throw BlockUnavailableError(blockIndex, "image has no block source");
        }

        Bytes block;
        std::string error;
        if (!source_->fetchBlock(blockIndex, block, error)) {
            throw BlockUnavailableError(blockIndex, error);
        }
        ++fetchCount_;

        const size_t begin = blockIndex * BLOCK_SIZE;
        const size_t count = std::min({block.size(), BLOCK_SIZE, data_.size() - begin});
        std::copy(block.begin(), block.begin() + count, data_.begin() + begin);
        std::fill(fetched_.begin() + begin, fetched_.begin() + begin + count, true);

        if (count < BLOCK_SIZE && begin + count < data_.size()) {
            spdlog::warn("Block {} delivered only {} bytes", blockIndex, count);
        }
    }
}

} // namespace pmem_decoder
