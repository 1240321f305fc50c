#include "pod_protocol/reassembly.hpp"

#include <spdlog/spdlog.h>

namespace pod_protocol {

std::optional<Bytes> ReassemblyFeed::feed(const Fragment& fragment) {
    const auto& header = fragment.getHeader();

    if (!header.isCorrect()) {
        spdlog::warn("Damaged fragment header ({}), dropping pending fragments", header.toString());
        discard("damaged header");
        return std::nullopt;
    }

    if (header.isFirst()) {
        if (first_) {
            spdlog::warn("New message started while previous message is incomplete");
            discard("superseded");
        }
        if (header.sequence == 0) {
            spdlog::warn("First fragment announces zero parts");
            discard("invalid part count");
            return std::nullopt;
        }
        first_ = fragment;
        parts_.clear();
    } else {
        if (!first_) {
            spdlog::debug("Dropping continuation {} received without a first fragment", header.sequence);
            return std::nullopt;
        }
        const uint16_t total = first_->getHeader().sequence;
        if (header.sequence == 0 || header.sequence >= total) {
            spdlog::warn("Continuation {} out of range for {} parts", header.sequence, total);
            discard("framing error");
            return std::nullopt;
        }
        parts_[header.sequence] = fragment;
    }

    return tryComplete();
}

std::optional<Bytes> ReassemblyFeed::tryComplete() {
    if (!first_) {
        return std::nullopt;
    }

    const size_t expected = static_cast<size_t>(first_->getHeader().sequence) - 1;
    if (parts_.size() != expected) {
        return std::nullopt;
    }

    auto firstData = first_->data();
    if (!firstData) {
        spdlog::warn("Checksum failed on first fragment, discarding message");
        discard("checksum");
        return std::nullopt;
    }

    Bytes message = std::move(*firstData);
    for (const auto& [sequence, part] : parts_) {
        auto partData = part.data();
        if (!partData) {
            spdlog::warn("Checksum failed on fragment {}, discarding message", sequence);
            discard("checksum");
            return std::nullopt;
        }
        message.insert(message.end(), partData->begin(), partData->end());
    }

    first_.reset();
    parts_.clear();
    messagesCompleted_++;
    return message;
}

void ReassemblyFeed::reset() {
    first_.reset();
    parts_.clear();
}

void ReassemblyFeed::discard(const char* reason) {
    if (first_ || !parts_.empty()) {
        messagesDiscarded_++;
        spdlog::debug("Reassembly state discarded: {}", reason);
    }
    reset();
}

} // namespace pod_protocol
