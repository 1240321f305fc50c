#include "pod_protocol/text.hpp"

#include <fmt/format.h>

namespace pod_protocol {

namespace {

constexpr const char* REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

bool isContinuation(uint8_t byte) {
    return (byte & 0xC0) == 0x80;
}

// Length of the well formed sequence starting at data[0], or 0 if there is none
size_t sequenceLength(const uint8_t* data, size_t available) {
    const uint8_t lead = data[0];
    if (lead < 0x80) {
        return 1;
    }

    size_t length = 0;
    uint8_t low = 0x80;
    uint8_t high = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) {
            low = 0xA0;
        } else if (lead == 0xED) {
            high = 0x9F;
        }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) {
            low = 0x90;
        } else if (lead == 0xF4) {
            high = 0x8F;
        }
    } else {
        return 0;
    }

    if (available < length || data[1] < low || data[1] > high) {
        return 0;
    }
    for (size_t i = 2; i < length; ++i) {
        if (!isContinuation(data[i])) {
            return 0;
        }
    }
    return length;
}

} // namespace

std::string toHex(const uint8_t* data, size_t length) {
    std::string hex;
    hex.reserve(length * 3);
    for (size_t i = 0; i < length; ++i) {
        if (i > 0) {
            hex += ' ';
        }
        hex += fmt::format("{:02X}", data[i]);
    }
    return hex;
}

std::string decodeText(const char* data, size_t length) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(data);
    std::string text;
    text.reserve(length);

    size_t position = 0;
    while (position < length) {
        size_t sequence = sequenceLength(bytes + position, length - position);
        if (sequence == 0) {
            text += REPLACEMENT_CHARACTER;
            ++position;
        } else {
            text.append(data + position, sequence);
            position += sequence;
        }
    }
    return text;
}

} // namespace pod_protocol
