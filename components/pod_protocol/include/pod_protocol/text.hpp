#pragma once

#include "pod_protocol/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace pod_protocol {

// Hex dump helper shared by the text renderings, e.g. "00 0A FF"
std::string toHex(const uint8_t* data, size_t length);
inline std::string toHex(const Bytes& data) { return toHex(data.data(), data.size()); }

/**
 * @brief Turn device text into valid UTF-8
 *
 * Well formed UTF-8 sequences are copied as they are. Every byte that does
 * not start a well formed sequence is replaced by U+FFFD, so the result can
 * always be serialized as JSON.
 *
 * @param data Start of the text
 * @param length Number of bytes, NUL bytes included
 * @return Valid UTF-8 string
 */
std::string decodeText(const char* data, size_t length);
inline std::string decodeText(const std::string& text) { return decodeText(text.data(), text.size()); }

} // namespace pod_protocol
