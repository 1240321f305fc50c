#pragma once

#include "pod_protocol/types.hpp"

#include <cstddef>
#include <cstdint>

namespace pod_protocol {

// Initial register value of the protocol checksum
constexpr uint16_t CRC_INITIAL = 0xFFFF;

/**
 * @brief CRC-16/CCITT-FALSE (poly 0x1021, no reflection, no final xor)
 *
 * Fragment headers use the default seed. Fragment payloads are seeded with
 * the header checksum of the fragment they are carried in.
 *
 * @param data Start of the data
 * @param length Number of bytes
 * @param seed Initial register value
 * @return Checksum
 */
uint16_t crc16(const uint8_t* data, size_t length, uint16_t seed = CRC_INITIAL);

/**
 * @brief Convenience overload for a whole buffer
 */
uint16_t crc16(const Bytes& data, uint16_t seed = CRC_INITIAL);

} // namespace pod_protocol
