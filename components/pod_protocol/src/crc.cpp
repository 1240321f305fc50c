#include "pod_protocol/crc.hpp"

#include <boost/crc.hpp>

namespace pod_protocol {

namespace {
using ProtocolCrc = boost::crc_optimal<16, 0x1021, CRC_INITIAL, 0, false, false>;
}

uint16_t crc16(const uint8_t* data, size_t length, uint16_t seed) {
    ProtocolCrc crc(seed);
    if (data != nullptr && length > 0) {
        crc.process_bytes(data, length);
    }
    return crc.checksum();
}

uint16_t crc16(const Bytes& data, uint16_t seed) {
    return crc16(data.data(), data.size(), seed);
}

} // namespace pod_protocol
