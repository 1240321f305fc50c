#include "pod_protocol/fragment.hpp"
#include "pod_protocol/crc.hpp"

#include <boost/endian/conversion.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cstring>

namespace pod_protocol {

uint16_t FragmentHeader::computeCrc() const {
    auto bytes = toBytes();
    // part marker, payload length and sequence
    return crc16(bytes.data() + 2, 4);
}

bool FragmentHeader::isCorrect() const {
    return magic == FRAGMENT_MAGIC &&
           usbLength == static_cast<uint8_t>(payloadLength + FRAGMENT_HEADER_SIZE) &&
           headerCrc == computeCrc();
}

void FragmentHeader::makeCorrect() {
    magic = FRAGMENT_MAGIC;
    headerCrc = computeCrc();
}

std::array<uint8_t, FRAGMENT_HEADER_SIZE> FragmentHeader::toBytes() const {
    std::array<uint8_t, FRAGMENT_HEADER_SIZE> bytes{};
    bytes[0] = magic;
    bytes[1] = usbLength;
    bytes[2] = partMarker;
    bytes[3] = payloadLength;
    boost::endian::store_little_u16(bytes.data() + 4, sequence);
    boost::endian::store_little_u16(bytes.data() + 6, headerCrc);
    return bytes;
}

FragmentHeader FragmentHeader::fromBytes(const uint8_t* data) {
    FragmentHeader header;
    header.magic = data[0];
    header.usbLength = data[1];
    header.partMarker = data[2];
    header.payloadLength = data[3];
    header.sequence = boost::endian::load_little_u16(data + 4);
    header.headerCrc = boost::endian::load_little_u16(data + 6);
    return header;
}

std::string FragmentHeader::toString() const {
    if (!isCorrect()) {
        return fmt::format("damaged header part({}) len: {:>3}", sequence, payloadLength);
    }
    if (isFirst()) {
        return fmt::format("start({}) len: {:>3}", sequence, payloadLength);
    }
    return fmt::format("part({}) len: {:>3}", sequence, payloadLength);
}

std::optional<Bytes> Fragment::data() const {
    if (!header_.isCorrect()) {
        return std::nullopt;
    }

    const size_t length = header_.payloadLength;
    if (length > MAX_FRAGMENT_DATA) {
        return std::nullopt;
    }

    const uint16_t stored = boost::endian::load_little_u16(payload_.data() + length);
    if (stored != crc16(payload_.data(), length, header_.headerCrc)) {
        return std::nullopt;
    }

    return Bytes(payload_.begin(), payload_.begin() + length);
}

void Fragment::setData(const uint8_t* data, size_t length) {
    length = std::min(length, MAX_FRAGMENT_DATA);

    header_.payloadLength = static_cast<uint8_t>(length);
    header_.usbLength = static_cast<uint8_t>(length + FRAGMENT_HEADER_SIZE);
    header_.makeCorrect();

    payload_.fill(0);
    if (length > 0) {
        std::memcpy(payload_.data(), data, length);
    }
    boost::endian::store_little_u16(payload_.data() + length,
                                    crc16(payload_.data(), length, header_.headerCrc));
}

Bytes Fragment::toBytes() const {
    Bytes packet;
    packet.reserve(PACKET_SIZE);
    auto header = header_.toBytes();
    packet.insert(packet.end(), header.begin(), header.end());
    packet.insert(packet.end(), payload_.begin(), payload_.end());
    return packet;
}

Fragment Fragment::fromBytes(const uint8_t* data, size_t length) {
    std::array<uint8_t, PACKET_SIZE> packet{};
    if (data != nullptr) {
        std::memcpy(packet.data(), data, std::min(length, PACKET_SIZE));
    }

    Fragment fragment;
    fragment.header_ = FragmentHeader::fromBytes(packet.data());
    std::copy(packet.begin() + FRAGMENT_HEADER_SIZE, packet.end(), fragment.payload_.begin());
    return fragment;
}

std::string Fragment::toString() const {
    auto payload = data();
    return fmt::format("<Fragment {}: data({})>", header_.toString(),
                       payload ? std::to_string(payload->size()) : std::string("-"));
}

std::vector<Fragment> encodeFragments(const Bytes& payload) {
    const size_t chunks = payload.empty() ? 1 : (payload.size() + MAX_FRAGMENT_DATA - 1) / MAX_FRAGMENT_DATA;

    std::vector<Fragment> fragments;
    fragments.reserve(chunks);

    for (size_t i = 0; i < chunks; ++i) {
        const size_t offset = i * MAX_FRAGMENT_DATA;
        const size_t length = std::min(MAX_FRAGMENT_DATA, payload.size() - offset);

        Fragment fragment;
        auto& header = fragment.getHeader();
        if (i == 0) {
            header.partMarker = static_cast<uint8_t>(PartMarker::FIRST);
            header.sequence = static_cast<uint16_t>(chunks);
        } else {
            header.partMarker = static_cast<uint8_t>(PartMarker::CONTINUATION);
            header.sequence = static_cast<uint16_t>(i);
        }
        fragment.setData(payload.data() + offset, length);
        fragments.push_back(fragment);
    }

    return fragments;
}

Fragment decodeFragment(const Bytes& packet) {
    return Fragment::fromBytes(packet.data(), packet.size());
}

} // namespace pod_protocol
