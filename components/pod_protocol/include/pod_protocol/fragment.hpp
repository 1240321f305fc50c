#pragma once

#include "pod_protocol/types.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace pod_protocol {

/**
 * @brief The 8 byte header in front of every USB packet
 *
 * Layout (little endian): magic, usb length, part marker, payload length,
 * sequence (u16), header checksum (u16). The checksum covers the part marker,
 * the payload length and the sequence.
 */
struct FragmentHeader {
    uint8_t magic = FRAGMENT_MAGIC;
    uint8_t usbLength = FRAGMENT_HEADER_SIZE;
    uint8_t partMarker = static_cast<uint8_t>(PartMarker::FIRST);
    uint8_t payloadLength = 0;
    uint16_t sequence = 0;
    uint16_t headerCrc = 0;

    /**
     * @brief Checksum the header should carry for its current contents
     */
    uint16_t computeCrc() const;

    /**
     * @brief True when magic, length relation and checksum are all valid
     */
    bool isCorrect() const;

    /**
     * @brief Set magic and checksum so that isCorrect() holds
     */
    void makeCorrect();

    bool isFirst() const { return partMarker == static_cast<uint8_t>(PartMarker::FIRST); }

    std::array<uint8_t, FRAGMENT_HEADER_SIZE> toBytes() const;
    static FragmentHeader fromBytes(const uint8_t* data);

    std::string toString() const;
};

/**
 * @brief One 64 byte USB packet: header followed by the payload area
 *
 * The payload area holds the data slice and, directly after it, the data
 * checksum seeded with the header checksum.
 */
class Fragment {
public:
    Fragment() = default;

    const FragmentHeader& getHeader() const { return header_; }
    FragmentHeader& getHeader() { return header_; }

    /**
     * @brief Data carried by the fragment
     * @return The data slice, or std::nullopt if the header is damaged,
     *         the length does not fit the packet or the data checksum
     *         does not match
     */
    std::optional<Bytes> data() const;

    /**
     * @brief Store data, truncated to MAX_FRAGMENT_DATA bytes
     *
     * Updates the lengths, header checksum and data checksum. Part marker and
     * sequence must be set before calling this.
     */
    void setData(const uint8_t* data, size_t length);

    /**
     * @brief Serialize to a full USB packet
     */
    Bytes toBytes() const;

    /**
     * @brief Build a fragment from received packet bytes
     *
     * At most PACKET_SIZE bytes are used; a short packet is zero padded.
     * Never throws; validity is reported through data() and isCorrect().
     */
    static Fragment fromBytes(const uint8_t* data, size_t length);

    std::string toString() const;

private:
    FragmentHeader header_;
    std::array<uint8_t, FRAGMENT_PAYLOAD_AREA> payload_{};
};

/**
 * @brief Split a logical message into USB packets
 *
 * The first fragment carries the number of fragments in its sequence field,
 * continuations carry their index starting at 1. An empty payload still
 * produces a single first fragment.
 */
std::vector<Fragment> encodeFragments(const Bytes& payload);

/**
 * @brief Interpret received packet bytes as a fragment
 */
Fragment decodeFragment(const Bytes& packet);

} // namespace pod_protocol
