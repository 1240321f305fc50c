#pragma once

#include "pod_device/types.hpp"

#include <chrono>

namespace pod_device {

/**
 * @brief Packet transport to the device
 *
 * Packets are the 64 byte USB reports carrying one fragment each.
 */
class IChannel {
public:
    virtual ~IChannel() = default;

    virtual VoidResult open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    /**
     * @brief Write one packet
     */
    virtual VoidResult write(const Bytes& packet) = 0;

    /**
     * @brief Read one packet
     * @param maxLength Largest packet accepted
     * @param timeout How long to wait for a packet
     * @return The packet, or ErrorCode::TIMEOUT when nothing arrived
     */
    virtual Result<Bytes> read(size_t maxLength, std::chrono::milliseconds timeout) = 0;
};

} // namespace pod_device
