#pragma once

#include "pod_device/channel.hpp"

#include <boost/asio.hpp>

#include <optional>
#include <string>

namespace pod_device {

/**
 * @brief Channel over a Linux hidraw node
 *
 * The fragment magic 0x3F doubles as the HID report id, so packets are
 * written and read as-is.
 */
class HidrawChannel : public IChannel {
public:
    struct Config {
        std::string path;            // empty: find the device through sysfs
        size_t packetSize = 64;
        uint16_t vendorId = USB_VENDOR_ID;
        uint16_t productId = USB_PRODUCT_ID;
    };

    explicit HidrawChannel(const Config& config);
    ~HidrawChannel() override;

    // Non-copyable, non-movable
    HidrawChannel(const HidrawChannel&) = delete;
    HidrawChannel& operator=(const HidrawChannel&) = delete;

    VoidResult open() override;
    void close() override;
    bool isOpen() const override;

    VoidResult write(const Bytes& packet) override;
    Result<Bytes> read(size_t maxLength, std::chrono::milliseconds timeout) override;

    const std::string& path() const { return path_; }

    /**
     * @brief Find the hidraw node of a USB device
     * @param sysfsRoot Directory holding the hidrawN entries
     * @return Path of the device node, e.g. /dev/hidraw3
     */
    static std::optional<std::string> findDevice(uint16_t vendorId, uint16_t productId,
                                                  const std::string& sysfsRoot = "/sys/class/hidraw");

private:
    Config config_;
    std::string path_;
    boost::asio::io_context ioContext_;
    boost::asio::posix::stream_descriptor descriptor_;
};

} // namespace pod_device
