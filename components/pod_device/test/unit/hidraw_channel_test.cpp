#include <gtest/gtest.h>

#include "pod_device/hidraw_channel.hpp"

#include <filesystem>
#include <fstream>

using namespace pod_device;

namespace fs = std::filesystem;

class HidrawChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::path(::testing::TempDir()) / "gpspod_sysfs";
        fs::remove_all(root_);
        addNode("hidraw0", "HID_ID=0003:0000046D:0000C52B");
        addNode("hidraw3", "HID_ID=0003:00001493:00000020");
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    void addNode(const std::string& name, const std::string& hidId) {
        fs::create_directories(root_ / name / "device");
        std::ofstream uevent(root_ / name / "device" / "uevent");
        uevent << "DRIVER=hid-generic\n" << hidId << "\nHID_NAME=Test\n";
    }

    fs::path root_;
};

TEST_F(HidrawChannelTest, FindsPodBySysfsId) {
    auto path = HidrawChannel::findDevice(USB_VENDOR_ID, USB_PRODUCT_ID, root_.string());
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ("/dev/hidraw3", *path);
}

TEST_F(HidrawChannelTest, UnknownDeviceNotFound) {
    EXPECT_FALSE(HidrawChannel::findDevice(0x1234, 0x5678, root_.string()).has_value());
    EXPECT_FALSE(HidrawChannel::findDevice(USB_VENDOR_ID, USB_PRODUCT_ID, (root_ / "missing").string()).has_value());
}

TEST_F(HidrawChannelTest, OpenFailsForMissingNode) {
    HidrawChannel::Config config;
    config.path = (root_ / "no_such_node").string();
    HidrawChannel channel(config);

    auto result = channel.open();
    EXPECT_FALSE(result);
    EXPECT_EQ(ErrorCode::TRANSPORT_ERROR, result.errorCode);
    EXPECT_FALSE(channel.isOpen());
}

TEST_F(HidrawChannelTest, ClosedChannelRefusesIo) {
    HidrawChannel channel(HidrawChannel::Config{});

    EXPECT_EQ(ErrorCode::NOT_CONNECTED, channel.write(Bytes(64, 0)).errorCode);
    EXPECT_EQ(ErrorCode::NOT_CONNECTED, channel.read(64, std::chrono::milliseconds(1)).errorCode);
}
