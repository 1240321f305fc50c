#include "pod_device/hidraw_channel.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>

#include <fcntl.h>
#include <unistd.h>

namespace pod_device {

HidrawChannel::HidrawChannel(const Config& config)
    : config_(config),
      descriptor_(ioContext_) {
}

HidrawChannel::~HidrawChannel() {
    close();
}

std::optional<std::string> HidrawChannel::findDevice(uint16_t vendorId, uint16_t productId,
                                                     const std::string& sysfsRoot) {
    namespace fs = std::filesystem;

    // Bus type 3 is USB
    const std::string wanted = fmt::format("HID_ID=0003:{:08X}:{:08X}", vendorId, productId);

    std::error_code error;
    for (const auto& entry : fs::directory_iterator(sysfsRoot, error)) {
        std::ifstream uevent(entry.path() / "device" / "uevent");
        std::string line;
        while (std::getline(uevent, line)) {
            if (line == wanted) {
                return "/dev/" + entry.path().filename().string();
            }
        }
    }
    if (error) {
        spdlog::debug("Cannot list {}: {}", sysfsRoot, error.message());
    }
    return std::nullopt;
}

VoidResult HidrawChannel::open() {
    if (isOpen()) {
        return makeSuccessResult();
    }

    path_ = config_.path;
    if (path_.empty()) {
        auto found = findDevice(config_.vendorId, config_.productId);
        if (!found) {
            return makeErrorResult(ErrorCode::NOT_CONNECTED,
                                   fmt::format("No device {:04x}:{:04x} found", config_.vendorId, config_.productId));
        }
        path_ = *found;
    }

    int fd = ::open(path_.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) {
        return makeErrorResult(ErrorCode::TRANSPORT_ERROR,
                               fmt::format("Failed to open {}: {}", path_, std::strerror(errno)));
    }

    boost::system::error_code error;
    descriptor_.assign(fd, error);
    if (error) {
        ::close(fd);
        return makeErrorResult(ErrorCode::TRANSPORT_ERROR, "Failed to assign descriptor: " + error.message());
    }

    spdlog::info("Opened {}", path_);
    return makeSuccessResult();
}

void HidrawChannel::close() {
    if (descriptor_.is_open()) {
        boost::system::error_code error;
        descriptor_.close(error);
        if (error) {
            spdlog::warn("Error closing {}: {}", path_, error.message());
        }
    }
}

bool HidrawChannel::isOpen() const {
    return descriptor_.is_open();
}

VoidResult HidrawChannel::write(const Bytes& packet) {
    if (!isOpen()) {
        return makeErrorResult(ErrorCode::NOT_CONNECTED, "Channel is not open");
    }

    boost::system::error_code error;
    size_t written = boost::asio::write(descriptor_, boost::asio::buffer(packet), error);
    if (error) {
        return makeErrorResult(ErrorCode::TRANSPORT_ERROR, "Write failed: " + error.message());
    }
    if (written != packet.size()) {
        return makeErrorResult(ErrorCode::TRANSPORT_ERROR,
                               fmt::format("Short write, {} of {} bytes", written, packet.size()));
    }
    return makeSuccessResult();
}

Result<Bytes> HidrawChannel::read(size_t maxLength, std::chrono::milliseconds timeout) {
    if (!isOpen()) {
        return Result<Bytes>::error(ErrorCode::NOT_CONNECTED, "Channel is not open");
    }

    Bytes buffer(std::max(maxLength, config_.packetSize));
    boost::system::error_code readError;
    size_t received = 0;
    bool completed = false;

    descriptor_.async_read_some(boost::asio::buffer(buffer),
        [&](const boost::system::error_code& error, size_t bytesTransferred) {
            readError = error;
            received = bytesTransferred;
            completed = true;
        });

    ioContext_.restart();
    ioContext_.run_for(timeout);

    if (!completed) {
        // Let the aborted handler run before the buffer goes away
        boost::system::error_code cancelError;
        descriptor_.cancel(cancelError);
        if (cancelError) {
            spdlog::debug("Cancel on {} failed: {}", path_, cancelError.message());
        }
        ioContext_.restart();
        ioContext_.run();
        if (!completed || readError == boost::asio::error::operation_aborted) {
            return Result<Bytes>::error(ErrorCode::TIMEOUT, "No packet received");
        }
    }

    if (readError) {
        return Result<Bytes>::error(ErrorCode::TRANSPORT_ERROR, "Read failed: " + readError.message());
    }

    buffer.resize(std::min(received, maxLength));
    return Result<Bytes>::ok(buffer);
}

} // namespace pod_device
