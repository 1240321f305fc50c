#pragma once

#include "pod_device/channel.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace pod_device {

/**
 * @brief A packet with the time it crossed the wire, in seconds
 */
struct TimedPacket {
    double time = 0.0;
    Bytes data;
};

/**
 * @brief USB traffic of one session, both directions
 *
 * Stored as {"incoming": [[time, base64], ...], "outgoing": [...]}, gzip
 * compressed when the file name ends in ".gz".
 */
struct Recording {
    std::vector<TimedPacket> incoming;
    std::vector<TimedPacket> outgoing;

    nlohmann::json toJson() const;
    static Recording fromJson(const nlohmann::json& json);

    /**
     * @brief Read a recording file
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static Recording load(const std::string& path);

    /**
     * @brief Write the recording to a file
     * @throws std::runtime_error if the file cannot be written
     */
    void save(const std::string& path) const;
};

std::string base64Encode(const Bytes& data);
Bytes base64Decode(const std::string& text);

/**
 * @brief Channel decorator that records every packet passing through
 */
class RecordingChannel : public IChannel {
public:
    explicit RecordingChannel(std::shared_ptr<IChannel> channel);

    VoidResult open() override;
    void close() override;
    bool isOpen() const override;

    VoidResult write(const Bytes& packet) override;
    Result<Bytes> read(size_t maxLength, std::chrono::milliseconds timeout) override;

    const Recording& recording() const { return recording_; }

    /**
     * @brief Save what was recorded so far
     */
    void save(const std::string& path) const { recording_.save(path); }

private:
    double now() const;

    std::shared_ptr<IChannel> channel_;
    Recording recording_;
};

/**
 * @brief Channel playing back a recording instead of talking to a device
 *
 * Reads hand out the recorded incoming packets in order and time out once
 * they are used up. Writes are compared against the recorded outgoing
 * packets; differences are logged and counted but do not fail.
 */
class ReplayChannel : public IChannel {
public:
    explicit ReplayChannel(Recording recording);

    VoidResult open() override;
    void close() override;
    bool isOpen() const override { return open_; }

    VoidResult write(const Bytes& packet) override;
    Result<Bytes> read(size_t maxLength, std::chrono::milliseconds timeout) override;

    size_t mismatches() const { return mismatches_; }
    size_t excessWrites() const { return excessWrites_; }
    size_t remainingIncoming() const { return recording_.incoming.size() - incomingIndex_; }

private:
    Recording recording_;
    size_t incomingIndex_ = 0;
    size_t outgoingIndex_ = 0;
    size_t mismatches_ = 0;
    size_t excessWrites_ = 0;
    bool open_ = false;
};

} // namespace pod_device
