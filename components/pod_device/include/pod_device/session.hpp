#pragma once

#include "pod_device/channel.hpp"
#include "pod_device/types.hpp"

#include "pod_protocol/message.hpp"
#include "pod_protocol/reassembly.hpp"

#include <chrono>
#include <functional>
#include <memory>

namespace pod_device {

/**
 * @class Session
 * @brief Request/reply exchange of messages over a packet channel
 *
 * Outgoing messages get an incrementing packet sequence and are split into
 * fragments; incoming packets go through a reassembly feed until a whole
 * message is available. The exchange is strictly half duplex.
 */
class Session {
public:
    /**
     * @brief Structure for session configuration
     */
    struct Config {
        std::chrono::milliseconds readTimeout{1000};  // whole reply
        std::chrono::milliseconds pollTimeout{100};   // single packet
        size_t retryCount = 10;
        std::chrono::milliseconds retryDelay{10};
        size_t packetSize = 64;
    };

    // Reply filter for transact(), returning false retries the request
    using ReplyCheck = std::function<bool(const pod_protocol::Message&)>;

    // Upper bound on the packets drain() throws away
    static constexpr size_t MAX_DRAIN_PACKETS = 4096;

    Session(std::shared_ptr<IChannel> channel, const Config& config);

    /**
     * @brief Send a message
     *
     * The packet sequence of the message is overwritten with the session's
     * next sequence number.
     */
    VoidResult writeMessage(pod_protocol::Message message);

    /**
     * @brief Wait for the next complete message
     * @return The message, TIMEOUT after readTimeout, or the channel error
     */
    Result<pod_protocol::Message> readMessage();

    /**
     * @brief Send a request and wait for a reply of the expected kind
     *
     * Transport errors, timeouts, replies of another kind and replies the
     * check rejects are retried up to retryCount times.
     *
     * @param request Message to send
     * @param expectedKind Kind the reply must have
     * @param check Optional extra validation of the reply
     * @return The reply, or RETRIES_EXHAUSTED with the last failure
     */
    Result<pod_protocol::Message> transact(const pod_protocol::Message& request,
                                           pod_protocol::MessageKind expectedKind,
                                           const ReplyCheck& check = nullptr);

    /**
     * @brief Throw away packets still queued from an earlier session
     * @return Number of packets discarded
     */
    size_t drain();
    static size_t drain(IChannel& channel, std::chrono::milliseconds pollTimeout, size_t packetSize = 64);

    const Config& config() const { return config_; }
    IChannel& channel() { return *channel_; }
    uint16_t nextSequence() const { return sequence_; }

private:
    std::shared_ptr<IChannel> channel_;
    Config config_;
    pod_protocol::ReassemblyFeed feed_;
    uint16_t sequence_ = 0;
};

} // namespace pod_device
