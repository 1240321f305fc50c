#pragma once

#include "pod_device/channel.hpp"
#include "pod_device/session.hpp"

#include "pod_protocol/codec.hpp"
#include "pod_protocol/fragment.hpp"
#include "pod_protocol/reassembly.hpp"
#include "pod_protocol/registry.hpp"

#include <gmock/gmock.h>

#include <deque>
#include <functional>
#include <vector>

namespace pod_device {
namespace test {

class MockChannel : public IChannel {
public:
    MOCK_METHOD(VoidResult, open, (), (override));
    MOCK_METHOD(void, close, (), (override));
    MOCK_METHOD(bool, isOpen, (), (const, override));
    MOCK_METHOD(VoidResult, write, (const Bytes& packet), (override));
    MOCK_METHOD(Result<Bytes>, read, (size_t maxLength, std::chrono::milliseconds timeout), (override));
};

/**
 * @brief Channel emulating the pod
 *
 * Reassembles written packets into requests and queues the packets of the
 * replies the responder returns. Reads never block.
 */
class FakePodChannel : public IChannel {
public:
    using Responder = std::function<std::vector<pod_protocol::Message>(const pod_protocol::Message&)>;

    explicit FakePodChannel(Responder responder = nullptr) : responder_(std::move(responder)) {}

    VoidResult open() override {
        open_ = true;
        return makeSuccessResult();
    }
    void close() override { open_ = false; }
    bool isOpen() const override { return open_; }

    VoidResult write(const Bytes& packet) override {
        auto assembled = requestFeed_.feed(pod_protocol::decodeFragment(packet));
        if (!assembled) {
            return makeSuccessResult();
        }

        pod_protocol::Message request = pod_protocol::decodeMessage(*assembled);
        requests.push_back(request);
        if (responder_) {
            for (const auto& reply : responder_(request)) {
                queueMessage(reply);
            }
        }
        return makeSuccessResult();
    }

    Result<Bytes> read(size_t maxLength, std::chrono::milliseconds) override {
        if (pending_.empty()) {
            return Result<Bytes>::error(ErrorCode::TIMEOUT, "nothing queued");
        }
        Bytes packet = pending_.front();
        pending_.pop_front();
        if (packet.size() > maxLength) {
            packet.resize(maxLength);
        }
        return Result<Bytes>::ok(packet);
    }

    void queuePacket(const Bytes& packet) { pending_.push_back(packet); }

    void queueMessage(const pod_protocol::Message& message) {
        for (const auto& fragment : pod_protocol::encodeFragments(pod_protocol::encodeMessage(message))) {
            pending_.push_back(fragment.toBytes());
        }
    }

    size_t queuedPackets() const { return pending_.size(); }

    std::vector<pod_protocol::Message> requests;

private:
    Responder responder_;
    pod_protocol::ReassemblyFeed requestFeed_;
    std::deque<Bytes> pending_;
    bool open_ = false;
};

// Reply kind the pod sends for each request kind
inline pod_protocol::MessageKind replyKindFor(pod_protocol::MessageKind request) {
    return static_cast<pod_protocol::MessageKind>(static_cast<int>(request) + 1);
}

// Session settings that keep timeouts short in tests
inline Session::Config fastSessionConfig(size_t retryCount = 3) {
    Session::Config config;
    config.readTimeout = std::chrono::milliseconds(20);
    config.pollTimeout = std::chrono::milliseconds(5);
    config.retryCount = retryCount;
    config.retryDelay = std::chrono::milliseconds(0);
    return config;
}

} // namespace test
} // namespace pod_device
