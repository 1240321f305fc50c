#include "pod_device/session.hpp"

#include "pod_protocol/codec.hpp"
#include "pod_protocol/error.hpp"
#include "pod_protocol/fragment.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace pod_device {

using pod_protocol::Message;
using pod_protocol::MessageKind;

Session::Session(std::shared_ptr<IChannel> channel, const Config& config)
    : channel_(std::move(channel)),
      config_(config) {
}

VoidResult Session::writeMessage(Message message) {
    message.setPacketSequence(sequence_++);

    auto fragments = pod_protocol::encodeFragments(pod_protocol::encodeMessage(message));
    spdlog::debug("> {} ({} packets)", message.toString(), fragments.size());

    for (const auto& fragment : fragments) {
        auto result = channel_->write(fragment.toBytes());
        if (!result) {
            return result;
        }
    }
    return makeSuccessResult();
}

Result<Message> Session::readMessage() {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + config_.readTimeout;

    while (true) {
        const auto now = Clock::now();
        if (now >= deadline) {
            return Result<Message>::error(ErrorCode::TIMEOUT,
                fmt::format("No message within {} ms", config_.readTimeout.count()));
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto packet = channel_->read(config_.packetSize, std::min(config_.pollTimeout, remaining));
        if (!packet) {
            if (packet.errorCode == ErrorCode::TIMEOUT) {
                continue;
            }
            return Result<Message>::error(packet.errorCode, packet.errorMessage);
        }

        auto assembled = feed_.feed(pod_protocol::decodeFragment(packet.value));
        if (!assembled) {
            continue;
        }

        try {
            Message message = pod_protocol::decodeMessage(*assembled);
            spdlog::debug("< {}", message.toString());
            return Result<Message>::ok(message);
        } catch (const pod_protocol::ParseError& e) {
            spdlog::warn("Dropping undecodable message: {}", e.what());
        }
    }
}

Result<Message> Session::transact(const Message& request, MessageKind expectedKind, const ReplyCheck& check) {
    const size_t attempts = std::max<size_t>(config_.retryCount, 1);
    ErrorCode lastCode = ErrorCode::TIMEOUT;
    std::string lastError = "no attempt made";

    for (size_t attempt = 1; attempt <= attempts; ++attempt) {
        if (attempt > 1) {
            spdlog::debug("Retrying {} ({}/{}): {}", request.getName(), attempt, attempts, lastError);
            std::this_thread::sleep_for(config_.retryDelay);
        }

        auto written = writeMessage(request);
        if (!written) {
            lastCode = written.errorCode;
            lastError = written.errorMessage;
            continue;
        }

        auto reply = readMessage();
        if (!reply) {
            lastCode = reply.errorCode;
            lastError = reply.errorMessage;
            continue;
        }

        if (reply.value.getKind() != expectedKind) {
            lastCode = ErrorCode::UNEXPECTED_REPLY;
            lastError = fmt::format("expected {}, got {}",
                                    pod_protocol::messageKindToString(expectedKind), reply.value.getName());
            continue;
        }

        if (check && !check(reply.value)) {
            lastCode = ErrorCode::UNEXPECTED_REPLY;
            lastError = fmt::format("{} rejected: {}", reply.value.getName(), reply.value.toString());
            continue;
        }

        return reply;
    }

    spdlog::warn("{} failed after {} attempts ({}): {}",
                 request.getName(), attempts, errorCodeToString(lastCode), lastError);
    return Result<Message>::error(ErrorCode::RETRIES_EXHAUSTED,
        fmt::format("{} failed after {} attempts: {}", request.getName(), attempts, lastError));
}

size_t Session::drain() {
    feed_.reset();
    return drain(*channel_, config_.pollTimeout, config_.packetSize);
}

size_t Session::drain(IChannel& channel, std::chrono::milliseconds pollTimeout, size_t packetSize) {
    size_t discarded = 0;
    while (discarded < MAX_DRAIN_PACKETS) {
        auto packet = channel.read(packetSize, pollTimeout);
        if (!packet) {
            break;
        }
        ++discarded;
    }
    if (discarded > 0) {
        spdlog::info("Discarded {} stale packets", discarded);
    }
    return discarded;
}

} // namespace pod_device
