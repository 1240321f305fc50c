#include "pod_device/device.hpp"

#include "pod_protocol/registry.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>

namespace pod_device {

using pod_protocol::Message;
using pod_protocol::MessageKind;
using pod_protocol::makeMessage;

GpsPod::GpsPod(std::shared_ptr<Session> session)
    : session_(std::move(session)) {
}

Result<pod_protocol::DeviceInfoBody> GpsPod::deviceInfo() {
    auto reply = session_->transact(makeMessage(MessageKind::DEVICE_INFO_REQUEST), MessageKind::DEVICE_INFO_REPLY);
    if (!reply) {
        return Result<pod_protocol::DeviceInfoBody>::error(reply.errorCode, reply.errorMessage);
    }
    return Result<pod_protocol::DeviceInfoBody>::ok(reply.value.getBodyAs<pod_protocol::DeviceInfoBody>());
}

Result<pod_protocol::DeviceStatusBody> GpsPod::deviceStatus() {
    auto reply = session_->transact(makeMessage(MessageKind::DEVICE_STATUS_REQUEST), MessageKind::DEVICE_STATUS_REPLY);
    if (!reply) {
        return Result<pod_protocol::DeviceStatusBody>::error(reply.errorCode, reply.errorMessage);
    }
    return Result<pod_protocol::DeviceStatusBody>::ok(reply.value.getBodyAs<pod_protocol::DeviceStatusBody>());
}

Result<uint16_t> GpsPod::logCount() {
    auto reply = session_->transact(makeMessage(MessageKind::LOG_COUNT_REQUEST), MessageKind::LOG_COUNT_REPLY);
    if (!reply) {
        return Result<uint16_t>::error(reply.errorCode, reply.errorMessage);
    }
    return Result<uint16_t>::ok(reply.value.getBodyAs<pod_protocol::LogCountBody>().logCount);
}

Result<pod_protocol::PersonalSettingsBody> GpsPod::readSettings() {
    auto reply = session_->transact(makeMessage(MessageKind::READ_SETTINGS_REQUEST), MessageKind::READ_SETTINGS_REPLY);
    if (!reply) {
        return Result<pod_protocol::PersonalSettingsBody>::error(reply.errorCode, reply.errorMessage);
    }
    return Result<pod_protocol::PersonalSettingsBody>::ok(
        reply.value.getBodyAs<pod_protocol::PersonalSettingsBody>());
}

VoidResult GpsPod::writeSettings(const pod_protocol::PersonalSettingsBody& settings) {
    auto reply = session_->transact(makeMessage(MessageKind::WRITE_SETTINGS_REQUEST, settings),
                                    MessageKind::WRITE_SETTINGS_REPLY);
    if (!reply) {
        return makeErrorResult(reply.errorCode, reply.errorMessage);
    }
    return makeSuccessResult();
}

VoidResult GpsPod::setSounds(bool enabled) {
    auto settings = readSettings();
    if (!settings) {
        return makeErrorResult(settings.errorCode, settings.errorMessage);
    }

    settings.value.setSounds(enabled);
    spdlog::info("Switching sounds {}", enabled ? "on" : "off");
    return writeSettings(settings.value);
}

VoidResult GpsPod::step(const char* name, const Message& request, MessageKind reply) {
    auto result = session_->transact(request, reply);
    if (!result) {
        return makeErrorResult(ErrorCode::TRANSACTION_FAILED,
                               fmt::format("{} step failed: {}", name, result.errorMessage));
    }
    return makeSuccessResult();
}

VoidResult GpsPod::writeLogSettings(const pod_protocol::LogSettingsBody& settings) {
    spdlog::info("Writing log settings: {}", settings.toString());

    auto result = step("Alpha", makeMessage(MessageKind::ALPHA_REQUEST), MessageKind::ALPHA_REPLY);
    if (!result) {
        return result;
    }

    result = step("SetLogSettings", makeMessage(MessageKind::WRITE_LOG_SETTINGS_REQUEST, settings),
                  MessageKind::WRITE_LOG_SETTINGS_REPLY);
    if (!result) {
        return result;
    }

    return step("Bravo", makeMessage(MessageKind::BRAVO_REQUEST), MessageKind::BRAVO_REPLY);
}

Result<pod_protocol::SgeeDateBody> GpsPod::readSgeeDate() {
    auto reply = session_->transact(makeMessage(MessageKind::READ_SGEE_DATE_REQUEST), MessageKind::READ_SGEE_DATE_REPLY);
    if (!reply) {
        return Result<pod_protocol::SgeeDateBody>::error(reply.errorCode, reply.errorMessage);
    }
    return Result<pod_protocol::SgeeDateBody>::ok(reply.value.getBodyAs<pod_protocol::SgeeDateBody>());
}

VoidResult GpsPod::lockStatus() {
    auto reply = session_->transact(makeMessage(MessageKind::LOCK_STATUS_REQUEST), MessageKind::LOCK_STATUS_REPLY);
    if (!reply) {
        return makeErrorResult(reply.errorCode, reply.errorMessage);
    }
    return makeSuccessResult();
}

VoidResult GpsPod::setDateTime(std::chrono::system_clock::time_point time) {
    auto sinceEpoch = time.time_since_epoch();
    std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(sinceEpoch).count() % 1000;

    std::tm local{};
    if (localtime_r(&seconds, &local) == nullptr) {
        return makeErrorResult(ErrorCode::INVALID_ARGUMENT, "Cannot convert time to local time");
    }

    pod_protocol::DateTimeBody body;
    body.year = static_cast<uint16_t>(local.tm_year + 1900);
    body.month = static_cast<uint8_t>(local.tm_mon + 1);
    body.day = static_cast<uint8_t>(local.tm_mday);
    body.hour = static_cast<uint8_t>(local.tm_hour);
    body.minute = static_cast<uint8_t>(local.tm_min);
    body.millisecond = static_cast<uint16_t>(local.tm_sec * 1000 + milliseconds);

    spdlog::info("Setting time to {}", body.toString());

    auto result = step("SetDate", makeMessage(MessageKind::SET_DATE_REQUEST, body), MessageKind::SET_DATE_REPLY);
    if (!result) {
        return result;
    }
    return step("SetTime", makeMessage(MessageKind::SET_TIME_REQUEST, body), MessageKind::SET_TIME_REPLY);
}

VoidResult GpsPod::writeSgee(const Bytes& data) {
    if (data.empty()) {
        return makeErrorResult(ErrorCode::INVALID_ARGUMENT, "No SGEE data given");
    }

    const size_t chunks = (data.size() + SGEE_CHUNK_SIZE - 1) / SGEE_CHUNK_SIZE;
    spdlog::info("Uploading {} bytes of SGEE data in {} chunks", data.size(), chunks);

    for (size_t position = 0; position < data.size(); position += SGEE_CHUNK_SIZE) {
        const size_t length = std::min(SGEE_CHUNK_SIZE, data.size() - position);

        pod_protocol::DataBlockBody chunk;
        chunk.position = static_cast<uint32_t>(position);
        chunk.length = static_cast<uint32_t>(length);
        chunk.data.assign(data.begin() + position, data.begin() + position + length);

        auto reply = session_->transact(makeMessage(MessageKind::WRITE_SGEE_DATA_REQUEST, chunk),
                                        MessageKind::WRITE_SGEE_DATA_REPLY);
        if (!reply) {
            return makeErrorResult(ErrorCode::TRANSACTION_FAILED,
                fmt::format("SGEE chunk at 0x{:X} failed: {}", position, reply.errorMessage));
        }
    }

    return step("Delta", makeMessage(MessageKind::DELTA_REQUEST), MessageKind::DELTA_REPLY);
}

VoidResult GpsPod::reset() {
    auto reply = session_->transact(makeMessage(MessageKind::RESET_REQUEST), MessageKind::RESET_REPLY);
    if (!reply) {
        return makeErrorResult(reply.errorCode, reply.errorMessage);
    }
    return makeSuccessResult();
}

Result<std::vector<pod_protocol::LogEntryBody>> GpsPod::readLogHeaders() {
    using Headers = std::vector<pod_protocol::LogEntryBody>;

    auto count = logCount();
    if (!count) {
        return Result<Headers>::error(count.errorCode, count.errorMessage);
    }

    auto rewind = session_->transact(makeMessage(MessageKind::LOG_HEADER_REWIND_REQUEST),
                                     MessageKind::LOG_HEADER_REWIND_REPLY);
    if (!rewind) {
        return Result<Headers>::error(rewind.errorCode, rewind.errorMessage);
    }

    Headers headers;
    for (uint16_t index = 0; index < count.value; ++index) {
        auto stepped = session_->transact(makeMessage(MessageKind::LOG_HEADER_STEP_REQUEST),
                                          MessageKind::LOG_HEADER_STEP_REPLY);
        if (!stepped) {
            return Result<Headers>::error(stepped.errorCode, stepped.errorMessage);
        }

        auto entry = session_->transact(makeMessage(MessageKind::LOG_HEADER_ENTRY_REQUEST),
                                        MessageKind::LOG_HEADER_ENTRY_REPLY);
        if (!entry) {
            return Result<Headers>::error(entry.errorCode, entry.errorMessage);
        }
        headers.push_back(entry.value.getBodyAs<pod_protocol::LogEntryBody>());

        auto peek = session_->transact(makeMessage(MessageKind::LOG_HEADER_PEEK_REQUEST),
                                       MessageKind::LOG_HEADER_PEEK_REPLY);
        if (!peek) {
            return Result<Headers>::error(peek.errorCode, peek.errorMessage);
        }
        if (peek.value.getBodyAs<pod_protocol::LogStepBody>().step == pod_protocol::LOG_PEEK_END) {
            break;
        }
    }

    spdlog::info("Read {} of {} log headers", headers.size(), count.value);
    return Result<Headers>::ok(headers);
}

VoidResult GpsPod::transferBlock(size_t blockIndex, Bytes& out) {
    pod_protocol::DataRequestBody request;
    request.position = static_cast<uint32_t>(blockIndex * pod_protocol::DATA_BLOCK_SIZE);
    request.length = pod_protocol::DATA_BLOCK_SIZE;

    auto reply = session_->transact(makeMessage(MessageKind::DATA_REQUEST, request), MessageKind::DATA_REPLY,
        [&request](const Message& message) {
            const auto& block = message.getBodyAs<pod_protocol::DataBlockBody>();
            return block.position == request.position;
        });
    if (!reply) {
        return makeErrorResult(ErrorCode::BLOCK_UNAVAILABLE,
                               fmt::format("Block {} unavailable: {}", blockIndex, reply.errorMessage));
    }

    const auto& block = reply.value.getBodyAs<pod_protocol::DataBlockBody>();
    out = block.data;
    out.resize(pod_protocol::DATA_BLOCK_SIZE, 0);
    return makeSuccessResult();
}

VoidResult GpsPod::dumpFilesystem(pmem_decoder::MemoryImage& image, const ProgressCallback& progress) {
    const size_t blockCount = image.size() / pmem_decoder::BLOCK_SIZE;
    spdlog::info("Dumping {} blocks", blockCount);

    for (size_t index = 0; index < blockCount; ++index) {
        const size_t offset = index * pmem_decoder::BLOCK_SIZE;
        if (!image.haveData(offset, pmem_decoder::BLOCK_SIZE)) {
            Bytes block;
            auto result = transferBlock(index, block);
            if (!result) {
                return result;
            }
            image.store(offset, block);
        }
        if (progress) {
            progress(index + 1, blockCount);
        }
    }
    return makeSuccessResult();
}

bool GpsPod::fetchBlock(size_t blockIndex, Bytes& out, std::string& error) {
    auto result = transferBlock(blockIndex, out);
    if (!result) {
        error = result.errorMessage;
        return false;
    }
    return true;
}

} // namespace pod_device
