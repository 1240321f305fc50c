#include "pod_protocol/codec.hpp"
#include "pod_protocol/error.hpp"
#include "pod_protocol/registry.hpp"

#include <boost/endian/conversion.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace pod_protocol {

namespace {

bool isVariableDataBlock(const Message& message) {
    if (message.getKind() == MessageKind::UNKNOWN) {
        return false;
    }
    return MessageRegistry::byKind(message.getKind()).bodyType == BodyType::SGEE_DATA_BLOCK;
}

CommandHeader parseCommandHeader(const uint8_t* data) {
    CommandHeader header;
    header.command = boost::endian::load_little_u16(data);
    header.direction = boost::endian::load_little_u16(data + 2);
    header.format = boost::endian::load_little_u16(data + 4);
    header.packetSequence = boost::endian::load_little_u16(data + 6);
    header.bodyLength = boost::endian::load_little_u32(data + 8);
    return header;
}

// Decode a body of the given shape, reporting how many bytes it covers
Message::Body decodeBody(BodyType type, const uint8_t* data, size_t length, size_t& consumed) {
    const size_t fixed = MessageRegistry::fixedBodySize(type);
    consumed = std::min(length, fixed);

    switch (type) {
        case BodyType::EMPTY:
            return EmptyBody::decode(data, length);
        case BodyType::DEVICE_INFO_REQUEST:
            return DeviceInfoRequestBody::decode(data, length);
        case BodyType::DEVICE_INFO:
            return DeviceInfoBody::decode(data, length);
        case BodyType::DEVICE_STATUS:
            return DeviceStatusBody::decode(data, length);
        case BodyType::DATE_TIME:
            return DateTimeBody::decode(data, length);
        case BodyType::LOG_COUNT:
            return LogCountBody::decode(data, length);
        case BodyType::LOG_STEP:
            return LogStepBody::decode(data, length);
        case BodyType::DATA_REQUEST:
            return DataRequestBody::decode(data, length);
        case BodyType::DATA_BLOCK:
            return DataBlockBody::decode(data, length);
        case BodyType::PERSONAL_SETTINGS:
            return PersonalSettingsBody::decode(data, length);
        case BodyType::LOG_SETTINGS:
            return LogSettingsBody::decode(data, length);
        case BodyType::SGEE_DATE:
            return SgeeDateBody::decode(data, length);
        case BodyType::LOG_ENTRY:
            consumed = std::min(length, LogEntryBody::PREFIX_SIZE + LogEntryBody::MAX_DATA);
            return LogEntryBody::decode(data, length);
        case BodyType::SGEE_DATA_BLOCK:
            consumed = length;
            return DataBlockBody::decodeVariable(data, length);
        case BodyType::RAW:
        default:
            consumed = length;
            return RawBody::decode(data, length);
    }
}

} // namespace

Bytes encodeBody(const Message& message) {
    if (isVariableDataBlock(message) && message.holds<DataBlockBody>()) {
        return message.getBodyAs<DataBlockBody>().encodeVariable();
    }
    return std::visit([](const auto& body) { return body.encode(); }, message.getBody());
}

size_t encodedBodyLength(const Message& message) {
    return encodeBody(message).size() + message.getTrailing().size();
}

Bytes encodeMessage(const Message& message) {
    const Bytes body = encodeBody(message);
    const auto& header = message.getHeader();
    const auto& trailing = message.getTrailing();

    Bytes bytes(COMMAND_HEADER_SIZE, 0);
    boost::endian::store_little_u16(bytes.data(), header.command);
    boost::endian::store_little_u16(bytes.data() + 2, header.direction);
    boost::endian::store_little_u16(bytes.data() + 4, header.format);
    boost::endian::store_little_u16(bytes.data() + 6, header.packetSequence);
    boost::endian::store_little_u32(bytes.data() + 8, static_cast<uint32_t>(body.size() + trailing.size()));

    bytes.reserve(COMMAND_HEADER_SIZE + body.size() + trailing.size());
    bytes.insert(bytes.end(), body.begin(), body.end());
    bytes.insert(bytes.end(), trailing.begin(), trailing.end());
    return bytes;
}

Message decodeMessage(const uint8_t* data, size_t length) {
    if (data == nullptr || length < COMMAND_HEADER_SIZE) {
        throw ParseError("message too small: " + std::to_string(length) + " bytes");
    }

    const CommandHeader header = parseCommandHeader(data);
    const MessageDescriptor* descriptor = MessageRegistry::find(header.command, header.direction);

    MessageKind kind = MessageKind::UNKNOWN;
    BodyType bodyType = BodyType::RAW;
    if (descriptor != nullptr) {
        kind = descriptor->kind;
        bodyType = descriptor->bodyType;
        if (descriptor->direction != header.direction) {
            spdlog::debug("No exact match for cmd 0x{:04X} dir 0x{:04X}, using {}",
                          header.command, header.direction, descriptor->name);
        }
    } else {
        spdlog::debug("Unknown command 0x{:04X} dir 0x{:04X}, keeping raw body", header.command, header.direction);
    }

    const uint8_t* bodyData = data + COMMAND_HEADER_SIZE;
    const size_t bodyLength = length - COMMAND_HEADER_SIZE;

    size_t consumed = 0;
    Message::Body body = decodeBody(bodyType, bodyData, bodyLength, consumed);

    Bytes trailing(bodyData + consumed, bodyData + bodyLength);
    return Message(kind, header, std::move(body), std::move(trailing));
}

Message decodeMessage(const Bytes& data) {
    return decodeMessage(data.data(), data.size());
}

} // namespace pod_protocol
