#include "pod_protocol/registry.hpp"
#include "pod_protocol/codec.hpp"
#include "pod_protocol/error.hpp"

namespace pod_protocol {

namespace {

const std::vector<MessageDescriptor> REGISTRY = {
    {MessageKind::DEVICE_INFO_REQUEST, "DeviceInfoRequest", command::DEVICE_INFO_REQUEST, direction::DEVICE_INFO_REQUEST, 0x0000, BodyType::DEVICE_INFO_REQUEST},
    {MessageKind::DEVICE_INFO_REPLY, "DeviceInfoReply", command::DEVICE_INFO_REPLY, direction::DEVICE_INFO_REPLY, DEFAULT_FORMAT, BodyType::DEVICE_INFO},
    {MessageKind::DEVICE_STATUS_REQUEST, "DeviceStatusRequest", command::DEVICE_STATUS, direction::REQUEST, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::DEVICE_STATUS_REPLY, "DeviceStatusReply", command::DEVICE_STATUS, direction::REPLY, DEFAULT_FORMAT, BodyType::DEVICE_STATUS},
    {MessageKind::LOG_COUNT_REQUEST, "LogCountRequest", command::LOG_COUNT, direction::REQUEST, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::LOG_COUNT_REPLY, "LogCountReply", command::LOG_COUNT, direction::REPLY, DEFAULT_FORMAT, BodyType::LOG_COUNT},
    {MessageKind::LOG_HEADER_REWIND_REQUEST, "LogHeaderRewindRequest", command::LOG_HEADER_REWIND, direction::REQUEST, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::LOG_HEADER_REWIND_REPLY, "LogHeaderRewindReply", command::LOG_HEADER_REWIND, direction::REPLY, DEFAULT_FORMAT, BodyType::LOG_STEP},
    {MessageKind::LOG_HEADER_STEP_REQUEST, "LogHeaderStepRequest", command::LOG_HEADER_STEP, direction::REQUEST, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::LOG_HEADER_STEP_REPLY, "LogHeaderStepReply", command::LOG_HEADER_STEP, direction::REPLY, DEFAULT_FORMAT, BodyType::LOG_STEP},
    {MessageKind::LOG_HEADER_ENTRY_REQUEST, "LogHeaderEntryRequest", command::LOG_HEADER_ENTRY, direction::REQUEST, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::LOG_HEADER_ENTRY_REPLY, "LogHeaderEntryReply", command::LOG_HEADER_ENTRY, direction::REPLY, DEFAULT_FORMAT, BodyType::LOG_ENTRY},
    {MessageKind::LOG_HEADER_PEEK_REQUEST, "LogHeaderPeekRequest", command::LOG_HEADER_PEEK, direction::REQUEST, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::LOG_HEADER_PEEK_REPLY, "LogHeaderPeekReply", command::LOG_HEADER_PEEK, direction::REPLY, DEFAULT_FORMAT, BodyType::LOG_STEP},
    {MessageKind::DATA_REQUEST, "DataRequest", command::DATA, direction::REQUEST, DEFAULT_FORMAT, BodyType::DATA_REQUEST},
    {MessageKind::DATA_REPLY, "DataReply", command::DATA, direction::REPLY, DEFAULT_FORMAT, BodyType::DATA_BLOCK},
    {MessageKind::SET_DATE_REQUEST, "SetDateRequest", command::SET_DATE, direction::REQUEST, DEFAULT_FORMAT, BodyType::DATE_TIME},
    {MessageKind::SET_DATE_REPLY, "SetDateReply", command::SET_DATE, direction::REPLY, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::SET_TIME_REQUEST, "SetTimeRequest", command::SET_TIME, direction::REQUEST, DEFAULT_FORMAT, BodyType::DATE_TIME},
    {MessageKind::SET_TIME_REPLY, "SetTimeReply", command::SET_TIME, direction::REPLY, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::LOCK_STATUS_REQUEST, "LockStatusRequest", command::LOCK_STATUS, direction::REQUEST, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::LOCK_STATUS_REPLY, "LockStatusReply", command::LOCK_STATUS, direction::STATUS_REPLY, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::READ_SETTINGS_REQUEST, "ReadSettingsRequest", command::READ_SETTINGS, direction::REQUEST, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::READ_SETTINGS_REPLY, "ReadSettingsReply", command::READ_SETTINGS, direction::REPLY, DEFAULT_FORMAT, BodyType::PERSONAL_SETTINGS},
    {MessageKind::WRITE_SETTINGS_REQUEST, "SetSettingsRequest", command::WRITE_SETTINGS, direction::REQUEST, DEFAULT_FORMAT, BodyType::PERSONAL_SETTINGS},
    {MessageKind::WRITE_SETTINGS_REPLY, "SetSettingsReply", command::WRITE_SETTINGS, direction::REPLY, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::ALPHA_REQUEST, "SetUnknownRequestAlpha", command::ALPHA, direction::REQUEST, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::ALPHA_REPLY, "SetUnknownReplyAlpha", command::ALPHA, direction::REPLY, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::WRITE_LOG_SETTINGS_REQUEST, "SetLogSettingsRequest", command::WRITE_LOG_SETTINGS, direction::REQUEST, DEFAULT_FORMAT, BodyType::LOG_SETTINGS},
    {MessageKind::WRITE_LOG_SETTINGS_REPLY, "SetLogSettingsReply", command::WRITE_LOG_SETTINGS, direction::REPLY, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::BRAVO_REQUEST, "SetUnknownRequestBravo", command::BRAVO, direction::REQUEST, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::BRAVO_REPLY, "SetUnknownReplyBravo", command::BRAVO, direction::REPLY, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::SEND_FIRMWARE_REQUEST, "SendFirmwareRequest", command::SEND_FIRMWARE, direction::REQUEST, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::SEND_FIRMWARE_REPLY, "SendFirmwareReply", command::SEND_FIRMWARE, direction::REPLY, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::RESET_REQUEST, "SendResetRequest", command::RESET, direction::REQUEST, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::RESET_REPLY, "SendResetReply", command::RESET, direction::REPLY, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::READ_SGEE_DATE_REQUEST, "ReadSGEEDateRequest", command::READ_SGEE_DATE, direction::REQUEST, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::READ_SGEE_DATE_REPLY, "ReadSGEEDateReply", command::READ_SGEE_DATE, direction::REPLY, DEFAULT_FORMAT, BodyType::SGEE_DATE},
    {MessageKind::WRITE_SGEE_DATA_REQUEST, "WriteSGEEDataRequest", command::WRITE_SGEE_DATA, direction::REQUEST, DEFAULT_FORMAT, BodyType::SGEE_DATA_BLOCK},
    {MessageKind::WRITE_SGEE_DATA_REPLY, "WriteSGEEDataReply", command::WRITE_SGEE_DATA, direction::REPLY, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::CHARLIE_REQUEST, "SetUnknownRequestCharlie", command::CHARLIE, direction::REQUEST, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::CHARLIE_REPLY, "SetUnknownReplyCharlie", command::CHARLIE, direction::STATUS_REPLY, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::DELTA_REQUEST, "SetUnknownRequestDelta", command::DELTA, direction::REQUEST, DEFAULT_FORMAT, BodyType::EMPTY},
    {MessageKind::DELTA_REPLY, "SetUnknownReplyDelta", command::DELTA, direction::REPLY, DEFAULT_FORMAT, BodyType::EMPTY},
};

} // namespace

std::string messageKindToString(MessageKind kind) {
    for (const auto& entry : REGISTRY) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return "Message";
}

std::string bodyTypeToString(BodyType type) {
    switch (type) {
        case BodyType::EMPTY:               return "empty";
        case BodyType::DEVICE_INFO_REQUEST: return "device_info_request";
        case BodyType::DEVICE_INFO:         return "device_info";
        case BodyType::DEVICE_STATUS:       return "device_status";
        case BodyType::DATE_TIME:           return "date_time";
        case BodyType::LOG_COUNT:           return "log_count";
        case BodyType::LOG_STEP:            return "log_header_step";
        case BodyType::LOG_ENTRY:           return "log_header_entry";
        case BodyType::DATA_REQUEST:        return "data_request";
        case BodyType::DATA_BLOCK:          return "data_reply";
        case BodyType::SGEE_DATA_BLOCK:     return "sgee_data";
        case BodyType::PERSONAL_SETTINGS:   return "personal_settings";
        case BodyType::LOG_SETTINGS:        return "log_settings";
        case BodyType::SGEE_DATE:           return "sgee_date";
        case BodyType::RAW:                 return "raw";
    }
    return "unknown";
}

const std::vector<MessageDescriptor>& MessageRegistry::entries() {
    return REGISTRY;
}

const MessageDescriptor* MessageRegistry::find(uint16_t command, uint16_t direction) {
    for (const auto& entry : REGISTRY) {
        if (entry.command == command && entry.direction == direction) {
            return &entry;
        }
    }
    for (const auto& entry : REGISTRY) {
        if (entry.command == command) {
            return &entry;
        }
    }
    return nullptr;
}

const MessageDescriptor& MessageRegistry::byKind(MessageKind kind) {
    for (const auto& entry : REGISTRY) {
        if (entry.kind == kind) {
            return entry;
        }
    }
    throw ValidationError("no descriptor for message kind " + std::to_string(static_cast<int>(kind)));
}

size_t MessageRegistry::fixedBodySize(BodyType type) {
    switch (type) {
        case BodyType::EMPTY:               return EmptyBody::SIZE;
        case BodyType::DEVICE_INFO_REQUEST: return DeviceInfoRequestBody::SIZE;
        case BodyType::DEVICE_INFO:         return DeviceInfoBody::SIZE;
        case BodyType::DEVICE_STATUS:       return DeviceStatusBody::SIZE;
        case BodyType::DATE_TIME:           return DateTimeBody::SIZE;
        case BodyType::LOG_COUNT:           return LogCountBody::SIZE;
        case BodyType::LOG_STEP:            return LogStepBody::SIZE;
        case BodyType::DATA_REQUEST:        return DataRequestBody::SIZE;
        case BodyType::DATA_BLOCK:          return DataBlockBody::SIZE;
        case BodyType::PERSONAL_SETTINGS:   return PersonalSettingsBody::SIZE;
        case BodyType::LOG_SETTINGS:        return LogSettingsBody::SIZE;
        case BodyType::SGEE_DATE:           return SgeeDateBody::SIZE;
        case BodyType::LOG_ENTRY:
        case BodyType::SGEE_DATA_BLOCK:
        case BodyType::RAW:                 return 0;
    }
    return 0;
}

Message::Body makeDefaultBody(BodyType type) {
    switch (type) {
        case BodyType::EMPTY:               return EmptyBody{};
        case BodyType::DEVICE_INFO_REQUEST: return DeviceInfoRequestBody{};
        case BodyType::DEVICE_INFO:         return DeviceInfoBody{};
        case BodyType::DEVICE_STATUS:       return DeviceStatusBody{};
        case BodyType::DATE_TIME:           return DateTimeBody{};
        case BodyType::LOG_COUNT:           return LogCountBody{};
        case BodyType::LOG_STEP:            return LogStepBody{};
        case BodyType::LOG_ENTRY:           return LogEntryBody{};
        case BodyType::DATA_REQUEST:        return DataRequestBody{};
        case BodyType::DATA_BLOCK:          return DataBlockBody{};
        case BodyType::SGEE_DATA_BLOCK:     return DataBlockBody{};
        case BodyType::PERSONAL_SETTINGS:   return PersonalSettingsBody::defaults();
        case BodyType::LOG_SETTINGS:        return LogSettingsBody::defaults();
        case BodyType::SGEE_DATE:           return SgeeDateBody{};
        case BodyType::RAW:                 return RawBody{};
    }
    return RawBody{};
}

Message makeMessage(MessageKind kind) {
    const auto& descriptor = MessageRegistry::byKind(kind);
    return makeMessage(kind, makeDefaultBody(descriptor.bodyType));
}

Message makeMessage(MessageKind kind, Message::Body body) {
    const auto& descriptor = MessageRegistry::byKind(kind);

    CommandHeader header;
    header.command = descriptor.command;
    header.direction = descriptor.direction;
    header.format = descriptor.format;

    Message message(kind, header, std::move(body));
    message.getHeader().bodyLength = static_cast<uint32_t>(encodedBodyLength(message));
    return message;
}

} // namespace pod_protocol
