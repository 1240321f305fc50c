#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pod_protocol {

// Raw byte buffer used throughout the stack
using Bytes = std::vector<uint8_t>;

// USB HID report framing
constexpr size_t PACKET_SIZE = 64;
constexpr size_t FRAGMENT_HEADER_SIZE = 8;
constexpr size_t FRAGMENT_CRC_SIZE = 2;
constexpr size_t FRAGMENT_PAYLOAD_AREA = PACKET_SIZE - FRAGMENT_HEADER_SIZE;
constexpr size_t MAX_FRAGMENT_DATA = FRAGMENT_PAYLOAD_AREA - FRAGMENT_CRC_SIZE;
constexpr uint8_t FRAGMENT_MAGIC = 0x3F;

// Part marker byte of a fragment header
enum class PartMarker : uint8_t {
    FIRST = 0x5D,
    CONTINUATION = 0x5E
};

// Command layer
constexpr size_t COMMAND_HEADER_SIZE = 12;
constexpr size_t MAX_MESSAGE_SIZE = 540;
constexpr uint16_t DEFAULT_FORMAT = 0x0009;

// Size of a single memory transfer
constexpr uint32_t DATA_BLOCK_SIZE = 512;

namespace direction {
constexpr uint16_t REQUEST = 0x0005;
constexpr uint16_t REPLY = 0x000A;
constexpr uint16_t DEVICE_INFO_REQUEST = 0x0001;
constexpr uint16_t DEVICE_INFO_REPLY = 0x0002;
constexpr uint16_t STATUS_REPLY = 0x0202;
} // namespace direction

namespace command {
constexpr uint16_t DEVICE_INFO_REQUEST = 0x0000;
constexpr uint16_t DEVICE_INFO_REPLY = 0x0200;
constexpr uint16_t DEVICE_STATUS = 0x0603;
constexpr uint16_t LOG_COUNT = 0x060B;
constexpr uint16_t LOG_HEADER_REWIND = 0x070B;
constexpr uint16_t LOG_HEADER_PEEK = 0x080B;
constexpr uint16_t LOG_HEADER_STEP = 0x0A0B;
constexpr uint16_t LOG_HEADER_ENTRY = 0x0B0B;
constexpr uint16_t DATA = 0x0007;
constexpr uint16_t SET_DATE = 0x0203;
constexpr uint16_t SET_TIME = 0x0003;
constexpr uint16_t LOCK_STATUS = 0x190B;
constexpr uint16_t READ_SETTINGS = 0x000B;
constexpr uint16_t WRITE_SETTINGS = 0x010B;
constexpr uint16_t ALPHA = 0x0F0B;
constexpr uint16_t WRITE_LOG_SETTINGS = 0x100B;
constexpr uint16_t BRAVO = 0x110B;
constexpr uint16_t SEND_FIRMWARE = 0x010E;
constexpr uint16_t RESET = 0x0002;
constexpr uint16_t READ_SGEE_DATE = 0x150B;
constexpr uint16_t WRITE_SGEE_DATA = 0x120B;
constexpr uint16_t CHARLIE = 0x260B;
constexpr uint16_t DELTA = 0x140B;
} // namespace command

// Step value returned by a log header peek once every log has been visited
constexpr uint32_t LOG_PEEK_END = 0x0C00;

/**
 * @brief Every message kind known to the registry
 */
enum class MessageKind {
    DEVICE_INFO_REQUEST,
    DEVICE_INFO_REPLY,
    DEVICE_STATUS_REQUEST,
    DEVICE_STATUS_REPLY,
    LOG_COUNT_REQUEST,
    LOG_COUNT_REPLY,
    LOG_HEADER_REWIND_REQUEST,
    LOG_HEADER_REWIND_REPLY,
    LOG_HEADER_STEP_REQUEST,
    LOG_HEADER_STEP_REPLY,
    LOG_HEADER_ENTRY_REQUEST,
    LOG_HEADER_ENTRY_REPLY,
    LOG_HEADER_PEEK_REQUEST,
    LOG_HEADER_PEEK_REPLY,
    DATA_REQUEST,
    DATA_REPLY,
    SET_DATE_REQUEST,
    SET_DATE_REPLY,
    SET_TIME_REQUEST,
    SET_TIME_REPLY,
    LOCK_STATUS_REQUEST,
    LOCK_STATUS_REPLY,
    READ_SETTINGS_REQUEST,
    READ_SETTINGS_REPLY,
    WRITE_SETTINGS_REQUEST,
    WRITE_SETTINGS_REPLY,
    ALPHA_REQUEST,
    ALPHA_REPLY,
    WRITE_LOG_SETTINGS_REQUEST,
    WRITE_LOG_SETTINGS_REPLY,
    BRAVO_REQUEST,
    BRAVO_REPLY,
    SEND_FIRMWARE_REQUEST,
    SEND_FIRMWARE_REPLY,
    RESET_REQUEST,
    RESET_REPLY,
    READ_SGEE_DATE_REQUEST,
    READ_SGEE_DATE_REPLY,
    WRITE_SGEE_DATA_REQUEST,
    WRITE_SGEE_DATA_REPLY,
    CHARLIE_REQUEST,
    CHARLIE_REPLY,
    DELTA_REQUEST,
    DELTA_REPLY,
    UNKNOWN
};

/**
 * @brief Shape of the body that follows the command header
 */
enum class BodyType {
    EMPTY,
    DEVICE_INFO_REQUEST,
    DEVICE_INFO,
    DEVICE_STATUS,
    DATE_TIME,
    LOG_COUNT,
    LOG_STEP,
    LOG_ENTRY,
    DATA_REQUEST,
    DATA_BLOCK,
    SGEE_DATA_BLOCK,
    PERSONAL_SETTINGS,
    LOG_SETTINGS,
    SGEE_DATE,
    RAW
};

// Human readable name of a message kind
std::string messageKindToString(MessageKind kind);

// Human readable name of a body type
std::string bodyTypeToString(BodyType type);

} // namespace pod_protocol
