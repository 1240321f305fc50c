#include "pod_protocol/bodies.hpp"
#include "pod_protocol/error.hpp"

#include <boost/endian/conversion.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cstring>

namespace pod_protocol {

using boost::endian::load_little_u16;
using boost::endian::load_little_u32;
using boost::endian::store_little_u16;
using boost::endian::store_little_u32;

namespace {

// Copy at most N bytes into a zero filled array
template<size_t N>
std::array<uint8_t, N> padded(const uint8_t* data, size_t length) {
    std::array<uint8_t, N> bytes{};
    if (data != nullptr && length > 0) {
        std::memcpy(bytes.data(), data, std::min(length, N));
    }
    return bytes;
}

std::string trimmedString(const std::array<char, 16>& chars) {
    auto end = std::find(chars.begin(), chars.end(), '\0');
    return decodeText(chars.data(), static_cast<size_t>(end - chars.begin()));
}

std::string versionString(const std::array<uint8_t, 4>& v) {
    return fmt::format("{}.{}.{}.{}", v[0], v[1], v[2], v[3]);
}

} // namespace

// EmptyBody

EmptyBody EmptyBody::decode(const uint8_t*, size_t) {
    return EmptyBody{};
}

// DeviceInfoRequestBody

DeviceInfoRequestBody DeviceInfoRequestBody::decode(const uint8_t* data, size_t length) {
    DeviceInfoRequestBody body;
    body.version = padded<SIZE>(data, length);
    return body;
}

Bytes DeviceInfoRequestBody::encode() const {
    return Bytes(version.begin(), version.end());
}

nlohmann::json DeviceInfoRequestBody::toJson() const {
    return {{"version", versionString(version)}};
}

std::string DeviceInfoRequestBody::toString() const {
    return fmt::format("version: {:02d}.{:02d}.{:02d}.{:02d}", version[0], version[1], version[2], version[3]);
}

// DeviceInfoBody

std::string DeviceInfoBody::getModel() const {
    return trimmedString(model);
}

std::string DeviceInfoBody::getSerial() const {
    return trimmedString(serial);
}

DeviceInfoBody DeviceInfoBody::decode(const uint8_t* data, size_t length) {
    auto bytes = padded<SIZE>(data, length);
    DeviceInfoBody body;
    std::memcpy(body.model.data(), bytes.data(), 16);
    std::memcpy(body.serial.data(), bytes.data() + 16, 16);
    std::copy(bytes.begin() + 32, bytes.begin() + 36, body.fwVersion.begin());
    std::copy(bytes.begin() + 36, bytes.begin() + 40, body.hwVersion.begin());
    std::copy(bytes.begin() + 40, bytes.begin() + 44, body.bslVersion.begin());
    return body;
}

Bytes DeviceInfoBody::encode() const {
    Bytes bytes(SIZE, 0);
    std::memcpy(bytes.data(), model.data(), 16);
    std::memcpy(bytes.data() + 16, serial.data(), 16);
    std::copy(fwVersion.begin(), fwVersion.end(), bytes.begin() + 32);
    std::copy(hwVersion.begin(), hwVersion.end(), bytes.begin() + 36);
    std::copy(bslVersion.begin(), bslVersion.end(), bytes.begin() + 40);
    return bytes;
}

nlohmann::json DeviceInfoBody::toJson() const {
    return {
        {"model", getModel()},
        {"serial", getSerial()},
        {"fw_version", versionString(fwVersion)},
        {"hw_version", versionString(hwVersion)},
        {"bsl_version", versionString(bslVersion)}
    };
}

std::string DeviceInfoBody::toString() const {
    return fmt::format("Model: {}, Serial: {}, fw: {} hw: {} bsl: {}", getModel(), getSerial(),
                       versionString(fwVersion), versionString(hwVersion), versionString(bslVersion));
}

bool DeviceInfoBody::operator==(const DeviceInfoBody& other) const {
    return model == other.model && serial == other.serial && fwVersion == other.fwVersion &&
           hwVersion == other.hwVersion && bslVersion == other.bslVersion;
}

// DeviceStatusBody

DeviceStatusBody DeviceStatusBody::decode(const uint8_t* data, size_t length) {
    auto bytes = padded<SIZE>(data, length);
    DeviceStatusBody body;
    body.pad = bytes[0];
    body.charge = bytes[1];
    return body;
}

Bytes DeviceStatusBody::encode() const {
    return Bytes{pad, charge};
}

nlohmann::json DeviceStatusBody::toJson() const {
    return {{"charge", charge}};
}

std::string DeviceStatusBody::toString() const {
    return fmt::format("Charge: {}%", charge);
}

// DateTimeBody

DateTimeBody DateTimeBody::decode(const uint8_t* data, size_t length) {
    auto bytes = padded<SIZE>(data, length);
    DateTimeBody body;
    body.year = load_little_u16(bytes.data());
    body.month = bytes[2];
    body.day = bytes[3];
    body.hour = bytes[4];
    body.minute = bytes[5];
    body.millisecond = load_little_u16(bytes.data() + 6);
    return body;
}

Bytes DateTimeBody::encode() const {
    Bytes bytes(SIZE, 0);
    store_little_u16(bytes.data(), year);
    bytes[2] = month;
    bytes[3] = day;
    bytes[4] = hour;
    bytes[5] = minute;
    store_little_u16(bytes.data() + 6, millisecond);
    return bytes;
}

nlohmann::json DateTimeBody::toJson() const {
    return {
        {"year", year}, {"month", month}, {"day", day},
        {"hour", hour}, {"minute", minute}, {"millisecond", millisecond}
    };
}

std::string DateTimeBody::toString() const {
    return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d} +{}ms", year, month, day, hour, minute, millisecond);
}

bool DateTimeBody::operator==(const DateTimeBody& other) const {
    return year == other.year && month == other.month && day == other.day &&
           hour == other.hour && minute == other.minute && millisecond == other.millisecond;
}

// LogCountBody

LogCountBody LogCountBody::decode(const uint8_t* data, size_t length) {
    auto bytes = padded<SIZE>(data, length);
    LogCountBody body;
    body.pad = load_little_u16(bytes.data());
    body.logCount = load_little_u16(bytes.data() + 2);
    return body;
}

Bytes LogCountBody::encode() const {
    Bytes bytes(SIZE, 0);
    store_little_u16(bytes.data(), pad);
    store_little_u16(bytes.data() + 2, logCount);
    return bytes;
}

nlohmann::json LogCountBody::toJson() const {
    return {{"log_count", logCount}};
}

std::string LogCountBody::toString() const {
    return fmt::format("Log count: {}", logCount);
}

// LogStepBody

LogStepBody LogStepBody::decode(const uint8_t* data, size_t length) {
    auto bytes = padded<SIZE>(data, length);
    LogStepBody body;
    body.step = load_little_u32(bytes.data());
    return body;
}

Bytes LogStepBody::encode() const {
    Bytes bytes(SIZE, 0);
    store_little_u32(bytes.data(), step);
    return bytes;
}

nlohmann::json LogStepBody::toJson() const {
    return {{"step", step}};
}

std::string LogStepBody::toString() const {
    return fmt::format("Step: {}", step);
}

// LogEntryBody

LogEntryBody LogEntryBody::decode(const uint8_t* data, size_t length) {
    auto prefix = padded<PREFIX_SIZE>(data, length);
    LogEntryBody body;
    body.type = load_little_u16(prefix.data());
    body.headerPart = load_little_u16(prefix.data() + 2);
    body.length = load_little_u32(prefix.data() + 4);
    if (length > PREFIX_SIZE) {
        const size_t count = std::min(length - PREFIX_SIZE, MAX_DATA);
        body.data.assign(data + PREFIX_SIZE, data + PREFIX_SIZE + count);
    }
    return body;
}

Bytes LogEntryBody::encode() const {
    Bytes bytes(PREFIX_SIZE, 0);
    store_little_u16(bytes.data(), type);
    store_little_u16(bytes.data() + 2, headerPart);
    store_little_u32(bytes.data() + 4, length);
    bytes.insert(bytes.end(), data.begin(), data.end());
    return bytes;
}

nlohmann::json LogEntryBody::toJson() const {
    return {
        {"type", type},
        {"header_part", headerPart},
        {"length", length},
        {"data", toHex(data.data(), std::min<size_t>(length, data.size()))}
    };
}

std::string LogEntryBody::toString() const {
    return fmt::format("type:{},{}, length: {}, data:{}", type, headerPart, length,
                       toHex(data.data(), std::min<size_t>(length, data.size())));
}

bool LogEntryBody::operator==(const LogEntryBody& other) const {
    return type == other.type && headerPart == other.headerPart &&
           length == other.length && data == other.data;
}

// DataRequestBody

DataRequestBody DataRequestBody::decode(const uint8_t* data, size_t length) {
    auto bytes = padded<SIZE>(data, length);
    DataRequestBody body;
    body.position = load_little_u32(bytes.data());
    body.length = load_little_u32(bytes.data() + 4);
    return body;
}

Bytes DataRequestBody::encode() const {
    Bytes bytes(SIZE, 0);
    store_little_u32(bytes.data(), position);
    store_little_u32(bytes.data() + 4, length);
    return bytes;
}

nlohmann::json DataRequestBody::toJson() const {
    return {{"position", position}, {"length", length}};
}

std::string DataRequestBody::toString() const {
    return fmt::format("0x{:04X},0x{:04X}", position, length);
}

// DataBlockBody

DataBlockBody DataBlockBody::decode(const uint8_t* data, size_t length) {
    auto bytes = padded<SIZE>(data, length);
    DataBlockBody body;
    body.position = load_little_u32(bytes.data());
    body.length = load_little_u32(bytes.data() + 4);
    body.data.assign(bytes.begin() + PREFIX_SIZE, bytes.end());
    return body;
}

DataBlockBody DataBlockBody::decodeVariable(const uint8_t* data, size_t length) {
    auto prefix = padded<PREFIX_SIZE>(data, length);
    DataBlockBody body;
    body.position = load_little_u32(prefix.data());
    body.length = load_little_u32(prefix.data() + 4);
    if (length > PREFIX_SIZE) {
        body.data.assign(data + PREFIX_SIZE, data + length);
    }
    return body;
}

Bytes DataBlockBody::encode() const {
    Bytes bytes = encodeVariable();
    bytes.resize(SIZE, 0);
    return bytes;
}

Bytes DataBlockBody::encodeVariable() const {
    Bytes bytes(PREFIX_SIZE, 0);
    store_little_u32(bytes.data(), position);
    store_little_u32(bytes.data() + 4, length);
    bytes.insert(bytes.end(), data.begin(), data.end());
    return bytes;
}

nlohmann::json DataBlockBody::toJson() const {
    return {{"position", position}, {"length", length}, {"data_size", data.size()}};
}

std::string DataBlockBody::toString() const {
    return fmt::format("0x{:04X},0x{:04X}", position, length);
}

bool DataBlockBody::operator==(const DataBlockBody& other) const {
    return position == other.position && length == other.length && data == other.data;
}

// PersonalSettingsBody

PersonalSettingsBody PersonalSettingsBody::defaults() {
    PersonalSettingsBody body;
    body.raw[SOUNDS_OFFSET] = SOUNDS_ON;
    return body;
}

PersonalSettingsBody PersonalSettingsBody::decode(const uint8_t* data, size_t length) {
    PersonalSettingsBody body;
    body.raw = padded<SIZE>(data, length);
    return body;
}

Bytes PersonalSettingsBody::encode() const {
    return Bytes(raw.begin(), raw.end());
}

nlohmann::json PersonalSettingsBody::toJson() const {
    return {{"sounds", getSounds()}};
}

std::string PersonalSettingsBody::toString() const {
    return fmt::format("Sounds: {}", getSounds() ? "on" : "off");
}

// LogSettingsBody

namespace {
// Settings block captured from the vendor software
constexpr std::array<uint8_t, LogSettingsBody::SIZE> DEFAULT_LOG_SETTINGS{{
    0x00, 0x00, 0x00, 0x00, 0x14, 0x01, 0x00, 0x00, 0x03, 0x00, 0x10, 0x01, 0x00, 0x01, 0x0C, 0x01,
    0x0B, 0x01, 0x02, 0x00, 0x02, 0x00, 0x01, 0x01, 0x02, 0x01, 0x02, 0x01, 0x2A, 0x00, 0x47, 0x50,
    0x53, 0x20, 0x54, 0x72, 0x61, 0x63, 0x6B, 0x20, 0x50, 0x4F, 0x44, 0x00, 0x00, 0x00, 0x01, 0x00,
    0x00, 0x00, 0x02, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x05, 0x01, 0xD0, 0x00, 0x06, 0x01, 0x3C, 0x00,
    0x07, 0x01, 0x02, 0x00, 0x11, 0x01, 0x08, 0x01, 0x08, 0x00, 0x09, 0x01, 0x04, 0x00, 0x00, 0x00,
    0x08, 0x00, 0x08, 0x01, 0x08, 0x00, 0x09, 0x01, 0x04, 0x00, 0x01, 0x00, 0x08, 0x00, 0x08, 0x01,
    0x1A, 0x00, 0x09, 0x01, 0x04, 0x00, 0x02, 0x00, 0x00, 0x00, 0x0A, 0x01, 0x02, 0x00, 0x10, 0x00,
    0x0A, 0x01, 0x02, 0x00, 0x01, 0x00, 0x0A, 0x01, 0x02, 0x00, 0xFE, 0xFF, 0x06, 0x01, 0x42, 0x00,
    0x07, 0x01, 0x02, 0x00, 0x23, 0x01, 0x08, 0x01, 0x08, 0x00, 0x09, 0x01, 0x04, 0x00, 0x00, 0x00,
    0x08, 0x00, 0x08, 0x01, 0x08, 0x00, 0x09, 0x01, 0x04, 0x00, 0x01, 0x00, 0x28, 0x00, 0x08, 0x01,
    0x20, 0x00, 0x09, 0x01, 0x04, 0x00, 0x02, 0x00, 0x00, 0x00, 0x0A, 0x01, 0x02, 0x00, 0x10, 0x00,
    0x0A, 0x01, 0x02, 0x00, 0x08, 0x00, 0x0A, 0x01, 0x02, 0x00, 0x01, 0x00, 0x0A, 0x01, 0x02, 0x00,
    0xFE, 0xFF, 0x06, 0x01, 0x3C, 0x00, 0x07, 0x01, 0x02, 0x00, 0x22, 0x01, 0x08, 0x01, 0x08, 0x00,
    0x09, 0x01, 0x04, 0x00, 0x00, 0x00, 0x18, 0x00, 0x08, 0x01, 0x08, 0x00, 0x09, 0x01, 0x04, 0x00,
    0x01, 0x00, 0x19, 0x00, 0x08, 0x01, 0x1A, 0x00, 0x09, 0x01, 0x04, 0x00, 0x02, 0x00, 0x00, 0x00,
    0x0A, 0x01, 0x02, 0x00, 0x32, 0x00, 0x0A, 0x01, 0x02, 0x00, 0x1A, 0x00, 0x0A, 0x01, 0x02, 0x00,
    0x10, 0x00, 0x06, 0x01, 0x06, 0x00, 0x07, 0x01, 0x02, 0x00, 0x50, 0x01
}};
} // namespace

LogSettingsBody LogSettingsBody::defaults() {
    LogSettingsBody body;
    body.raw = DEFAULT_LOG_SETTINGS;
    return body;
}

void LogSettingsBody::loadSettings(const Bytes& settings) {
    const size_t count = std::min(settings.size(), SIZE - SETTINGS_OFFSET);
    std::copy(settings.begin(), settings.begin() + count, raw.begin() + SETTINGS_OFFSET);
}

uint32_t LogSettingsBody::getWritePosition() const {
    return load_little_u32(raw.data() + WRITE_POSITION_OFFSET);
}

uint32_t LogSettingsBody::getWriteLength() const {
    return load_little_u32(raw.data() + WRITE_LENGTH_OFFSET);
}

uint16_t LogSettingsBody::getInterval() const {
    return load_little_u16(raw.data() + INTERVAL1_OFFSET);
}

void LogSettingsBody::setInterval(uint16_t seconds) {
    if (seconds != 1 && seconds != 60) {
        throw ValidationError("interval must be 1 or 60 seconds, got " + std::to_string(seconds));
    }
    store_little_u16(raw.data() + INTERVAL1_OFFSET, seconds);
    store_little_u16(raw.data() + INTERVAL2_OFFSET, seconds);
}

uint16_t LogSettingsBody::getAutolap() const {
    return load_little_u16(raw.data() + AUTOLAP_OFFSET);
}

void LogSettingsBody::setAutolap(uint16_t meters) {
    store_little_u16(raw.data() + AUTOLAP_OFFSET, meters);
}

bool LogSettingsBody::getAutostart() const {
    return raw[AUTOSTART_OFFSET] != 0;
}

void LogSettingsBody::setAutostart(bool enabled) {
    raw[AUTOSTART_OFFSET] = enabled ? 1 : 0;
}

uint16_t LogSettingsBody::getAutosleep() const {
    return load_little_u16(raw.data() + AUTOSLEEP_OFFSET);
}

void LogSettingsBody::setAutosleep(uint16_t minutes) {
    if (minutes != 0 && minutes != 10 && minutes != 30 && minutes != 60) {
        throw ValidationError("autosleep must be 0, 10, 30 or 60 minutes, got " + std::to_string(minutes));
    }
    store_little_u16(raw.data() + AUTOSLEEP_OFFSET, minutes);
}

LogSettingsBody LogSettingsBody::decode(const uint8_t* data, size_t length) {
    LogSettingsBody body;
    body.raw = padded<SIZE>(data, length);
    return body;
}

Bytes LogSettingsBody::encode() const {
    return Bytes(raw.begin(), raw.end());
}

nlohmann::json LogSettingsBody::toJson() const {
    return {
        {"interval", getInterval()},
        {"autolap", getAutolap()},
        {"autostart", getAutostart()},
        {"autosleep", getAutosleep()}
    };
}

std::string LogSettingsBody::toString() const {
    return fmt::format("interval: {:>2}s, autostart: {:>3}, autosleep: {} min, autolap: {:>3} m",
                       getInterval(), getAutostart() ? "on" : "off", getAutosleep(), getAutolap());
}

// SgeeDateBody

SgeeDateBody SgeeDateBody::decode(const uint8_t* data, size_t length) {
    auto bytes = padded<SIZE>(data, length);
    SgeeDateBody body;
    body.entry = bytes[0];
    body.year = load_little_u16(bytes.data() + 1);
    body.month = bytes[3];
    body.day = bytes[4];
    body.seconds = load_little_u32(bytes.data() + 5);
    return body;
}

Bytes SgeeDateBody::encode() const {
    Bytes bytes(SIZE, 0);
    bytes[0] = entry;
    store_little_u16(bytes.data() + 1, year);
    bytes[3] = month;
    bytes[4] = day;
    store_little_u32(bytes.data() + 5, seconds);
    return bytes;
}

nlohmann::json SgeeDateBody::toJson() const {
    return {{"year", year}, {"month", month}, {"day", day}, {"seconds", seconds}};
}

std::string SgeeDateBody::toString() const {
    return fmt::format("{}-{}-{}, {}", year, month, day, seconds);
}

bool SgeeDateBody::operator==(const SgeeDateBody& other) const {
    return entry == other.entry && year == other.year && month == other.month &&
           day == other.day && seconds == other.seconds;
}

// RawBody

RawBody RawBody::decode(const uint8_t* data, size_t length) {
    RawBody body;
    if (data != nullptr && length > 0) {
        body.data.assign(data, data + length);
    }
    return body;
}

nlohmann::json RawBody::toJson() const {
    return {{"raw", toHex(data)}};
}

std::string RawBody::toString() const {
    return toHex(data);
}

} // namespace pod_protocol
