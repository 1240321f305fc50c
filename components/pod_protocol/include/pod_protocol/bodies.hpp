#pragma once

#include "pod_protocol/text.hpp"
#include "pod_protocol/types.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <string>

namespace pod_protocol {

// Every body offers the same surface:
//   static X decode(const uint8_t* data, size_t length)  - zero pads short input
//   Bytes encode() const
//   nlohmann::json toJson() const
//   std::string toString() const
// Fixed bodies also carry SIZE; decode reads at most SIZE bytes.

struct EmptyBody {
    static constexpr size_t SIZE = 0;

    static EmptyBody decode(const uint8_t* data, size_t length);
    Bytes encode() const { return {}; }
    nlohmann::json toJson() const { return nlohmann::json::object(); }
    std::string toString() const { return "{}"; }

    bool operator==(const EmptyBody&) const { return true; }
    bool operator!=(const EmptyBody&) const { return false; }
};

struct DeviceInfoRequestBody {
    static constexpr size_t SIZE = 4;

    std::array<uint8_t, 4> version{{2, 4, 89, 0}};

    static DeviceInfoRequestBody decode(const uint8_t* data, size_t length);
    Bytes encode() const;
    nlohmann::json toJson() const;
    std::string toString() const;

    bool operator==(const DeviceInfoRequestBody& other) const { return version == other.version; }
    bool operator!=(const DeviceInfoRequestBody& other) const { return !(*this == other); }
};

/**
 * @brief Identification of the pod
 *
 * Model and serial are NUL padded ASCII; the raw arrays are kept so that
 * re-encoding reproduces the received bytes.
 */
struct DeviceInfoBody {
    static constexpr size_t SIZE = 44;

    std::array<char, 16> model{};
    std::array<char, 16> serial{};
    std::array<uint8_t, 4> fwVersion{};
    std::array<uint8_t, 4> hwVersion{};
    std::array<uint8_t, 4> bslVersion{};

    std::string getModel() const;
    std::string getSerial() const;

    static DeviceInfoBody decode(const uint8_t* data, size_t length);
    Bytes encode() const;
    nlohmann::json toJson() const;
    std::string toString() const;

    bool operator==(const DeviceInfoBody& other) const;
    bool operator!=(const DeviceInfoBody& other) const { return !(*this == other); }
};

struct DeviceStatusBody {
    static constexpr size_t SIZE = 2;

    uint8_t pad = 0;
    uint8_t charge = 0;     ///< Battery charge in percent

    static DeviceStatusBody decode(const uint8_t* data, size_t length);
    Bytes encode() const;
    nlohmann::json toJson() const;
    std::string toString() const;

    bool operator==(const DeviceStatusBody& other) const {
        return pad == other.pad && charge == other.charge;
    }
    bool operator!=(const DeviceStatusBody& other) const { return !(*this == other); }
};

struct DateTimeBody {
    static constexpr size_t SIZE = 8;

    uint16_t year = 0;
    uint8_t month = 0;
    uint8_t day = 0;
    uint8_t hour = 0;
    uint8_t minute = 0;
    uint16_t millisecond = 0;   ///< Milliseconds within the minute

    static DateTimeBody decode(const uint8_t* data, size_t length);
    Bytes encode() const;
    nlohmann::json toJson() const;
    std::string toString() const;

    bool operator==(const DateTimeBody& other) const;
    bool operator!=(const DateTimeBody& other) const { return !(*this == other); }
};

struct LogCountBody {
    static constexpr size_t SIZE = 4;

    uint16_t pad = 0;
    uint16_t logCount = 0;

    static LogCountBody decode(const uint8_t* data, size_t length);
    Bytes encode() const;
    nlohmann::json toJson() const;
    std::string toString() const;

    bool operator==(const LogCountBody& other) const {
        return pad == other.pad && logCount == other.logCount;
    }
    bool operator!=(const LogCountBody& other) const { return !(*this == other); }
};

struct LogStepBody {
    static constexpr size_t SIZE = 4;

    uint32_t step = 0;

    static LogStepBody decode(const uint8_t* data, size_t length);
    Bytes encode() const;
    nlohmann::json toJson() const;
    std::string toString() const;

    bool operator==(const LogStepBody& other) const { return step == other.step; }
    bool operator!=(const LogStepBody& other) const { return !(*this == other); }
};

/**
 * @brief One log header entry, variable length
 */
struct LogEntryBody {
    static constexpr size_t PREFIX_SIZE = 8;
    static constexpr size_t MAX_DATA = MAX_MESSAGE_SIZE;

    uint16_t type = 0;
    uint16_t headerPart = 0;
    uint32_t length = 0;
    Bytes data;

    static LogEntryBody decode(const uint8_t* data, size_t length);
    Bytes encode() const;
    nlohmann::json toJson() const;
    std::string toString() const;

    bool operator==(const LogEntryBody& other) const;
    bool operator!=(const LogEntryBody& other) const { return !(*this == other); }
};

struct DataRequestBody {
    static constexpr size_t SIZE = 8;

    uint32_t position = 0;
    uint32_t length = DATA_BLOCK_SIZE;

    static DataRequestBody decode(const uint8_t* data, size_t length);
    Bytes encode() const;
    nlohmann::json toJson() const;
    std::string toString() const;

    bool operator==(const DataRequestBody& other) const {
        return position == other.position && length == other.length;
    }
    bool operator!=(const DataRequestBody& other) const { return !(*this == other); }
};

/**
 * @brief Position, length and a block of memory
 *
 * Memory replies always carry a full 512 byte block. SGEE uploads use the
 * same layout with only the bytes actually sent.
 */
struct DataBlockBody {
    static constexpr size_t PREFIX_SIZE = 8;
    static constexpr size_t SIZE = PREFIX_SIZE + DATA_BLOCK_SIZE;

    uint32_t position = 0;
    uint32_t length = 0;
    Bytes data;

    /**
     * @brief Decode a full size block, data zero padded to 512 bytes
     */
    static DataBlockBody decode(const uint8_t* data, size_t length);

    /**
     * @brief Decode a block whose data is whatever follows the prefix
     */
    static DataBlockBody decodeVariable(const uint8_t* data, size_t length);

    /**
     * @brief Encode as a full size block
     */
    Bytes encode() const;

    /**
     * @brief Encode prefix and data without padding
     */
    Bytes encodeVariable() const;

    nlohmann::json toJson() const;
    std::string toString() const;

    bool operator==(const DataBlockBody& other) const;
    bool operator!=(const DataBlockBody& other) const { return !(*this == other); }
};

/**
 * @brief Personal settings blob, only the sounds byte is understood
 */
struct PersonalSettingsBody {
    static constexpr size_t SIZE = 70;
    static constexpr size_t SOUNDS_OFFSET = 26;
    static constexpr uint8_t SOUNDS_ON = 1;
    static constexpr uint8_t SOUNDS_OFF = 2;

    std::array<uint8_t, SIZE> raw{};

    /**
     * @brief Settings as written by the vendor software: sounds on, rest zero
     */
    static PersonalSettingsBody defaults();

    bool getSounds() const { return raw[SOUNDS_OFFSET] == SOUNDS_ON; }
    void setSounds(bool enabled) { raw[SOUNDS_OFFSET] = enabled ? SOUNDS_ON : SOUNDS_OFF; }

    static PersonalSettingsBody decode(const uint8_t* data, size_t length);
    Bytes encode() const;
    nlohmann::json toJson() const;
    std::string toString() const;

    bool operator==(const PersonalSettingsBody& other) const { return raw == other.raw; }
    bool operator!=(const PersonalSettingsBody& other) const { return !(*this == other); }
};

/**
 * @brief Log settings write, a window into the settings memory
 *
 * Starts with the write position and length, followed by the settings
 * themselves. Only interval, autolap, autostart and autosleep are known.
 */
struct LogSettingsBody {
    static constexpr size_t SIZE = 284;

    static constexpr size_t WRITE_POSITION_OFFSET = 0;
    static constexpr size_t WRITE_LENGTH_OFFSET = 4;
    static constexpr size_t SETTINGS_OFFSET = 8;
    static constexpr size_t INTERVAL1_OFFSET = 52;
    static constexpr size_t INTERVAL2_OFFSET = 54;
    static constexpr size_t AUTOLAP_OFFSET = 56;
    static constexpr size_t AUTOSTART_OFFSET = 68;
    static constexpr size_t AUTOSLEEP_OFFSET = 70;

    std::array<uint8_t, SIZE> raw{};

    /**
     * @brief The settings block as written by the vendor software
     *
     * Interval 1s, autostart on, autosleep off, autolap off.
     */
    static LogSettingsBody defaults();

    /**
     * @brief Overlay raw settings bytes, starting after position and length
     */
    void loadSettings(const Bytes& settings);

    uint32_t getWritePosition() const;
    uint32_t getWriteLength() const;

    uint16_t getInterval() const;
    /**
     * @brief Set the sample interval
     * @param seconds 1 or 60
     * @throws ValidationError for any other value
     */
    void setInterval(uint16_t seconds);

    uint16_t getAutolap() const;
    void setAutolap(uint16_t meters);

    bool getAutostart() const;
    void setAutostart(bool enabled);

    uint16_t getAutosleep() const;
    /**
     * @brief Set the autosleep timeout
     * @param minutes 0 (off), 10, 30 or 60
     * @throws ValidationError for any other value
     */
    void setAutosleep(uint16_t minutes);

    static LogSettingsBody decode(const uint8_t* data, size_t length);
    Bytes encode() const;
    nlohmann::json toJson() const;
    std::string toString() const;

    bool operator==(const LogSettingsBody& other) const { return raw == other.raw; }
    bool operator!=(const LogSettingsBody& other) const { return !(*this == other); }
};

struct SgeeDateBody {
    static constexpr size_t SIZE = 9;

    uint8_t entry = 0;
    uint16_t year = 0;
    uint8_t month = 0;
    uint8_t day = 0;
    uint32_t seconds = 0;

    static SgeeDateBody decode(const uint8_t* data, size_t length);
    Bytes encode() const;
    nlohmann::json toJson() const;
    std::string toString() const;

    bool operator==(const SgeeDateBody& other) const;
    bool operator!=(const SgeeDateBody& other) const { return !(*this == other); }
};

/**
 * @brief Body of a message whose shape is not known
 */
struct RawBody {
    Bytes data;

    static RawBody decode(const uint8_t* data, size_t length);
    Bytes encode() const { return data; }
    nlohmann::json toJson() const;
    std::string toString() const;

    bool operator==(const RawBody& other) const { return data == other.data; }
    bool operator!=(const RawBody& other) const { return !(*this == other); }
};

} // namespace pod_protocol
