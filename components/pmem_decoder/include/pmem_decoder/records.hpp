#pragma once

#include "pmem_decoder/entry_cursor.hpp"
#include "pmem_decoder/layout.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pmem_decoder {

/**
 * @brief Known periodic sample type: name, signedness and scale
 */
struct SampleType {
    uint16_t id;
    const char* name;
    bool isSigned;
    double scale;
};

/**
 * @brief Look up a periodic sample type
 * @return nullptr for unknown types
 */
const SampleType* findSampleType(uint16_t id);

/**
 * @brief Name of a sample type, "unknown_0xNN" when not known
 */
std::string sampleTypeName(uint16_t id);

struct SchemaField {
    uint16_t sampleType = 0;
    uint16_t offset = 0;
    uint16_t length = 0;

    bool operator==(const SchemaField& other) const {
        return sampleType == other.sampleType && offset == other.offset && length == other.length;
    }
};

struct PeriodicValue {
    uint16_t sampleType = 0;
    std::string name;
    std::optional<double> value;  // empty when the field length is not 1, 2 or 4
    Bytes raw;
};

struct PeriodicRecord {
    std::vector<PeriodicValue> values;

    const PeriodicValue* find(const std::string& name) const;
};

/**
 * @brief Layout of the periodic entries of one track
 */
class PeriodicSchema {
public:
    PeriodicSchema() = default;
    explicit PeriodicSchema(std::vector<SchemaField> fields) : fields_(std::move(fields)) {}

    /**
     * @brief Parse the body of a schema entry
     * @throws DecodeError when the body is shorter than its field count
     */
    static PeriodicSchema parse(const Bytes& body);

    /**
     * @brief Decode the body of a periodic entry; fields past its end are skipped
     */
    PeriodicRecord decode(const Bytes& body) const;

    const std::vector<SchemaField>& fields() const { return fields_; }
    bool empty() const { return fields_.empty(); }

    nlohmann::json toJson() const;

private:
    std::vector<SchemaField> fields_;
};

struct DateTimeStamp {
    uint16_t year = 0;
    uint8_t month = 0;
    uint8_t day = 0;
    uint8_t hour = 0;
    uint8_t minute = 0;
    uint8_t second = 0;

    static constexpr size_t SIZE = 7;
    static DateTimeStamp decode(const uint8_t* data);
    std::string toString() const;
};

/**
 * @brief Summary stored in the second header entry of every track
 */
struct TrackMetadata {
    DateTimeStamp start;
    uint8_t interval = 0;
    uint32_t duration = 0;       // ms
    uint16_t ascent = 0;
    uint16_t descent = 0;
    uint32_t ascentTime = 0;     // ms
    uint32_t descentTime = 0;    // ms
    uint32_t recoveryTime = 0;   // ms
    uint16_t avgSpeed = 0;       // 0.01 m/s
    uint16_t maxSpeed = 0;       // 0.01 m/s
    int16_t maxAltitude = 0;
    int16_t minAltitude = 0;
    uint8_t avgHr = 0;
    uint8_t maxHr = 0;
    uint8_t peakTrainingEffect = 0;  // 0.1
    uint8_t activityType = 0;
    std::array<char, 16> activityName{};
    uint8_t minHr = 0;
    uint32_t distance = 0;
    uint32_t samples = 0;
    Bytes extra;

    static constexpr size_t SIZE = 72;

    // Zero pads a shorter body, bytes past SIZE are kept in extra
    static TrackMetadata parse(const Bytes& body);

    std::string getActivityName() const;
    nlohmann::json toJson() const;
};

// Episodic subtypes
namespace episodic {
    constexpr uint8_t LOG_PAUSE = 0x02;
    constexpr uint8_t LOG_RESTART = 0x03;
    constexpr uint8_t DISTANCE_SOURCE = 0x06;
    constexpr uint8_t LAP_INFO = 0x07;
    constexpr uint8_t GPS_USER_DATA = 0x09;
    constexpr uint8_t TIME_REFERENCE = 0x0C;

    constexpr size_t PREFIX_SIZE = 5;
}

struct LogPauseRecord {
    uint32_t time = 0;
};

struct LogRestartRecord {
    uint32_t time = 0;
};

struct DistanceSourceRecord {
    uint32_t time = 0;
    uint8_t source = 0;
};

struct LapInfoRecord {
    uint32_t time = 0;
    uint8_t eventType = 0;
    DateTimeStamp dateTime;
    uint32_t duration = 0;  // ms
    uint32_t distance = 0;  // m
};

struct GpsUserDataRecord {
    uint32_t time = 0;
    uint16_t navValid = 0;
    uint16_t navType = 0;
    uint16_t year = 0;
    uint8_t month = 0;
    uint8_t day = 0;
    uint8_t hour = 0;
    uint8_t minute = 0;
    uint16_t millisecond = 0;
    int32_t latitude = 0;     // 1e-7 deg
    int32_t longitude = 0;    // 1e-7 deg
    int32_t gpsAltitude = 0;  // 0.01 m
    uint16_t gpsSpeed = 0;    // 0.01 m/s
    uint16_t gpsHeading = 0;  // 1e-4 rad
    uint32_t ehpe = 0;        // 0.01 m
    uint32_t evpe = 0;        // 0.01 m
    uint8_t satellites = 0;
    uint8_t hdop = 0;
};

struct TimeReferenceRecord {
    uint32_t time = 0;
    DateTimeStamp dateTime;
};

struct UnknownEpisodicRecord {
    uint32_t time = 0;
    uint8_t subtype = 0;
    Bytes data;
};

struct LogHeaderRecord {
    uint32_t unknown = 0;
    DateTimeStamp dateTime;
};

struct LogTextRecord {
    uint32_t timestamp = 0;
    uint16_t code = 0;
    std::string text;
};

struct OpaqueRecord {
    uint8_t type = 0;
    Bytes data;
};

using Record = std::variant<PeriodicRecord,
                            LogPauseRecord,
                            LogRestartRecord,
                            DistanceSourceRecord,
                            LapInfoRecord,
                            GpsUserDataRecord,
                            TimeReferenceRecord,
                            UnknownEpisodicRecord,
                            LogHeaderRecord,
                            LogTextRecord,
                            OpaqueRecord>;

/**
 * @brief Decode the body of an episodic entry
 * @return Empty when the body is shorter than time and subtype
 */
std::optional<Record> decodeEpisodic(const Bytes& body);

/**
 * @brief Decode an entry of a track sample stream
 *
 * Periodic entries decode through the schema, episodic entries through
 * the subtype table. Any other type yields no record.
 */
std::optional<Record> decodeTrackEntry(const Entry& entry, const PeriodicSchema& schema);

/**
 * @brief Decode an entry of the internal log, unknown types stay opaque
 */
Record decodeInternalLogEntry(const Entry& entry);

/**
 * @brief Heuristic sanity check used to find entry alignment in unindexed data
 *
 * A gpsheading must be below 2*pi, a time not negative and a month below 13.
 * Records without such fields always pass.
 */
bool isPlausible(const Record& record);

std::string recordName(const Record& record);
nlohmann::json toJson(const Record& record);

} // namespace pmem_decoder
