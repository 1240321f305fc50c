#include "pmem_decoder/records.hpp"
#include "pmem_decoder/error.hpp"

#include <pod_protocol/text.hpp>

#include <boost/endian/conversion.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace pmem_decoder {

namespace {

constexpr double TWO_PI = 6.283185307179586;

const SampleType SAMPLE_TYPES[] = {
    {0x01, "latitude", true, 1e-7},
    {0x02, "longitude", true, 1e-7},
    {0x03, "distance", false, 1.0},
    {0x04, "speed", false, 0.01},
    {0x05, "heartrate", false, 1.0},
    {0x06, "time", true, 1e-3},
    {0x07, "gpsspeed", false, 0.01},
    {0x08, "wristaccspeed", false, 0.01},
    {0x09, "bikepodspeed", false, 0.01},
    {0x0A, "ehpe", false, 0.01},
    {0x0B, "evpe", false, 0.01},
    {0x0C, "altitude", true, 1.0},
    {0x0D, "abspressure", false, 0.1},
    {0x0E, "energy", false, 0.1},
    {0x0F, "temperature", true, 0.1},
    {0x10, "charge", false, 1.0},
    {0x11, "gpsaltitude", true, 0.01},
    {0x12, "gpsheading", false, 1e-4},
    {0x13, "gpshdop", false, 1.0},
    {0x14, "gpsvdop", false, 1.0},
    {0x15, "wristcadence", false, 1.0},
    {0x17, "noofsatellites", false, 1.0},
    {0x18, "sealevelpressure", false, 0.1},
    {0x19, "verticalspeed", true, 0.01},
    {0x1A, "cadence", false, 1.0},
    {0x1F, "bikepower", false, 1.0},
    {0x20, "swimingstrokecnt", false, 1.0},
};

// Copy of body, zero padded to at least size bytes
Bytes padded(const Bytes& body, size_t offset, size_t size) {
    Bytes result(std::max(size, body.size() > offset ? body.size() - offset : 0), 0);
    if (body.size() > offset) {
        std::copy(body.begin() + offset, body.end(), result.begin());
    }
    return result;
}

std::optional<double> scaledValue(const SampleType* type, const uint8_t* data, uint16_t length) {
    const bool isSigned = type ? type->isSigned : false;
    const double scale = type ? type->scale : 1.0;

    double raw = 0;
    switch (length) {
        case 1:
            raw = isSigned ? static_cast<double>(static_cast<int8_t>(data[0])) : data[0];
            break;
        case 2:
            raw = isSigned ? static_cast<double>(boost::endian::load_little_s16(data))
                           : static_cast<double>(boost::endian::load_little_u16(data));
            break;
        case 4:
            raw = isSigned ? static_cast<double>(boost::endian::load_little_s32(data))
                           : static_cast<double>(boost::endian::load_little_u32(data));
            break;
        default:
            return std::nullopt;
    }
    return raw * scale;
}

nlohmann::json dateTimeJson(const DateTimeStamp& stamp) {
    return stamp.toString();
}

} // namespace

const SampleType* findSampleType(uint16_t id) {
    for (const auto& type : SAMPLE_TYPES) {
        if (type.id == id) {
            return &type;
        }
    }
    return nullptr;
}

std::string sampleTypeName(uint16_t id) {
    const SampleType* type = findSampleType(id);
    return type ? std::string(type->name) : fmt::format("unknown_0x{:02X}", id);
}

const PeriodicValue* PeriodicRecord::find(const std::string& name) const {
    for (const auto& value : values) {
        if (value.name == name) {
            return &value;
        }
    }
    return nullptr;
}

PeriodicSchema PeriodicSchema::parse(const Bytes& body) {
    if (body.size() < 2) {
        throw DecodeError("periodic schema without field count");
    }
    const uint16_t count = boost::endian::load_little_u16(body.data());
    if (body.size() < 2 + static_cast<size_t>(count) * 6) {
        throw DecodeError(fmt::format("periodic schema declares {} fields in {} bytes", count, body.size()));
    }

    std::vector<SchemaField> fields;
    fields.reserve(count);
    for (uint16_t i = 0; i < count; ++i) {
        const uint8_t* field = body.data() + 2 + i * 6;
        SchemaField schemaField;
        schemaField.sampleType = boost::endian::load_little_u16(field);
        schemaField.offset = boost::endian::load_little_u16(field + 2);
        schemaField.length = boost::endian::load_little_u16(field + 4);
        fields.push_back(schemaField);
    }
    return PeriodicSchema(std::move(fields));
}

PeriodicRecord PeriodicSchema::decode(const Bytes& body) const {
    PeriodicRecord record;
    for (const auto& field : fields_) {
        if (static_cast<size_t>(field.offset) + field.length > body.size()) {
            continue;
        }
        const uint8_t* data = body.data() + field.offset;
        const SampleType* type = findSampleType(field.sampleType);

        PeriodicValue value;
        value.sampleType = field.sampleType;
        value.name = sampleTypeName(field.sampleType);
        value.value = scaledValue(type, data, field.length);
        value.raw.assign(data, data + field.length);
        record.values.push_back(std::move(value));
    }
    return record;
}

nlohmann::json PeriodicSchema::toJson() const {
    nlohmann::json fields = nlohmann::json::array();
    for (const auto& field : fields_) {
        fields.push_back({
            {"type", sampleTypeName(field.sampleType)},
            {"offset", field.offset},
            {"length", field.length}
        });
    }
    return fields;
}

DateTimeStamp DateTimeStamp::decode(const uint8_t* data) {
    DateTimeStamp stamp;
    stamp.year = boost::endian::load_little_u16(data);
    stamp.month = data[2];
    stamp.day = data[3];
    stamp.hour = data[4];
    stamp.minute = data[5];
    stamp.second = data[6];
    return stamp;
}

std::string DateTimeStamp::toString() const {
    return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}", year, month, day, hour, minute, second);
}

TrackMetadata TrackMetadata::parse(const Bytes& body) {
    Bytes data = padded(body, 0, SIZE);
    const uint8_t* p = data.data();

    TrackMetadata metadata;
    metadata.start = DateTimeStamp::decode(p);
    metadata.interval = p[7];
    metadata.duration = boost::endian::load_little_u32(p + 12);
    metadata.ascent = boost::endian::load_little_u16(p + 16);
    metadata.descent = boost::endian::load_little_u16(p + 18);
    metadata.ascentTime = boost::endian::load_little_u32(p + 20);
    metadata.descentTime = boost::endian::load_little_u32(p + 24);
    metadata.recoveryTime = boost::endian::load_little_u32(p + 28);
    metadata.avgSpeed = boost::endian::load_little_u16(p + 32);
    metadata.maxSpeed = boost::endian::load_little_u16(p + 34);
    metadata.maxAltitude = boost::endian::load_little_s16(p + 36);
    metadata.minAltitude = boost::endian::load_little_s16(p + 38);
    metadata.avgHr = p[40];
    metadata.maxHr = p[41];
    metadata.peakTrainingEffect = p[42];
    metadata.activityType = p[43];
    std::copy(p + 44, p + 60, metadata.activityName.begin());
    metadata.minHr = p[60];
    metadata.distance = boost::endian::load_little_u32(p + 64);
    metadata.samples = boost::endian::load_little_u32(p + 68);
    metadata.extra.assign(data.begin() + SIZE, data.end());
    return metadata;
}

std::string TrackMetadata::getActivityName() const {
    auto end = std::find(activityName.begin(), activityName.end(), '\0');
    return pod_protocol::decodeText(activityName.data(), static_cast<size_t>(end - activityName.begin()));
}

nlohmann::json TrackMetadata::toJson() const {
    return {
        {"start", start.toString()},
        {"interval", interval},
        {"duration", duration / 1000.0},
        {"ascent", ascent},
        {"descent", descent},
        {"ascent_time", ascentTime / 1000.0},
        {"descent_time", descentTime / 1000.0},
        {"recovery_time", recoveryTime / 1000.0},
        {"avg_speed", avgSpeed * 0.01},
        {"max_speed", maxSpeed * 0.01},
        {"max_altitude", maxAltitude},
        {"min_altitude", minAltitude},
        {"avg_hr", avgHr},
        {"max_hr", maxHr},
        {"min_hr", minHr},
        {"peak_training_effect", peakTrainingEffect * 0.1},
        {"activity_type", activityType},
        {"activity_name", getActivityName()},
        {"distance", distance},
        {"samples", samples}
    };
}

std::optional<Record> decodeEpisodic(const Bytes& body) {
    if (body.size() < episodic::PREFIX_SIZE) {
        return std::nullopt;
    }
    const uint32_t time = boost::endian::load_little_u32(body.data());
    const uint8_t subtype = body[4];

    switch (subtype) {
        case episodic::LOG_PAUSE:
            return Record(LogPauseRecord{time});

        case episodic::LOG_RESTART:
            return Record(LogRestartRecord{time});

        case episodic::DISTANCE_SOURCE: {
            Bytes data = padded(body, episodic::PREFIX_SIZE, 1);
            return Record(DistanceSourceRecord{time, data[0]});
        }

        case episodic::LAP_INFO: {
            Bytes data = padded(body, episodic::PREFIX_SIZE, 16);
            LapInfoRecord lap;
            lap.time = time;
            lap.eventType = data[0];
            lap.dateTime = DateTimeStamp::decode(data.data() + 1);
            lap.duration = boost::endian::load_little_u32(data.data() + 8);
            lap.distance = boost::endian::load_little_u32(data.data() + 12);
            return Record(lap);
        }

        case episodic::GPS_USER_DATA: {
            Bytes data = padded(body, episodic::PREFIX_SIZE, 38);
            const uint8_t* p = data.data();
            GpsUserDataRecord gps;
            gps.time = time;
            gps.navValid = boost::endian::load_little_u16(p);
            gps.navType = boost::endian::load_little_u16(p + 2);
            gps.year = boost::endian::load_little_u16(p + 4);
            gps.month = p[6];
            gps.day = p[7];
            gps.hour = p[8];
            gps.minute = p[9];
            gps.millisecond = boost::endian::load_little_u16(p + 10);
            gps.latitude = boost::endian::load_little_s32(p + 12);
            gps.longitude = boost::endian::load_little_s32(p + 16);
            gps.gpsAltitude = boost::endian::load_little_s32(p + 20);
            gps.gpsSpeed = boost::endian::load_little_u16(p + 24);
            gps.gpsHeading = boost::endian::load_little_u16(p + 26);
            gps.ehpe = boost::endian::load_little_u32(p + 28);
            gps.evpe = boost::endian::load_little_u32(p + 32);
            gps.satellites = p[36];
            gps.hdop = p[37];
            return Record(gps);
        }

        case episodic::TIME_REFERENCE: {
            Bytes data = padded(body, episodic::PREFIX_SIZE, DateTimeStamp::SIZE);
            return Record(TimeReferenceRecord{time, DateTimeStamp::decode(data.data())});
        }

        default:
            return Record(UnknownEpisodicRecord{time, subtype, Bytes(body.begin() + episodic::PREFIX_SIZE, body.end())});
    }
}

std::optional<Record> decodeTrackEntry(const Entry& entry, const PeriodicSchema& schema) {
    switch (entry.type) {
        case entry_type::PERIODIC:
            return Record(schema.decode(entry.body));
        case entry_type::EPISODIC:
            return decodeEpisodic(entry.body);
        default:
            return std::nullopt;
    }
}

Record decodeInternalLogEntry(const Entry& entry) {
    switch (entry.type) {
        case log_entry_type::HEADER: {
            Bytes data = padded(entry.body, 0, 4 + DateTimeStamp::SIZE);
            LogHeaderRecord header;
            header.unknown = boost::endian::load_little_u32(data.data());
            header.dateTime = DateTimeStamp::decode(data.data() + 4);
            return header;
        }

        case log_entry_type::TEXT: {
            constexpr size_t TEXT_OFFSET = 9;
            Bytes data = padded(entry.body, 0, TEXT_OFFSET);
            LogTextRecord line;
            line.timestamp = boost::endian::load_little_u32(data.data());
            line.code = boost::endian::load_little_u16(data.data() + 4);
            auto end = data.end();
            while (end != data.begin() + TEXT_OFFSET && *(end - 1) == 0) {
                --end;
            }
            const std::string raw(data.begin() + TEXT_OFFSET, end);
            line.text = pod_protocol::decodeText(raw);
            return line;
        }

        default:
            return OpaqueRecord{entry.type, entry.body};
    }
}

bool isPlausible(const Record& record) {
    if (const auto* periodic = std::get_if<PeriodicRecord>(&record)) {
        if (const auto* heading = periodic->find("gpsheading")) {
            if (heading->value && std::fabs(*heading->value) >= TWO_PI) {
                return false;
            }
        }
        if (const auto* time = periodic->find("time")) {
            if (time->value && *time->value < 0) {
                return false;
            }
        }
        return true;
    }
    if (const auto* gps = std::get_if<GpsUserDataRecord>(&record)) {
        return gps->gpsHeading * 1e-4 < TWO_PI && gps->month < 13;
    }
    if (const auto* lap = std::get_if<LapInfoRecord>(&record)) {
        return lap->dateTime.month < 13;
    }
    if (const auto* reference = std::get_if<TimeReferenceRecord>(&record)) {
        return reference->dateTime.month < 13;
    }
    return true;
}

std::string recordName(const Record& record) {
    return std::visit([](const auto& value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, PeriodicRecord>) {
            return "periodic";
        } else if constexpr (std::is_same_v<T, LogPauseRecord>) {
            return "log_pause";
        } else if constexpr (std::is_same_v<T, LogRestartRecord>) {
            return "log_restart";
        } else if constexpr (std::is_same_v<T, DistanceSourceRecord>) {
            return "distance_source";
        } else if constexpr (std::is_same_v<T, LapInfoRecord>) {
            return "lap_info";
        } else if constexpr (std::is_same_v<T, GpsUserDataRecord>) {
            return "gps_user_data";
        } else if constexpr (std::is_same_v<T, TimeReferenceRecord>) {
            return "time_reference";
        } else if constexpr (std::is_same_v<T, UnknownEpisodicRecord>) {
            return "unknown_episodic";
        } else if constexpr (std::is_same_v<T, LogHeaderRecord>) {
            return "log_header";
        } else if constexpr (std::is_same_v<T, LogTextRecord>) {
            return "log_text";
        } else {
            return "opaque";
        }
    }, record);
}

nlohmann::json toJson(const Record& record) {
    nlohmann::json json = {{"type", recordName(record)}};

    std::visit([&json](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, PeriodicRecord>) {
            nlohmann::json values = nlohmann::json::object();
            for (const auto& field : value.values) {
                if (field.value) {
                    values[field.name] = *field.value;
                } else {
                    values[field.name] = pod_protocol::toHex(field.raw);
                }
            }
            json["values"] = values;
        } else if constexpr (std::is_same_v<T, LogPauseRecord> || std::is_same_v<T, LogRestartRecord>) {
            json["time"] = value.time / 1000.0;
        } else if constexpr (std::is_same_v<T, DistanceSourceRecord>) {
            json["time"] = value.time / 1000.0;
            json["source"] = value.source;
        } else if constexpr (std::is_same_v<T, LapInfoRecord>) {
            json["time"] = value.time / 1000.0;
            json["event_type"] = value.eventType;
            json["date_time"] = dateTimeJson(value.dateTime);
            json["duration"] = value.duration / 1000.0;
            json["distance"] = value.distance;
        } else if constexpr (std::is_same_v<T, GpsUserDataRecord>) {
            json["time"] = value.time / 1000.0;
            json["nav_valid"] = value.navValid;
            json["nav_type"] = value.navType;
            json["date_time"] = fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:06.3f}",
                                            value.year, value.month, value.day, value.hour,
                                            value.minute, value.millisecond / 1000.0);
            json["latitude"] = value.latitude * 1e-7;
            json["longitude"] = value.longitude * 1e-7;
            json["gpsaltitude"] = value.gpsAltitude * 0.01;
            json["gpsspeed"] = value.gpsSpeed * 0.01;
            json["gpsheading"] = value.gpsHeading * 1e-4;
            json["ehpe"] = value.ehpe * 0.01;
            json["evpe"] = value.evpe * 0.01;
            json["satellites"] = value.satellites;
            json["hdop"] = value.hdop;
        } else if constexpr (std::is_same_v<T, TimeReferenceRecord>) {
            json["time"] = value.time / 1000.0;
            json["date_time"] = dateTimeJson(value.dateTime);
        } else if constexpr (std::is_same_v<T, UnknownEpisodicRecord>) {
            json["time"] = value.time / 1000.0;
            json["subtype"] = value.subtype;
            json["data"] = pod_protocol::toHex(value.data);
        } else if constexpr (std::is_same_v<T, LogHeaderRecord>) {
            json["unknown"] = value.unknown;
            json["date_time"] = dateTimeJson(value.dateTime);
        } else if constexpr (std::is_same_v<T, LogTextRecord>) {
            json["timestamp"] = value.timestamp;
            json["code"] = value.code;
            json["text"] = value.text;
        } else {
            json["entry_type"] = value.type;
            json["data"] = pod_protocol::toHex(value.data);
        }
    }, record);

    return json;
}

} // namespace pmem_decoder
