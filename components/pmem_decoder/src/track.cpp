#include "pmem_decoder/track.hpp"
#include "pmem_decoder/error.hpp"
#include "pmem_decoder/pmem_file.hpp"

#include <spdlog/spdlog.h>

namespace pmem_decoder {

Track::Track(const PmemFile& file, uint32_t dataStart, uint32_t dataEnd)
    : file_(&file),
      dataStart_(dataStart),
      dataEnd_(dataEnd),
      cursor_(file, dataStart, dataEnd) {
}

Track Track::continuation(const Track& previous, uint32_t position, uint32_t dataEnd) {
    Track track(*previous.file_, position, dataEnd);
    track.headerLoaded_ = true;
    track.recovered_ = true;
    track.schema_ = previous.schema_;
    track.metadata_ = previous.metadata_;
    track.metadata_.samples = 0;
    return track;
}

bool Track::loadHeader() {
    cursor_.seek(dataStart_);
    entryCount_ = 0;
    records_.clear();
    opaqueHeaders_.clear();
    headerLoaded_ = false;

    auto schemaEntry = cursor_.next();
    if (!schemaEntry || schemaEntry->type != entry_type::PERIODIC_SCHEMA) {
        spdlog::warn("Track at 0x{:X} has no periodic schema", dataStart_);
        return false;
    }
    try {
        schema_ = PeriodicSchema::parse(schemaEntry->body);
    } catch (const DecodeError& e) {
        spdlog::warn("Track at 0x{:X}: {}", dataStart_, e.what());
        return false;
    }

    auto metadataEntry = cursor_.next();
    if (!metadataEntry || metadataEntry->type != entry_type::TRACK_METADATA) {
        spdlog::warn("Track at 0x{:X} has no metadata", dataStart_);
        return false;
    }
    metadata_ = TrackMetadata::parse(metadataEntry->body);

    for (int i = 0; i < 2; ++i) {
        auto opaque = cursor_.next();
        if (!opaque) {
            break;
        }
        opaqueHeaders_.push_back(opaque->body);
    }

    headerLoaded_ = true;
    spdlog::debug("Track at 0x{:X}: {} schema fields, {} samples",
                  dataStart_, schema_.fields().size(), metadata_.samples);
    return true;
}

size_t Track::loadEntries() {
    if (!headerLoaded_ && !loadHeader()) {
        return 0;
    }

    while (entryCount_ < metadata_.samples) {
        if (!pullEntry()) {
            spdlog::warn("Track at 0x{:X} ends after {} of {} samples",
                         dataStart_, entryCount_, metadata_.samples);
            break;
        }
    }
    return entryCount_;
}

std::optional<PulledEntry> Track::pullEntry() {
    auto pulled = readEntry();
    if (pulled) {
        accept(*pulled);
    }
    return pulled;
}

std::optional<PulledEntry> Track::readEntry() {
    auto entry = cursor_.next();
    if (!entry) {
        return std::nullopt;
    }
    PulledEntry pulled;
    pulled.record = decodeTrackEntry(*entry, schema_);
    pulled.entry = std::move(*entry);
    return pulled;
}

void Track::accept(PulledEntry pulled) {
    ++entryCount_;
    if (pulled.record) {
        records_.push_back(std::move(*pulled.record));
    }
}

nlohmann::json Track::toJson() const {
    nlohmann::json records = nlohmann::json::array();
    for (const auto& record : records_) {
        records.push_back(pmem_decoder::toJson(record));
    }
    return {
        {"offset", dataStart_},
        {"recovered", recovered_},
        {"metadata", metadata_.toJson()},
        {"schema", schema_.toJson()},
        {"entries", entryCount_},
        {"records", records}
    };
}

TrackLog::TrackLog(const PmemFile& file)
    : TrackLog(file, file.trackLog()) {
}

TrackLog::TrackLog(const PmemFile& file, Region region)
    : file_(file),
      block_(file, region) {
}

void TrackLog::load() {
    tracks_.clear();
    block_.loadLogs();

    for (const auto& subBlock : block_.subBlocks()) {
        Track track(file_, subBlock.dataStart, subBlock.dataEnd);
        if (!track.loadHeader()) {
            continue;
        }
        track.loadEntries();
        tracks_.push_back(std::move(track));
    }

    loaded_ = true;
    spdlog::info("Loaded {} tracks", tracks_.size());
}

std::optional<Track> TrackLog::recoverTrack() {
    if (!loaded_) {
        load();
    }
    if (tracks_.empty()) {
        spdlog::info("No indexed track to recover after");
        return std::nullopt;
    }

    const Track& last = tracks_.back();
    const uint32_t start = last.cursor().position();
    const uint32_t end = block_.region().end;

    for (uint32_t attempt = 0; attempt < RECOVERY_SEARCH_LIMIT; ++attempt) {
        const uint32_t position = start + attempt;
        if (position >= end) {
            break;
        }

        Track candidate = Track::continuation(last, position, end);
        if (!alignedAt(candidate)) {
            continue;
        }

        // Start over and keep entries until the first implausible one
        candidate.cursor().seek(position);
        candidate.entryCount_ = 0;
        candidate.records_.clear();
        while (true) {
            const uint32_t before = candidate.cursor().position();
            auto pulled = candidate.readEntry();
            if (!pulled || !pulled->record || !isPlausible(*pulled->record)) {
                candidate.cursor().seek(before);
                break;
            }
            candidate.accept(std::move(*pulled));
        }

        if (candidate.entryCount() == 0) {
            break;
        }
        candidate.metadata_.samples = static_cast<uint32_t>(candidate.entryCount());
        spdlog::info("Recovered {} entries at 0x{:X}", candidate.entryCount(), position);
        return candidate;
    }

    spdlog::info("Could not recover a track after 0x{:X}", start);
    return std::nullopt;
}

bool TrackLog::alignedAt(Track& candidate) const {
    for (size_t i = 0; i < RECOVERY_WINDOW; ++i) {
        auto pulled = candidate.readEntry();
        if (!pulled || !pulled->record || !isPlausible(*pulled->record)) {
            return false;
        }
    }
    return true;
}

} // namespace pmem_decoder
