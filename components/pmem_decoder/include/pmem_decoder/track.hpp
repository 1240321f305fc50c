#pragma once

#include "pmem_decoder/entry_cursor.hpp"
#include "pmem_decoder/log_block.hpp"
#include "pmem_decoder/records.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <vector>

namespace pmem_decoder {

class PmemFile;

struct PulledEntry {
    Entry entry;
    std::optional<Record> record;
};

/**
 * @brief One recorded track: header entries followed by its samples
 *
 * The header consists of the periodic schema, the track metadata and two
 * opaque entries. Schema and metadata are parsed once by loadHeader() and
 * kept for the lifetime of the track.
 */
class Track {
public:
    Track(const PmemFile& file, uint32_t dataStart, uint32_t dataEnd);

    /**
     * @brief Read the header entries from the start of the track data
     * @return false when the schema or metadata entry is missing or mistyped
     */
    bool loadHeader();

    /**
     * @brief Pull metadata().samples entries, or fewer when the stream ends
     * @return Number of entries pulled
     */
    size_t loadEntries();

    /**
     * @brief Pull and keep the next entry of the sample stream
     */
    std::optional<PulledEntry> pullEntry();

    EntryCursor& cursor() { return cursor_; }
    const EntryCursor& cursor() const { return cursor_; }

    size_t entryCount() const { return entryCount_; }
    const std::vector<Record>& records() const { return records_; }
    const PeriodicSchema& schema() const { return schema_; }
    const TrackMetadata& metadata() const { return metadata_; }
    const std::vector<Bytes>& opaqueHeaders() const { return opaqueHeaders_; }

    bool headerLoaded() const { return headerLoaded_; }
    bool isRecovered() const { return recovered_; }
    uint32_t dataStart() const { return dataStart_; }
    uint32_t dataEnd() const { return dataEnd_; }

    nlohmann::json toJson() const;

private:
    friend class TrackLog;

    // Candidate for recovered data, using the header of an indexed track
    static Track continuation(const Track& previous, uint32_t position, uint32_t dataEnd);

    std::optional<PulledEntry> readEntry();
    void accept(PulledEntry pulled);

    const PmemFile* file_;
    uint32_t dataStart_;
    uint32_t dataEnd_;
    EntryCursor cursor_;

    bool headerLoaded_ = false;
    bool recovered_ = false;
    PeriodicSchema schema_;
    TrackMetadata metadata_;
    std::vector<Bytes> opaqueHeaders_;

    size_t entryCount_ = 0;
    std::vector<Record> records_;
};

/**
 * @brief All tracks stored in the track log region
 */
class TrackLog {
public:
    static constexpr uint32_t RECOVERY_SEARCH_LIMIT = 65536;
    static constexpr size_t RECOVERY_WINDOW = 10;

    explicit TrackLog(const PmemFile& file);
    TrackLog(const PmemFile& file, Region region);

    /**
     * @brief Enumerate the sub-blocks and load header and samples of every track
     */
    void load();

    /**
     * @brief Try to recover a track from the unindexed data after the last track
     *
     * Scans forward byte by byte from the end of the last track for an offset
     * where RECOVERY_WINDOW consecutive entries decode to plausible records,
     * then pulls entries from there until the first implausible one. The
     * alignment can be wrong when noise passes the plausibility check.
     *
     * @return The recovered track, or empty when nothing could be recovered
     */
    std::optional<Track> recoverTrack();

    const std::vector<Track>& tracks() const { return tracks_; }
    const LogBlock& block() const { return block_; }
    bool loaded() const { return loaded_; }

private:
    bool alignedAt(Track& candidate) const;

    const PmemFile& file_;
    LogBlock block_;
    std::vector<Track> tracks_;
    bool loaded_ = false;
};

} // namespace pmem_decoder
