#pragma once

#include "pod_device/session.hpp"
#include "pod_device/types.hpp"

#include "pmem_decoder/memory_image.hpp"
#include "pod_protocol/bodies.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <vector>

namespace pod_device {

/**
 * @class GpsPod
 * @brief Operations of the GPS pod on top of a session
 *
 * Also serves as block source, so that a MemoryImage can fetch the
 * filesystem from the device on demand.
 */
class GpsPod : public pmem_decoder::IBlockSource {
public:
    // Called after each block of a dump with (done, total)
    using ProgressCallback = std::function<void(size_t, size_t)>;

    static constexpr size_t SGEE_CHUNK_SIZE = 512;

    explicit GpsPod(std::shared_ptr<Session> session);

    Result<pod_protocol::DeviceInfoBody> deviceInfo();
    Result<pod_protocol::DeviceStatusBody> deviceStatus();
    Result<uint16_t> logCount();
    Result<pod_protocol::PersonalSettingsBody> readSettings();
    VoidResult writeSettings(const pod_protocol::PersonalSettingsBody& settings);

    /**
     * @brief Switch the sounds on or off, keeping the other settings
     */
    VoidResult setSounds(bool enabled);

    /**
     * @brief Write log settings
     *
     * Runs Alpha, SetLogSettings and Bravo in order. The first step without
     * its expected reply aborts with TRANSACTION_FAILED naming the step.
     */
    VoidResult writeLogSettings(const pod_protocol::LogSettingsBody& settings);

    Result<pod_protocol::SgeeDateBody> readSgeeDate();
    VoidResult lockStatus();

    /**
     * @brief Set the clock of the pod to a local time, date first then time
     */
    VoidResult setDateTime(std::chrono::system_clock::time_point time);

    /**
     * @brief Upload SGEE (extended ephemeris) data
     *
     * Sent in chunks of SGEE_CHUNK_SIZE bytes, then committed. Any failing
     * chunk aborts the upload.
     */
    VoidResult writeSgee(const Bytes& data);

    VoidResult reset();

    /**
     * @brief Walk the log header list of the pod
     */
    Result<std::vector<pod_protocol::LogEntryBody>> readLogHeaders();

    /**
     * @brief Retrieve one 512 byte filesystem block
     * @param blockIndex Block number, the position is blockIndex * 512
     * @param out Receives the block data
     * @return BLOCK_UNAVAILABLE once the retries are used up
     */
    VoidResult transferBlock(size_t blockIndex, Bytes& out);

    /**
     * @brief Retrieve every block of the image
     *
     * Blocks already present in the image are skipped. A failing block aborts
     * the dump with its index in the error message.
     */
    VoidResult dumpFilesystem(pmem_decoder::MemoryImage& image, const ProgressCallback& progress = nullptr);

    bool fetchBlock(size_t blockIndex, Bytes& out, std::string& error) override;

    Session& session() { return *session_; }

private:
    // One step of a multi step transaction, failures become TRANSACTION_FAILED
    VoidResult step(const char* name, const pod_protocol::Message& request, pod_protocol::MessageKind reply);

    std::shared_ptr<Session> session_;
};

} // namespace pod_device
