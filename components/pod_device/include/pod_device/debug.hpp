#pragma once

#include "pod_device/recording.hpp"

#include "pmem_decoder/memory_image.hpp"

#include <ostream>

namespace pod_device {

/**
 * @brief Rebuild the filesystem image from the data replies in a recording
 *
 * Bytes not covered by any reply stay unfetched in the image, see
 * MemoryImage::missingRanges().
 *
 * @return Number of data replies stored
 */
size_t reconstructFilesystem(const Recording& recording, pmem_decoder::MemoryImage& image);

/**
 * @brief Print the messages of a recording in the order they were exchanged
 *
 * One line per message, prefixed with the time relative to the first packet.
 *
 * @param color Highlight incoming and outgoing messages with ANSI colors
 * @return Number of messages printed
 */
size_t printInteraction(const Recording& recording, std::ostream& out, bool color = false);

} // namespace pod_device
