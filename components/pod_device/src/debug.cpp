#include "pod_device/debug.hpp"

#include "pod_protocol/codec.hpp"
#include "pod_protocol/error.hpp"
#include "pod_protocol/fragment.hpp"
#include "pod_protocol/reassembly.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace pod_device {

namespace {

enum class Direction {
    INCOMING,
    OUTGOING
};

struct DirectedPacket {
    double time;
    Direction direction;
    const Bytes* data;
};

} // namespace

size_t reconstructFilesystem(const Recording& recording, pmem_decoder::MemoryImage& image) {
    pod_protocol::ReassemblyFeed feed;
    size_t stored = 0;

    for (const auto& packet : recording.incoming) {
        auto assembled = feed.feed(pod_protocol::decodeFragment(packet.data));
        if (!assembled) {
            continue;
        }

        pod_protocol::Message message;
        try {
            message = pod_protocol::decodeMessage(*assembled);
        } catch (const pod_protocol::ParseError& e) {
            spdlog::warn("Skipping undecodable message: {}", e.what());
            continue;
        }

        if (message.getKind() != pod_protocol::MessageKind::DATA_REPLY) {
            continue;
        }

        const auto& block = message.getBodyAs<pod_protocol::DataBlockBody>();
        if (block.position >= image.size()) {
            spdlog::warn("Data reply at 0x{:X} lies outside the image", block.position);
            continue;
        }

        size_t length = std::min<size_t>({block.length, block.data.size(), image.size() - block.position});
        image.store(block.position, Bytes(block.data.begin(), block.data.begin() + length));
        ++stored;
    }

    spdlog::info("Reconstructed {} blocks from {} packets", stored, recording.incoming.size());
    return stored;
}

size_t printInteraction(const Recording& recording, std::ostream& out, bool color) {
    std::vector<DirectedPacket> packets;
    for (const auto& packet : recording.incoming) {
        packets.push_back({packet.time, Direction::INCOMING, &packet.data});
    }
    for (const auto& packet : recording.outgoing) {
        packets.push_back({packet.time, Direction::OUTGOING, &packet.data});
    }
    if (packets.empty()) {
        return 0;
    }

    std::stable_sort(packets.begin(), packets.end(),
                     [](const DirectedPacket& a, const DirectedPacket& b) { return a.time < b.time; });

    pod_protocol::ReassemblyFeed incomingFeed;
    pod_protocol::ReassemblyFeed outgoingFeed;
    const double start = packets.front().time;
    size_t printed = 0;

    for (const auto& packet : packets) {
        auto& feed = packet.direction == Direction::INCOMING ? incomingFeed : outgoingFeed;
        auto assembled = feed.feed(pod_protocol::decodeFragment(*packet.data));
        if (!assembled) {
            continue;
        }

        std::string text;
        try {
            text = pod_protocol::decodeMessage(*assembled).toString();
        } catch (const pod_protocol::ParseError& e) {
            text = e.what();
        }

        std::string line = fmt::format("#{:06.3f} {}", packet.time - start, text);
        if (color) {
            // Green for the pod, blue for the host
            const char* code = packet.direction == Direction::INCOMING ? "1;32" : "1;34";
            line = fmt::format("\033[{}m{}\033[00m", code, line);
        }
        out << line << "\n";
        ++printed;
    }
    return printed;
}

} // namespace pod_device
