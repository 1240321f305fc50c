#include "pod_device/recording.hpp"

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <thread>

namespace pod_device {

namespace {

bool isGzipPath(const std::string& path) {
    const std::string suffix = ".gz";
    return path.size() >= suffix.size() &&
           path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
}

nlohmann::json packetsToJson(const std::vector<TimedPacket>& packets) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& packet : packets) {
        array.push_back({packet.time, base64Encode(packet.data)});
    }
    return array;
}

std::vector<TimedPacket> packetsFromJson(const nlohmann::json& array) {
    std::vector<TimedPacket> packets;
    for (const auto& entry : array) {
        TimedPacket packet;
        packet.time = entry.at(0).get<double>();
        packet.data = base64Decode(entry.at(1).get<std::string>());
        packets.push_back(std::move(packet));
    }
    return packets;
}

} // namespace

std::string base64Encode(const Bytes& data) {
    using namespace boost::archive::iterators;
    using Encoder = base64_from_binary<transform_width<Bytes::const_iterator, 6, 8>>;

    std::string encoded(Encoder(data.begin()), Encoder(data.end()));
    encoded.append((3 - data.size() % 3) % 3, '=');
    return encoded;
}

Bytes base64Decode(const std::string& text) {
    using namespace boost::archive::iterators;
    using Decoder = transform_width<binary_from_base64<std::string::const_iterator>, 8, 6>;

    std::string input = text;
    input.erase(std::remove_if(input.begin(), input.end(),
                               [](char c) { return c == '\n' || c == '\r' || c == ' '; }),
                input.end());

    size_t padding = 0;
    while (!input.empty() && input.back() == '=') {
        input.pop_back();
        ++padding;
    }
    // The decoder works on whole quads; padding decodes as zero bits
    input.append(padding, 'A');

    Bytes decoded(Decoder(input.begin()), Decoder(input.end()));
    decoded.resize(decoded.size() - std::min(padding, decoded.size()));
    return decoded;
}

nlohmann::json Recording::toJson() const {
    return {
        {"incoming", packetsToJson(incoming)},
        {"outgoing", packetsToJson(outgoing)}
    };
}

Recording Recording::fromJson(const nlohmann::json& json) {
    Recording recording;
    if (json.contains("incoming")) {
        recording.incoming = packetsFromJson(json["incoming"]);
    }
    if (json.contains("outgoing")) {
        recording.outgoing = packetsFromJson(json["outgoing"]);
    }
    return recording;
}

Recording Recording::load(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open recording: " + path);
    }

    try {
        boost::iostreams::filtering_istream stream;
        if (isGzipPath(path)) {
            stream.push(boost::iostreams::gzip_decompressor());
        }
        stream.push(file);

        nlohmann::json json = nlohmann::json::parse(stream);
        Recording recording = fromJson(json);
        spdlog::debug("Loaded {} incoming and {} outgoing packets from {}",
                      recording.incoming.size(), recording.outgoing.size(), path);
        return recording;
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to parse recording: " + path + ": " + e.what());
    }
}

void Recording::save(const std::string& path) const {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open recording for writing: " + path);
    }

    {
        boost::iostreams::filtering_ostream stream;
        if (isGzipPath(path)) {
            stream.push(boost::iostreams::gzip_compressor());
        }
        stream.push(file);
        stream << toJson().dump();
        // Closing the chain writes the gzip trailer
        stream.reset();
    }
    file.flush();

    if (!file) {
        throw std::runtime_error("Failed to write recording: " + path);
    }
    spdlog::info("Saved {} incoming and {} outgoing packets to {}", incoming.size(), outgoing.size(), path);
}

// RecordingChannel

RecordingChannel::RecordingChannel(std::shared_ptr<IChannel> channel)
    : channel_(std::move(channel)) {
}

VoidResult RecordingChannel::open() {
    return channel_->open();
}

void RecordingChannel::close() {
    channel_->close();
}

bool RecordingChannel::isOpen() const {
    return channel_->isOpen();
}

VoidResult RecordingChannel::write(const Bytes& packet) {
    recording_.outgoing.push_back({now(), packet});
    return channel_->write(packet);
}

Result<Bytes> RecordingChannel::read(size_t maxLength, std::chrono::milliseconds timeout) {
    auto result = channel_->read(maxLength, timeout);
    if (result && !result.value.empty()) {
        recording_.incoming.push_back({now(), result.value});
    }
    return result;
}

double RecordingChannel::now() const {
    auto since = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since).count();
}

// ReplayChannel

ReplayChannel::ReplayChannel(Recording recording)
    : recording_(std::move(recording)) {
}

VoidResult ReplayChannel::open() {
    open_ = true;
    return makeSuccessResult();
}

void ReplayChannel::close() {
    open_ = false;
}

VoidResult ReplayChannel::write(const Bytes& packet) {
    if (outgoingIndex_ >= recording_.outgoing.size()) {
        ++excessWrites_;
        spdlog::warn("Writing more packets than were recorded");
        return makeSuccessResult();
    }

    const auto& expected = recording_.outgoing[outgoingIndex_++];
    if (expected.data != packet) {
        ++mismatches_;
        spdlog::warn("Written packet {} does not match recording", outgoingIndex_ - 1);
    }
    return makeSuccessResult();
}

Result<Bytes> ReplayChannel::read(size_t maxLength, std::chrono::milliseconds timeout) {
    if (incomingIndex_ >= recording_.incoming.size()) {
        std::this_thread::sleep_for(timeout);
        return Result<Bytes>::error(ErrorCode::TIMEOUT, "Recording exhausted");
    }

    Bytes packet = recording_.incoming[incomingIndex_++].data;
    if (packet.size() > maxLength) {
        packet.resize(maxLength);
    }
    return Result<Bytes>::ok(packet);
}

} // namespace pod_device
