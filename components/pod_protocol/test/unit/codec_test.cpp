#include <gtest/gtest.h>

#include "pod_protocol/codec.hpp"
#include "pod_protocol/error.hpp"
#include "pod_protocol/reassembly.hpp"
#include "pod_protocol/registry.hpp"

using namespace pod_protocol;

namespace {

// DeviceInfoReply as captured on the wire, two USB packets
const Bytes REPLY_PART1{
    0x3f, 0x3e, 0x5d, 0x36, 0x02, 0x00, 0x1a, 0xd9, 0x00, 0x02, 0x02, 0x00, 0x09, 0x00, 0x00, 0x00,
    0x30, 0x00, 0x00, 0x00, 0x47, 0x70, 0x73, 0x50, 0x6f, 0x64, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x00, 0x00, 0x38, 0x37, 0x36, 0x31, 0x39, 0x39, 0x34, 0x36, 0x31, 0x37, 0x30, 0x30,
    0x31, 0x30, 0x30, 0x30, 0x01, 0x06, 0x27, 0x00, 0x42, 0x02, 0x00, 0x00, 0x01, 0x04, 0x29, 0xc8};
const Bytes REPLY_PART2{
    0x3f, 0x0e, 0x5e, 0x06, 0x01, 0x00, 0x30, 0xd2, 0x03, 0x00, 0x00, 0x02, 0x00, 0x00, 0x9a, 0x83};

Bytes reassemble(const std::vector<Bytes>& packets) {
    ReassemblyFeed feed;
    std::optional<Bytes> result;
    for (const auto& packet : packets) {
        result = feed.feed(decodeFragment(packet));
    }
    return result ? *result : Bytes{};
}

DeviceInfoBody sampleDeviceInfo() {
    DeviceInfoBody info;
    const std::string model = "GpsPod";
    const std::string serial = "8761994617001000";
    std::copy(model.begin(), model.end(), info.model.begin());
    std::copy(serial.begin(), serial.end(), info.serial.begin());
    info.fwVersion = {1, 6, 39, 0};
    info.hwVersion = {66, 2, 0, 0};
    info.bslVersion = {1, 4, 3, 0};
    return info;
}

} // namespace

TEST(CodecTest, DecodeRecordedDeviceInfoReply) {
    Bytes data = reassemble({REPLY_PART1, REPLY_PART2});
    ASSERT_EQ(60u, data.size());

    Message message = decodeMessage(data);
    EXPECT_EQ(MessageKind::DEVICE_INFO_REPLY, message.getKind());
    EXPECT_EQ("DeviceInfoReply", message.getName());
    EXPECT_EQ(0x0200, message.getHeader().command);
    EXPECT_EQ(0x0002, message.getHeader().direction);
    EXPECT_EQ(0x0009, message.getHeader().format);
    EXPECT_EQ(48u, message.getHeader().bodyLength);

    const auto& info = message.getBodyAs<DeviceInfoBody>();
    EXPECT_EQ("GpsPod", info.getModel());
    EXPECT_EQ("8761994617001000", info.getSerial());
    EXPECT_EQ((std::array<uint8_t, 4>{1, 6, 39, 0}), info.fwVersion);
    EXPECT_EQ((std::array<uint8_t, 4>{66, 2, 0, 0}), info.hwVersion);
    EXPECT_EQ((std::array<uint8_t, 4>{1, 4, 3, 0}), info.bslVersion);

    // Declared length exceeds the shape, the extra bytes are preserved
    EXPECT_EQ((Bytes{0x00, 0x02, 0x00, 0x00}), message.getTrailing());
    EXPECT_EQ(data, encodeMessage(message));
}

TEST(CodecTest, DeviceInfoRequestMatchesRecording) {
    Message request = makeMessage(MessageKind::DEVICE_INFO_REQUEST);
    EXPECT_EQ(0x0000, request.getHeader().format);
    EXPECT_EQ(0x0001, request.getHeader().direction);

    Bytes expected{0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00,
                   0x04, 0x00, 0x00, 0x00, 0x02, 0x04, 0x59, 0x00};
    EXPECT_EQ(expected, encodeMessage(request));
}

TEST(CodecTest, ThreeFragmentDeviceInfoEndToEnd) {
    Message reply = makeMessage(MessageKind::DEVICE_INFO_REPLY, sampleDeviceInfo());
    // Pad the body so the message needs three fragments
    Bytes padding(150 - COMMAND_HEADER_SIZE - DeviceInfoBody::SIZE, 0xEE);
    reply = Message(reply.getKind(), reply.getHeader(), reply.getBody(), padding);

    Bytes encoded = encodeMessage(reply);
    ASSERT_EQ(150u, encoded.size());

    auto fragments = encodeFragments(encoded);
    ASSERT_EQ(3u, fragments.size());

    ReassemblyFeed feed;
    EXPECT_FALSE(feed.feed(decodeFragment(fragments[0].toBytes())).has_value());
    EXPECT_FALSE(feed.feed(decodeFragment(fragments[1].toBytes())).has_value());
    auto data = feed.feed(decodeFragment(fragments[2].toBytes()));
    ASSERT_TRUE(data.has_value());

    Message decoded = decodeMessage(*data);
    EXPECT_EQ(MessageKind::DEVICE_INFO_REPLY, decoded.getKind());
    const auto& info = decoded.getBodyAs<DeviceInfoBody>();
    EXPECT_EQ("GpsPod", info.getModel());
    EXPECT_EQ("8761994617001000", info.getSerial());
    EXPECT_EQ((std::array<uint8_t, 4>{1, 6, 39, 0}), info.fwVersion);
    EXPECT_EQ((std::array<uint8_t, 4>{1, 4, 3, 0}), info.bslVersion);
}

TEST(CodecTest, DecodeIsIdempotent) {
    Bytes data = reassemble({REPLY_PART1, REPLY_PART2});
    EXPECT_EQ(decodeMessage(data), decodeMessage(data));

    Message status = makeMessage(MessageKind::DEVICE_STATUS_REPLY, DeviceStatusBody{0, 87});
    Bytes encoded = encodeMessage(status);
    EXPECT_EQ(decodeMessage(encoded), decodeMessage(encoded));
    EXPECT_EQ(status, decodeMessage(encoded));
}

TEST(CodecTest, TooShortThrows) {
    EXPECT_THROW(decodeMessage(Bytes{0x03, 0x06, 0x05}), ParseError);
    EXPECT_THROW(decodeMessage(Bytes{}), ParseError);
}

TEST(CodecTest, CommandOnlyFallback) {
    // Status command with an unexpected direction
    Bytes data{0x03, 0x06, 0x02, 0x02, 0x09, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00};
    Message message = decodeMessage(data);
    EXPECT_EQ(MessageKind::DEVICE_STATUS_REQUEST, message.getKind());
    EXPECT_EQ(0x0202, message.getHeader().direction);
    EXPECT_EQ(data, encodeMessage(message));
}

TEST(CodecTest, UnknownCommandKeepsRawBody) {
    Bytes data{0x34, 0x12, 0x05, 0x00, 0x09, 0x00, 0x07, 0x00, 0x03, 0x00, 0x00, 0x00, 0xAA, 0xBB, 0xCC};
    Message message = decodeMessage(data);
    EXPECT_EQ(MessageKind::UNKNOWN, message.getKind());
    EXPECT_EQ((Bytes{0xAA, 0xBB, 0xCC}), message.getBodyAs<RawBody>().data);
    EXPECT_TRUE(message.getTrailing().empty());
    EXPECT_EQ(data, encodeMessage(message));
    EXPECT_THROW(message.getBodyAs<DeviceStatusBody>(), FieldAccessError);
}

TEST(CodecTest, ShortBodyIsZeroPadded) {
    // Log count reply with only the padding word present
    Bytes data{0x0B, 0x06, 0x0A, 0x00, 0x09, 0x00, 0x02, 0x00, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00};
    Message message = decodeMessage(data);
    EXPECT_EQ(MessageKind::LOG_COUNT_REPLY, message.getKind());
    EXPECT_EQ(0, message.getBodyAs<LogCountBody>().logCount);
    EXPECT_EQ(COMMAND_HEADER_SIZE + LogCountBody::SIZE, encodeMessage(message).size());
}

TEST(CodecTest, DataReplyCarriesFullBlock) {
    DataBlockBody block;
    block.position = 0xBA00;
    block.length = DATA_BLOCK_SIZE;
    block.data.assign(DATA_BLOCK_SIZE, 0x5A);

    Message reply = makeMessage(MessageKind::DATA_REPLY, block);
    EXPECT_EQ(DataBlockBody::SIZE, reply.getHeader().bodyLength);

    Message decoded = decodeMessage(encodeMessage(reply));
    const auto& body = decoded.getBodyAs<DataBlockBody>();
    EXPECT_EQ(0xBA00u, body.position);
    EXPECT_EQ(DATA_BLOCK_SIZE, body.data.size());
    EXPECT_EQ(0x5A, body.data[511]);
}

TEST(CodecTest, SgeeUploadUsesContentLength) {
    DataBlockBody chunk;
    chunk.position = 512;
    chunk.length = 100;
    chunk.data.assign(100, 0x11);

    Message request = makeMessage(MessageKind::WRITE_SGEE_DATA_REQUEST, chunk);
    EXPECT_EQ(108u, request.getHeader().bodyLength);

    Bytes encoded = encodeMessage(request);
    ASSERT_EQ(COMMAND_HEADER_SIZE + 108, encoded.size());

    Message decoded = decodeMessage(encoded);
    EXPECT_EQ(MessageKind::WRITE_SGEE_DATA_REQUEST, decoded.getKind());
    EXPECT_EQ(chunk, decoded.getBodyAs<DataBlockBody>());
}

TEST(CodecTest, LogEntryIsVariableLength) {
    LogEntryBody entry;
    entry.type = 1;
    entry.headerPart = 2;
    entry.length = 5;
    entry.data = {1, 2, 3, 4, 5};

    Message reply = makeMessage(MessageKind::LOG_HEADER_ENTRY_REPLY, entry);
    EXPECT_EQ(13u, reply.getHeader().bodyLength);
    EXPECT_EQ(entry, decodeMessage(encodeMessage(reply)).getBodyAs<LogEntryBody>());
}

TEST(CodecTest, SequenceIsEncoded) {
    Message request = makeMessage(MessageKind::LOG_COUNT_REQUEST);
    request.setPacketSequence(0x1234);
    Bytes encoded = encodeMessage(request);
    EXPECT_EQ(0x34, encoded[6]);
    EXPECT_EQ(0x12, encoded[7]);
}

TEST(CodecTest, JsonRendering) {
    Message message = decodeMessage(reassemble({REPLY_PART1, REPLY_PART2}));
    auto json = message.toJson();
    EXPECT_EQ("DeviceInfoReply", json["kind"].get<std::string>());
    EXPECT_EQ("GpsPod", json["body"]["model"].get<std::string>());
    EXPECT_EQ("1.6.39.0", json["body"]["fw_version"].get<std::string>());
    EXPECT_EQ("00 02 00 00", json["trailing"].get<std::string>());
}

TEST(CodecTest, TextRendering) {
    Message request = makeMessage(MessageKind::DEVICE_INFO_REQUEST);
    EXPECT_EQ("<DeviceInfoRequest cmd 0x0000, dir:0x0001 fmt 0x00, packseq 0x00, len 04, version: 02.04.89.00>",
              request.toString());
}
