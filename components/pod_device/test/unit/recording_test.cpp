#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "pod_device/device.hpp"
#include "pod_device/recording.hpp"
#include "../utils/fake_pod.hpp"

#include <cstdio>
#include <fstream>

using namespace pod_device;
using namespace pod_device::test;
using namespace testing;
using pod_protocol::Message;
using pod_protocol::MessageKind;
using pod_protocol::makeMessage;

namespace {

Bytes text(const std::string& value) {
    return Bytes(value.begin(), value.end());
}

Recording sampleRecording() {
    Recording recording;
    recording.outgoing.push_back({1475503530.25, {0x3f, 0x10, 0x5d, 0x04}});
    recording.incoming.push_back({1475503530.5, {0x3f, 0x3e, 0x5d, 0x36, 0x02}});
    recording.incoming.push_back({1475503530.75, {}});
    return recording;
}

} // namespace

TEST(Base64Test, EncodesWithPadding) {
    EXPECT_EQ("", base64Encode({}));
    EXPECT_EQ("Zg==", base64Encode(text("f")));
    EXPECT_EQ("Zm8=", base64Encode(text("fo")));
    EXPECT_EQ("Zm9v", base64Encode(text("foo")));
    EXPECT_EQ("Zm9vYmFy", base64Encode(text("foobar")));
    EXPECT_EQ("P/8A", base64Encode({0x3f, 0xff, 0x00}));
}

TEST(Base64Test, DecodesWithPadding) {
    EXPECT_EQ(Bytes{}, base64Decode(""));
    EXPECT_EQ(text("f"), base64Decode("Zg=="));
    EXPECT_EQ(text("fo"), base64Decode("Zm8="));
    EXPECT_EQ(text("foobar"), base64Decode("Zm9vYmFy"));
    EXPECT_EQ((Bytes{0x3f, 0xff, 0x00}), base64Decode("P/8A"));
}

TEST(RecordingTest, JsonLayout) {
    auto json = sampleRecording().toJson();

    ASSERT_TRUE(json.contains("incoming"));
    ASSERT_EQ(1u, json["outgoing"].size());
    EXPECT_DOUBLE_EQ(1475503530.25, json["outgoing"][0][0].get<double>());
    EXPECT_EQ("PxBdBA==", json["outgoing"][0][1].get<std::string>());
    EXPECT_EQ("", json["incoming"][1][1].get<std::string>());
}

TEST(RecordingTest, SaveAndLoadPlain) {
    const std::string path = ::testing::TempDir() + "recording_test.json";
    sampleRecording().save(path);

    auto loaded = Recording::load(path);
    ASSERT_EQ(2u, loaded.incoming.size());
    EXPECT_EQ((Bytes{0x3f, 0x3e, 0x5d, 0x36, 0x02}), loaded.incoming[0].data);
    EXPECT_DOUBLE_EQ(1475503530.75, loaded.incoming[1].time);
    EXPECT_EQ(sampleRecording().outgoing[0].data, loaded.outgoing[0].data);

    // Plain JSON on disk
    std::ifstream file(path);
    EXPECT_EQ('{', file.get());
    std::remove(path.c_str());
}

TEST(RecordingTest, SaveAndLoadGzip) {
    const std::string path = ::testing::TempDir() + "recording_test.json.gz";
    sampleRecording().save(path);

    std::ifstream file(path, std::ios::binary);
    EXPECT_EQ(0x1f, file.get());
    EXPECT_EQ(0x8b, file.get());
    file.close();

    auto loaded = Recording::load(path);
    EXPECT_EQ(2u, loaded.incoming.size());
    EXPECT_EQ(1u, loaded.outgoing.size());
    std::remove(path.c_str());
}

TEST(RecordingTest, LoadMissingFileThrows) {
    EXPECT_THROW(Recording::load(::testing::TempDir() + "does_not_exist.json"), std::runtime_error);
}

TEST(RecordingTest, LoadMalformedFileThrows) {
    const std::string path = ::testing::TempDir() + "recording_bad.json";
    std::ofstream(path) << "{\"incoming\": [[0.0, ";
    EXPECT_THROW(Recording::load(path), std::runtime_error);
    std::remove(path.c_str());
}

TEST(RecordingChannelTest, RecordsBothDirections) {
    auto pod = std::make_shared<FakePodChannel>([](const pod_protocol::Message& request) {
        return std::vector<pod_protocol::Message>{makeMessage(replyKindFor(request.getKind()))};
    });
    auto recorder = std::make_shared<RecordingChannel>(pod);
    Session session(recorder, fastSessionConfig());

    auto reply = session.transact(makeMessage(MessageKind::DEVICE_STATUS_REQUEST), MessageKind::DEVICE_STATUS_REPLY);
    ASSERT_TRUE(reply);

    const auto& recording = recorder->recording();
    ASSERT_EQ(1u, recording.outgoing.size());
    ASSERT_EQ(1u, recording.incoming.size());
    EXPECT_EQ(64u, recording.outgoing[0].data.size());
    EXPECT_LE(recording.outgoing[0].time, recording.incoming[0].time);
}

TEST(ReplayChannelTest, ReplaysIncomingThenTimesOut) {
    ReplayChannel replay(sampleRecording());
    ASSERT_TRUE(replay.open());

    auto first = replay.read(64, std::chrono::milliseconds(1));
    ASSERT_TRUE(first);
    EXPECT_EQ(5u, first.value.size());
    EXPECT_TRUE(replay.read(64, std::chrono::milliseconds(1)));
    EXPECT_EQ(0u, replay.remainingIncoming());

    auto exhausted = replay.read(64, std::chrono::milliseconds(1));
    EXPECT_EQ(ErrorCode::TIMEOUT, exhausted.errorCode);
}

TEST(ReplayChannelTest, CountsMismatchesAndExcessWrites) {
    ReplayChannel replay(sampleRecording());

    EXPECT_TRUE(replay.write({0x3f, 0x10, 0x5d, 0x05}));
    EXPECT_EQ(1u, replay.mismatches());

    EXPECT_TRUE(replay.write({0x00}));
    EXPECT_EQ(1u, replay.excessWrites());
}

TEST(ReplayChannelTest, RecordedSessionReplaysIdentically) {
    pod_protocol::DeviceStatusBody status;
    status.charge = 64;
    auto pod = std::make_shared<FakePodChannel>([&status](const pod_protocol::Message&) {
        return std::vector<pod_protocol::Message>{makeMessage(MessageKind::DEVICE_STATUS_REPLY, status)};
    });
    auto recorder = std::make_shared<RecordingChannel>(pod);
    GpsPod live(std::make_shared<Session>(recorder, fastSessionConfig()));
    ASSERT_TRUE(live.deviceStatus());

    auto replay = std::make_shared<ReplayChannel>(recorder->recording());
    GpsPod offline(std::make_shared<Session>(replay, fastSessionConfig()));

    auto result = offline.deviceStatus();
    ASSERT_TRUE(result) << result.errorMessage;
    EXPECT_EQ(64, result.value.charge);
    EXPECT_EQ(0u, replay->mismatches());
    EXPECT_EQ(0u, replay->excessWrites());
}
