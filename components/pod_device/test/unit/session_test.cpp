#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "pod_device/session.hpp"
#include "../utils/fake_pod.hpp"

using namespace pod_device;
using namespace pod_device::test;
using namespace testing;
using pod_protocol::Message;
using pod_protocol::MessageKind;
using pod_protocol::makeMessage;

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        channel_ = std::make_shared<FakePodChannel>([this](const pod_protocol::Message& request) {
            return respond(request);
        });
        session_ = std::make_shared<Session>(channel_, fastSessionConfig());
    }

    std::vector<pod_protocol::Message> respond(const pod_protocol::Message& request) {
        if (!replies_.empty()) {
            pod_protocol::Message reply = replies_.front();
            replies_.erase(replies_.begin());
            return {reply};
        }
        return {makeMessage(replyKindFor(request.getKind()))};
    }

    std::shared_ptr<FakePodChannel> channel_;
    std::shared_ptr<Session> session_;
    std::vector<pod_protocol::Message> replies_;
};

TEST_F(SessionTest, WriteMessageStampsIncrementingSequence) {
    ASSERT_TRUE(session_->writeMessage(makeMessage(MessageKind::DEVICE_STATUS_REQUEST)));
    ASSERT_TRUE(session_->writeMessage(makeMessage(MessageKind::LOG_COUNT_REQUEST)));

    ASSERT_EQ(2u, channel_->requests.size());
    EXPECT_EQ(0, channel_->requests[0].getHeader().packetSequence);
    EXPECT_EQ(1, channel_->requests[1].getHeader().packetSequence);
    EXPECT_EQ(MessageKind::LOG_COUNT_REQUEST, channel_->requests[1].getKind());
    EXPECT_EQ(2, session_->nextSequence());
}

TEST_F(SessionTest, ReadMessageReassemblesMultiPacketReply) {
    pod_protocol::DeviceInfoBody info;
    info.model = {'G', 'p', 's', 'P', 'o', 'd'};
    channel_->queueMessage(makeMessage(MessageKind::DEVICE_INFO_REPLY, info));
    ASSERT_EQ(2u, channel_->queuedPackets());

    auto result = session_->readMessage();
    ASSERT_TRUE(result) << result.errorMessage;
    EXPECT_EQ(MessageKind::DEVICE_INFO_REPLY, result.value.getKind());
    EXPECT_EQ("GpsPod", result.value.getBodyAs<pod_protocol::DeviceInfoBody>().getModel());
}

TEST_F(SessionTest, ReadMessageSkipsDamagedPackets) {
    channel_->queuePacket(Bytes(64, 0xAA));
    channel_->queueMessage(makeMessage(MessageKind::DEVICE_STATUS_REPLY));

    auto result = session_->readMessage();
    ASSERT_TRUE(result) << result.errorMessage;
    EXPECT_EQ(MessageKind::DEVICE_STATUS_REPLY, result.value.getKind());
}

TEST_F(SessionTest, ReadMessageTimesOut) {
    auto result = session_->readMessage();
    EXPECT_FALSE(result);
    EXPECT_EQ(ErrorCode::TIMEOUT, result.errorCode);
}

TEST_F(SessionTest, TransactReturnsExpectedReply) {
    pod_protocol::DeviceStatusBody status;
    status.charge = 87;
    replies_.push_back(makeMessage(MessageKind::DEVICE_STATUS_REPLY, status));

    auto reply = session_->transact(makeMessage(MessageKind::DEVICE_STATUS_REQUEST), MessageKind::DEVICE_STATUS_REPLY);
    ASSERT_TRUE(reply) << reply.errorMessage;
    EXPECT_EQ(87, reply.value.getBodyAs<pod_protocol::DeviceStatusBody>().charge);
    EXPECT_EQ(1u, channel_->requests.size());
}

TEST_F(SessionTest, TransactRetriesOnWrongReplyKind) {
    replies_.push_back(makeMessage(MessageKind::LOG_COUNT_REPLY));

    auto reply = session_->transact(makeMessage(MessageKind::DEVICE_STATUS_REQUEST), MessageKind::DEVICE_STATUS_REPLY);
    ASSERT_TRUE(reply) << reply.errorMessage;
    EXPECT_EQ(2u, channel_->requests.size());
}

TEST_F(SessionTest, TransactRetriesRejectedReply) {
    size_t calls = 0;
    auto reply = session_->transact(makeMessage(MessageKind::DEVICE_STATUS_REQUEST), MessageKind::DEVICE_STATUS_REPLY,
                                    [&calls](const pod_protocol::Message&) { return ++calls == 2; });
    ASSERT_TRUE(reply) << reply.errorMessage;
    EXPECT_EQ(2u, calls);
}

TEST_F(SessionTest, TransactExhaustsRetries) {
    for (int i = 0; i < 3; ++i) {
        replies_.push_back(makeMessage(MessageKind::RESET_REPLY));
    }

    auto reply = session_->transact(makeMessage(MessageKind::DEVICE_STATUS_REQUEST), MessageKind::DEVICE_STATUS_REPLY);
    EXPECT_FALSE(reply);
    EXPECT_EQ(ErrorCode::RETRIES_EXHAUSTED, reply.errorCode);
    EXPECT_THAT(reply.errorMessage, HasSubstr("SendResetReply"));
    EXPECT_EQ(3u, channel_->requests.size());
}

TEST_F(SessionTest, DrainDiscardsQueuedPackets) {
    channel_->queueMessage(makeMessage(MessageKind::DEVICE_INFO_REPLY));
    channel_->queuePacket(Bytes(64, 0));

    EXPECT_EQ(3u, session_->drain());
    EXPECT_EQ(0u, channel_->queuedPackets());
}

TEST(SessionMockTest, TimeoutsAreRetried) {
    auto channel = std::make_shared<StrictMock<MockChannel>>();
    Session session(channel, fastSessionConfig(4));

    EXPECT_CALL(*channel, write(_)).Times(4).WillRepeatedly(Return(makeSuccessResult()));
    EXPECT_CALL(*channel, read(_, _))
        .WillRepeatedly(Return(Result<Bytes>::error(ErrorCode::TIMEOUT, "timeout")));

    auto reply = session.transact(makeMessage(MessageKind::LOG_COUNT_REQUEST), MessageKind::LOG_COUNT_REPLY);
    EXPECT_EQ(ErrorCode::RETRIES_EXHAUSTED, reply.errorCode);
}

TEST(SessionMockTest, WriteFailuresAreRetriedWithoutReading) {
    auto channel = std::make_shared<StrictMock<MockChannel>>();
    Session session(channel, fastSessionConfig(2));

    EXPECT_CALL(*channel, write(_))
        .Times(2)
        .WillRepeatedly(Return(makeErrorResult(ErrorCode::TRANSPORT_ERROR, "unplugged")));
    EXPECT_CALL(*channel, read(_, _)).Times(0);

    auto reply = session.transact(makeMessage(MessageKind::LOG_COUNT_REQUEST), MessageKind::LOG_COUNT_REPLY);
    EXPECT_EQ(ErrorCode::RETRIES_EXHAUSTED, reply.errorCode);
    EXPECT_THAT(reply.errorMessage, HasSubstr("unplugged"));
}

TEST(SessionMockTest, ReadErrorIsReported) {
    auto channel = std::make_shared<StrictMock<MockChannel>>();
    Session session(channel, fastSessionConfig());

    EXPECT_CALL(*channel, read(_, _))
        .WillOnce(Return(Result<Bytes>::error(ErrorCode::TRANSPORT_ERROR, "device gone")));

    auto result = session.readMessage();
    EXPECT_EQ(ErrorCode::TRANSPORT_ERROR, result.errorCode);
    EXPECT_EQ("device gone", result.errorMessage);
}
