#include <gtest/gtest.h>

#include "pod_protocol/codec.hpp"
#include "pod_protocol/error.hpp"
#include "pod_protocol/registry.hpp"

#include <set>
#include <string>
#include <utility>
#include <variant>

using namespace pod_protocol;

TEST(RegistryTest, EveryEntryDecodesZeroFilledBody) {
    for (const auto& entry : MessageRegistry::entries()) {
        size_t bodySize = MessageRegistry::fixedBodySize(entry.bodyType);
        if (bodySize == 0 && entry.bodyType != BodyType::EMPTY) {
            bodySize = 16;
        }

        Bytes data(COMMAND_HEADER_SIZE + bodySize, 0);
        data[0] = static_cast<uint8_t>(entry.command & 0xFF);
        data[1] = static_cast<uint8_t>(entry.command >> 8);
        data[2] = static_cast<uint8_t>(entry.direction & 0xFF);
        data[3] = static_cast<uint8_t>(entry.direction >> 8);
        data[8] = static_cast<uint8_t>(bodySize & 0xFF);
        data[9] = static_cast<uint8_t>(bodySize >> 8);

        Message message;
        ASSERT_NO_THROW(message = decodeMessage(data)) << entry.name;
        EXPECT_EQ(entry.kind, message.getKind()) << entry.name;
        EXPECT_TRUE(message.getTrailing().empty()) << entry.name;
        EXPECT_EQ(data, encodeMessage(message)) << entry.name;
    }
}

TEST(RegistryTest, PairsAreUnique) {
    std::set<std::pair<uint16_t, uint16_t>> seen;
    for (const auto& entry : MessageRegistry::entries()) {
        EXPECT_TRUE(seen.insert({entry.command, entry.direction}).second) << entry.name;
    }
}

TEST(RegistryTest, ExactLookup) {
    const auto* descriptor = MessageRegistry::find(command::LOCK_STATUS, direction::STATUS_REPLY);
    ASSERT_NE(nullptr, descriptor);
    EXPECT_EQ(MessageKind::LOCK_STATUS_REPLY, descriptor->kind);

    descriptor = MessageRegistry::find(command::CHARLIE, direction::STATUS_REPLY);
    ASSERT_NE(nullptr, descriptor);
    EXPECT_EQ(MessageKind::CHARLIE_REPLY, descriptor->kind);
}

TEST(RegistryTest, CommandOnlyLookupTakesFirstRegistered) {
    const auto* descriptor = MessageRegistry::find(command::LOG_COUNT, 0x7777);
    ASSERT_NE(nullptr, descriptor);
    EXPECT_EQ(MessageKind::LOG_COUNT_REQUEST, descriptor->kind);
}

TEST(RegistryTest, UnknownCommand) {
    EXPECT_EQ(nullptr, MessageRegistry::find(0xFFFF, direction::REQUEST));
    EXPECT_THROW(MessageRegistry::byKind(MessageKind::UNKNOWN), ValidationError);
    EXPECT_EQ("Message", messageKindToString(MessageKind::UNKNOWN));
}

TEST(RegistryTest, DefaultRequests) {
    Message info = makeMessage(MessageKind::DEVICE_INFO_REQUEST);
    EXPECT_EQ(0x0000, info.getHeader().format);
    EXPECT_EQ((std::array<uint8_t, 4>{2, 4, 89, 0}), info.getBodyAs<DeviceInfoRequestBody>().version);

    Message data = makeMessage(MessageKind::DATA_REQUEST);
    EXPECT_EQ(DEFAULT_FORMAT, data.getHeader().format);
    EXPECT_EQ(DATA_BLOCK_SIZE, data.getBodyAs<DataRequestBody>().length);
    EXPECT_EQ(8u, data.getHeader().bodyLength);

    Message settings = makeMessage(MessageKind::WRITE_SETTINGS_REQUEST);
    EXPECT_TRUE(settings.getBodyAs<PersonalSettingsBody>().getSounds());
    EXPECT_EQ(70u, settings.getHeader().bodyLength);

    Message logSettings = makeMessage(MessageKind::WRITE_LOG_SETTINGS_REQUEST);
    EXPECT_EQ(284u, logSettings.getHeader().bodyLength);
    EXPECT_EQ(1, logSettings.getBodyAs<LogSettingsBody>().getInterval());

    Message status = makeMessage(MessageKind::DEVICE_STATUS_REQUEST);
    EXPECT_EQ(direction::REQUEST, status.getHeader().direction);
    EXPECT_EQ(0u, status.getHeader().bodyLength);
    EXPECT_TRUE(status.holds<EmptyBody>());
}

TEST(RegistryTest, ReplyDirections) {
    EXPECT_EQ(direction::REPLY, MessageRegistry::byKind(MessageKind::DEVICE_STATUS_REPLY).direction);
    EXPECT_EQ(direction::DEVICE_INFO_REPLY, MessageRegistry::byKind(MessageKind::DEVICE_INFO_REPLY).direction);
    EXPECT_EQ(direction::STATUS_REPLY, MessageRegistry::byKind(MessageKind::LOCK_STATUS_REPLY).direction);
}

TEST(RegistryTest, EveryBodyTypeIsNamed) {
    std::set<std::string> names;
    for (int i = static_cast<int>(BodyType::EMPTY); i <= static_cast<int>(BodyType::RAW); ++i) {
        std::string name = bodyTypeToString(static_cast<BodyType>(i));
        EXPECT_NE("unknown", name);
        names.insert(name);
    }
    EXPECT_EQ(static_cast<size_t>(BodyType::RAW) + 1, names.size());
}

TEST(RegistryTest, VariableBodiesHaveNoFixedSize) {
    EXPECT_EQ(0u, MessageRegistry::fixedBodySize(BodyType::LOG_ENTRY));
    EXPECT_EQ(0u, MessageRegistry::fixedBodySize(BodyType::SGEE_DATA_BLOCK));
    EXPECT_EQ(0u, MessageRegistry::fixedBodySize(BodyType::RAW));
    EXPECT_EQ(DeviceInfoBody::SIZE, MessageRegistry::fixedBodySize(BodyType::DEVICE_INFO));
    EXPECT_TRUE(std::holds_alternative<RawBody>(makeDefaultBody(BodyType::RAW)));
}
